#include "storage/record_repository.hpp"

#include "storage/field_codec.hpp"

namespace larder::storage {

namespace {

constexpr const char* kColumns =
    "id, fields_json, local_version, remote_version, tombstoned, sync_state, prior_json, updated_at";

Result<Record, Error> row_to_record(EntityType type, Statement& stmt) {
    auto fields = decode_fields(stmt.column_text(1));
    if (fields.is_err()) {
        return forward_err<Record>(fields);
    }

    std::optional<Fields> prior;
    if (!stmt.column_is_null(6)) {
        auto decoded = decode_fields(stmt.column_text(6));
        if (decoded.is_err()) {
            return forward_err<Record>(decoded);
        }
        prior = std::move(decoded).unwrap();
    }

    return Result<Record, Error>::ok(Record{
        .type = type,
        .id = stmt.column_text(0),
        .fields = std::move(fields).unwrap(),
        .local_version = stmt.column_int64(2),
        .remote_version = stmt.column_int64(3),
        .tombstoned = stmt.column_int(4) != 0,
        .sync_state = stmt.column_text(5) == "unconfirmed" ? SyncState::Unconfirmed
                                                           : SyncState::Confirmed,
        .prior_fields = std::move(prior),
        .updated_at = Timestamp(stmt.column_int64(7)),
    });
}

std::string select_sql(EntityType type, std::string_view where) {
    std::string sql = "SELECT ";
    sql += kColumns;
    sql += " FROM ";
    sql += table_for(type);
    sql += where;
    return sql;
}

} // namespace

std::string_view table_for(EntityType type) {
    return type == EntityType::Item ? "items" : "categories";
}

// ============================================================================
// Cursor / query
// ============================================================================

Result<std::optional<Record>, Error> RecordCursor::next() {
    using R = Result<std::optional<Record>, Error>;
    while (!done_) {
        auto stepped = stmt_.step();
        if (stepped.is_err()) {
            done_ = true;
            return R::err(stepped.unwrap_err());
        }
        if (!stepped.unwrap()) {
            done_ = true;
            break;
        }
        auto record = row_to_record(type_, stmt_);
        if (record.is_err()) {
            return R::err(record.unwrap_err());
        }
        if (!predicate_ || predicate_(record.unwrap())) {
            return R::ok(std::move(record).unwrap());
        }
    }
    return R::ok(std::nullopt);
}

Result<RecordCursor, Error> RecordQuery::open() const {
    const auto sql = select_sql(type_, include_tombstoned_
        ? " ORDER BY id;"
        : " WHERE tombstoned = 0 ORDER BY id;");
    auto prepared = db_.prepare(sql);
    if (prepared.is_err()) {
        return forward_err<RecordCursor>(prepared);
    }
    return Result<RecordCursor, Error>::ok(
        RecordCursor(std::move(prepared).unwrap(), type_, predicate_));
}

Result<std::vector<Record>, Error> RecordQuery::collect() const {
    auto opened = open();
    if (opened.is_err()) {
        return forward_err<std::vector<Record>>(opened);
    }
    auto cursor = std::move(opened).unwrap();
    std::vector<Record> out;
    while (true) {
        auto next = cursor.next();
        if (next.is_err()) {
            return forward_err<std::vector<Record>>(next);
        }
        auto record = std::move(next).unwrap();
        if (!record) break;
        out.push_back(std::move(*record));
    }
    return Result<std::vector<Record>, Error>::ok(std::move(out));
}

// ============================================================================
// Repository
// ============================================================================

Result<std::optional<Record>, Error> RecordRepository::get(EntityType type, const std::string& id) {
    using R = Result<std::optional<Record>, Error>;
    auto prepared = db_.prepare(select_sql(type, " WHERE id = ?;"));
    if (prepared.is_err()) {
        return R::err(prepared.unwrap_err());
    }
    auto stmt = std::move(prepared).unwrap();
    auto bound = stmt.bind_all(id);
    if (bound.is_err()) {
        return R::err(bound.unwrap_err());
    }

    auto stepped = stmt.step();
    if (stepped.is_err()) {
        return R::err(stepped.unwrap_err());
    }
    if (!stepped.unwrap()) {
        return R::ok(std::nullopt);
    }
    auto record = row_to_record(type, stmt);
    if (record.is_err()) {
        return R::err(record.unwrap_err());
    }
    return R::ok(std::move(record).unwrap());
}

Status RecordRepository::save(const Record& record) {
    std::string sql = "INSERT INTO ";
    sql += table_for(record.type);
    sql += R"SQL( (id, fields_json, local_version, remote_version, tombstoned,
                   sync_state, prior_json, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            fields_json = excluded.fields_json,
            local_version = excluded.local_version,
            remote_version = excluded.remote_version,
            tombstoned = excluded.tombstoned,
            sync_state = excluded.sync_state,
            prior_json = excluded.prior_json,
            updated_at = excluded.updated_at;
    )SQL";

    auto prepared = db_.prepare(sql);
    if (prepared.is_err()) {
        return Status::err(prepared.unwrap_err());
    }
    auto stmt = std::move(prepared).unwrap();

    std::optional<std::string> prior;
    if (record.prior_fields) {
        prior = encode_fields(*record.prior_fields);
    }
    auto bound = stmt.bind_all(record.id,
                               encode_fields(record.fields),
                               record.local_version,
                               record.remote_version,
                               record.tombstoned,
                               std::string(state_name(record.sync_state)),
                               prior,
                               record.updated_at.millis());
    if (bound.is_err()) {
        return bound;
    }
    return stmt.run();
}

Status RecordRepository::purge(EntityType type, const std::string& id) {
    std::string sql = "DELETE FROM ";
    sql += table_for(type);
    sql += " WHERE id = ?;";
    return db_.run(sql, id);
}

RecordQuery RecordRepository::query(EntityType type, RecordPredicate predicate, bool include_tombstoned) {
    return RecordQuery(db_, type, std::move(predicate), include_tombstoned);
}

Result<int64_t, Error> RecordRepository::count(EntityType type, bool include_tombstoned) {
    std::string sql = "SELECT COUNT(*) FROM ";
    sql += table_for(type);
    if (!include_tombstoned) {
        sql += " WHERE tombstoned = 0";
    }
    return db_.scalar(sql);
}

Result<int64_t, Error> RecordRepository::count_unconfirmed() {
    return db_.scalar(R"SQL(
        SELECT (SELECT COUNT(*) FROM items WHERE sync_state = 'unconfirmed')
             + (SELECT COUNT(*) FROM categories WHERE sync_state = 'unconfirmed');
    )SQL");
}

} // namespace larder::storage
