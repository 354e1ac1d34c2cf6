#include "storage/conflict_repository.hpp"

#include "storage/field_codec.hpp"

namespace larder::storage {

namespace {

constexpr const char* kSelect = R"SQL(
    SELECT id, entity_type, entity_id, queue_entry_id, field, local_json, remote_json,
           base_json, local_timestamp, remote_timestamp, remote_version, detected_at
    FROM conflicts
)SQL";

Result<Conflict, Error> row_to_conflict(Statement& stmt) {
    using R = Result<Conflict, Error>;
    const auto id = Uuid::parse(stmt.column_text(0));
    const auto type = parse_entity_type(stmt.column_text(1));
    if (!id || !type) {
        return R::err(Error::of(ErrorKind::Corrupted, "Malformed conflict row"));
    }

    auto local = decode_value(stmt.column_text(5));
    if (local.is_err()) return forward_err<Conflict>(local);
    auto remote = decode_value(stmt.column_text(6));
    if (remote.is_err()) return forward_err<Conflict>(remote);

    std::optional<FieldValue> base;
    if (!stmt.column_is_null(7)) {
        auto decoded = decode_value(stmt.column_text(7));
        if (decoded.is_err()) return forward_err<Conflict>(decoded);
        base = std::move(decoded).unwrap();
    }

    return R::ok(Conflict{
        .id = *id,
        .entity_type = *type,
        .entity_id = stmt.column_text(2),
        .queue_entry_id = stmt.column_int64(3),
        .field = stmt.column_text(4),
        .local_value = std::move(local).unwrap(),
        .remote_value = std::move(remote).unwrap(),
        .base_value = std::move(base),
        .local_timestamp = Timestamp(stmt.column_int64(8)),
        .remote_timestamp = Timestamp(stmt.column_int64(9)),
        .remote_version = stmt.column_int64(10),
        .conflict_detected_at = Timestamp(stmt.column_int64(11)),
    });
}

Result<ResolvedConflict, Error> row_to_resolved(Statement& stmt) {
    using R = Result<ResolvedConflict, Error>;
    const auto id = Uuid::parse(stmt.column_text(0));
    const auto type = parse_entity_type(stmt.column_text(1));
    const auto strategy = parse_strategy(stmt.column_text(4));
    if (!id || !type || !strategy) {
        return R::err(Error::of(ErrorKind::Corrupted, "Malformed resolution row"));
    }
    auto value = decode_value(stmt.column_text(5));
    if (value.is_err()) return forward_err<ResolvedConflict>(value);

    return R::ok(ResolvedConflict{
        .conflict_id = *id,
        .entity_type = *type,
        .entity_id = stmt.column_text(2),
        .field = stmt.column_text(3),
        .strategy = *strategy,
        .value = std::move(value).unwrap(),
        .resolved_by = stmt.column_text(6) == "auto" ? ResolvedBy::Auto : ResolvedBy::User,
        .resolved_at = Timestamp(stmt.column_int64(7)),
    });
}

} // namespace

Status ConflictRepository::insert(const Conflict& c) {
    std::optional<std::string> base;
    if (c.base_value) {
        base = encode_value(*c.base_value);
    }
    return db_.run(R"SQL(
        INSERT INTO conflicts (id, entity_type, entity_id, queue_entry_id, field, local_json,
                               remote_json, base_json, local_timestamp, remote_timestamp,
                               remote_version, detected_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL",
        c.id.to_string(), std::string(type_name(c.entity_type)), c.entity_id, c.queue_entry_id,
        c.field, encode_value(c.local_value), encode_value(c.remote_value), base,
        c.local_timestamp.millis(), c.remote_timestamp.millis(), c.remote_version,
        c.conflict_detected_at.millis());
}

Result<std::optional<Conflict>, Error> ConflictRepository::get(const Uuid& id) {
    using R = Result<std::optional<Conflict>, Error>;
    auto prepared = db_.prepare(std::string(kSelect) + " WHERE id = ?;");
    if (prepared.is_err()) {
        return R::err(prepared.unwrap_err());
    }
    auto stmt = std::move(prepared).unwrap();
    auto bound = stmt.bind_all(id.to_string());
    if (bound.is_err()) {
        return R::err(bound.unwrap_err());
    }
    auto rows = collect_rows<Conflict>(stmt, row_to_conflict);
    if (rows.is_err()) {
        return R::err(rows.unwrap_err());
    }
    auto& found = rows.unwrap();
    if (found.empty()) {
        return R::ok(std::nullopt);
    }
    return R::ok(std::move(found.front()));
}

Result<std::vector<Conflict>, Error> ConflictRepository::list_pending() {
    auto prepared = db_.prepare(std::string(kSelect) + " ORDER BY detected_at, queue_entry_id, field;");
    if (prepared.is_err()) {
        return forward_err<std::vector<Conflict>>(prepared);
    }
    auto stmt = std::move(prepared).unwrap();
    return collect_rows<Conflict>(stmt, row_to_conflict);
}

Result<std::vector<Conflict>, Error> ConflictRepository::for_entry(int64_t queue_entry_id) {
    auto prepared = db_.prepare(std::string(kSelect) + " WHERE queue_entry_id = ? ORDER BY field;");
    if (prepared.is_err()) {
        return forward_err<std::vector<Conflict>>(prepared);
    }
    auto stmt = std::move(prepared).unwrap();
    auto bound = stmt.bind_all(queue_entry_id);
    if (bound.is_err()) {
        return Result<std::vector<Conflict>, Error>::err(bound.unwrap_err());
    }
    return collect_rows<Conflict>(stmt, row_to_conflict);
}

Status ConflictRepository::remove(const Uuid& id) {
    return db_.run("DELETE FROM conflicts WHERE id = ?;", id.to_string());
}

Status ConflictRepository::remove_for_entry(int64_t queue_entry_id) {
    return db_.run("DELETE FROM conflicts WHERE queue_entry_id = ?;", queue_entry_id);
}

Result<int64_t, Error> ConflictRepository::count() {
    return db_.scalar("SELECT COUNT(*) FROM conflicts;");
}

Status ConflictRepository::record_resolution(const ResolvedConflict& r) {
    return db_.run(R"SQL(
        INSERT OR IGNORE INTO resolved_conflicts (conflict_id, entity_type, entity_id, field,
                                                  strategy, value_json, resolved_by, resolved_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?);
    )SQL",
        r.conflict_id.to_string(), std::string(type_name(r.entity_type)), r.entity_id, r.field,
        std::string(strategy_name(r.strategy)), encode_value(r.value),
        std::string(r.resolved_by == ResolvedBy::Auto ? "auto" : "user"),
        r.resolved_at.millis());
}

Result<bool, Error> ConflictRepository::is_resolved(const Uuid& conflict_id) {
    auto prepared = db_.prepare("SELECT COUNT(*) FROM resolved_conflicts WHERE conflict_id = ?;");
    if (prepared.is_err()) {
        return forward_err<bool>(prepared);
    }
    auto stmt = std::move(prepared).unwrap();
    auto bound = stmt.bind_all(conflict_id.to_string());
    if (bound.is_err()) {
        return Result<bool, Error>::err(bound.unwrap_err());
    }
    auto stepped = stmt.step();
    if (stepped.is_err()) {
        return forward_err<bool>(stepped);
    }
    return Result<bool, Error>::ok(stepped.unwrap() && stmt.column_int64(0) > 0);
}

Result<std::vector<ResolvedConflict>, Error> ConflictRepository::history(int limit) {
    auto prepared = db_.prepare(R"SQL(
        SELECT conflict_id, entity_type, entity_id, field, strategy, value_json,
               resolved_by, resolved_at
        FROM resolved_conflicts ORDER BY id DESC LIMIT ?;
    )SQL");
    if (prepared.is_err()) {
        return forward_err<std::vector<ResolvedConflict>>(prepared);
    }
    auto stmt = std::move(prepared).unwrap();
    auto bound = stmt.bind_all(limit);
    if (bound.is_err()) {
        return Result<std::vector<ResolvedConflict>, Error>::err(bound.unwrap_err());
    }
    return collect_rows<ResolvedConflict>(stmt, row_to_resolved);
}

} // namespace larder::storage
