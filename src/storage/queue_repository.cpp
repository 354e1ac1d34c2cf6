#include "storage/queue_repository.hpp"

#include "crypto/checksum.hpp"
#include "log/logging.hpp"
#include "storage/field_codec.hpp"

namespace larder::storage {

namespace {

constexpr const char* kSelect = R"SQL(
    SELECT q.id, q.operation_id, q.entity_type, q.entity_id, q.operation, q.payload_json,
           q.base_fields_json, q.base_version, q.retry_count, q.state, q.enqueued_at,
           q.next_attempt_at, q.last_error, q.checksum
    FROM sync_queue q
)SQL";

Result<SyncQueueEntry, Error> row_to_entry(Statement& stmt) {
    using R = Result<SyncQueueEntry, Error>;
    const auto type = parse_entity_type(stmt.column_text(2));
    const auto operation = parse_operation(stmt.column_text(4));
    const auto state = parse_entry_state(stmt.column_text(9));
    if (!type || !operation || !state) {
        return R::err(Error::of(ErrorKind::Corrupted,
            "Queue entry " + std::to_string(stmt.column_int64(0)) + " has an unknown enum value"));
    }

    SyncQueueEntry entry{
        .id = stmt.column_int64(0),
        .operation_id = Uuid::parse(stmt.column_text(1)).value_or(Uuid{}),
        .entity_type = *type,
        .entity_id = stmt.column_text(3),
        .operation = *operation,
        .payload = {},
        .base_fields = {},
        .base_version = stmt.column_int64(7),
        .retry_count = stmt.column_int(8),
        .state = *state,
        .enqueued_at = Timestamp(stmt.column_int64(10)),
        .next_attempt_at = Timestamp(stmt.column_int64(11)),
        .last_error = stmt.column_text(12),
        .checksum = stmt.column_text(13),
    };

    // An undecodable payload is kept with an empty checksum so that the
    // drain fails it as Corrupted instead of stalling the whole queue.
    auto payload = decode_fields(stmt.column_text(5));
    auto base = decode_fields(stmt.column_text(6));
    if (payload.is_err() || base.is_err()) {
        qCWarning(larderQueueLog) << "queue entry" << entry.id << "has an undecodable payload";
        entry.checksum.clear();
        return R::ok(std::move(entry));
    }
    entry.payload = std::move(payload).unwrap();
    entry.base_fields = std::move(base).unwrap();
    return R::ok(std::move(entry));
}

Result<std::optional<SyncQueueEntry>, Error> first_row(Statement& stmt) {
    using R = Result<std::optional<SyncQueueEntry>, Error>;
    auto stepped = stmt.step();
    if (stepped.is_err()) {
        return R::err(stepped.unwrap_err());
    }
    if (!stepped.unwrap()) {
        return R::ok(std::nullopt);
    }
    auto entry = row_to_entry(stmt);
    if (entry.is_err()) {
        return R::err(entry.unwrap_err());
    }
    return R::ok(std::move(entry).unwrap());
}

} // namespace

bool verify_checksum(const SyncQueueEntry& entry) {
    return !entry.checksum.empty() &&
           crypto::checksum_matches(encode_fields(entry.payload), entry.checksum);
}

Result<int64_t, Error> QueueRepository::insert(const SyncQueueEntry& entry) {
    auto prepared = db_.prepare(R"SQL(
        INSERT INTO sync_queue (operation_id, entity_type, entity_id, operation, payload_json,
                                base_fields_json, base_version, retry_count, state, enqueued_at,
                                next_attempt_at, last_error, checksum)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (prepared.is_err()) {
        return forward_err<int64_t>(prepared);
    }
    auto stmt = std::move(prepared).unwrap();

    const auto payload = encode_fields(entry.payload);
    auto bound = stmt.bind_all(entry.operation_id.to_string(),
                               std::string(type_name(entry.entity_type)),
                               entry.entity_id,
                               std::string(operation_name(entry.operation)),
                               payload,
                               encode_fields(entry.base_fields),
                               entry.base_version,
                               entry.retry_count,
                               std::string(entry_state_name(entry.state)),
                               entry.enqueued_at.millis(),
                               entry.next_attempt_at.millis(),
                               entry.last_error,
                               crypto::checksum(payload));
    if (bound.is_err()) {
        return Result<int64_t, Error>::err(bound.unwrap_err());
    }
    auto ran = stmt.run();
    if (ran.is_err()) {
        return Result<int64_t, Error>::err(ran.unwrap_err());
    }
    return Result<int64_t, Error>::ok(db_.last_insert_rowid());
}

Status QueueRepository::update(const SyncQueueEntry& entry) {
    auto prepared = db_.prepare(R"SQL(
        UPDATE sync_queue SET
            operation_id = ?, operation = ?, payload_json = ?, base_fields_json = ?,
            base_version = ?, retry_count = ?, state = ?, next_attempt_at = ?,
            last_error = ?, checksum = ?
        WHERE id = ?;
    )SQL");
    if (prepared.is_err()) {
        return Status::err(prepared.unwrap_err());
    }
    auto stmt = std::move(prepared).unwrap();

    const auto payload = encode_fields(entry.payload);
    auto bound = stmt.bind_all(entry.operation_id.to_string(),
                               std::string(operation_name(entry.operation)),
                               payload,
                               encode_fields(entry.base_fields),
                               entry.base_version,
                               entry.retry_count,
                               std::string(entry_state_name(entry.state)),
                               entry.next_attempt_at.millis(),
                               entry.last_error,
                               crypto::checksum(payload),
                               entry.id);
    if (bound.is_err()) {
        return bound;
    }
    auto ran = stmt.run();
    if (ran.is_err()) {
        return ran;
    }
    if (db_.changes() == 0) {
        return Status::err(Error::of(ErrorKind::NotFound,
                                     "Queue entry " + std::to_string(entry.id) + " not found"));
    }
    return Status::ok();
}

Status QueueRepository::remove(int64_t id) {
    return db_.run("DELETE FROM sync_queue WHERE id = ?;", id);
}

Result<std::optional<SyncQueueEntry>, Error> QueueRepository::get(int64_t id) {
    auto prepared = db_.prepare(std::string(kSelect) + " WHERE q.id = ?;");
    if (prepared.is_err()) {
        return forward_err<std::optional<SyncQueueEntry>>(prepared);
    }
    auto stmt = std::move(prepared).unwrap();
    auto bound = stmt.bind_all(id);
    if (bound.is_err()) {
        return Result<std::optional<SyncQueueEntry>, Error>::err(bound.unwrap_err());
    }
    return first_row(stmt);
}

Result<std::optional<SyncQueueEntry>, Error> QueueRepository::next_ready(Timestamp now) {
    auto prepared = db_.prepare(std::string(kSelect) + R"SQL(
        WHERE q.state = 'pending'
          AND q.next_attempt_at <= ?
          AND NOT EXISTS (
              SELECT 1 FROM sync_queue earlier
              WHERE earlier.entity_type = q.entity_type
                AND earlier.entity_id = q.entity_id
                AND earlier.id < q.id)
        ORDER BY q.id
        LIMIT 1;
    )SQL");
    if (prepared.is_err()) {
        return forward_err<std::optional<SyncQueueEntry>>(prepared);
    }
    auto stmt = std::move(prepared).unwrap();
    auto bound = stmt.bind_all(now.millis());
    if (bound.is_err()) {
        return Result<std::optional<SyncQueueEntry>, Error>::err(bound.unwrap_err());
    }
    return first_row(stmt);
}

Result<std::vector<SyncQueueEntry>, Error> QueueRepository::for_entity(EntityType type,
                                                                       const std::string& id) {
    auto prepared = db_.prepare(std::string(kSelect) +
                                " WHERE q.entity_type = ? AND q.entity_id = ? ORDER BY q.id;");
    if (prepared.is_err()) {
        return forward_err<std::vector<SyncQueueEntry>>(prepared);
    }
    auto stmt = std::move(prepared).unwrap();
    auto bound = stmt.bind_all(std::string(type_name(type)), id);
    if (bound.is_err()) {
        return Result<std::vector<SyncQueueEntry>, Error>::err(bound.unwrap_err());
    }
    return collect_rows<SyncQueueEntry>(stmt, row_to_entry);
}

Result<std::vector<SyncQueueEntry>, Error> QueueRepository::list_all() {
    auto prepared = db_.prepare(std::string(kSelect) + " ORDER BY q.id;");
    if (prepared.is_err()) {
        return forward_err<std::vector<SyncQueueEntry>>(prepared);
    }
    auto stmt = std::move(prepared).unwrap();
    return collect_rows<SyncQueueEntry>(stmt, row_to_entry);
}

Status QueueRepository::set_state(int64_t id, EntryState state) {
    return db_.run("UPDATE sync_queue SET state = ? WHERE id = ?;",
                   std::string(entry_state_name(state)), id);
}

Result<int, Error> QueueRepository::recover_in_flight() {
    auto executed = db_.execute("UPDATE sync_queue SET state = 'pending' WHERE state = 'in_flight';");
    if (executed.is_err()) {
        return Result<int, Error>::err(executed.unwrap_err());
    }
    return Result<int, Error>::ok(db_.changes());
}

Result<int64_t, Error> QueueRepository::pending_count() {
    return db_.scalar("SELECT COUNT(*) FROM sync_queue WHERE state IN ('pending', 'in_flight');");
}

Result<int64_t, Error> QueueRepository::conflicted_count() {
    return db_.scalar("SELECT COUNT(*) FROM sync_queue WHERE state = 'conflicted';");
}

Result<std::optional<Timestamp>, Error> QueueRepository::earliest_due() {
    using R = Result<std::optional<Timestamp>, Error>;
    auto prepared = db_.prepare(
        "SELECT MIN(next_attempt_at) FROM sync_queue WHERE state = 'pending';");
    if (prepared.is_err()) {
        return R::err(prepared.unwrap_err());
    }
    auto stmt = std::move(prepared).unwrap();
    auto stepped = stmt.step();
    if (stepped.is_err()) {
        return R::err(stepped.unwrap_err());
    }
    if (!stepped.unwrap() || stmt.column_is_null(0)) {
        return R::ok(std::nullopt);
    }
    return R::ok(Timestamp(stmt.column_int64(0)));
}

Result<int64_t, Error> QueueRepository::payload_bytes() {
    return db_.scalar(
        "SELECT COALESCE(SUM(LENGTH(payload_json) + LENGTH(base_fields_json)), 0) FROM sync_queue;");
}

} // namespace larder::storage
