#include "storage/journal_repository.hpp"

namespace larder::storage {

namespace {

ActivityEntry row_to_activity(Statement& stmt) {
    ActivityEntry entry;
    entry.id = stmt.column_int64(0);
    if (auto type = stmt.column_optional_text(1)) {
        entry.entity_type = parse_entity_type(*type);
    }
    entry.entity_id = stmt.column_optional_text(2);
    entry.action = parse_action(stmt.column_text(3)).value_or(ActivityAction::Updated);
    entry.description = stmt.column_text(4);
    entry.created_at = Timestamp(stmt.column_int64(5));
    return entry;
}

NotificationEntry row_to_notification(Statement& stmt) {
    return NotificationEntry{
        .id = stmt.column_int64(0),
        .kind = stmt.column_text(1),
        .title = stmt.column_text(2),
        .body = stmt.column_text(3),
        .processed = stmt.column_int(4) != 0,
        .created_at = Timestamp(stmt.column_int64(5)),
    };
}

SyncHistoryEntry row_to_history(Statement& stmt) {
    return SyncHistoryEntry{
        .id = stmt.column_int64(0),
        .started_at = Timestamp(stmt.column_int64(1)),
        .finished_at = Timestamp(stmt.column_int64(2)),
        .reason = stmt.column_text(3),
        .confirmed = stmt.column_int(4),
        .conflicted = stmt.column_int(5),
        .retried = stmt.column_int(6),
        .failed = stmt.column_int(7),
        .aborted = stmt.column_int(8) != 0,
    };
}

Result<std::optional<Timestamp>, Error> min_timestamp(Database& db, std::string_view sql) {
    using R = Result<std::optional<Timestamp>, Error>;
    auto prepared = db.prepare(sql);
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

} // namespace

Result<int64_t, Error> JournalRepository::append_activity(const ActivityEntry& entry) {
    std::optional<std::string> type;
    if (entry.entity_type) {
        type = std::string(type_name(*entry.entity_type));
    }
    auto ran = db_.run(R"SQL(
        INSERT INTO activity_log (entity_type, entity_id, action, description, created_at)
        VALUES (?, ?, ?, ?, ?);
    )SQL", type, entry.entity_id, std::string(action_name(entry.action)), entry.description,
           entry.created_at.millis());
    if (ran.is_err()) {
        return Result<int64_t, Error>::err(ran.unwrap_err());
    }
    return Result<int64_t, Error>::ok(db_.last_insert_rowid());
}

Result<std::vector<ActivityEntry>, Error> JournalRepository::recent_activity(int limit) {
    auto prepared = db_.prepare(R"SQL(
        SELECT id, entity_type, entity_id, action, description, created_at
        FROM activity_log ORDER BY id DESC LIMIT ?;
    )SQL");
    if (prepared.is_err()) {
        return forward_err<std::vector<ActivityEntry>>(prepared);
    }
    auto stmt = std::move(prepared).unwrap();
    auto bound = stmt.bind_all(limit);
    if (bound.is_err()) {
        return Result<std::vector<ActivityEntry>, Error>::err(bound.unwrap_err());
    }
    return collect_rows<ActivityEntry>(stmt, row_to_activity);
}

Result<int64_t, Error> JournalRepository::activity_count() {
    return db_.scalar("SELECT COUNT(*) FROM activity_log;");
}

Result<int64_t, Error> JournalRepository::add_notification(const NotificationEntry& entry) {
    auto ran = db_.run(R"SQL(
        INSERT INTO notifications (kind, title, body, processed, created_at)
        VALUES (?, ?, ?, ?, ?);
    )SQL", entry.kind, entry.title, entry.body, entry.processed, entry.created_at.millis());
    if (ran.is_err()) {
        return Result<int64_t, Error>::err(ran.unwrap_err());
    }
    return Result<int64_t, Error>::ok(db_.last_insert_rowid());
}

Result<std::vector<NotificationEntry>, Error> JournalRepository::notifications(bool unprocessed_only) {
    std::string sql = "SELECT id, kind, title, body, processed, created_at FROM notifications";
    if (unprocessed_only) {
        sql += " WHERE processed = 0";
    }
    sql += " ORDER BY id;";
    auto prepared = db_.prepare(sql);
    if (prepared.is_err()) {
        return forward_err<std::vector<NotificationEntry>>(prepared);
    }
    auto stmt = std::move(prepared).unwrap();
    return collect_rows<NotificationEntry>(stmt, row_to_notification);
}

Status JournalRepository::mark_processed(int64_t id) {
    return db_.run("UPDATE notifications SET processed = 1 WHERE id = ?;", id);
}

Result<int64_t, Error> JournalRepository::notification_count() {
    return db_.scalar("SELECT COUNT(*) FROM notifications;");
}

Status JournalRepository::append_history(const SyncHistoryEntry& e) {
    return db_.transaction([&]() -> Status {
        auto ran = db_.run(R"SQL(
            INSERT INTO sync_history (started_at, finished_at, reason, confirmed, conflicted,
                                      retried, failed, aborted)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?);
        )SQL", e.started_at.millis(), e.finished_at.millis(), e.reason, e.confirmed,
               e.conflicted, e.retried, e.failed, e.aborted);
        if (ran.is_err()) {
            return ran;
        }
        return db_.run(R"SQL(
            DELETE FROM sync_history WHERE id NOT IN (
                SELECT id FROM sync_history ORDER BY id DESC LIMIT ?);
        )SQL", SYNC_HISTORY_LIMIT);
    });
}

Result<std::vector<SyncHistoryEntry>, Error> JournalRepository::history(int limit) {
    auto prepared = db_.prepare(R"SQL(
        SELECT id, started_at, finished_at, reason, confirmed, conflicted, retried, failed, aborted
        FROM sync_history ORDER BY id DESC LIMIT ?;
    )SQL");
    if (prepared.is_err()) {
        return forward_err<std::vector<SyncHistoryEntry>>(prepared);
    }
    auto stmt = std::move(prepared).unwrap();
    auto bound = stmt.bind_all(limit);
    if (bound.is_err()) {
        return Result<std::vector<SyncHistoryEntry>, Error>::err(bound.unwrap_err());
    }
    return collect_rows<SyncHistoryEntry>(stmt, row_to_history);
}

Result<int64_t, Error> JournalRepository::bytes_older_than(Timestamp cutoff) {
    auto prepared = db_.prepare(R"SQL(
        SELECT
            (SELECT COALESCE(SUM(LENGTH(action) + LENGTH(description)
                                 + COALESCE(LENGTH(entity_id), 0) + 32), 0)
             FROM activity_log WHERE created_at < ?1)
          + (SELECT COALESCE(SUM(LENGTH(kind) + LENGTH(title) + LENGTH(body) + 32), 0)
             FROM notifications WHERE created_at < ?1);
    )SQL");
    if (prepared.is_err()) {
        return forward_err<int64_t>(prepared);
    }
    auto stmt = std::move(prepared).unwrap();
    auto bound = stmt.bind_all(cutoff.millis());
    if (bound.is_err()) {
        return Result<int64_t, Error>::err(bound.unwrap_err());
    }
    auto stepped = stmt.step();
    if (stepped.is_err()) {
        return forward_err<int64_t>(stepped);
    }
    return Result<int64_t, Error>::ok(stepped.unwrap() ? stmt.column_int64(0) : 0);
}

Result<int64_t, Error> JournalRepository::prune_older_than(Timestamp cutoff) {
    int64_t removed = 0;
    auto pruned = db_.transaction([&]() -> Status {
        auto activity = db_.run("DELETE FROM activity_log WHERE created_at < ?;", cutoff.millis());
        if (activity.is_err()) {
            return activity;
        }
        removed += db_.changes();
        auto notifications = db_.run("DELETE FROM notifications WHERE created_at < ?;",
                                     cutoff.millis());
        if (notifications.is_err()) {
            return notifications;
        }
        removed += db_.changes();
        return Status::ok();
    });
    if (pruned.is_err()) {
        return Result<int64_t, Error>::err(pruned.unwrap_err());
    }
    return Result<int64_t, Error>::ok(removed);
}

Result<std::optional<Timestamp>, Error> JournalRepository::oldest_notification() {
    return min_timestamp(db_, "SELECT MIN(created_at) FROM notifications;");
}

Result<std::optional<Timestamp>, Error> JournalRepository::oldest_activity() {
    return min_timestamp(db_, "SELECT MIN(created_at) FROM activity_log;");
}

} // namespace larder::storage
