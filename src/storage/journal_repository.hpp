#pragma once

#include "storage/database.hpp"
#include "core/journal.hpp"
#include "core/result.hpp"
#include <vector>

namespace larder::storage {

/**
 * JournalRepository - Activity log, notification queue and sync history.
 * None of these ever gate synchronisation, so all of them may be pruned.
 */
class JournalRepository {
public:
    static constexpr int SYNC_HISTORY_LIMIT = 200;

    explicit JournalRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<int64_t, Error> append_activity(const ActivityEntry& entry);
    [[nodiscard]] Result<std::vector<ActivityEntry>, Error> recent_activity(int limit);
    [[nodiscard]] Result<int64_t, Error> activity_count();

    [[nodiscard]] Result<int64_t, Error> add_notification(const NotificationEntry& entry);
    [[nodiscard]] Result<std::vector<NotificationEntry>, Error> notifications(bool unprocessed_only);
    [[nodiscard]] Status mark_processed(int64_t id);
    [[nodiscard]] Result<int64_t, Error> notification_count();

    /**
     * Append a drain outcome and keep only the newest SYNC_HISTORY_LIMIT rows.
     */
    [[nodiscard]] Status append_history(const SyncHistoryEntry& entry);
    [[nodiscard]] Result<std::vector<SyncHistoryEntry>, Error> history(int limit);

    /**
     * Approximate payload bytes held by activity and notification rows
     * created before `cutoff`.
     */
    [[nodiscard]] Result<int64_t, Error> bytes_older_than(Timestamp cutoff);

    /**
     * Delete activity and notification rows created before `cutoff`.
     * Returns the number of rows removed.
     */
    [[nodiscard]] Result<int64_t, Error> prune_older_than(Timestamp cutoff);

    [[nodiscard]] Result<std::optional<Timestamp>, Error> oldest_notification();
    [[nodiscard]] Result<std::optional<Timestamp>, Error> oldest_activity();

private:
    Database& db_;
};

} // namespace larder::storage
