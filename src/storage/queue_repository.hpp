#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include "core/sync_entry.hpp"
#include <optional>
#include <vector>

namespace larder::storage {

/**
 * QueueRepository - Data access for the durable sync queue.
 *
 * The payload checksum is computed here on every write, so callers never
 * set SyncQueueEntry::checksum themselves.
 */
class QueueRepository {
public:
    explicit QueueRepository(Database& db) : db_(db) {}

    /**
     * Append an entry; returns its queue position (id).
     */
    [[nodiscard]] Result<int64_t, Error> insert(const SyncQueueEntry& entry);

    /**
     * Overwrite every mutable column of an existing entry.
     */
    [[nodiscard]] Status update(const SyncQueueEntry& entry);

    [[nodiscard]] Status remove(int64_t id);

    [[nodiscard]] Result<std::optional<SyncQueueEntry>, Error> get(int64_t id);

    /**
     * Oldest Pending entry that is due and has no earlier entry (in any
     * state) for the same entity.
     */
    [[nodiscard]] Result<std::optional<SyncQueueEntry>, Error> next_ready(Timestamp now);

    [[nodiscard]] Result<std::vector<SyncQueueEntry>, Error> for_entity(EntityType type,
                                                                        const std::string& id);
    [[nodiscard]] Result<std::vector<SyncQueueEntry>, Error> list_all();

    [[nodiscard]] Status set_state(int64_t id, EntryState state);

    /**
     * Return InFlight entries (left over by a crash) to Pending without
     * touching their retry count. Returns the number recovered.
     */
    [[nodiscard]] Result<int, Error> recover_in_flight();

    /**
     * Entries that still await propagation (Pending or InFlight).
     */
    [[nodiscard]] Result<int64_t, Error> pending_count();
    [[nodiscard]] Result<int64_t, Error> conflicted_count();

    [[nodiscard]] Result<std::optional<Timestamp>, Error> earliest_due();

    /**
     * Payload bytes currently queued (used by the storage optimizer).
     */
    [[nodiscard]] Result<int64_t, Error> payload_bytes();

private:
    Database& db_;
};

/**
 * True when the entry's payload still matches the checksum taken when it
 * was queued.
 */
[[nodiscard]] bool verify_checksum(const SyncQueueEntry& entry);

} // namespace larder::storage
