#pragma once

#include "core/result.hpp"
#include "core/sync_entry.hpp"
#include "sync/local_store.hpp"
#include <optional>
#include <vector>

namespace larder::sync {

/**
 * TerminalFailure - A queued mutation given up on. Carries the original
 * payload so the loss can be reported, plus any later entries for the same
 * record that had to be dropped with it.
 */
struct TerminalFailure {
    SyncQueueEntry entry;
    Error error;
    std::vector<SyncQueueEntry> dropped;
};

enum class RetryDecision {
    Rescheduled,
    Exhausted
};

/**
 * How a terminal failure treats the local record.
 *   Revert: roll the tentative write back to the last confirmed image
 *   Purge:  the backend no longer has the record; remove it locally
 */
enum class FailMode {
    Revert,
    Purge
};

/**
 * SyncQueue - State transitions of queue entries.
 *
 *   Pending -> InFlight           mark_in_flight (persisted before the send)
 *   InFlight -> removed           confirm / fail
 *   InFlight -> Pending           reschedule (retry_count + 1, backoff)
 *
 * Conflicted entries are managed by the detector and the resolver.
 */
class SyncQueue {
public:
    SyncQueue(LocalStore& store, Backoff backoff, int max_attempts)
        : store_(store), backoff_(backoff), max_attempts_(max_attempts) {}

    [[nodiscard]] Result<std::optional<SyncQueueEntry>, Error> next_ready(Timestamp now);

    [[nodiscard]] Status mark_in_flight(const SyncQueueEntry& entry);

    /**
     * Put a failed entry back with a backoff delay, or report that the
     * retry ceiling is reached (nothing is written in that case).
     */
    [[nodiscard]] Result<RetryDecision, Error> reschedule(const SyncQueueEntry& entry,
                                                          const Error& error);

    /**
     * The backend accepted the entry at `version`: remove it, advance the
     * record's confirmed state and rebase later entries for the record.
     */
    [[nodiscard]] Status confirm(const SyncQueueEntry& entry, int64_t version);

    /**
     * Drop the entry for good and undo its tentative effect on the record.
     */
    [[nodiscard]] Result<TerminalFailure, Error> fail(const SyncQueueEntry& entry, const Error& error,
                                                      FailMode mode = FailMode::Revert);

    /**
     * Return entries left InFlight by an interrupted drain to Pending.
     */
    [[nodiscard]] Result<int, Error> recover();

    [[nodiscard]] Result<std::vector<SyncQueueEntry>, Error> entries();
    [[nodiscard]] Result<int64_t, Error> pending_count();
    [[nodiscard]] Result<std::optional<Timestamp>, Error> earliest_due();

    [[nodiscard]] const Backoff& backoff() const { return backoff_; }
    [[nodiscard]] int max_attempts() const { return max_attempts_; }

private:
    LocalStore& store_;
    Backoff backoff_;
    int max_attempts_;
};

} // namespace larder::sync
