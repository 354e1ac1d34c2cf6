#include "sync/sync_queue.hpp"

#include "log/logging.hpp"
#include <set>

namespace larder::sync {

namespace {

std::set<std::string> keys_touched_by(const std::vector<SyncQueueEntry>& entries) {
    std::set<std::string> keys;
    for (const auto& entry : entries) {
        for (const auto& [name, value] : entry.payload) {
            keys.insert(name);
        }
    }
    return keys;
}

} // namespace

Result<std::optional<SyncQueueEntry>, Error> SyncQueue::next_ready(Timestamp now) {
    return store_.queue().next_ready(now);
}

Status SyncQueue::mark_in_flight(const SyncQueueEntry& entry) {
    return store_.queue().set_state(entry.id, EntryState::InFlight);
}

Result<RetryDecision, Error> SyncQueue::reschedule(const SyncQueueEntry& entry, const Error& error) {
    using R = Result<RetryDecision, Error>;
    const int failures = entry.retry_count + 1;
    if (failures >= max_attempts_) {
        return R::ok(RetryDecision::Exhausted);
    }

    SyncQueueEntry next = entry;
    next.retry_count = failures;
    next.state = EntryState::Pending;
    next.next_attempt_at = store_.now() + backoff_.delay_for(failures);
    next.last_error = error.message;
    auto updated = store_.queue().update(next);
    if (updated.is_err()) {
        return R::err(updated.unwrap_err());
    }
    qCInfo(larderQueueLog) << "entry" << entry.id << "retry" << failures << "in"
                           << backoff_.delay_for(failures).count() << "ms:"
                           << QString::fromStdString(error.message);
    return R::ok(RetryDecision::Rescheduled);
}

Status SyncQueue::confirm(const SyncQueueEntry& entry, int64_t version) {
    return store_.transact([&](StoreTxn& txn) -> Status {
        auto removed = txn.queue().remove(entry.id);
        if (removed.is_err()) {
            return removed;
        }
        auto remaining = txn.queue().for_entity(entry.entity_type, entry.entity_id);
        if (remaining.is_err()) {
            return Status::err(remaining.unwrap_err());
        }
        auto found = txn.find(entry.entity_type, entry.entity_id);
        if (found.is_err()) {
            return Status::err(found.unwrap_err());
        }
        if (!found.unwrap()) {
            return Status::ok();
        }

        const auto& later = remaining.unwrap();
        if (entry.operation == Operation::Delete && later.empty()) {
            return txn.purge(entry.entity_type, entry.entity_id);
        }

        const Record record = with_confirmation(*found.unwrap(), entry.payload, version,
                                                !later.empty(), txn.now());
        auto saved = txn.save(record, ChangeCause::Confirmed);
        if (saved.is_err()) {
            return saved;
        }

        // Later entries were written on top of this one; their base is now
        // the version just confirmed.
        for (auto next : later) {
            next.base_version = record.remote_version;
            if (next.operation == Operation::Create) {
                next.operation = Operation::Update;
            }
            next.base_fields = project(record.confirmed_image(), keys_of(next.payload));
            auto updated = txn.queue().update(next);
            if (updated.is_err()) {
                return updated;
            }
        }
        return Status::ok();
    });
}

Result<TerminalFailure, Error> SyncQueue::fail(const SyncQueueEntry& entry, const Error& error,
                                               FailMode mode) {
    using R = Result<TerminalFailure, Error>;
    return store_.transact([&](StoreTxn& txn) -> R {
        TerminalFailure failure{.entry = entry, .error = error, .dropped = {}};

        auto removed = txn.queue().remove(entry.id);
        if (removed.is_err()) {
            return R::err(removed.unwrap_err());
        }
        auto remaining = txn.queue().for_entity(entry.entity_type, entry.entity_id);
        if (remaining.is_err()) {
            return forward_err<TerminalFailure>(remaining);
        }
        auto found = txn.find(entry.entity_type, entry.entity_id);
        if (found.is_err()) {
            return forward_err<TerminalFailure>(found);
        }

        std::string name = entry.entity_id;
        if (found.unwrap()) {
            Record record = *found.unwrap();
            name = as_text(field_or_null(record.fields, field::Name)).value_or(entry.entity_id);

            const bool never_created = entry.operation == Operation::Create && record.remote_version == 0;
            if (mode == FailMode::Purge || never_created) {
                for (const auto& later : remaining.unwrap()) {
                    auto dropped = txn.queue().remove(later.id);
                    if (dropped.is_err()) {
                        return R::err(dropped.unwrap_err());
                    }
                    failure.dropped.push_back(later);
                }
                auto purged = txn.purge(entry.entity_type, entry.entity_id);
                if (purged.is_err()) {
                    return R::err(purged.unwrap_err());
                }
            } else {
                const auto& later = remaining.unwrap();
                const auto still_pending = keys_touched_by(later);
                const Fields confirmed = record.confirmed_image();
                for (const auto& [key, value] : entry.payload) {
                    if (still_pending.count(key)) continue;
                    if (auto it = confirmed.find(key); it != confirmed.end()) {
                        record.fields[key] = it->second;
                    } else {
                        record.fields.erase(key);
                    }
                }
                if (entry.operation == Operation::Delete) {
                    record.tombstoned = false;
                }
                if (later.empty()) {
                    record.fields = confirmed;
                    record.local_version = record.remote_version;
                    record.sync_state = SyncState::Confirmed;
                    record.prior_fields.reset();
                }
                record.updated_at = txn.now();
                auto saved = txn.save(record, ChangeCause::Reverted);
                if (saved.is_err()) {
                    return R::err(saved.unwrap_err());
                }
            }
        }

        const auto summary = std::string("Could not sync ") + std::string(operation_name(entry.operation)) +
                             " of " + std::string(type_name(entry.entity_type)) + " '" + name + "'";
        auto logged = txn.log(ActivityAction::SyncFailed, entry.entity_type, entry.entity_id,
                              summary + ": " + error.message);
        if (logged.is_err()) {
            return R::err(logged.unwrap_err());
        }
        auto notified = txn.notify(notification_kind::SyncFailed, summary, error.message);
        if (notified.is_err()) {
            return R::err(notified.unwrap_err());
        }

        qCWarning(larderQueueLog) << "entry" << entry.id << "failed terminally:"
                                  << QString::fromStdString(error.message)
                                  << "dropped" << failure.dropped.size() << "later entries";
        return R::ok(std::move(failure));
    });
}

Result<int, Error> SyncQueue::recover() {
    return store_.queue().recover_in_flight();
}

Result<std::vector<SyncQueueEntry>, Error> SyncQueue::entries() {
    return store_.queue().list_all();
}

Result<int64_t, Error> SyncQueue::pending_count() {
    return store_.queue().pending_count();
}

Result<std::optional<Timestamp>, Error> SyncQueue::earliest_due() {
    return store_.queue().earliest_due();
}

} // namespace larder::sync
