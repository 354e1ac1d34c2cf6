#include "sync/conflict_detector.hpp"

#include "log/logging.hpp"
#include <algorithm>
#include <set>

namespace larder::sync {

Result<Detection, Error> ConflictDetector::detect(const SyncQueueEntry& entry) {
    using R = Result<Detection, Error>;
    auto fetched = remote_.fetch(entry.entity_type, entry.entity_id);
    if (fetched.is_err()) {
        return forward_err<Detection>(fetched);
    }
    const auto& remote = fetched.unwrap();

    if (!remote) {
        if (entry.operation == Operation::Delete) {
            // Already gone: the deletion has the effect it wanted.
            return R::ok(Detection{.outcome = Detection::Outcome::Converged,
                                   .conflicts = {},
                                   .remote_version = entry.base_version});
        }
        return R::ok(Detection{.outcome = Detection::Outcome::RemoteGone,
                               .conflicts = {},
                               .remote_version = 0});
    }

    if (entry.operation == Operation::Delete) {
        return rebase_delete(entry, *remote);
    }
    return compare(entry, *remote);
}

Result<Detection, Error> ConflictDetector::rebase_delete(const SyncQueueEntry& entry,
                                                         const network::RemoteRecord& remote) {
    using R = Result<Detection, Error>;
    return store_.transact([&](StoreTxn& txn) -> R {
        SyncQueueEntry next = entry;
        next.base_version = remote.version;
        next.state = EntryState::Pending;
        next.next_attempt_at = txn.now();
        auto updated = txn.queue().update(next);
        if (updated.is_err()) {
            return R::err(updated.unwrap_err());
        }

        auto found = txn.find(entry.entity_type, entry.entity_id);
        if (found.is_err()) {
            return forward_err<Detection>(found);
        }
        if (found.unwrap()) {
            Record record = *found.unwrap();
            record.remote_version = std::max(record.remote_version, remote.version);
            record.local_version = std::max(record.local_version, record.remote_version + 1);
            record.prior_fields = remote.fields;
            auto saved = txn.save(record, ChangeCause::RemoteApply);
            if (saved.is_err()) {
                return R::err(saved.unwrap_err());
            }
        }

        qCInfo(larderConflictLog) << "delete of" << QString::fromStdString(entry.entity_id)
                                  << "rebased onto remote version" << remote.version;
        return R::ok(Detection{.outcome = Detection::Outcome::Rebased,
                               .conflicts = {},
                               .remote_version = remote.version});
    });
}

Result<Detection, Error> ConflictDetector::compare(const SyncQueueEntry& entry,
                                                   const network::RemoteRecord& remote) {
    using R = Result<Detection, Error>;
    return store_.transact([&](StoreTxn& txn) -> R {
        auto found = txn.find(entry.entity_type, entry.entity_id);
        if (found.is_err()) {
            return forward_err<Detection>(found);
        }
        auto entries = txn.queue().for_entity(entry.entity_type, entry.entity_id);
        if (entries.is_err()) {
            return forward_err<Detection>(entries);
        }

        Conflict proto;
        proto.entity_type = entry.entity_type;
        proto.entity_id = entry.entity_id;
        proto.queue_entry_id = entry.id;
        proto.local_timestamp = entry.enqueued_at;
        proto.remote_timestamp = remote.updated_at;
        proto.remote_version = remote.version;
        proto.conflict_detected_at = txn.now();
        auto conflicts = diverging_fields(proto, entry.payload, entry.base_fields, remote.fields);

        // Fields nobody has pending work on follow the remote.
        if (found.unwrap()) {
            std::set<std::string> pending_keys;
            for (const auto& queued : entries.unwrap()) {
                for (const auto& [name, value] : queued.payload) {
                    pending_keys.insert(name);
                }
            }
            Record record = *found.unwrap();
            for (const auto& [name, value] : remote.fields) {
                if (!pending_keys.count(name)) {
                    record.fields[name] = value;
                }
            }
            record.prior_fields = remote.fields;
            record.remote_version = std::max(record.remote_version, remote.version);
            record.local_version = std::max(record.local_version, record.remote_version + 1);
            record.sync_state = SyncState::Unconfirmed;
            record.updated_at = txn.now();
            auto saved = txn.save(record, ChangeCause::RemoteApply);
            if (saved.is_err()) {
                return R::err(saved.unwrap_err());
            }
        }

        if (conflicts.empty()) {
            qCInfo(larderConflictLog) << "entry" << entry.id << "converged with remote version"
                                      << remote.version;
            return R::ok(Detection{.outcome = Detection::Outcome::Converged,
                                   .conflicts = {},
                                   .remote_version = remote.version});
        }

        std::vector<std::string> diverging;
        for (const auto& conflict : conflicts) {
            diverging.push_back(conflict.field);
        }
        SyncQueueEntry held = entry;
        held.payload = project(entry.payload, diverging);
        held.base_fields = project(entry.base_fields, diverging);
        held.state = EntryState::Conflicted;
        held.last_error = "version conflict";
        auto updated = txn.queue().update(held);
        if (updated.is_err()) {
            return R::err(updated.unwrap_err());
        }
        for (const auto& conflict : conflicts) {
            auto inserted = txn.conflicts().insert(conflict);
            if (inserted.is_err()) {
                return R::err(inserted.unwrap_err());
            }
        }

        qCInfo(larderConflictLog) << "entry" << entry.id << "held with" << conflicts.size()
                                  << "conflicting field(s) against remote version" << remote.version;
        return R::ok(Detection{.outcome = Detection::Outcome::Conflicted,
                               .conflicts = std::move(conflicts),
                               .remote_version = remote.version});
    });
}

} // namespace larder::sync
