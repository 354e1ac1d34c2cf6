#include "sync/conflict_resolver.hpp"

#include "core/merge_policy.hpp"
#include "log/logging.hpp"
#include "storage/field_codec.hpp"
#include <QJsonArray>
#include <QJsonObject>

namespace larder::sync {

namespace {

QString qstr(std::string_view text) {
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

QJsonObject conflict_to_json(const Conflict& c) {
    QJsonObject obj;
    obj[QStringLiteral("id")] = QString::fromStdString(c.id.to_string());
    obj[QStringLiteral("entity_type")] = qstr(type_name(c.entity_type));
    obj[QStringLiteral("entity_id")] = QString::fromStdString(c.entity_id);
    obj[QStringLiteral("queue_entry_id")] = qint64(c.queue_entry_id);
    obj[QStringLiteral("field")] = QString::fromStdString(c.field);
    obj[QStringLiteral("local_value")] = storage::to_json(c.local_value);
    obj[QStringLiteral("remote_value")] = storage::to_json(c.remote_value);
    if (c.base_value) {
        obj[QStringLiteral("base_value")] = storage::to_json(*c.base_value);
    }
    obj[QStringLiteral("local_timestamp")] = QString::fromStdString(c.local_timestamp.to_iso_string());
    obj[QStringLiteral("remote_timestamp")] = QString::fromStdString(c.remote_timestamp.to_iso_string());
    obj[QStringLiteral("remote_version")] = qint64(c.remote_version);
    obj[QStringLiteral("detected_at")] = QString::fromStdString(c.conflict_detected_at.to_iso_string());
    return obj;
}

QJsonObject resolved_to_json(const storage::ResolvedConflict& r) {
    QJsonObject obj;
    obj[QStringLiteral("conflict_id")] = QString::fromStdString(r.conflict_id.to_string());
    obj[QStringLiteral("entity_type")] = qstr(type_name(r.entity_type));
    obj[QStringLiteral("entity_id")] = QString::fromStdString(r.entity_id);
    obj[QStringLiteral("field")] = QString::fromStdString(r.field);
    obj[QStringLiteral("strategy")] = qstr(strategy_name(r.strategy));
    obj[QStringLiteral("value")] = storage::to_json(r.value);
    obj[QStringLiteral("resolved_by")] = r.resolved_by == ResolvedBy::Auto ? QStringLiteral("auto")
                                                                           : QStringLiteral("user");
    obj[QStringLiteral("resolved_at")] = QString::fromStdString(r.resolved_at.to_iso_string());
    return obj;
}

} // namespace

Result<std::vector<Conflict>, Error> ConflictResolver::list_pending() {
    return store_.conflicts().list_pending();
}

ResolutionStrategy ConflictResolver::suggest_resolution(const Conflict& conflict) const {
    return larder::suggest_resolution(conflict);
}

FieldValue ConflictResolver::suggest_merge(const Conflict& conflict) const {
    return larder::suggest_merge(conflict);
}

Result<ResolutionReport, Error> ConflictResolver::apply(const std::vector<ConflictResolution>& resolutions) {
    ResolutionReport report;
    for (const auto& resolution : resolutions) {
        auto one = apply_one(resolution);
        if (one.is_err()) {
            qCWarning(larderConflictLog) << "resolution of"
                                         << QString::fromStdString(resolution.conflict_id.to_string())
                                         << "failed:" << QString::fromStdString(one.unwrap_err().message);
            return one;
        }
        report += one.unwrap();
    }
    return Result<ResolutionReport, Error>::ok(report);
}

Result<ResolutionReport, Error> ConflictResolver::auto_resolve(AutoStrategy strategy) {
    auto pending = list_pending();
    if (pending.is_err()) {
        return forward_err<ResolutionReport>(pending);
    }
    return auto_resolve(strategy, pending.unwrap());
}

Result<ResolutionReport, Error> ConflictResolver::auto_resolve(AutoStrategy strategy,
                                                               const std::vector<Conflict>& conflicts) {
    std::vector<ConflictResolution> resolutions;
    resolutions.reserve(conflicts.size());
    for (const auto& conflict : conflicts) {
        resolutions.push_back(auto_resolution(conflict, strategy));
    }
    qCInfo(larderConflictLog) << "auto-resolving" << resolutions.size() << "conflict(s) with"
                              << qstr(auto_strategy_name(strategy));
    return apply(resolutions);
}

Result<ResolutionReport, Error> ConflictResolver::apply_one(const ConflictResolution& resolution) {
    using R = Result<ResolutionReport, Error>;
    return store_.transact([&](StoreTxn& txn) -> R {
        ResolutionReport report;

        auto stored = txn.conflicts().get(resolution.conflict_id);
        if (stored.is_err()) {
            return forward_err<ResolutionReport>(stored);
        }
        if (!stored.unwrap()) {
            report.skipped = 1;
            return R::ok(report);
        }
        const Conflict conflict = *stored.unwrap();

        auto held = txn.queue().get(conflict.queue_entry_id);
        if (held.is_err()) {
            return forward_err<ResolutionReport>(held);
        }
        auto found = txn.find(conflict.entity_type, conflict.entity_id);
        if (found.is_err()) {
            return forward_err<ResolutionReport>(found);
        }

        if (!held.unwrap() || !found.unwrap() || found.unwrap()->tombstoned) {
            auto removed = txn.conflicts().remove(conflict.id);
            if (removed.is_err()) {
                return R::err(removed.unwrap_err());
            }
            qCInfo(larderConflictLog) << "discarding resolution for deleted"
                                      << qstr(type_name(conflict.entity_type))
                                      << QString::fromStdString(conflict.entity_id);
            report.discarded = 1;
            return R::ok(report);
        }

        FieldValue value = resolution.strategy == ResolutionStrategy::Merge
            ? resolution.resolved_value
            : resolved_value_for(conflict, resolution.strategy);
        auto valid = validate_fields(conflict.entity_type, Fields{{conflict.field, value}}, true);
        if (valid.is_err()) {
            return R::err(valid.unwrap_err());
        }

        SyncQueueEntry entry = *held.unwrap();
        Record record = *found.unwrap();

        if (resolution.strategy == ResolutionStrategy::KeepRemote) {
            entry.payload.erase(conflict.field);
            entry.base_fields.erase(conflict.field);
        } else {
            entry.payload[conflict.field] = value;
            entry.base_fields[conflict.field] = conflict.remote_value;
        }
        record.fields[conflict.field] = value;
        Fields confirmed = record.prior_fields.value_or(Fields{});
        confirmed[conflict.field] = conflict.remote_value;
        record.prior_fields = std::move(confirmed);
        record.remote_version = std::max(record.remote_version, conflict.remote_version);
        record.local_version = std::max(record.local_version, record.remote_version + 1);
        record.updated_at = txn.now();

        entry.base_version = conflict.remote_version;
        if (entry.operation == Operation::Create) {
            entry.operation = Operation::Update;
        }

        auto removed = txn.conflicts().remove(conflict.id);
        if (removed.is_err()) {
            return R::err(removed.unwrap_err());
        }
        auto recorded = txn.conflicts().record_resolution(storage::ResolvedConflict{
            .conflict_id = conflict.id,
            .entity_type = conflict.entity_type,
            .entity_id = conflict.entity_id,
            .field = conflict.field,
            .strategy = resolution.strategy,
            .value = value,
            .resolved_by = resolution.resolved_by,
            .resolved_at = txn.now(),
        });
        if (recorded.is_err()) {
            return R::err(recorded.unwrap_err());
        }

        auto remaining = txn.conflicts().for_entry(entry.id);
        if (remaining.is_err()) {
            return forward_err<ResolutionReport>(remaining);
        }
        if (!remaining.unwrap().empty()) {
            auto updated = txn.queue().update(entry);
            if (updated.is_err()) {
                return R::err(updated.unwrap_err());
            }
        } else if (entry.payload.empty()) {
            // Everything went the remote's way: nothing left to send.
            auto dropped = txn.queue().remove(entry.id);
            if (dropped.is_err()) {
                return R::err(dropped.unwrap_err());
            }
            auto later = txn.queue().for_entity(entry.entity_type, entry.entity_id);
            if (later.is_err()) {
                return forward_err<ResolutionReport>(later);
            }
            if (later.unwrap().empty()) {
                record.fields = record.confirmed_image();
                record.local_version = record.remote_version;
                record.sync_state = SyncState::Confirmed;
                record.prior_fields.reset();
            }
            for (auto next : later.unwrap()) {
                next.base_version = record.remote_version;
                if (next.operation == Operation::Create) {
                    next.operation = Operation::Update;
                }
                next.base_fields = project(record.confirmed_image(), keys_of(next.payload));
                auto rebased = txn.queue().update(next);
                if (rebased.is_err()) {
                    return R::err(rebased.unwrap_err());
                }
            }
        } else {
            // The payload changed, so it is a new operation as far as the
            // backend's idempotency key is concerned.
            entry.operation_id = Uuid::generate();
            entry.state = EntryState::Pending;
            entry.retry_count = 0;
            entry.next_attempt_at = txn.now();
            entry.last_error.clear();
            auto updated = txn.queue().update(entry);
            if (updated.is_err()) {
                return R::err(updated.unwrap_err());
            }
            report.requeued = 1;
        }

        auto saved = txn.save(record, ChangeCause::Resolution);
        if (saved.is_err()) {
            return R::err(saved.unwrap_err());
        }

        const auto name = as_text(field_or_null(record.fields, field::Name)).value_or(record.id);
        auto logged = txn.log(ActivityAction::ConflictResolved, record.type, record.id,
            std::string(type_name(record.type)) + " '" + name + "' " + conflict.field + " resolved with " +
            std::string(strategy_name(resolution.strategy)) + ": " + display(value));
        if (logged.is_err()) {
            return R::err(logged.unwrap_err());
        }

        report.applied = 1;
        return R::ok(report);
    });
}

Result<std::vector<storage::ResolvedConflict>, Error> ConflictResolver::history(int limit) {
    return store_.conflicts().history(limit);
}

Result<QJsonDocument, Error> ConflictResolver::export_conflicts(int history_limit) {
    auto pending = list_pending();
    if (pending.is_err()) {
        return forward_err<QJsonDocument>(pending);
    }
    auto resolved = history(history_limit);
    if (resolved.is_err()) {
        return forward_err<QJsonDocument>(resolved);
    }

    QJsonArray pending_json;
    for (const auto& conflict : pending.unwrap()) {
        QJsonObject obj = conflict_to_json(conflict);
        obj[QStringLiteral("suggested_strategy")] = qstr(strategy_name(suggest_resolution(conflict)));
        obj[QStringLiteral("suggested_merge")] = storage::to_json(suggest_merge(conflict));
        pending_json.append(obj);
    }
    QJsonArray history_json;
    for (const auto& row : resolved.unwrap()) {
        history_json.append(resolved_to_json(row));
    }

    QJsonObject root;
    root[QStringLiteral("pending")] = pending_json;
    root[QStringLiteral("history")] = history_json;
    return Result<QJsonDocument, Error>::ok(QJsonDocument(root));
}

} // namespace larder::sync
