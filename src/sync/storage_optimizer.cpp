#include "sync/storage_optimizer.hpp"

#include "log/logging.hpp"
#include "storage/field_codec.hpp"
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonObject>
#include <QStorageInfo>
#include <algorithm>
#include <chrono>
#include <cmath>

namespace larder::sync {

namespace {

constexpr int EXPORT_ACTIVITY_LIMIT = 10000;

QString qstr(std::string_view text) {
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

QString iso(Timestamp ts) {
    return QString::fromStdString(ts.to_iso_string());
}

std::chrono::milliseconds days(int n) {
    return std::chrono::milliseconds{int64_t{n} * 24 * 60 * 60 * 1000};
}

std::string kib(int64_t bytes) {
    return std::to_string((bytes + 1023) / 1024) + " KiB";
}

QJsonObject record_to_json(const Record& r) {
    QJsonObject obj;
    obj[QStringLiteral("id")] = QString::fromStdString(r.id);
    obj[QStringLiteral("fields")] = storage::to_json_object(r.fields);
    obj[QStringLiteral("local_version")] = qint64(r.local_version);
    obj[QStringLiteral("remote_version")] = qint64(r.remote_version);
    obj[QStringLiteral("tombstoned")] = r.tombstoned;
    obj[QStringLiteral("sync_state")] = qstr(state_name(r.sync_state));
    obj[QStringLiteral("updated_at")] = iso(r.updated_at);
    return obj;
}

QJsonObject entry_to_json(const SyncQueueEntry& e) {
    QJsonObject obj;
    obj[QStringLiteral("id")] = qint64(e.id);
    obj[QStringLiteral("operation_id")] = QString::fromStdString(e.operation_id.to_string());
    obj[QStringLiteral("entity_type")] = qstr(type_name(e.entity_type));
    obj[QStringLiteral("entity_id")] = QString::fromStdString(e.entity_id);
    obj[QStringLiteral("operation")] = qstr(operation_name(e.operation));
    obj[QStringLiteral("payload")] = storage::to_json_object(e.payload);
    obj[QStringLiteral("base_version")] = qint64(e.base_version);
    obj[QStringLiteral("retry_count")] = e.retry_count;
    obj[QStringLiteral("state")] = qstr(entry_state_name(e.state));
    obj[QStringLiteral("enqueued_at")] = iso(e.enqueued_at);
    obj[QStringLiteral("next_attempt_at")] = iso(e.next_attempt_at);
    if (!e.last_error.empty()) {
        obj[QStringLiteral("last_error")] = QString::fromStdString(e.last_error);
    }
    return obj;
}

} // namespace

Result<StorageMetrics, Error> StorageOptimizer::update_metrics() {
    using R = Result<StorageMetrics, Error>;
    auto& db = store_.database();
    auto stats = db.page_stats();
    if (stats.is_err()) {
        return forward_err<StorageMetrics>(stats);
    }

    StorageMetrics metrics;
    metrics.used_bytes = stats.unwrap().used_bytes() + db.wal_bytes();

    QString volume_path = QDir::tempPath();
    if (!db.is_memory()) {
        volume_path = QFileInfo(QString::fromStdString(db.path())).absolutePath();
        const auto temp = QDir(QDir::tempPath()).canonicalPath();
        metrics.persistent_granted = !QDir(volume_path).canonicalPath().startsWith(temp);
    }

    if (config_.quota_bytes) {
        metrics.quota_bytes = *config_.quota_bytes;
    } else {
        const QStorageInfo volume(volume_path);
        if (volume.isValid() && volume.isReady()) {
            metrics.quota_bytes = metrics.used_bytes + volume.bytesAvailable();
        } else {
            qCWarning(larderStorageLog) << "cannot query volume" << volume_path << "for free space";
            metrics.quota_bytes = metrics.used_bytes;
        }
    }

    qCDebug(larderStorageLog) << "storage used" << metrics.used_bytes << "of" << metrics.quota_bytes
                              << "bytes," << metrics.percent_used() << "%";

    auto warned = warn_if_critical(metrics);
    if (warned.is_err()) {
        return R::err(warned.unwrap_err());
    }
    return R::ok(metrics);
}

Status StorageOptimizer::warn_if_critical(const StorageMetrics& metrics) {
    if (metrics.percent_used() < CRITICAL_USAGE_PERCENT) {
        return Status::ok();
    }
    auto unprocessed = store_.journal().notifications(true);
    if (unprocessed.is_err()) {
        return Status::err(unprocessed.unwrap_err());
    }
    for (const auto& n : unprocessed.unwrap()) {
        if (n.kind == notification_kind::StorageLow) {
            return Status::ok();
        }
    }
    qCWarning(larderStorageLog) << "storage is" << metrics.percent_used() << "% full";
    return store_.transact([&](StoreTxn& txn) {
        return txn.notify(notification_kind::StorageLow, "Storage almost full",
            "Local storage is " + std::to_string(static_cast<int>(std::round(metrics.percent_used()))) +
            "% full. Clean up old data to keep working offline.");
    });
}

Result<int64_t, Error> StorageOptimizer::cleanup_old_data(int days_old) {
    using R = Result<int64_t, Error>;
    if (days_old < 0) {
        return R::err(Error::of(ErrorKind::InvalidArgument, "days_old must not be negative"));
    }
    const Timestamp cutoff = store_.now() - days(days_old);
    return store_.database().transaction([&]() -> R {
        auto bytes = store_.journal().bytes_older_than(cutoff);
        if (bytes.is_err()) {
            return bytes;
        }
        auto rows = store_.journal().prune_older_than(cutoff);
        if (rows.is_err()) {
            return rows;
        }
        qCInfo(larderStorageLog) << "pruned" << rows.unwrap() << "journal rows older than"
                                 << days_old << "days, about" << bytes.unwrap() << "bytes";
        return R::ok(bytes.unwrap());
    });
}

Result<std::vector<std::string>, Error> StorageOptimizer::get_suggestions() {
    using R = Result<std::vector<std::string>, Error>;
    std::vector<std::string> out;

    auto metrics = update_metrics();
    if (metrics.is_err()) {
        return forward_err<std::vector<std::string>>(metrics);
    }
    const auto& m = metrics.unwrap();
    if (m.percent_used() > HIGH_USAGE_PERCENT) {
        out.push_back("Storage is " + std::to_string(static_cast<int>(std::round(m.percent_used()))) +
                      "% full, consider cleaning up old activity and notifications");
    }
    if (!m.persistent_granted) {
        out.push_back("Data is not kept on persistent storage and may be lost when the app exits");
    }

    const Timestamp now = store_.now();
    auto oldest_notification = store_.journal().oldest_notification();
    if (oldest_notification.is_err()) {
        return forward_err<std::vector<std::string>>(oldest_notification);
    }
    if (oldest_notification.unwrap() &&
        *oldest_notification.unwrap() < now - days(config_.notification_retention_days)) {
        out.push_back("Notification history exceeds " + std::to_string(config_.notification_retention_days) +
                      " days, consider cleanup");
    }
    auto oldest_activity = store_.journal().oldest_activity();
    if (oldest_activity.is_err()) {
        return forward_err<std::vector<std::string>>(oldest_activity);
    }
    if (oldest_activity.unwrap() &&
        *oldest_activity.unwrap() < now - days(config_.activity_retention_days)) {
        out.push_back("Activity log exceeds " + std::to_string(config_.activity_retention_days) +
                      " days, consider cleanup");
    }

    auto pending = store_.queue().pending_count();
    if (pending.is_err()) {
        return forward_err<std::vector<std::string>>(pending);
    }
    auto queued_bytes = store_.queue().payload_bytes();
    if (queued_bytes.is_err()) {
        return forward_err<std::vector<std::string>>(queued_bytes);
    }
    if (pending.unwrap() > LARGE_QUEUE_ENTRIES || queued_bytes.unwrap() > LARGE_QUEUE_BYTES) {
        out.push_back(std::to_string(pending.unwrap()) +
                      " changes are waiting to sync, connect to the network to upload them");
    }

    auto conflicts = store_.conflict_count();
    if (conflicts.is_err()) {
        return forward_err<std::vector<std::string>>(conflicts);
    }
    if (conflicts.unwrap() > 0) {
        out.push_back(std::to_string(conflicts.unwrap()) + " conflict(s) need a decision before they can sync");
    }

    auto stats = store_.database().page_stats();
    if (stats.is_err()) {
        return forward_err<std::vector<std::string>>(stats);
    }
    if (stats.unwrap().free_bytes() >= COMPACT_MIN_BYTES) {
        out.push_back("Compacting the database would reclaim about " + kib(stats.unwrap().free_bytes()));
    }
    return R::ok(std::move(out));
}

Result<bool, Error> StorageOptimizer::has_enough_space(int64_t required_bytes) {
    auto metrics = update_metrics();
    if (metrics.is_err()) {
        return forward_err<bool>(metrics);
    }
    return Result<bool, Error>::ok(metrics.unwrap().available_bytes() >= required_bytes);
}

Result<int64_t, Error> StorageOptimizer::compact() {
    using R = Result<int64_t, Error>;
    auto& db = store_.database();
    if (db.in_transaction()) {
        return R::err(Error::of(ErrorKind::InvalidArgument, "Cannot compact inside a transaction"));
    }
    auto before = db.page_stats();
    if (before.is_err()) {
        return forward_err<int64_t>(before);
    }
    auto vacuumed = db.execute("VACUUM;");
    if (vacuumed.is_err()) {
        return R::err(vacuumed.unwrap_err());
    }
    auto after = db.page_stats();
    if (after.is_err()) {
        return forward_err<int64_t>(after);
    }
    const int64_t reclaimed = std::max<int64_t>(0, before.unwrap().used_bytes() - after.unwrap().used_bytes());
    qCInfo(larderStorageLog) << "compacted database, reclaimed" << reclaimed << "bytes";
    return R::ok(reclaimed);
}

Result<QJsonDocument, Error> StorageOptimizer::export_data() {
    using R = Result<QJsonDocument, Error>;
    QJsonObject root;
    root[QStringLiteral("exported_at")] = iso(store_.now());

    storage::RecordRepository records(store_.database());
    for (auto type : {EntityType::Item, EntityType::Category}) {
        auto rows = records.query(type, {}, true).collect();
        if (rows.is_err()) {
            return forward_err<QJsonDocument>(rows);
        }
        QJsonArray arr;
        for (const auto& record : rows.unwrap()) {
            arr.append(record_to_json(record));
        }
        root[QString::fromStdString(std::string(storage::table_for(type)))] = arr;
    }

    auto entries = store_.queue().list_all();
    if (entries.is_err()) {
        return forward_err<QJsonDocument>(entries);
    }
    QJsonArray queue;
    for (const auto& entry : entries.unwrap()) {
        queue.append(entry_to_json(entry));
    }
    root[QStringLiteral("sync_queue")] = queue;

    auto activity = store_.journal().recent_activity(EXPORT_ACTIVITY_LIMIT);
    if (activity.is_err()) {
        return forward_err<QJsonDocument>(activity);
    }
    QJsonArray log;
    for (const auto& a : activity.unwrap()) {
        QJsonObject obj;
        obj[QStringLiteral("id")] = qint64(a.id);
        if (a.entity_type) obj[QStringLiteral("entity_type")] = qstr(type_name(*a.entity_type));
        if (a.entity_id) obj[QStringLiteral("entity_id")] = QString::fromStdString(*a.entity_id);
        obj[QStringLiteral("action")] = qstr(action_name(a.action));
        obj[QStringLiteral("description")] = QString::fromStdString(a.description);
        obj[QStringLiteral("created_at")] = iso(a.created_at);
        log.append(obj);
    }
    root[QStringLiteral("activity_log")] = log;

    auto notifications = store_.journal().notifications(false);
    if (notifications.is_err()) {
        return forward_err<QJsonDocument>(notifications);
    }
    QJsonArray notes;
    for (const auto& n : notifications.unwrap()) {
        QJsonObject obj;
        obj[QStringLiteral("id")] = qint64(n.id);
        obj[QStringLiteral("kind")] = QString::fromStdString(n.kind);
        obj[QStringLiteral("title")] = QString::fromStdString(n.title);
        obj[QStringLiteral("body")] = QString::fromStdString(n.body);
        obj[QStringLiteral("processed")] = n.processed;
        obj[QStringLiteral("created_at")] = iso(n.created_at);
        notes.append(obj);
    }
    root[QStringLiteral("notifications")] = notes;

    auto history = store_.journal().history(storage::JournalRepository::SYNC_HISTORY_LIMIT);
    if (history.is_err()) {
        return forward_err<QJsonDocument>(history);
    }
    QJsonArray cycles;
    for (const auto& h : history.unwrap()) {
        QJsonObject obj;
        obj[QStringLiteral("started_at")] = iso(h.started_at);
        obj[QStringLiteral("finished_at")] = iso(h.finished_at);
        obj[QStringLiteral("reason")] = QString::fromStdString(h.reason);
        obj[QStringLiteral("confirmed")] = h.confirmed;
        obj[QStringLiteral("conflicted")] = h.conflicted;
        obj[QStringLiteral("retried")] = h.retried;
        obj[QStringLiteral("failed")] = h.failed;
        obj[QStringLiteral("aborted")] = h.aborted;
        cycles.append(obj);
    }
    root[QStringLiteral("sync_history")] = cycles;

    return R::ok(QJsonDocument(root));
}

} // namespace larder::sync
