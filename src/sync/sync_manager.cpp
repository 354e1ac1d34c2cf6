#include "sync/sync_manager.hpp"

#include "log/logging.hpp"
#include <QElapsedTimer>
#include <QScopeGuard>
#include <QTimer>
#include <algorithm>

namespace larder::sync {

namespace {

QString qstr(std::string_view text) {
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

network::MutationRequest request_for(const SyncQueueEntry& entry) {
    return network::MutationRequest{
        .operation_id = entry.operation_id,
        .entity_type = entry.entity_type,
        .entity_id = entry.entity_id,
        .operation = entry.operation,
        .payload = entry.payload,
        .base_version = entry.base_version,
    };
}

} // namespace

SyncManager::SyncManager(LocalStore& store,
                         network::RemoteApi& remote,
                         ConflictDetector& detector,
                         ConflictResolver& resolver,
                         const config::EngineConfig& config,
                         QObject* parent)
    : QObject(parent)
    , store_(store)
    , remote_(remote)
    , detector_(detector)
    , resolver_(resolver)
    , config_(config)
    , queue_(store, config.backoff(), config.max_attempts)
    , lease_(store.database(), Uuid::generate(), config.lease_ttl)
    , periodic_timer_(std::make_unique<QTimer>(this))
    , backoff_timer_(std::make_unique<QTimer>(this))
{
    qRegisterMetaType<larder::sync::SyncStatus>();
    qRegisterMetaType<larder::sync::TerminalFailure>();
    qRegisterMetaType<larder::SyncHistoryEntry>();

    periodic_timer_->setInterval(static_cast<int>(config_.periodic_interval.count()));
    backoff_timer_->setSingleShot(true);
    connect(periodic_timer_.get(), &QTimer::timeout, this, &SyncManager::onPeriodicTimeout);
    connect(backoff_timer_.get(), &QTimer::timeout, this, &SyncManager::onBackoffTimeout);
}

SyncManager::~SyncManager() {
    stop();
}

void SyncManager::start() {
    periodic_timer_->start();
    arm_backoff_timer();
}

void SyncManager::stop() {
    periodic_timer_->stop();
    backoff_timer_->stop();
    request_abort();
}

void SyncManager::request_abort() {
    if (draining_) {
        qCInfo(larderSyncLog) << "abort requested; stopping before the next entry";
        abort_requested_ = true;
    }
}

void SyncManager::onPeriodicTimeout() {
    wake_from_timer(WakeReason::PeriodicTimer);
}

void SyncManager::onBackoffTimeout() {
    wake_from_timer(WakeReason::BackoffElapsed);
}

void SyncManager::wake_from_timer(WakeReason reason) {
    auto result = on_wake(reason);
    if (result.is_err()) {
        qCWarning(larderSyncLog) << "drain after" << qstr(wake_reason_name(reason)) << "failed:"
                                 << QString::fromStdString(result.unwrap_err().message);
        set_status(SyncStatus::Error, QString::fromStdString(result.unwrap_err().message));
    }
}

Result<DrainReport, Error> SyncManager::on_wake(WakeReason reason) {
    if (draining_) {
        qCDebug(larderSyncLog) << "wake" << qstr(wake_reason_name(reason))
                               << "coalesced into the running drain";
        return Result<DrainReport, Error>::ok(DrainReport{});
    }

    draining_ = true;
    abort_requested_ = false;
    rebased_.clear();
    emit syncingChanged();
    auto reset = qScopeGuard([this] {
        draining_ = false;
        abort_requested_ = false;
        emit syncingChanged();
    });

    auto acquired = lease_.try_acquire(store_.now());
    if (acquired.is_err()) {
        return forward_err<DrainReport>(acquired);
    }
    if (!acquired.unwrap()) {
        qCInfo(larderSyncLog) << "another process holds the drain lease; wake"
                              << qstr(wake_reason_name(reason)) << "coalesced";
        return Result<DrainReport, Error>::ok(DrainReport{});
    }

    auto report = drain(reason);

    auto released = lease_.release();
    if (released.is_err()) {
        qCWarning(larderSyncLog) << "could not release drain lease:"
                                 << QString::fromStdString(released.unwrap_err().message);
    }
    if (report.is_err()) {
        return report;
    }
    if (!report.unwrap().history.aborted) {
        arm_backoff_timer();
    }
    return report;
}

Result<DrainReport, Error> SyncManager::drain(WakeReason reason) {
    using R = Result<DrainReport, Error>;
    DrainReport report;
    report.ran = true;
    report.history.started_at = store_.now();
    report.history.reason = std::string(wake_reason_name(reason));

    set_status(SyncStatus::Syncing, QStringLiteral("Syncing"));

    auto recovered = queue_.recover();
    if (recovered.is_err()) {
        return forward_err<DrainReport>(recovered);
    }
    report.recovered = recovered.unwrap();
    if (report.recovered > 0) {
        qCInfo(larderSyncLog) << "resending" << report.recovered << "entries left in flight";
    }

    bool offline = false;
    while (true) {
        if (abort_requested_) {
            report.history.aborted = true;
            break;
        }
        auto renewed = lease_.renew(store_.now());
        if (renewed.is_err()) {
            return forward_err<DrainReport>(renewed);
        }
        if (!renewed.unwrap()) {
            qCWarning(larderSyncLog) << "drain lease lost; stopping";
            report.history.aborted = true;
            break;
        }

        auto next = queue_.next_ready(store_.now());
        if (next.is_err()) {
            return forward_err<DrainReport>(next);
        }
        if (!next.unwrap()) {
            break;
        }

        auto outcome = process(*next.unwrap(), report, offline);
        if (outcome.is_err()) {
            return forward_err<DrainReport>(outcome);
        }
        switch (outcome.unwrap()) {
            case EntryOutcome::Confirmed: report.history.confirmed++; break;
            case EntryOutcome::Conflicted: report.history.conflicted++; break;
            case EntryOutcome::Retried: report.history.retried++; break;
            case EntryOutcome::Failed: report.history.failed++; break;
            case EntryOutcome::Resend: break;
        }
    }

    if (!report.history.aborted && !offline && config_.pull_remote) {
        auto pulled = pull();
        if (pulled.is_err()) {
            if (!pulled.unwrap_err().retryable()) {
                return forward_err<DrainReport>(pulled);
            }
            offline = pulled.unwrap_err().kind == ErrorKind::NetworkError;
            qCInfo(larderSyncLog) << "pull skipped:" << QString::fromStdString(pulled.unwrap_err().message);
        } else {
            report.pulled = pulled.unwrap();
        }
    }

    report.history.finished_at = store_.now();
    auto saved = store_.journal().append_history(report.history);
    if (saved.is_err()) {
        return forward_err<DrainReport>(saved);
    }
    if (!offline) {
        metrics_.last_sync = report.history.finished_at;
    }

    qCInfo(larderSyncLog) << "drain" << qstr(report.history.reason) << "done:"
                          << report.history.confirmed << "confirmed"
                          << report.history.conflicted << "conflicted"
                          << report.history.retried << "retried"
                          << report.history.failed << "failed"
                          << (report.history.aborted ? "(aborted)" : "");

    if (offline) {
        set_status(SyncStatus::Offline, QStringLiteral("Backend unreachable"));
    } else if (report.history.failed > 0) {
        set_status(SyncStatus::Error,
                   QStringLiteral("%1 change(s) could not be synced").arg(report.history.failed));
    } else {
        set_status(SyncStatus::Synced, QStringLiteral("Up to date"));
    }

    if (!report.conflicts.empty()) {
        emit conflictsDetected(static_cast<int>(report.conflicts.size()));
    }
    emit drainFinished(report.history);
    return R::ok(std::move(report));
}

Result<SyncManager::EntryOutcome, Error> SyncManager::process(const SyncQueueEntry& entry,
                                                              DrainReport& report, bool& offline) {
    using R = Result<EntryOutcome, Error>;

    if (!storage::verify_checksum(entry)) {
        return fail(entry, Error::of(ErrorKind::Corrupted,
                                     "Queued payload of entry " + std::to_string(entry.id) +
                                     " failed its checksum"),
                    report);
    }

    auto marked = queue_.mark_in_flight(entry);
    if (marked.is_err()) {
        return R::err(marked.unwrap_err());
    }

    qCDebug(larderQueueLog) << "sending entry" << entry.id << qstr(operation_name(entry.operation))
                            << qstr(type_name(entry.entity_type))
                            << QString::fromStdString(entry.entity_id)
                            << "base" << entry.base_version;

    QElapsedTimer timer;
    timer.start();
    auto sent = remote_.send(request_for(entry));
    record_latency(static_cast<double>(timer.elapsed()));

    if (sent.is_ok()) {
        metrics_.successes++;
        auto confirmed = queue_.confirm(entry, sent.unwrap());
        if (confirmed.is_err()) {
            return R::err(confirmed.unwrap_err());
        }
        return R::ok(EntryOutcome::Confirmed);
    }

    const Error& error = sent.unwrap_err();
    if (error.kind == ErrorKind::VersionConflict) {
        return handle_version_conflict(entry, report, offline);
    }
    metrics_.failures++;
    if (error.kind == ErrorKind::NetworkError) {
        offline = true;
    }
    if (error.retryable()) {
        return retry_or_fail(entry, error, report);
    }
    return fail(entry, error, report);
}

Result<SyncManager::EntryOutcome, Error> SyncManager::handle_version_conflict(const SyncQueueEntry& entry,
                                                                              DrainReport& report,
                                                                              bool& offline) {
    using R = Result<EntryOutcome, Error>;

    auto detected = detector_.detect(entry);
    if (detected.is_err()) {
        const Error& error = detected.unwrap_err();
        if (error.kind == ErrorKind::NetworkError) {
            offline = true;
        }
        if (error.retryable()) {
            return retry_or_fail(entry, error, report);
        }
        return R::err(error);
    }

    auto& detection = detected.unwrap();
    switch (detection.outcome) {
        case Detection::Outcome::Converged: {
            metrics_.successes++;
            auto confirmed = queue_.confirm(entry, detection.remote_version);
            if (confirmed.is_err()) {
                return R::err(confirmed.unwrap_err());
            }
            return R::ok(EntryOutcome::Confirmed);
        }
        case Detection::Outcome::Rebased: {
            if (std::find(rebased_.begin(), rebased_.end(), entry.id) != rebased_.end()) {
                return retry_or_fail(entry, Error::of(ErrorKind::ServerRejection,
                                                      "Deletion kept conflicting with remote edits"),
                                     report);
            }
            rebased_.push_back(entry.id);
            return R::ok(EntryOutcome::Resend);
        }
        case Detection::Outcome::RemoteGone:
            return fail(entry, Error::of(ErrorKind::TerminalSyncFailure,
                                         std::string(type_name(entry.entity_type)) + " " + entry.entity_id +
                                         " was deleted on the server"),
                        report, FailMode::Purge);
        case Detection::Outcome::Conflicted:
            break;
    }

    report.conflicts.insert(report.conflicts.end(), detection.conflicts.begin(), detection.conflicts.end());
    if (config_.auto_resolve) {
        auto resolved = resolver_.auto_resolve(*config_.auto_resolve, detection.conflicts);
        if (resolved.is_err()) {
            return R::err(resolved.unwrap_err());
        }
    }
    return R::ok(EntryOutcome::Conflicted);
}

Result<SyncManager::EntryOutcome, Error> SyncManager::retry_or_fail(const SyncQueueEntry& entry,
                                                                    const Error& error,
                                                                    DrainReport& report) {
    using R = Result<EntryOutcome, Error>;
    auto decision = queue_.reschedule(entry, error);
    if (decision.is_err()) {
        return R::err(decision.unwrap_err());
    }
    if (decision.unwrap() == RetryDecision::Rescheduled) {
        return R::ok(EntryOutcome::Retried);
    }
    return fail(entry, Error::of(ErrorKind::TerminalSyncFailure,
                                 "Gave up after " + std::to_string(queue_.max_attempts()) +
                                 " attempts: " + error.message, error.code),
                report);
}

Result<SyncManager::EntryOutcome, Error> SyncManager::fail(const SyncQueueEntry& entry, const Error& error,
                                                           DrainReport& report, FailMode mode) {
    using R = Result<EntryOutcome, Error>;
    auto failed = queue_.fail(entry, error, mode);
    if (failed.is_err()) {
        return R::err(failed.unwrap_err());
    }
    report.failures.push_back(failed.unwrap());
    emit terminalFailure(report.failures.back());
    return R::ok(EntryOutcome::Failed);
}

Result<int, Error> SyncManager::pull() {
    int applied = 0;
    for (auto type : {EntityType::Category, EntityType::Item}) {
        auto listed = remote_.list(type);
        if (listed.is_err()) {
            return forward_err<int>(listed);
        }
        for (const auto& record : listed.unwrap()) {
            auto ingested = store_.apply_remote(record);
            if (ingested.is_err()) {
                return forward_err<int>(ingested);
            }
            if (ingested.unwrap()) {
                applied++;
            }
        }
    }
    if (applied > 0) {
        qCInfo(larderSyncLog) << "pulled" << applied << "remote change(s)";
    }
    return Result<int, Error>::ok(applied);
}

void SyncManager::record_latency(double millis) {
    metrics_.total_operations++;
    const auto n = static_cast<double>(metrics_.total_operations);
    metrics_.average_latency_ms += (millis - metrics_.average_latency_ms) / n;
}

void SyncManager::arm_backoff_timer() {
    auto due = queue_.earliest_due();
    if (due.is_err()) {
        qCWarning(larderQueueLog) << "could not read queue schedule:"
                                  << QString::fromStdString(due.unwrap_err().message);
        return;
    }
    if (!due.unwrap()) {
        backoff_timer_->stop();
        return;
    }
    const auto wait = std::max<int64_t>(0, (*due.unwrap() - store_.now()).count());
    backoff_timer_->start(static_cast<int>(std::min<int64_t>(wait, config_.max_delay.count())));
}

void SyncManager::set_status(SyncStatus status, const QString& message) {
    status_ = status;
    const auto pending = store_.pending_count();
    const auto conflicts = store_.conflict_count();
    emit statusChanged(status, message,
                       pending.is_ok() ? static_cast<int>(pending.unwrap()) : 0,
                       conflicts.is_ok() ? static_cast<int>(conflicts.unwrap()) : 0);
}

} // namespace larder::sync
