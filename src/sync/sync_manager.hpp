#pragma once

#include "config/engine_config.hpp"
#include "core/journal.hpp"
#include "core/result.hpp"
#include "network/remote_api.hpp"
#include "storage/drain_lease.hpp"
#include "sync/conflict_detector.hpp"
#include "sync/conflict_resolver.hpp"
#include "sync/local_store.hpp"
#include "sync/sync_queue.hpp"
#include <QObject>
#include <QString>
#include <memory>
#include <optional>
#include <vector>

class QTimer;

namespace larder::sync {

enum class WakeReason {
    ConnectivityRestored,
    PeriodicTimer,
    SyncNow,
    BackoffElapsed
};

[[nodiscard]] constexpr std::string_view wake_reason_name(WakeReason reason) {
    switch (reason) {
        case WakeReason::ConnectivityRestored: return "connectivity_restored";
        case WakeReason::PeriodicTimer: return "periodic_timer";
        case WakeReason::SyncNow: return "sync_now";
        case WakeReason::BackoffElapsed: return "backoff_elapsed";
    }
    return "unknown";
}

/**
 * SyncStatus - What a status indicator shows.
 */
enum class SyncStatus {
    Idle,
    Syncing,
    Synced,
    Offline,
    Error
};

[[nodiscard]] constexpr std::string_view status_name(SyncStatus status) {
    switch (status) {
        case SyncStatus::Idle: return "idle";
        case SyncStatus::Syncing: return "syncing";
        case SyncStatus::Synced: return "synced";
        case SyncStatus::Offline: return "offline";
        case SyncStatus::Error: return "error";
    }
    return "unknown";
}

/**
 * SyncMetrics - Counters over the lifetime of the manager.
 */
struct SyncMetrics {
    int64_t total_operations{0};
    int64_t successes{0};
    int64_t failures{0};
    double average_latency_ms{0.0};
    std::optional<Timestamp> last_sync;
};

/**
 * DrainReport - Result of one wake. `ran` is false when the wake was
 * coalesced into a drain already running here or in another process.
 */
struct DrainReport {
    bool ran{false};
    SyncHistoryEntry history;
    std::vector<Conflict> conflicts;
    std::vector<TerminalFailure> failures;
    int recovered{0};
    int pulled{0};
};

/**
 * SyncManager - Drains the sync queue against the backend.
 *
 * One drain runs at a time: re-entrant wakes (the HTTP backend spins a
 * local event loop while waiting) are coalesced by an in-memory flag, and
 * other processes sharing the database are kept out by a DrainLease.
 * Each entry is persisted InFlight before it is sent, so a crash leads to
 * a resend with the same operation id rather than a lost write.
 */
class SyncManager : public QObject {
    Q_OBJECT

    Q_PROPERTY(bool syncing READ isSyncing NOTIFY syncingChanged)

public:
    SyncManager(LocalStore& store,
                network::RemoteApi& remote,
                ConflictDetector& detector,
                ConflictResolver& resolver,
                const config::EngineConfig& config,
                QObject* parent = nullptr);
    ~SyncManager() override;

    /**
     * The single integration point for connectivity and scheduling
     * facilities. Runs one drain cycle unless one is already running.
     */
    [[nodiscard]] Result<DrainReport, Error> on_wake(WakeReason reason);

    /**
     * Ask the running drain to stop before its next entry. Entries not
     * reached stay Pending.
     */
    void request_abort();

    /**
     * Start the periodic timer and the backoff timer.
     */
    void start();
    void stop();

    [[nodiscard]] bool isSyncing() const { return draining_; }
    [[nodiscard]] SyncStatus status() const { return status_; }
    [[nodiscard]] const SyncMetrics& metrics() const { return metrics_; }
    [[nodiscard]] SyncQueue& queue() { return queue_; }

signals:
    void syncingChanged();
    void statusChanged(larder::sync::SyncStatus status, const QString& message,
                       int pending, int conflicts);
    void conflictsDetected(int count);
    void terminalFailure(const larder::sync::TerminalFailure& failure);
    void drainFinished(const larder::SyncHistoryEntry& entry);

private slots:
    void onPeriodicTimeout();
    void onBackoffTimeout();

private:
    enum class EntryOutcome {
        Confirmed,
        Conflicted,
        Retried,
        Resend,
        Failed
    };

    [[nodiscard]] Result<DrainReport, Error> drain(WakeReason reason);
    [[nodiscard]] Result<EntryOutcome, Error> process(const SyncQueueEntry& entry, DrainReport& report,
                                                      bool& offline);
    [[nodiscard]] Result<EntryOutcome, Error> handle_version_conflict(const SyncQueueEntry& entry,
                                                                      DrainReport& report,
                                                                      bool& offline);
    [[nodiscard]] Result<EntryOutcome, Error> retry_or_fail(const SyncQueueEntry& entry,
                                                            const Error& error,
                                                            DrainReport& report);
    [[nodiscard]] Result<EntryOutcome, Error> fail(const SyncQueueEntry& entry, const Error& error,
                                                   DrainReport& report,
                                                   FailMode mode = FailMode::Revert);
    [[nodiscard]] Result<int, Error> pull();

    void record_latency(double millis);
    void arm_backoff_timer();
    void wake_from_timer(WakeReason reason);
    void set_status(SyncStatus status, const QString& message);

    LocalStore& store_;
    network::RemoteApi& remote_;
    ConflictDetector& detector_;
    ConflictResolver& resolver_;
    config::EngineConfig config_;
    SyncQueue queue_;
    storage::DrainLease lease_;

    std::unique_ptr<QTimer> periodic_timer_;
    std::unique_ptr<QTimer> backoff_timer_;

    bool draining_ = false;
    bool abort_requested_ = false;
    SyncStatus status_ = SyncStatus::Idle;
    SyncMetrics metrics_;

    // Deletions rebased in the current drain; a second rebase waits for backoff.
    std::vector<int64_t> rebased_;
};

} // namespace larder::sync

Q_DECLARE_METATYPE(larder::sync::SyncStatus)
Q_DECLARE_METATYPE(larder::sync::TerminalFailure)
Q_DECLARE_METATYPE(larder::SyncHistoryEntry)
