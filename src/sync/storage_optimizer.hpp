#pragma once

#include "config/engine_config.hpp"
#include "core/result.hpp"
#include "sync/local_store.hpp"
#include <QJsonDocument>
#include <string>
#include <vector>

namespace larder::sync {

/**
 * StorageMetrics - Recomputed on demand, never persisted.
 */
struct StorageMetrics {
    int64_t used_bytes{0};
    int64_t quota_bytes{0};
    bool persistent_granted{false};

    [[nodiscard]] double percent_used() const {
        if (quota_bytes <= 0) return 0.0;
        return 100.0 * static_cast<double>(used_bytes) / static_cast<double>(quota_bytes);
    }

    [[nodiscard]] int64_t available_bytes() const {
        return quota_bytes > used_bytes ? quota_bytes - used_bytes : 0;
    }
};

/**
 * StorageOptimizer - Keeps the local database from growing without bound.
 *
 * Only the activity log and notifications are ever pruned; records and
 * queue entries stay regardless of age.
 */
class StorageOptimizer {
public:
    static constexpr double HIGH_USAGE_PERCENT = 80.0;
    static constexpr double CRITICAL_USAGE_PERCENT = 90.0;
    static constexpr int64_t LARGE_QUEUE_ENTRIES = 500;
    static constexpr int64_t LARGE_QUEUE_BYTES = 1024 * 1024;
    static constexpr int64_t COMPACT_MIN_BYTES = 1024 * 1024;

    StorageOptimizer(LocalStore& store, const config::EngineConfig& config)
        : store_(store), config_(config) {}

    /**
     * Current usage and quota. Crossing CRITICAL_USAGE_PERCENT queues a
     * storage_low notification (once until it is processed).
     */
    [[nodiscard]] Result<StorageMetrics, Error> update_metrics();

    /**
     * Delete activity and notification rows older than `days_old` days.
     * Returns the approximate number of bytes freed.
     */
    [[nodiscard]] Result<int64_t, Error> cleanup_old_data(int days_old);

    [[nodiscard]] Result<std::vector<std::string>, Error> get_suggestions();

    [[nodiscard]] Result<bool, Error> has_enough_space(int64_t required_bytes);

    /**
     * VACUUM the database; returns the bytes reclaimed.
     */
    [[nodiscard]] Result<int64_t, Error> compact();

    /**
     * JSON snapshot of every collection.
     */
    [[nodiscard]] Result<QJsonDocument, Error> export_data();

private:
    [[nodiscard]] Status warn_if_critical(const StorageMetrics& metrics);

    LocalStore& store_;
    config::EngineConfig config_;
};

} // namespace larder::sync
