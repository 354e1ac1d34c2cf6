#pragma once

#include "core/conflict.hpp"
#include "core/sync_entry.hpp"
#include <QString>
#include <chrono>
#include <cstdint>
#include <optional>

class QSettings;

namespace larder::config {

/**
 * EngineConfig - Tunables of the sync engine.
 *
 * Loaded from QSettings keys under `sync/` and `storage/`; LARDER_DB_PATH and
 * LARDER_REMOTE_URL override the paths.
 */
struct EngineConfig {
    QString database_path;
    QString remote_url;

    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{60000};
    int max_attempts{3};
    std::chrono::milliseconds request_timeout{15000};
    std::chrono::milliseconds periodic_interval{30000};
    std::chrono::milliseconds lease_ttl{120000};
    std::optional<AutoStrategy> auto_resolve;
    bool pull_remote{true};

    std::optional<int64_t> quota_bytes;
    int notification_retention_days{30};
    int activity_retention_days{90};

    [[nodiscard]] Backoff backoff() const {
        return Backoff{.base = base_delay, .cap = max_delay};
    }
};

/**
 * Read the configuration. Out-of-range values are clamped to sane bounds.
 */
[[nodiscard]] EngineConfig load_config(QSettings& settings);

/**
 * Same as load_config() on the application's default QSettings.
 */
[[nodiscard]] EngineConfig load_default_config();

void save_config(QSettings& settings, const EngineConfig& config);

/**
 * Default database location: LARDER_DB_PATH, else <AppDataLocation>/larder.db.
 * Creates the parent directory.
 */
[[nodiscard]] QString resolve_database_path();

} // namespace larder::config
