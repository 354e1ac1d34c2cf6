#include "config/engine_config.hpp"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <algorithm>

namespace larder::config {

namespace {

constexpr const char* kBaseDelay = "sync/base_delay_ms";
constexpr const char* kMaxDelay = "sync/max_delay_ms";
constexpr const char* kMaxAttempts = "sync/max_attempts";
constexpr const char* kRequestTimeout = "sync/request_timeout_ms";
constexpr const char* kPeriodicInterval = "sync/periodic_interval_ms";
constexpr const char* kLeaseTtl = "sync/lease_ttl_ms";
constexpr const char* kAutoResolve = "sync/auto_resolve";
constexpr const char* kPullRemote = "sync/pull_remote";
constexpr const char* kRemoteUrl = "sync/remote_url";
constexpr const char* kDatabasePath = "storage/database_path";
constexpr const char* kQuotaBytes = "storage/quota_bytes";
constexpr const char* kNotificationRetention = "storage/notification_retention_days";
constexpr const char* kActivityRetention = "storage/activity_retention_days";

std::chrono::milliseconds read_millis(QSettings& settings, const char* key,
                                      std::chrono::milliseconds fallback,
                                      int64_t min_ms, int64_t max_ms) {
    bool ok = false;
    const auto raw = settings.value(QString::fromLatin1(key), qint64(fallback.count())).toLongLong(&ok);
    if (!ok) return fallback;
    return std::chrono::milliseconds{std::clamp<int64_t>(raw, min_ms, max_ms)};
}

int read_int(QSettings& settings, const char* key, int fallback, int min_v, int max_v) {
    bool ok = false;
    const auto raw = settings.value(QString::fromLatin1(key), fallback).toInt(&ok);
    if (!ok) return fallback;
    return std::clamp(raw, min_v, max_v);
}

} // namespace

EngineConfig load_config(QSettings& settings) {
    EngineConfig config;
    config.base_delay = read_millis(settings, kBaseDelay, config.base_delay, 10, 600'000);
    config.max_delay = read_millis(settings, kMaxDelay, config.max_delay,
                                   config.base_delay.count(), 86'400'000);
    config.max_attempts = read_int(settings, kMaxAttempts, config.max_attempts, 1, 100);
    config.request_timeout = read_millis(settings, kRequestTimeout, config.request_timeout, 100, 600'000);
    config.periodic_interval = read_millis(settings, kPeriodicInterval, config.periodic_interval,
                                           1000, 86'400'000);
    config.lease_ttl = read_millis(settings, kLeaseTtl, config.lease_ttl,
                                   config.request_timeout.count(), 3'600'000);

    const auto auto_name = settings.value(QString::fromLatin1(kAutoResolve)).toString().trimmed();
    if (!auto_name.isEmpty()) {
        config.auto_resolve = parse_auto_strategy(auto_name.toStdString());
        if (!config.auto_resolve && auto_name != QLatin1String("none")) {
            qWarning() << "Ignoring unknown sync/auto_resolve value" << auto_name;
        }
    }
    config.pull_remote = settings.value(QString::fromLatin1(kPullRemote), config.pull_remote).toBool();

    bool quota_ok = false;
    const auto quota = settings.value(QString::fromLatin1(kQuotaBytes)).toLongLong(&quota_ok);
    if (quota_ok && quota > 0) {
        config.quota_bytes = quota;
    }
    config.notification_retention_days = read_int(settings, kNotificationRetention,
                                                  config.notification_retention_days, 1, 3650);
    config.activity_retention_days = read_int(settings, kActivityRetention,
                                              config.activity_retention_days, 1, 3650);

    config.remote_url = settings.value(QString::fromLatin1(kRemoteUrl)).toString();
    const auto remote_override = qEnvironmentVariable("LARDER_REMOTE_URL");
    if (!remote_override.isEmpty()) {
        config.remote_url = remote_override;
    }

    config.database_path = settings.value(QString::fromLatin1(kDatabasePath)).toString();
    if (config.database_path.isEmpty() || qEnvironmentVariableIsSet("LARDER_DB_PATH")) {
        config.database_path = resolve_database_path();
    }
    return config;
}

EngineConfig load_default_config() {
    QSettings settings;
    return load_config(settings);
}

void save_config(QSettings& settings, const EngineConfig& config) {
    settings.setValue(QString::fromLatin1(kBaseDelay), qint64(config.base_delay.count()));
    settings.setValue(QString::fromLatin1(kMaxDelay), qint64(config.max_delay.count()));
    settings.setValue(QString::fromLatin1(kMaxAttempts), config.max_attempts);
    settings.setValue(QString::fromLatin1(kRequestTimeout), qint64(config.request_timeout.count()));
    settings.setValue(QString::fromLatin1(kPeriodicInterval), qint64(config.periodic_interval.count()));
    settings.setValue(QString::fromLatin1(kLeaseTtl), qint64(config.lease_ttl.count()));
    settings.setValue(QString::fromLatin1(kPullRemote), config.pull_remote);
    if (config.auto_resolve) {
        settings.setValue(QString::fromLatin1(kAutoResolve),
                          QString::fromLatin1(auto_strategy_name(*config.auto_resolve).data()));
    } else {
        settings.remove(QString::fromLatin1(kAutoResolve));
    }
    if (config.quota_bytes) {
        settings.setValue(QString::fromLatin1(kQuotaBytes), qint64(*config.quota_bytes));
    } else {
        settings.remove(QString::fromLatin1(kQuotaBytes));
    }
    settings.setValue(QString::fromLatin1(kNotificationRetention), config.notification_retention_days);
    settings.setValue(QString::fromLatin1(kActivityRetention), config.activity_retention_days);
    settings.setValue(QString::fromLatin1(kRemoteUrl), config.remote_url);
    settings.setValue(QString::fromLatin1(kDatabasePath), config.database_path);
}

QString resolve_database_path() {
    const auto override_path = qEnvironmentVariable("LARDER_DB_PATH");
    if (!override_path.isEmpty()) {
        QFileInfo info(override_path);
        QDir().mkpath(info.absolutePath());
        return info.absoluteFilePath();
    }

    const auto data_path = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(data_path);
    return QDir(data_path).filePath(QStringLiteral("larder.db"));
}

} // namespace larder::config
