#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(larderStoreLog)
Q_DECLARE_LOGGING_CATEGORY(larderQueueLog)
Q_DECLARE_LOGGING_CATEGORY(larderSyncLog)
Q_DECLARE_LOGGING_CATEGORY(larderConflictLog)
Q_DECLARE_LOGGING_CATEGORY(larderStorageLog)
Q_DECLARE_LOGGING_CATEGORY(larderRemoteLog)

namespace larder::logging {

// Installs a Qt message handler that appends every message to the log file
// and mirrors it to stderr.
void install_file_logging();

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Debug output from the larder.* categories is off unless LARDER_DEBUG_SYNC
// is set or `force` is true.
void configure_categories(bool force = false);

[[nodiscard]] bool sync_debug_enabled();

} // namespace larder::logging
