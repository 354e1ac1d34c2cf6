#pragma once

#include <QString>
#include <QStringList>

#include "core/result.hpp"
#include "storage/conflict_repository.hpp"
#include "sync/engine.hpp"
#include "sync/storage_optimizer.hpp"
#include "sync/sync_manager.hpp"

namespace larder::cli {

struct CliOptions {
    bool json = false;
    QString mergeValue;   // JSON literal for `resolve <id> merge`
};

// Runs one command ("status", "sync", "conflicts", "resolve", "auto-resolve",
// "cleanup", "suggestions", "history", "export") and returns its output.
[[nodiscard]] Result<QString> run_command(sync::Engine& engine,
                                          const QStringList& args,
                                          const CliOptions& options);

// Formatters are pure so they can be tested without an engine.
[[nodiscard]] QString format_drain_report(const sync::DrainReport& report, bool json);
[[nodiscard]] QString format_conflicts(const std::vector<Conflict>& conflicts,
                                       const sync::ConflictResolver& resolver,
                                       bool json);
[[nodiscard]] QString format_resolution_report(const sync::ResolutionReport& report, bool json);
[[nodiscard]] QString format_history(const std::vector<SyncHistoryEntry>& history, bool json);
[[nodiscard]] QString format_lines(const std::vector<std::string>& lines, const QString& key, bool json);

} // namespace larder::cli
