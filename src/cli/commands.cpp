#include "cli/commands.hpp"

#include "storage/field_codec.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace larder::cli {

namespace {

constexpr int HISTORY_ROWS = 20;

[[nodiscard]] QString qstr(std::string_view text) {
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

[[nodiscard]] QString to_text(const QJsonObject& obj) {
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Indented));
}

[[nodiscard]] Result<QString> usage_error(const QString& message) {
    return Result<QString>::err(Error::of(ErrorKind::InvalidArgument, message.toStdString()));
}

[[nodiscard]] QJsonObject history_to_json(const SyncHistoryEntry& h) {
    QJsonObject obj;
    obj[QStringLiteral("startedAt")] = QString::fromStdString(h.started_at.to_iso_string());
    obj[QStringLiteral("finishedAt")] = QString::fromStdString(h.finished_at.to_iso_string());
    obj[QStringLiteral("reason")] = QString::fromStdString(h.reason);
    obj[QStringLiteral("confirmed")] = h.confirmed;
    obj[QStringLiteral("conflicted")] = h.conflicted;
    obj[QStringLiteral("retried")] = h.retried;
    obj[QStringLiteral("failed")] = h.failed;
    obj[QStringLiteral("aborted")] = h.aborted;
    return obj;
}

[[nodiscard]] QString history_line(const SyncHistoryEntry& h) {
    return QStringLiteral("%1 %2: %3 confirmed, %4 conflicted, %5 retried, %6 failed%7")
        .arg(QString::fromStdString(h.started_at.to_iso_string()),
             QString::fromStdString(h.reason))
        .arg(h.confirmed)
        .arg(h.conflicted)
        .arg(h.retried)
        .arg(h.failed)
        .arg(h.aborted ? QStringLiteral(" (aborted)") : QString{});
}

[[nodiscard]] Result<QString> run_status(sync::Engine& engine, const CliOptions& options) {
    auto pending = engine.pending_count();
    if (pending.is_err()) return forward_err<QString>(pending);
    auto conflicts = engine.conflict_count();
    if (conflicts.is_err()) return forward_err<QString>(conflicts);
    auto items = engine.store().count(EntityType::Item);
    if (items.is_err()) return forward_err<QString>(items);
    auto categories = engine.store().count(EntityType::Category);
    if (categories.is_err()) return forward_err<QString>(categories);
    auto metrics = engine.optimizer().update_metrics();
    if (metrics.is_err()) return forward_err<QString>(metrics);
    auto last = engine.store().journal().history(1);
    if (last.is_err()) return forward_err<QString>(last);

    const auto& m = metrics.unwrap();
    if (options.json) {
        QJsonObject obj;
        obj[QStringLiteral("items")] = qint64(items.unwrap());
        obj[QStringLiteral("categories")] = qint64(categories.unwrap());
        obj[QStringLiteral("pending")] = qint64(pending.unwrap());
        obj[QStringLiteral("conflicts")] = qint64(conflicts.unwrap());
        obj[QStringLiteral("usedBytes")] = qint64(m.used_bytes);
        obj[QStringLiteral("quotaBytes")] = qint64(m.quota_bytes);
        obj[QStringLiteral("persistent")] = m.persistent_granted;
        if (!last.unwrap().empty()) {
            obj[QStringLiteral("lastSync")] = history_to_json(last.unwrap().front());
        }
        return Result<QString>::ok(to_text(obj));
    }

    QStringList out;
    out << QStringLiteral("Items: %1, categories: %2").arg(items.unwrap()).arg(categories.unwrap());
    out << QStringLiteral("Pending changes: %1").arg(pending.unwrap());
    out << QStringLiteral("Conflicts requiring attention: %1").arg(conflicts.unwrap());
    out << QStringLiteral("Storage: %1 of %2 bytes (%3%)")
               .arg(m.used_bytes)
               .arg(m.quota_bytes)
               .arg(m.percent_used(), 0, 'f', 1);
    if (!last.unwrap().empty()) {
        out << QStringLiteral("Last sync: ") + history_line(last.unwrap().front());
    }
    return Result<QString>::ok(out.join(QLatin1Char('\n')) + QLatin1Char('\n'));
}

[[nodiscard]] Result<QString> run_resolve(sync::Engine& engine, const QStringList& args,
                                          const CliOptions& options) {
    if (args.size() < 3) {
        return usage_error(QStringLiteral("usage: resolve <conflict-id> <keep-local|keep-remote|merge>"));
    }
    const auto id = Uuid::parse(args.at(1).toStdString());
    if (!id) {
        return usage_error(QStringLiteral("not a conflict id: ") + args.at(1));
    }
    const auto strategy = parse_strategy(args.at(2).toStdString());
    if (!strategy) {
        return usage_error(QStringLiteral("unknown strategy: ") + args.at(2));
    }

    ConflictResolution resolution{.conflict_id = *id, .strategy = *strategy, .resolved_value = {},
                                  .resolved_by = ResolvedBy::User};
    if (*strategy == ResolutionStrategy::Merge) {
        if (!options.mergeValue.isEmpty()) {
            auto value = storage::decode_value(
                (QStringLiteral("[") + options.mergeValue + QStringLiteral("]")).toStdString());
            if (value.is_err()) {
                return usage_error(QStringLiteral("--value is not valid JSON: ") + options.mergeValue);
            }
            resolution.resolved_value = value.unwrap();
        } else {
            auto stored = engine.store().conflicts().get(*id);
            if (stored.is_err()) return forward_err<QString>(stored);
            if (stored.unwrap()) {
                resolution.resolved_value = engine.suggest_merge(*stored.unwrap());
            }
        }
    }

    auto report = engine.apply_resolutions({resolution});
    if (report.is_err()) return forward_err<QString>(report);
    return Result<QString>::ok(format_resolution_report(report.unwrap(), options.json));
}

} // namespace

QString format_drain_report(const sync::DrainReport& report, bool json) {
    if (json) {
        QJsonObject obj;
        obj[QStringLiteral("ran")] = report.ran;
        if (report.ran) {
            obj[QStringLiteral("cycle")] = history_to_json(report.history);
            obj[QStringLiteral("recovered")] = report.recovered;
            obj[QStringLiteral("pulled")] = report.pulled;
        }
        QJsonArray failures;
        for (const auto& f : report.failures) {
            QJsonObject fo;
            fo[QStringLiteral("entityType")] = qstr(type_name(f.entry.entity_type));
            fo[QStringLiteral("entityId")] = QString::fromStdString(f.entry.entity_id);
            fo[QStringLiteral("operation")] = qstr(operation_name(f.entry.operation));
            fo[QStringLiteral("payload")] = storage::to_json_object(f.entry.payload);
            fo[QStringLiteral("error")] = QString::fromStdString(f.error.message);
            failures.append(fo);
        }
        obj[QStringLiteral("failures")] = failures;
        return to_text(obj);
    }

    if (!report.ran) {
        return QStringLiteral("A sync is already running; nothing to do.\n");
    }
    QStringList out;
    out << history_line(report.history);
    if (report.pulled > 0) {
        out << QStringLiteral("Pulled %1 remote change(s)").arg(report.pulled);
    }
    for (const auto& f : report.failures) {
        out << QStringLiteral("FAILED %1 %2 %3: %4")
                   .arg(qstr(operation_name(f.entry.operation)),
                        qstr(type_name(f.entry.entity_type)),
                        QString::fromStdString(f.entry.entity_id),
                        QString::fromStdString(f.error.message));
    }
    if (!report.conflicts.empty()) {
        out << QStringLiteral("%1 conflict(s) need attention; run 'larder conflicts'")
                   .arg(report.conflicts.size());
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_conflicts(const std::vector<Conflict>& conflicts,
                         const sync::ConflictResolver& resolver,
                         bool json) {
    if (json) {
        QJsonArray arr;
        for (const auto& c : conflicts) {
            QJsonObject obj;
            obj[QStringLiteral("id")] = QString::fromStdString(c.id.to_string());
            obj[QStringLiteral("entityType")] = qstr(type_name(c.entity_type));
            obj[QStringLiteral("entityId")] = QString::fromStdString(c.entity_id);
            obj[QStringLiteral("field")] = QString::fromStdString(c.field);
            obj[QStringLiteral("local")] = storage::to_json(c.local_value);
            obj[QStringLiteral("remote")] = storage::to_json(c.remote_value);
            obj[QStringLiteral("suggested")] = qstr(strategy_name(resolver.suggest_resolution(c)));
            obj[QStringLiteral("merge")] = storage::to_json(resolver.suggest_merge(c));
            arr.append(obj);
        }
        QJsonObject root;
        root[QStringLiteral("conflicts")] = arr;
        return to_text(root);
    }

    if (conflicts.empty()) {
        return QStringLiteral("No conflicts.\n");
    }
    QStringList out;
    for (const auto& c : conflicts) {
        out << QStringLiteral("%1  %2 %3 %4: local=%5 remote=%6 (suggest %7, merge=%8)")
                   .arg(QString::fromStdString(c.id.to_string()),
                        qstr(type_name(c.entity_type)),
                        QString::fromStdString(c.entity_id),
                        QString::fromStdString(c.field),
                        QString::fromStdString(display(c.local_value)),
                        QString::fromStdString(display(c.remote_value)),
                        qstr(strategy_name(resolver.suggest_resolution(c))),
                        QString::fromStdString(display(resolver.suggest_merge(c))));
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_resolution_report(const sync::ResolutionReport& report, bool json) {
    if (json) {
        QJsonObject obj;
        obj[QStringLiteral("applied")] = report.applied;
        obj[QStringLiteral("discarded")] = report.discarded;
        obj[QStringLiteral("skipped")] = report.skipped;
        obj[QStringLiteral("requeued")] = report.requeued;
        return to_text(obj);
    }
    return QStringLiteral("Applied %1, discarded %2 (record deleted), skipped %3 (already resolved)\n")
        .arg(report.applied)
        .arg(report.discarded)
        .arg(report.skipped);
}

QString format_history(const std::vector<SyncHistoryEntry>& history, bool json) {
    if (json) {
        QJsonArray arr;
        for (const auto& h : history) {
            arr.append(history_to_json(h));
        }
        QJsonObject root;
        root[QStringLiteral("history")] = arr;
        return to_text(root);
    }
    if (history.empty()) {
        return QStringLiteral("No sync history.\n");
    }
    QStringList out;
    for (const auto& h : history) {
        out << history_line(h);
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_lines(const std::vector<std::string>& lines, const QString& key, bool json) {
    if (json) {
        QJsonArray arr;
        for (const auto& line : lines) {
            arr.append(QString::fromStdString(line));
        }
        QJsonObject root;
        root[key] = arr;
        return to_text(root);
    }
    QString out;
    for (const auto& line : lines) {
        out += QStringLiteral("- ") + QString::fromStdString(line) + QLatin1Char('\n');
    }
    return out;
}

Result<QString> run_command(sync::Engine& engine, const QStringList& args, const CliOptions& options) {
    const QString command = args.isEmpty() ? QStringLiteral("status") : args.first();

    if (command == QStringLiteral("status")) {
        return run_status(engine, options);
    }
    if (command == QStringLiteral("sync")) {
        auto report = engine.on_wake(sync::WakeReason::SyncNow);
        if (report.is_err()) return forward_err<QString>(report);
        return Result<QString>::ok(format_drain_report(report.unwrap(), options.json));
    }
    if (command == QStringLiteral("conflicts")) {
        auto pending = engine.list_pending_conflicts();
        if (pending.is_err()) return forward_err<QString>(pending);
        return Result<QString>::ok(format_conflicts(pending.unwrap(), engine.resolver(), options.json));
    }
    if (command == QStringLiteral("resolve")) {
        return run_resolve(engine, args, options);
    }
    if (command == QStringLiteral("auto-resolve")) {
        if (args.size() < 2) {
            return usage_error(QStringLiteral("usage: auto-resolve <latest-wins|remote-wins|local-wins>"));
        }
        const auto strategy = parse_auto_strategy(args.at(1).toStdString());
        if (!strategy) {
            return usage_error(QStringLiteral("unknown strategy: ") + args.at(1));
        }
        auto report = engine.auto_resolve(*strategy);
        if (report.is_err()) return forward_err<QString>(report);
        return Result<QString>::ok(format_resolution_report(report.unwrap(), options.json));
    }
    if (command == QStringLiteral("cleanup")) {
        int days = engine.config().notification_retention_days;
        if (args.size() >= 2) {
            bool ok = false;
            days = args.at(1).toInt(&ok);
            if (!ok || days < 0) {
                return usage_error(QStringLiteral("cleanup expects a non-negative number of days"));
            }
        }
        auto freed = engine.optimizer().cleanup_old_data(days);
        if (freed.is_err()) return forward_err<QString>(freed);
        if (options.json) {
            QJsonObject obj;
            obj[QStringLiteral("bytesFreed")] = qint64(freed.unwrap());
            return Result<QString>::ok(to_text(obj));
        }
        return Result<QString>::ok(QStringLiteral("Freed about %1 bytes\n").arg(freed.unwrap()));
    }
    if (command == QStringLiteral("suggestions")) {
        auto suggestions = engine.optimizer().get_suggestions();
        if (suggestions.is_err()) return forward_err<QString>(suggestions);
        if (suggestions.unwrap().empty() && !options.json) {
            return Result<QString>::ok(QStringLiteral("Nothing to suggest.\n"));
        }
        return Result<QString>::ok(format_lines(suggestions.unwrap(), QStringLiteral("suggestions"), options.json));
    }
    if (command == QStringLiteral("history")) {
        auto history = engine.store().journal().history(HISTORY_ROWS);
        if (history.is_err()) return forward_err<QString>(history);
        return Result<QString>::ok(format_history(history.unwrap(), options.json));
    }
    if (command == QStringLiteral("export")) {
        auto data = engine.optimizer().export_data();
        if (data.is_err()) return forward_err<QString>(data);
        auto conflicts = engine.resolver().export_conflicts();
        if (conflicts.is_err()) return forward_err<QString>(conflicts);
        QJsonObject root = data.unwrap().object();
        root[QStringLiteral("conflicts")] = conflicts.unwrap().object();
        return Result<QString>::ok(to_text(root));
    }
    return usage_error(QStringLiteral("unknown command: ") + command);
}

} // namespace larder::cli
