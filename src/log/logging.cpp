#include "log/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>
#include <cstdio>

Q_LOGGING_CATEGORY(larderStoreLog, "larder.store", QtInfoMsg)
Q_LOGGING_CATEGORY(larderQueueLog, "larder.queue", QtInfoMsg)
Q_LOGGING_CATEGORY(larderSyncLog, "larder.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(larderConflictLog, "larder.conflict", QtInfoMsg)
Q_LOGGING_CATEGORY(larderStorageLog, "larder.storage", QtInfoMsg)
Q_LOGGING_CATEGORY(larderRemoteLog, "larder.remote", QtInfoMsg)

namespace larder::logging {
namespace {

QString compute_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/larder.log"));
}

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LogSink {
    QMutex mu;
    QFile file;
    bool opened = false;
};

LogSink& sink() {
    static LogSink s{};
    return s;
}

void open_once(LogSink& s) {
    if (s.opened) return;
    s.opened = true;

    const auto path = compute_log_file_path();
    if (path.isEmpty()) {
        return;
    }
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        std::fprintf(stderr, "larder: cannot create log directory for %s\n", qPrintable(path));
        return;
    }
    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "larder: cannot open log file %s\n", qPrintable(path));
    }
}

void write_message(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    auto& s = sink();
    QMutexLocker lock(&s.mu);
    open_once(s);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto category = ctx.category ? QString::fromLatin1(ctx.category) : QString{};
    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), category, msg);
    const auto bytes = line.toUtf8();

    if (s.file.isOpen()) {
        s.file.write(bytes);
        s.file.flush();
    }
    std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stderr);
}

} // namespace

void install_file_logging() {
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    qInstallMessageHandler(write_message);
}

QString default_log_file_path() {
    return compute_log_file_path();
}

bool sync_debug_enabled() {
    return qEnvironmentVariableIsSet("LARDER_DEBUG_SYNC");
}

void configure_categories(bool force) {
    if (force || sync_debug_enabled()) {
        QLoggingCategory::setFilterRules(QStringLiteral("larder.*.debug=true"));
    }
}

} // namespace larder::logging
