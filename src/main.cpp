#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>
#include <QUrl>

#include "cli/commands.hpp"
#include "config/engine_config.hpp"
#include "log/logging.hpp"
#include "network/http_remote_api.hpp"
#include "sync/engine.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("Larder");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Larder");
    app.setOrganizationDomain("larder.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Larder offline inventory sync"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets LARDER_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption remoteOption(
        QStringList{QStringLiteral("remote")},
        QStringLiteral("Backend base URL (sets LARDER_REMOTE_URL for this run)."),
        QStringLiteral("url"));
    parser.addOption(remoteOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON."));
    parser.addOption(jsonOption);

    const QCommandLineOption valueOption(
        QStringList{QStringLiteral("value")},
        QStringLiteral("JSON value for 'resolve <id> merge' (defaults to the suggested merge)."),
        QStringLiteral("json"));
    parser.addOption(valueOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets LARDER_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("status | sync | conflicts | resolve <id> <strategy> | "
                                                "auto-resolve <strategy> | cleanup [days] | suggestions | "
                                                "history | export"));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("LARDER_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    if (parser.isSet(remoteOption)) {
        qputenv("LARDER_REMOTE_URL", parser.value(remoteOption).toUtf8());
    }
    const bool debugSync = parser.isSet(debugSyncOption);
    if (debugSync) {
        qputenv("LARDER_DEBUG_SYNC", "1");
    }

    larder::logging::install_file_logging();
    larder::logging::configure_categories(debugSync);
    qInfo() << "Larder: logging to" << larder::logging::default_log_file_path();

    const auto config = larder::config::load_default_config();

    std::unique_ptr<larder::network::RemoteApi> remote;
    if (config.remote_url.isEmpty()) {
        remote = std::make_unique<larder::network::OfflineRemoteApi>();
    } else {
        remote = std::make_unique<larder::network::HttpRemoteApi>(QUrl(config.remote_url),
                                                                  config.request_timeout);
    }

    auto opened = larder::sync::Engine::open(config, std::move(remote));
    if (opened.is_err()) {
        QTextStream(stderr) << "Failed to open database: "
                            << QString::fromStdString(opened.unwrap_err().message) << QLatin1Char('\n');
        return 1;
    }
    auto engine = std::move(opened).unwrap();

    larder::cli::CliOptions options;
    options.json = parser.isSet(jsonOption);
    options.mergeValue = parser.value(valueOption);

    const auto result = larder::cli::run_command(*engine, parser.positionalArguments(), options);
    if (result.is_err()) {
        QTextStream(stderr) << QString::fromStdString(result.unwrap_err().message) << QLatin1Char('\n');
        return result.unwrap_err().kind == larder::ErrorKind::InvalidArgument ? 2 : 1;
    }

    QTextStream(stdout) << result.unwrap();
    return 0;
}
