#include "sync/engine.hpp"

#include "crypto/checksum.hpp"
#include "log/logging.hpp"
#include "storage/migrations.hpp"

namespace larder::sync {

Engine::Engine(storage::Database db,
               std::unique_ptr<network::RemoteApi> remote,
               const config::EngineConfig& config,
               ClockFn clock,
               QObject* parent)
    : QObject(parent)
    , config_(config)
    , db_(std::move(db))
    , remote_(std::move(remote))
    , store_(db_, std::move(clock))
    , detector_(store_, *remote_)
    , resolver_(store_)
    , optimizer_(store_, config_)
    , sync_(store_, *remote_, detector_, resolver_, config_)
{
    store_.set_space_check([this](int64_t bytes) { return optimizer_.has_enough_space(bytes); });
}

Engine::~Engine() {
    sync_.stop();
}

Result<std::unique_ptr<Engine>, Error> Engine::open(const config::EngineConfig& config,
                                                   std::unique_ptr<network::RemoteApi> remote,
                                                   ClockFn clock) {
    using R = Result<std::unique_ptr<Engine>, Error>;
    if (!remote) {
        return R::err(Error::of(ErrorKind::InvalidArgument, "A remote backend is required"));
    }
    auto sodium = crypto::init();
    if (sodium.is_err()) {
        return R::err(sodium.unwrap_err());
    }

    const auto path = config.database_path.toStdString();
    auto opened = path.empty() || path == ":memory:" ? storage::Database::open_memory()
                                                     : storage::Database::open(path);
    if (opened.is_err()) {
        return forward_err<std::unique_ptr<Engine>>(opened);
    }
    auto db = std::move(opened).unwrap();
    auto migrated = storage::initialize_database(db);
    if (migrated.is_err()) {
        return R::err(migrated.unwrap_err());
    }

    qCInfo(larderSyncLog) << "engine opened on" << (db.is_memory() ? QStringLiteral(":memory:")
                                                                   : config.database_path);
    return R::ok(std::make_unique<Engine>(std::move(db), std::move(remote), config, std::move(clock)));
}

} // namespace larder::sync
