#pragma once

#include "config/engine_config.hpp"
#include "core/result.hpp"
#include "network/remote_api.hpp"
#include "storage/database.hpp"
#include "sync/conflict_detector.hpp"
#include "sync/conflict_resolver.hpp"
#include "sync/local_store.hpp"
#include "sync/storage_optimizer.hpp"
#include "sync/sync_manager.hpp"
#include <QObject>
#include <memory>
#include <vector>

namespace larder::sync {

/**
 * Engine - The offline sync engine as one explicitly constructed service.
 *
 * Owns the database connection and every component built on it. Callers
 * hold the Engine (or references to its parts) for as long as they use it;
 * there is no global instance.
 */
class Engine : public QObject {
    Q_OBJECT

public:
    Engine(storage::Database db,
           std::unique_ptr<network::RemoteApi> remote,
           const config::EngineConfig& config,
           ClockFn clock = system_clock(),
           QObject* parent = nullptr);
    ~Engine() override;

    /**
     * Open (creating and migrating if needed) the database named by
     * `config.database_path` and assemble the engine around it.
     * ":memory:" opens a private in-memory database.
     */
    [[nodiscard]] static Result<std::unique_ptr<Engine>, Error> open(
        const config::EngineConfig& config,
        std::unique_ptr<network::RemoteApi> remote,
        ClockFn clock = system_clock());

    [[nodiscard]] Result<DrainReport, Error> on_wake(WakeReason reason) { return sync_.on_wake(reason); }

    [[nodiscard]] Result<std::vector<Conflict>, Error> list_pending_conflicts() {
        return resolver_.list_pending();
    }
    [[nodiscard]] ResolutionStrategy suggest_resolution(const Conflict& conflict) const {
        return resolver_.suggest_resolution(conflict);
    }
    [[nodiscard]] FieldValue suggest_merge(const Conflict& conflict) const {
        return resolver_.suggest_merge(conflict);
    }
    [[nodiscard]] Result<ResolutionReport, Error> apply_resolutions(
        const std::vector<ConflictResolution>& resolutions) {
        return resolver_.apply(resolutions);
    }
    [[nodiscard]] Result<ResolutionReport, Error> auto_resolve(AutoStrategy strategy) {
        return resolver_.auto_resolve(strategy);
    }

    /**
     * Unsynced work (pending or in flight); conflicts are counted apart.
     */
    [[nodiscard]] Result<int64_t, Error> pending_count() { return store_.pending_count(); }
    [[nodiscard]] Result<int64_t, Error> conflict_count() { return store_.conflict_count(); }

    [[nodiscard]] storage::Database& database() { return db_; }
    [[nodiscard]] LocalStore& store() { return store_; }
    [[nodiscard]] ConflictResolver& resolver() { return resolver_; }
    [[nodiscard]] SyncManager& sync() { return sync_; }
    [[nodiscard]] StorageOptimizer& optimizer() { return optimizer_; }
    [[nodiscard]] const config::EngineConfig& config() const { return config_; }

private:
    config::EngineConfig config_;
    storage::Database db_;
    std::unique_ptr<network::RemoteApi> remote_;
    LocalStore store_;
    ConflictDetector detector_;
    ConflictResolver resolver_;
    StorageOptimizer optimizer_;
    SyncManager sync_;
};

} // namespace larder::sync
