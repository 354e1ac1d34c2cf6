#include "storage/migrations.hpp"

#include "log/logging.hpp"

namespace larder::storage {

Status MigrationRunner::ensure_migrations_table() {
    return db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL
        );
    )SQL");
}

Result<int, Error> MigrationRunner::current_version() {
    auto ensured = ensure_migrations_table();
    if (ensured.is_err()) {
        return Result<int, Error>::err(ensured.unwrap_err());
    }
    auto version = db_.scalar("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
    if (version.is_err()) {
        return forward_err<int>(version);
    }
    return Result<int, Error>::ok(static_cast<int>(version.unwrap()));
}

Status MigrationRunner::apply(const Migration& m) {
    auto executed = db_.execute(m.up_sql);
    if (executed.is_err()) {
        const auto& e = executed.unwrap_err();
        return Status::err(Error{
            "Migration " + std::to_string(m.version) + " (" + m.name + ") failed: " + e.message,
            e.code, e.kind});
    }

    auto prepared = db_.prepare(
        "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);");
    if (prepared.is_err()) {
        return Status::err(prepared.unwrap_err());
    }
    auto stmt = std::move(prepared).unwrap();
    auto bound = stmt.bind_int(1, m.version)
        .and_then([&] { return stmt.bind_text(2, m.name); })
        .and_then([&] { return stmt.bind_int64(3, Timestamp::now().millis()); });
    if (bound.is_err()) {
        return bound;
    }
    qCInfo(larderStorageLog) << "applied migration" << m.version << QString::fromStdString(m.name);
    return stmt.run();
}

Status MigrationRunner::revert(const Migration& m) {
    if (m.down_sql.empty()) {
        return Status::err(Error{"Migration " + std::to_string(m.version) + " has no rollback SQL"});
    }
    auto executed = db_.execute(m.down_sql);
    if (executed.is_err()) {
        return Status::err(Error{
            "Rollback of migration " + std::to_string(m.version) + " failed: " +
            executed.unwrap_err().message});
    }

    auto prepared = db_.prepare("DELETE FROM schema_migrations WHERE version = ?;");
    if (prepared.is_err()) {
        return Status::err(prepared.unwrap_err());
    }
    auto stmt = std::move(prepared).unwrap();
    auto bound = stmt.bind_int(1, m.version);
    if (bound.is_err()) {
        return bound;
    }
    return stmt.run();
}

Status MigrationRunner::migrate() {
    return migrate_to(latest_version());
}

Status MigrationRunner::migrate_to(int target_version) {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Status::err(current_result.unwrap_err());
    }
    const int current = current_result.unwrap();
    if (current >= target_version) {
        return Status::ok();
    }

    return db_.transaction([&]() -> Status {
        for (const auto& m : ALL_MIGRATIONS) {
            if (m.version > current && m.version <= target_version) {
                auto applied = apply(m);
                if (applied.is_err()) {
                    return applied;
                }
            }
        }
        return Status::ok();
    });
}

Status MigrationRunner::rollback() {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Status::err(current_result.unwrap_err());
    }
    const int current = current_result.unwrap();
    if (current == 0) {
        return Status::ok();
    }
    return rollback_to(current - 1);
}

Status MigrationRunner::rollback_to(int target_version) {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Status::err(current_result.unwrap_err());
    }
    const int current = current_result.unwrap();
    if (current <= target_version) {
        return Status::ok();
    }

    return db_.transaction([&]() -> Status {
        for (auto it = ALL_MIGRATIONS.rbegin(); it != ALL_MIGRATIONS.rend(); ++it) {
            if (it->version <= current && it->version > target_version) {
                auto reverted = revert(*it);
                if (reverted.is_err()) {
                    return reverted;
                }
            }
        }
        return Status::ok();
    });
}

} // namespace larder::storage
