#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace larder::storage {

/**
 * Migration - A database schema migration.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "entity_collections",
        .up_sql = R"SQL(
            -- Entity images. fields_json holds the current (possibly tentative)
            -- image, prior_json the last confirmed one while unconfirmed.
            CREATE TABLE IF NOT EXISTS items (
                id TEXT PRIMARY KEY,
                fields_json TEXT NOT NULL,
                local_version INTEGER NOT NULL DEFAULT 0,
                remote_version INTEGER NOT NULL DEFAULT 0,
                tombstoned INTEGER NOT NULL DEFAULT 0,
                sync_state TEXT NOT NULL DEFAULT 'confirmed',
                prior_json TEXT,
                updated_at INTEGER NOT NULL,
                CHECK (remote_version <= local_version)
            );

            CREATE TABLE IF NOT EXISTS categories (
                id TEXT PRIMARY KEY,
                fields_json TEXT NOT NULL,
                local_version INTEGER NOT NULL DEFAULT 0,
                remote_version INTEGER NOT NULL DEFAULT 0,
                tombstoned INTEGER NOT NULL DEFAULT 0,
                sync_state TEXT NOT NULL DEFAULT 'confirmed',
                prior_json TEXT,
                updated_at INTEGER NOT NULL,
                CHECK (remote_version <= local_version)
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS categories;
            DROP TABLE IF EXISTS items;
        )SQL"
    },
    {
        .version = 2,
        .name = "sync_queue",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS sync_queue (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                operation_id TEXT NOT NULL UNIQUE,
                entity_type TEXT NOT NULL,
                entity_id TEXT NOT NULL,
                operation TEXT NOT NULL,
                payload_json TEXT NOT NULL,
                base_fields_json TEXT NOT NULL DEFAULT '{}',
                base_version INTEGER NOT NULL DEFAULT 0,
                retry_count INTEGER NOT NULL DEFAULT 0,
                state TEXT NOT NULL DEFAULT 'pending',
                enqueued_at INTEGER NOT NULL,
                next_attempt_at INTEGER NOT NULL,
                last_error TEXT NOT NULL DEFAULT '',
                checksum TEXT NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_sync_queue_entity
                ON sync_queue(entity_type, entity_id, id);
            CREATE INDEX IF NOT EXISTS idx_sync_queue_ready
                ON sync_queue(state, next_attempt_at);

            -- Drain lease shared by every process opening this file.
            CREATE TABLE IF NOT EXISTS engine_state (
                key TEXT PRIMARY KEY,
                owner TEXT NOT NULL,
                expires_at INTEGER NOT NULL
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS engine_state;
            DROP TABLE IF EXISTS sync_queue;
        )SQL"
    },
    {
        .version = 3,
        .name = "conflicts",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS conflicts (
                id TEXT PRIMARY KEY,
                entity_type TEXT NOT NULL,
                entity_id TEXT NOT NULL,
                queue_entry_id INTEGER NOT NULL REFERENCES sync_queue(id) ON DELETE CASCADE,
                field TEXT NOT NULL,
                local_json TEXT NOT NULL,
                remote_json TEXT NOT NULL,
                base_json TEXT,
                local_timestamp INTEGER NOT NULL,
                remote_timestamp INTEGER NOT NULL,
                remote_version INTEGER NOT NULL,
                detected_at INTEGER NOT NULL,
                UNIQUE (queue_entry_id, field)
            );
            CREATE INDEX IF NOT EXISTS idx_conflicts_entity ON conflicts(entity_type, entity_id);

            CREATE TABLE IF NOT EXISTS resolved_conflicts (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                conflict_id TEXT NOT NULL UNIQUE,
                entity_type TEXT NOT NULL,
                entity_id TEXT NOT NULL,
                field TEXT NOT NULL,
                strategy TEXT NOT NULL,
                value_json TEXT NOT NULL,
                resolved_by TEXT NOT NULL,
                resolved_at INTEGER NOT NULL
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS resolved_conflicts;
            DROP TABLE IF EXISTS conflicts;
        )SQL"
    },
    {
        .version = 4,
        .name = "journals",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS activity_log (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                entity_type TEXT,
                entity_id TEXT,
                action TEXT NOT NULL,
                description TEXT NOT NULL DEFAULT '',
                created_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_activity_created ON activity_log(created_at);

            CREATE TABLE IF NOT EXISTS notifications (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                kind TEXT NOT NULL,
                title TEXT NOT NULL,
                body TEXT NOT NULL DEFAULT '',
                processed INTEGER NOT NULL DEFAULT 0,
                created_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_notifications_created ON notifications(created_at);

            CREATE TABLE IF NOT EXISTS sync_history (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                started_at INTEGER NOT NULL,
                finished_at INTEGER NOT NULL,
                reason TEXT NOT NULL,
                confirmed INTEGER NOT NULL DEFAULT 0,
                conflicted INTEGER NOT NULL DEFAULT 0,
                retried INTEGER NOT NULL DEFAULT 0,
                failed INTEGER NOT NULL DEFAULT 0,
                aborted INTEGER NOT NULL DEFAULT 0
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS sync_history;
            DROP TABLE IF EXISTS notifications;
            DROP TABLE IF EXISTS activity_log;
        )SQL"
    }
};

/**
 * MigrationRunner - Brings the schema to a given version inside one
 * transaction.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    [[nodiscard]] Status migrate();
    [[nodiscard]] Status migrate_to(int target_version);
    [[nodiscard]] Status rollback();
    [[nodiscard]] Status rollback_to(int target_version);

    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Status ensure_migrations_table();
    [[nodiscard]] Status apply(const Migration& m);
    [[nodiscard]] Status revert(const Migration& m);
};

/**
 * Initialize a database with all migrations.
 */
[[nodiscard]] inline Status initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace larder::storage
