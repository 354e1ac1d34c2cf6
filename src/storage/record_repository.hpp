#pragma once

#include "storage/database.hpp"
#include "core/record.hpp"
#include "core/result.hpp"
#include <functional>
#include <optional>
#include <vector>

namespace larder::storage {

using RecordPredicate = std::function<bool(const Record&)>;

/**
 * RecordCursor - Pulls matching records one at a time from an open
 * statement. Single pass.
 */
class RecordCursor {
public:
    RecordCursor(Statement stmt, EntityType type, RecordPredicate predicate)
        : stmt_(std::move(stmt)), type_(type), predicate_(std::move(predicate)) {}

    /**
     * Next matching record, std::nullopt once exhausted.
     */
    [[nodiscard]] Result<std::optional<Record>, Error> next();

private:
    Statement stmt_;
    EntityType type_;
    RecordPredicate predicate_;
    bool done_ = false;
};

/**
 * RecordQuery - A lazy, restartable query. Every open() starts a fresh
 * cursor; no state is shared between passes.
 */
class RecordQuery {
public:
    RecordQuery(Database& db, EntityType type, RecordPredicate predicate, bool include_tombstoned)
        : db_(db), type_(type), predicate_(std::move(predicate)),
          include_tombstoned_(include_tombstoned) {}

    [[nodiscard]] Result<RecordCursor, Error> open() const;

    /**
     * Drain a fresh cursor into a vector.
     */
    [[nodiscard]] Result<std::vector<Record>, Error> collect() const;

private:
    Database& db_;
    EntityType type_;
    RecordPredicate predicate_;
    bool include_tombstoned_;
};

/**
 * RecordRepository - Data access for the items and categories tables.
 */
class RecordRepository {
public:
    explicit RecordRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<Record>, Error> get(EntityType type, const std::string& id);

    /**
     * Insert or replace the full record row.
     */
    [[nodiscard]] Status save(const Record& record);

    /**
     * Physically delete a row (tombstone purge or never-confirmed create).
     */
    [[nodiscard]] Status purge(EntityType type, const std::string& id);

    [[nodiscard]] RecordQuery query(EntityType type,
                                    RecordPredicate predicate = {},
                                    bool include_tombstoned = false);

    [[nodiscard]] Result<int64_t, Error> count(EntityType type, bool include_tombstoned = false);

    /**
     * Rows whose image has not been confirmed by the backend.
     */
    [[nodiscard]] Result<int64_t, Error> count_unconfirmed();

private:
    Database& db_;
};

[[nodiscard]] std::string_view table_for(EntityType type);

} // namespace larder::storage
