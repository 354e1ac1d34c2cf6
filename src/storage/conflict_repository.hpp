#pragma once

#include "storage/database.hpp"
#include "core/conflict.hpp"
#include "core/result.hpp"
#include <optional>
#include <vector>

namespace larder::storage {

/**
 * ResolvedConflict - Audit row written when a resolution is committed.
 */
struct ResolvedConflict {
    Uuid conflict_id;
    EntityType entity_type{EntityType::Item};
    std::string entity_id;
    std::string field;
    ResolutionStrategy strategy{ResolutionStrategy::KeepLocal};
    FieldValue value;
    ResolvedBy resolved_by{ResolvedBy::User};
    Timestamp resolved_at;
};

/**
 * ConflictRepository - Durable unresolved conflicts and resolution history.
 */
class ConflictRepository {
public:
    explicit ConflictRepository(Database& db) : db_(db) {}

    [[nodiscard]] Status insert(const Conflict& conflict);
    [[nodiscard]] Result<std::optional<Conflict>, Error> get(const Uuid& id);

    /**
     * Unresolved conflicts in detection order.
     */
    [[nodiscard]] Result<std::vector<Conflict>, Error> list_pending();
    [[nodiscard]] Result<std::vector<Conflict>, Error> for_entry(int64_t queue_entry_id);

    [[nodiscard]] Status remove(const Uuid& id);
    [[nodiscard]] Status remove_for_entry(int64_t queue_entry_id);

    [[nodiscard]] Result<int64_t, Error> count();

    [[nodiscard]] Status record_resolution(const ResolvedConflict& resolved);
    [[nodiscard]] Result<bool, Error> is_resolved(const Uuid& conflict_id);
    [[nodiscard]] Result<std::vector<ResolvedConflict>, Error> history(int limit);

private:
    Database& db_;
};

} // namespace larder::storage
