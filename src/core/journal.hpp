#pragma once

#include "core/inventory.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>

namespace larder {

enum class ActivityAction {
    Added,
    Updated,
    Deleted,
    QuantityAdjusted,
    ConflictResolved,
    SyncFailed
};

[[nodiscard]] constexpr std::string_view action_name(ActivityAction action) {
    switch (action) {
        case ActivityAction::Added: return "added";
        case ActivityAction::Updated: return "updated";
        case ActivityAction::Deleted: return "deleted";
        case ActivityAction::QuantityAdjusted: return "quantity_adjusted";
        case ActivityAction::ConflictResolved: return "conflict_resolved";
        case ActivityAction::SyncFailed: return "sync_failed";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<ActivityAction> parse_action(std::string_view name) {
    if (name == "added") return ActivityAction::Added;
    if (name == "updated") return ActivityAction::Updated;
    if (name == "deleted") return ActivityAction::Deleted;
    if (name == "quantity_adjusted") return ActivityAction::QuantityAdjusted;
    if (name == "conflict_resolved") return ActivityAction::ConflictResolved;
    if (name == "sync_failed") return ActivityAction::SyncFailed;
    return std::nullopt;
}

/**
 * ActivityEntry - One line of the user-facing activity log.
 */
struct ActivityEntry {
    int64_t id{0};
    std::optional<EntityType> entity_type;
    std::optional<std::string> entity_id;
    ActivityAction action{ActivityAction::Updated};
    std::string description;
    Timestamp created_at;
};

/**
 * NotificationEntry - A queued local notification (low stock, sync failure).
 * Delivery is someone else's job; the engine only records and prunes them.
 */
struct NotificationEntry {
    int64_t id{0};
    std::string kind;
    std::string title;
    std::string body;
    bool processed{false};
    Timestamp created_at;
};

namespace notification_kind {
    inline constexpr const char* LowStock = "low_stock";
    inline constexpr const char* SyncFailed = "sync_failed";
    inline constexpr const char* StorageLow = "storage_low";
}

/**
 * SyncHistoryEntry - Outcome counters of one drain cycle.
 */
struct SyncHistoryEntry {
    int64_t id{0};
    Timestamp started_at;
    Timestamp finished_at;
    std::string reason;
    int confirmed{0};
    int conflicted{0};
    int retried{0};
    int failed{0};
    bool aborted{false};
};

} // namespace larder
