#pragma once

#include "core/field_value.hpp"
#include "core/inventory.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace larder {

/**
 * Conflict - One diverging field between a held local mutation and the
 * backend's current record.
 */
struct Conflict {
    Uuid id;
    EntityType entity_type{EntityType::Item};
    std::string entity_id;
    int64_t queue_entry_id{0};
    std::string field;
    FieldValue local_value;
    FieldValue remote_value;
    std::optional<FieldValue> base_value;
    Timestamp local_timestamp;
    Timestamp remote_timestamp;
    int64_t remote_version{0};
    Timestamp conflict_detected_at;

    bool operator==(const Conflict&) const = default;
};

enum class ResolutionStrategy {
    KeepLocal,
    KeepRemote,
    Merge
};

[[nodiscard]] constexpr std::string_view strategy_name(ResolutionStrategy s) {
    switch (s) {
        case ResolutionStrategy::KeepLocal: return "keep-local";
        case ResolutionStrategy::KeepRemote: return "keep-remote";
        case ResolutionStrategy::Merge: return "merge";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<ResolutionStrategy> parse_strategy(std::string_view name) {
    if (name == "keep-local") return ResolutionStrategy::KeepLocal;
    if (name == "keep-remote") return ResolutionStrategy::KeepRemote;
    if (name == "merge") return ResolutionStrategy::Merge;
    return std::nullopt;
}

/**
 * AutoStrategy - Batch strategies applied uniformly to a list of conflicts.
 */
enum class AutoStrategy {
    LatestWins,
    RemoteWins,
    LocalWins
};

[[nodiscard]] constexpr std::string_view auto_strategy_name(AutoStrategy s) {
    switch (s) {
        case AutoStrategy::LatestWins: return "latest-wins";
        case AutoStrategy::RemoteWins: return "remote-wins";
        case AutoStrategy::LocalWins: return "local-wins";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<AutoStrategy> parse_auto_strategy(std::string_view name) {
    if (name == "latest-wins") return AutoStrategy::LatestWins;
    if (name == "remote-wins") return AutoStrategy::RemoteWins;
    if (name == "local-wins") return AutoStrategy::LocalWins;
    return std::nullopt;
}

enum class ResolvedBy {
    Auto,
    User
};

struct ConflictResolution {
    Uuid conflict_id;
    ResolutionStrategy strategy{ResolutionStrategy::KeepLocal};
    FieldValue resolved_value;
    ResolvedBy resolved_by{ResolvedBy::User};

    bool operator==(const ConflictResolution&) const = default;
};

/**
 * Per-field divergence between a local payload and the remote image.
 *
 * Emits one Conflict per payload field whose local value differs from the
 * remote value; convergent edits produce nothing. The caller fills in ids
 * and version bookkeeping through `proto`.
 */
[[nodiscard]] std::vector<Conflict> diverging_fields(const Conflict& proto,
                                                     const Fields& local_payload,
                                                     const Fields& base_fields,
                                                     const Fields& remote_fields);

} // namespace larder
