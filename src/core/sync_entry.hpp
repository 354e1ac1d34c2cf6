#pragma once

#include "core/field_value.hpp"
#include "core/inventory.hpp"
#include "core/types.hpp"
#include <algorithm>
#include <chrono>
#include <optional>
#include <string>

namespace larder {

enum class Operation {
    Create,
    Update,
    Delete
};

[[nodiscard]] constexpr std::string_view operation_name(Operation op) {
    switch (op) {
        case Operation::Create: return "create";
        case Operation::Update: return "update";
        case Operation::Delete: return "delete";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<Operation> parse_operation(std::string_view name) {
    if (name == "create") return Operation::Create;
    if (name == "update") return Operation::Update;
    if (name == "delete") return Operation::Delete;
    return std::nullopt;
}

/**
 * EntryState - Persisted part of the queue entry state machine.
 *
 * Pending -> InFlight -> {removed (confirmed or terminal),
 *                        Conflicted (held for resolution),
 *                        Pending (retryable failure, retry_count + 1)}
 */
enum class EntryState {
    Pending,
    InFlight,
    Conflicted
};

[[nodiscard]] constexpr std::string_view entry_state_name(EntryState state) {
    switch (state) {
        case EntryState::Pending: return "pending";
        case EntryState::InFlight: return "in_flight";
        case EntryState::Conflicted: return "conflicted";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<EntryState> parse_entry_state(std::string_view name) {
    if (name == "pending") return EntryState::Pending;
    if (name == "in_flight") return EntryState::InFlight;
    if (name == "conflicted") return EntryState::Conflicted;
    return std::nullopt;
}

/**
 * SyncQueueEntry - One pending mutation awaiting propagation.
 *
 * `id` is the monotonically increasing queue position; entries for the same
 * entity are sent strictly in id order.
 */
struct SyncQueueEntry {
    int64_t id{0};
    Uuid operation_id;
    EntityType entity_type{EntityType::Item};
    std::string entity_id;
    Operation operation{Operation::Update};
    Fields payload;
    Fields base_fields;        // values of the payload fields at base_version
    int64_t base_version{0};
    int retry_count{0};
    EntryState state{EntryState::Pending};
    Timestamp enqueued_at;
    Timestamp next_attempt_at;
    std::string last_error;
    std::string checksum;

    bool operator==(const SyncQueueEntry&) const = default;
};

/**
 * Backoff - exponential retry delay, base * 2^(retry_count - 1), capped.
 * The first retry waits `base`.
 */
struct Backoff {
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds cap{60000};

    [[nodiscard]] std::chrono::milliseconds delay_for(int retry_count) const {
        if (retry_count <= 0) return std::chrono::milliseconds{0};
        const int shift = std::min(retry_count - 1, 30);
        const auto raw = base.count() * (int64_t{1} << shift);
        return std::chrono::milliseconds{std::min<int64_t>(raw, cap.count())};
    }
};

} // namespace larder
