#pragma once

#include "core/field_value.hpp"
#include "core/inventory.hpp"
#include "core/types.hpp"
#include <algorithm>
#include <optional>
#include <string>

namespace larder {

/**
 * SyncState - Two-phase status of a record's local image.
 *
 * Unconfirmed: the image carries tentative local writes not yet accepted by
 * the backend; `prior_fields` holds the last confirmed image to revert to.
 */
enum class SyncState {
    Confirmed,
    Unconfirmed
};

[[nodiscard]] constexpr std::string_view state_name(SyncState state) {
    return state == SyncState::Confirmed ? "confirmed" : "unconfirmed";
}

/**
 * Record - An entity image plus its version bookkeeping.
 *
 * Invariant: remote_version <= local_version. Equality means in sync.
 */
struct Record {
    EntityType type{EntityType::Item};
    std::string id;
    Fields fields;
    int64_t local_version{0};
    int64_t remote_version{0};
    bool tombstoned{false};
    SyncState sync_state{SyncState::Confirmed};
    std::optional<Fields> prior_fields;
    Timestamp updated_at;

    [[nodiscard]] bool in_sync() const { return local_version == remote_version; }

    /**
     * The image the backend is known to hold at remote_version.
     */
    [[nodiscard]] const Fields& confirmed_image() const {
        return prior_fields ? *prior_fields : fields;
    }

    bool operator==(const Record&) const = default;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

/**
 * A record first seen through a remote fetch: confirmed and in sync.
 */
[[nodiscard]] inline Record remote_record(EntityType type, std::string id, Fields fields,
                                          int64_t remote_version, Timestamp now) {
    Record r;
    r.type = type;
    r.id = std::move(id);
    r.fields = std::move(fields);
    r.local_version = remote_version;
    r.remote_version = remote_version;
    r.updated_at = now;
    return r;
}

/**
 * Apply a tentative local write. The confirmed image is captured the first
 * time the record leaves the Confirmed state.
 */
[[nodiscard]] inline Record with_local_write(Record r, const Fields& patch, Timestamp now) {
    if (r.sync_state == SyncState::Confirmed && r.remote_version > 0) {
        r.prior_fields = r.fields;
    }
    r.fields = overlay(std::move(r.fields), patch);
    r.local_version += 1;
    r.sync_state = SyncState::Unconfirmed;
    r.updated_at = now;
    return r;
}

[[nodiscard]] inline Record with_tombstone(Record r, Timestamp now) {
    if (r.sync_state == SyncState::Confirmed && r.remote_version > 0) {
        r.prior_fields = r.fields;
    }
    r.tombstoned = true;
    r.local_version += 1;
    r.sync_state = SyncState::Unconfirmed;
    r.updated_at = now;
    return r;
}

/**
 * Record the backend's acknowledgement of `sent` at `version`. When nothing
 * else is pending for the record it becomes Confirmed and in sync; otherwise
 * the confirmed image advances by `sent` and the later writes stay tentative.
 */
[[nodiscard]] inline Record with_confirmation(Record r, const Fields& sent, int64_t version,
                                              bool more_pending, Timestamp now) {
    r.remote_version = std::max(r.remote_version, version);
    if (more_pending) {
        r.prior_fields = overlay(r.prior_fields.value_or(Fields{}), sent);
        r.local_version = std::max(r.local_version, r.remote_version + 1);
    } else {
        r.local_version = r.remote_version;
        r.sync_state = SyncState::Confirmed;
        r.prior_fields.reset();
    }
    r.updated_at = now;
    return r;
}

} // namespace larder
