#pragma once

#include "core/field_value.hpp"
#include "core/inventory.hpp"
#include "core/result.hpp"
#include "core/sync_entry.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace larder::network {

/**
 * MutationRequest - One queued mutation as sent to the backend.
 *
 * The backend must treat (entity_id, operation_id) as an idempotency key:
 * a resend after a crash carries the same operation_id.
 */
struct MutationRequest {
    Uuid operation_id;
    EntityType entity_type{EntityType::Item};
    std::string entity_id;
    Operation operation{Operation::Update};
    Fields payload;
    int64_t base_version{0};
};

/**
 * RemoteRecord - The backend's current image of an entity.
 */
struct RemoteRecord {
    EntityType type{EntityType::Item};
    std::string id;
    Fields fields;
    int64_t version{0};
    Timestamp updated_at;
};

/**
 * RemoteApi - Boundary to the inventory backend.
 *
 * Errors use the engine taxonomy: VersionConflict when base_version is
 * stale (or the record no longer exists), NetworkError for transport
 * failures and timeouts, ServerRejection for any other refusal.
 */
class RemoteApi {
public:
    virtual ~RemoteApi() = default;

    /**
     * Apply a mutation; returns the record's new version.
     */
    [[nodiscard]] virtual Result<int64_t, Error> send(const MutationRequest& request) = 0;

    /**
     * Current remote image, std::nullopt when the record does not exist.
     */
    [[nodiscard]] virtual Result<std::optional<RemoteRecord>, Error> fetch(EntityType type,
                                                                          const std::string& id) = 0;

    [[nodiscard]] virtual Result<std::vector<RemoteRecord>, Error> list(EntityType type) = 0;
};

} // namespace larder::network

namespace larder::network {

/**
 * OfflineRemoteApi - Stand-in backend when no remote URL is configured.
 * Every call fails as a network error, so queued work simply waits.
 */
class OfflineRemoteApi : public RemoteApi {
public:
    [[nodiscard]] Result<int64_t, Error> send(const MutationRequest&) override { return unreachable<int64_t>(); }
    [[nodiscard]] Result<std::optional<RemoteRecord>, Error> fetch(EntityType, const std::string&) override {
        return unreachable<std::optional<RemoteRecord>>();
    }
    [[nodiscard]] Result<std::vector<RemoteRecord>, Error> list(EntityType) override {
        return unreachable<std::vector<RemoteRecord>>();
    }

private:
    template<typename T>
    [[nodiscard]] static Result<T, Error> unreachable() {
        return Result<T, Error>::err(Error::of(ErrorKind::NetworkError, "No remote backend configured"));
    }
};

} // namespace larder::network
