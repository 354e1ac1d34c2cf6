#pragma once

#include "core/conflict.hpp"
#include "core/result.hpp"
#include "core/sync_entry.hpp"
#include "network/remote_api.hpp"
#include "sync/local_store.hpp"
#include <vector>

namespace larder::sync {

/**
 * Detection - What the detector concluded about an entry the backend
 * rejected with a version conflict.
 */
struct Detection {
    enum class Outcome {
        Converged,   // every local change already matches the remote; confirm
        Conflicted,  // entry held with one Conflict per diverging field
        Rebased,     // deletion rebased onto the remote version; resend
        RemoteGone   // the record no longer exists remotely
    };

    Outcome outcome{Outcome::Converged};
    std::vector<Conflict> conflicts;
    int64_t remote_version{0};
};

[[nodiscard]] constexpr std::string_view outcome_name(Detection::Outcome outcome) {
    switch (outcome) {
        case Detection::Outcome::Converged: return "converged";
        case Detection::Outcome::Conflicted: return "conflicted";
        case Detection::Outcome::Rebased: return "rebased";
        case Detection::Outcome::RemoteGone: return "remote_gone";
    }
    return "unknown";
}

/**
 * ConflictDetector - Per-field comparison of a rejected mutation against the
 * backend's current record.
 *
 * A version mismatch alone does not mean every field diverged: fields the
 * remote already holds are dropped from the payload, the rest become
 * Conflicts. Fields without local work are rebased onto the remote image.
 */
class ConflictDetector {
public:
    ConflictDetector(LocalStore& store, network::RemoteApi& remote)
        : store_(store), remote_(remote) {}

    [[nodiscard]] Result<Detection, Error> detect(const SyncQueueEntry& entry);

private:
    [[nodiscard]] Result<Detection, Error> rebase_delete(const SyncQueueEntry& entry,
                                                         const network::RemoteRecord& remote);
    [[nodiscard]] Result<Detection, Error> compare(const SyncQueueEntry& entry,
                                                   const network::RemoteRecord& remote);

    LocalStore& store_;
    network::RemoteApi& remote_;
};

} // namespace larder::sync
