#pragma once

#include "core/conflict.hpp"
#include "core/result.hpp"
#include "storage/conflict_repository.hpp"
#include "sync/local_store.hpp"
#include <QJsonDocument>
#include <vector>

namespace larder::sync {

/**
 * ResolutionReport - Outcome of a batch of resolutions.
 *
 *   applied   committed to the store
 *   discarded the record was deleted meanwhile; deletion wins
 *   skipped   the conflict no longer exists (already resolved)
 */
struct ResolutionReport {
    int applied{0};
    int discarded{0};
    int skipped{0};
    int requeued{0};   // entries released back to the queue

    ResolutionReport& operator+=(const ResolutionReport& other) {
        applied += other.applied;
        discarded += other.discarded;
        skipped += other.skipped;
        requeued += other.requeued;
        return *this;
    }
};

/**
 * ConflictResolver - Commits conflict resolutions through the LocalStore.
 *
 * Each resolution is one transaction: the record, the held queue entry,
 * the conflict row and the history row change together. Applying a
 * resolution whose conflict is gone is a no-op, so a retried batch
 * cannot merge twice.
 */
class ConflictResolver {
public:
    explicit ConflictResolver(LocalStore& store) : store_(store) {}

    [[nodiscard]] Result<std::vector<Conflict>, Error> list_pending();

    [[nodiscard]] ResolutionStrategy suggest_resolution(const Conflict& conflict) const;
    [[nodiscard]] FieldValue suggest_merge(const Conflict& conflict) const;

    [[nodiscard]] Result<ResolutionReport, Error> apply(const std::vector<ConflictResolution>& resolutions);

    /**
     * Resolve every pending conflict with one batch strategy.
     */
    [[nodiscard]] Result<ResolutionReport, Error> auto_resolve(AutoStrategy strategy);

    /**
     * Same, restricted to the conflicts of one queue entry.
     */
    [[nodiscard]] Result<ResolutionReport, Error> auto_resolve(AutoStrategy strategy,
                                                               const std::vector<Conflict>& conflicts);

    [[nodiscard]] Result<std::vector<storage::ResolvedConflict>, Error> history(int limit);

    /**
     * JSON document with the pending conflicts and the most recent
     * resolution history.
     */
    [[nodiscard]] Result<QJsonDocument, Error> export_conflicts(int history_limit = 100);

private:
    [[nodiscard]] Result<ResolutionReport, Error> apply_one(const ConflictResolution& resolution);

    LocalStore& store_;
};

} // namespace larder::sync
