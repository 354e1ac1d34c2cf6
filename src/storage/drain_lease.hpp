#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include <chrono>

namespace larder::storage {

/**
 * DrainLease - Durable "one drain at a time" flag shared by every process
 * that opens the same database file.
 *
 * Acquisition is a single conditional upsert on engine_state: it succeeds
 * when no lease exists, the existing one has expired, or it is already ours.
 * A holder that crashes simply lets the lease expire.
 */
class DrainLease {
public:
    DrainLease(Database& db, Uuid owner, std::chrono::milliseconds ttl)
        : db_(db), owner_(owner), ttl_(ttl) {}

    [[nodiscard]] Result<bool, Error> try_acquire(Timestamp now);

    /**
     * Push the expiry forward. Ok(false) means the lease was lost.
     */
    [[nodiscard]] Result<bool, Error> renew(Timestamp now);

    [[nodiscard]] Status release();

    [[nodiscard]] const Uuid& owner() const { return owner_; }

    /**
     * Whether anyone currently holds an unexpired lease.
     */
    [[nodiscard]] Result<bool, Error> held_by_anyone(Timestamp now);

private:
    Database& db_;
    Uuid owner_;
    std::chrono::milliseconds ttl_;
};

} // namespace larder::storage
