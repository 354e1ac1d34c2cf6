#include "storage/drain_lease.hpp"

namespace larder::storage {

namespace {
constexpr const char* kLeaseKey = "drain";
}

Result<bool, Error> DrainLease::try_acquire(Timestamp now) {
    auto ran = db_.run(R"SQL(
        INSERT INTO engine_state (key, owner, expires_at) VALUES (?1, ?2, ?3)
        ON CONFLICT(key) DO UPDATE SET owner = excluded.owner, expires_at = excluded.expires_at
        WHERE engine_state.expires_at <= ?4 OR engine_state.owner = excluded.owner;
    )SQL", kLeaseKey, owner_.to_string(), (now + ttl_).millis(), now.millis());
    if (ran.is_err()) {
        return Result<bool, Error>::err(ran.unwrap_err());
    }
    return Result<bool, Error>::ok(db_.changes() == 1);
}

Result<bool, Error> DrainLease::renew(Timestamp now) {
    auto ran = db_.run("UPDATE engine_state SET expires_at = ? WHERE key = ? AND owner = ?;",
                       (now + ttl_).millis(), kLeaseKey, owner_.to_string());
    if (ran.is_err()) {
        return Result<bool, Error>::err(ran.unwrap_err());
    }
    return Result<bool, Error>::ok(db_.changes() == 1);
}

Status DrainLease::release() {
    return db_.run("DELETE FROM engine_state WHERE key = ? AND owner = ?;",
                   kLeaseKey, owner_.to_string());
}

Result<bool, Error> DrainLease::held_by_anyone(Timestamp now) {
    auto prepared = db_.prepare("SELECT COUNT(*) FROM engine_state WHERE key = ? AND expires_at > ?;");
    if (prepared.is_err()) {
        return forward_err<bool>(prepared);
    }
    auto stmt = std::move(prepared).unwrap();
    auto bound = stmt.bind_all(kLeaseKey, now.millis());
    if (bound.is_err()) {
        return Result<bool, Error>::err(bound.unwrap_err());
    }
    auto stepped = stmt.step();
    if (stepped.is_err()) {
        return forward_err<bool>(stepped);
    }
    return Result<bool, Error>::ok(stepped.unwrap() && stmt.column_int64(0) > 0);
}

} // namespace larder::storage
