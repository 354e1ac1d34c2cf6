#pragma once

#include "core/inventory.hpp"
#include "core/journal.hpp"
#include "core/record.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/remote_api.hpp"
#include "storage/conflict_repository.hpp"
#include "storage/database.hpp"
#include "storage/journal_repository.hpp"
#include "storage/queue_repository.hpp"
#include "storage/record_repository.hpp"
#include <QMetaObject>
#include <QObject>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace larder::sync {

enum class ChangeCause {
    LocalWrite,
    RemoteApply,
    Resolution,
    Confirmed,
    Reverted,
    Purged
};

[[nodiscard]] constexpr std::string_view cause_name(ChangeCause cause) {
    switch (cause) {
        case ChangeCause::LocalWrite: return "local_write";
        case ChangeCause::RemoteApply: return "remote_apply";
        case ChangeCause::Resolution: return "resolution";
        case ChangeCause::Confirmed: return "confirmed";
        case ChangeCause::Reverted: return "reverted";
        case ChangeCause::Purged: return "purged";
    }
    return "unknown";
}

struct RecordEvent {
    EntityType type{EntityType::Item};
    std::string id;
    ChangeCause cause{ChangeCause::LocalWrite};
};

/**
 * Subscription - Observer registration. Unsubscribes when destroyed or
 * reset; movable, not copyable.
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(QMetaObject::Connection connection) : connection_(connection) {}
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept : connection_(other.connection_) {
        other.connection_ = {};
    }
    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            connection_ = other.connection_;
            other.connection_ = {};
        }
        return *this;
    }

    void reset() {
        if (connection_) {
            QObject::disconnect(connection_);
            connection_ = {};
        }
    }

    [[nodiscard]] bool active() const { return static_cast<bool>(connection_); }

private:
    QMetaObject::Connection connection_;
};

/**
 * StoreTxn - Handle given to code running inside LocalStore::transact().
 * Record writes made through it are announced to observers only after the
 * transaction commits.
 */
class StoreTxn {
public:
    StoreTxn(storage::RecordRepository& records,
             storage::QueueRepository& queue,
             storage::ConflictRepository& conflicts,
             storage::JournalRepository& journal,
             Timestamp now)
        : records_(records), queue_(queue), conflicts_(conflicts), journal_(journal), now_(now) {}

    /**
     * Record including tombstoned ones.
     */
    [[nodiscard]] Result<std::optional<Record>, Error> find(EntityType type, const std::string& id);
    [[nodiscard]] Status save(const Record& record, ChangeCause cause);
    [[nodiscard]] Status purge(EntityType type, const std::string& id);

    [[nodiscard]] Status log(ActivityAction action, std::optional<EntityType> type,
                             std::optional<std::string> id, std::string description);
    [[nodiscard]] Status notify(std::string kind, std::string title, std::string body);

    [[nodiscard]] storage::QueueRepository& queue() { return queue_; }
    [[nodiscard]] storage::ConflictRepository& conflicts() { return conflicts_; }
    [[nodiscard]] storage::JournalRepository& journal() { return journal_; }
    [[nodiscard]] Timestamp now() const { return now_; }

    [[nodiscard]] const std::vector<RecordEvent>& events() const { return events_; }

private:
    storage::RecordRepository& records_;
    storage::QueueRepository& queue_;
    storage::ConflictRepository& conflicts_;
    storage::JournalRepository& journal_;
    Timestamp now_;
    std::vector<RecordEvent> events_;
};

/**
 * LocalStore - The single writer of records and of the queue.
 *
 * put() and remove() apply the tentative write, append the matching sync
 * queue entry and an activity line in one SQLite transaction; the write is
 * durable when the call returns.
 */
class LocalStore : public QObject {
    Q_OBJECT

public:
    // Payloads above this size are checked against the storage quota first.
    static constexpr int64_t LARGE_WRITE_BYTES = 64 * 1024;

    using SpaceCheck = std::function<Result<bool, Error>(int64_t)>;

    LocalStore(storage::Database& db, ClockFn clock, QObject* parent = nullptr);

    /**
     * Live record, NotFound when absent or tombstoned.
     */
    [[nodiscard]] Result<Record, Error> get(EntityType type, const std::string& id);

    /**
     * Write `fields` (full image for a new record, any subset for an
     * existing one). Unchanged fields are not queued; a write that changes
     * nothing enqueues nothing.
     */
    [[nodiscard]] Result<Record, Error> put(EntityType type, const std::string& id, const Fields& fields);
    [[nodiscard]] Result<Record, Error> put_item(const Item& item);
    [[nodiscard]] Result<Record, Error> put_category(const Category& category);

    /**
     * Tombstone the record and queue its deletion. Unsent updates and
     * held conflicts for the record are dropped; deletion takes precedence.
     */
    [[nodiscard]] Status remove(EntityType type, const std::string& id);

    /**
     * Add `delta` to an item's quantity, never going below zero.
     */
    [[nodiscard]] Result<Record, Error> adjust_quantity(const std::string& item_id, int64_t delta);

    [[nodiscard]] storage::RecordQuery query(EntityType type, storage::RecordPredicate predicate = {});

    /**
     * Ingest a record read from the backend. Returns false (and leaves the
     * record alone) when it has local work queued or is already newer.
     */
    [[nodiscard]] Result<bool, Error> apply_remote(const network::RemoteRecord& remote);

    [[nodiscard]] Result<int64_t, Error> count(EntityType type);
    [[nodiscard]] Result<int64_t, Error> pending_count();
    [[nodiscard]] Result<int64_t, Error> conflict_count();

    [[nodiscard]] Subscription subscribe(std::function<void(const RecordEvent&)> callback);

    void set_space_check(SpaceCheck check) { space_check_ = std::move(check); }

    /**
     * Run `f(StoreTxn&)` in one transaction and announce its record events
     * once it commits.
     */
    template<typename F>
    [[nodiscard]] auto transact(F&& f) -> std::invoke_result_t<F, StoreTxn&> {
        StoreTxn txn(records_, queue_, conflicts_, journal_, clock_());
        auto result = db_.transaction([&] { return f(txn); });
        if (result.is_ok()) {
            for (const auto& event : txn.events()) {
                emit recordChanged(event);
            }
        }
        return result;
    }

    [[nodiscard]] storage::Database& database() { return db_; }
    [[nodiscard]] storage::QueueRepository& queue() { return queue_; }
    [[nodiscard]] storage::ConflictRepository& conflicts() { return conflicts_; }
    [[nodiscard]] storage::JournalRepository& journal() { return journal_; }
    [[nodiscard]] Timestamp now() const { return clock_(); }

signals:
    void recordChanged(const larder::sync::RecordEvent& event);

private:
    [[nodiscard]] Status ensure_space(int64_t bytes);
    [[nodiscard]] Result<Record, Error> write(EntityType type, const std::string& id,
                                              const Fields& fields,
                                              std::optional<ActivityAction> action);

    storage::Database& db_;
    ClockFn clock_;
    storage::RecordRepository records_;
    storage::QueueRepository queue_;
    storage::ConflictRepository conflicts_;
    storage::JournalRepository journal_;
    SpaceCheck space_check_;
};

} // namespace larder::sync

Q_DECLARE_METATYPE(larder::sync::RecordEvent)
