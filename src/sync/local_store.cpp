#include "sync/local_store.hpp"

#include "log/logging.hpp"
#include "storage/field_codec.hpp"
#include <algorithm>

namespace larder::sync {

namespace {

std::string display_name(const Fields& fields, const std::string& fallback) {
    return as_text(field_or_null(fields, field::Name)).value_or(fallback);
}

bool low_stock(const Fields& fields) {
    const auto quantity = as_integer(field_or_null(fields, field::Quantity)).value_or(0);
    const auto minimum = as_integer(field_or_null(fields, field::MinQuantity)).value_or(0);
    return minimum > 0 && quantity < minimum;
}

std::string joined_keys(const Fields& fields) {
    std::string out;
    for (const auto& [name, value] : fields) {
        if (!out.empty()) out += ", ";
        out += name;
    }
    return out;
}

Error not_found(EntityType type, const std::string& id) {
    return Error::of(ErrorKind::NotFound, std::string(type_name(type)) + " " + id + " not found");
}

} // namespace

// ============================================================================
// StoreTxn
// ============================================================================

Result<std::optional<Record>, Error> StoreTxn::find(EntityType type, const std::string& id) {
    return records_.get(type, id);
}

Status StoreTxn::save(const Record& record, ChangeCause cause) {
    auto saved = records_.save(record);
    if (saved.is_ok()) {
        events_.push_back(RecordEvent{.type = record.type, .id = record.id, .cause = cause});
    }
    return saved;
}

Status StoreTxn::purge(EntityType type, const std::string& id) {
    auto purged = records_.purge(type, id);
    if (purged.is_ok()) {
        events_.push_back(RecordEvent{.type = type, .id = id, .cause = ChangeCause::Purged});
    }
    return purged;
}

Status StoreTxn::log(ActivityAction action, std::optional<EntityType> type,
                     std::optional<std::string> id, std::string description) {
    ActivityEntry entry;
    entry.entity_type = type;
    entry.entity_id = std::move(id);
    entry.action = action;
    entry.description = std::move(description);
    entry.created_at = now_;
    auto appended = journal_.append_activity(entry);
    if (appended.is_err()) {
        return Status::err(appended.unwrap_err());
    }
    return Status::ok();
}

Status StoreTxn::notify(std::string kind, std::string title, std::string body) {
    NotificationEntry entry;
    entry.kind = std::move(kind);
    entry.title = std::move(title);
    entry.body = std::move(body);
    entry.created_at = now_;
    auto added = journal_.add_notification(entry);
    if (added.is_err()) {
        return Status::err(added.unwrap_err());
    }
    return Status::ok();
}

// ============================================================================
// LocalStore
// ============================================================================

LocalStore::LocalStore(storage::Database& db, ClockFn clock, QObject* parent)
    : QObject(parent)
    , db_(db)
    , clock_(std::move(clock))
    , records_(db)
    , queue_(db)
    , conflicts_(db)
    , journal_(db)
{
    qRegisterMetaType<larder::sync::RecordEvent>();
}

Result<Record, Error> LocalStore::get(EntityType type, const std::string& id) {
    auto found = records_.get(type, id);
    if (found.is_err()) {
        return forward_err<Record>(found);
    }
    auto& record = found.unwrap();
    if (!record || record->tombstoned) {
        return Result<Record, Error>::err(not_found(type, id));
    }
    return Result<Record, Error>::ok(std::move(*record));
}

Result<Record, Error> LocalStore::put(EntityType type, const std::string& id, const Fields& fields) {
    return write(type, id, fields, std::nullopt);
}

Result<Record, Error> LocalStore::put_item(const Item& item) {
    return put(EntityType::Item, item.id, to_fields(item));
}

Result<Record, Error> LocalStore::put_category(const Category& category) {
    return put(EntityType::Category, category.id, to_fields(category));
}

Result<Record, Error> LocalStore::adjust_quantity(const std::string& item_id, int64_t delta) {
    auto current = get(EntityType::Item, item_id);
    if (current.is_err()) {
        return current;
    }
    const auto quantity = as_integer(field_or_null(current.unwrap().fields, field::Quantity)).value_or(0);
    const int64_t next = std::max<int64_t>(0, quantity + delta);
    return write(EntityType::Item, item_id, Fields{{field::Quantity, next}},
                 ActivityAction::QuantityAdjusted);
}

Status LocalStore::ensure_space(int64_t bytes) {
    if (!space_check_ || bytes <= LARGE_WRITE_BYTES) {
        return Status::ok();
    }
    auto enough = space_check_(bytes);
    if (enough.is_err()) {
        return Status::err(enough.unwrap_err());
    }
    if (!enough.unwrap()) {
        return Status::err(Error::of(ErrorKind::StorageQuotaExceeded,
            "Not enough storage for a " + std::to_string(bytes) + " byte write"));
    }
    return Status::ok();
}

Result<Record, Error> LocalStore::write(EntityType type, const std::string& id, const Fields& fields,
                                        std::optional<ActivityAction> action) {
    using R = Result<Record, Error>;
    if (id.empty()) {
        return R::err(Error::of(ErrorKind::InvalidArgument, "Record id must not be empty"));
    }
    auto space = ensure_space(static_cast<int64_t>(storage::encode_fields(fields).size()));
    if (space.is_err()) {
        return R::err(space.unwrap_err());
    }

    auto written = transact([&](StoreTxn& txn) -> R {
        auto found = txn.find(type, id);
        if (found.is_err()) {
            return forward_err<Record>(found);
        }
        const auto& existing = found.unwrap();
        if (existing && existing->tombstoned) {
            return R::err(Error::of(ErrorKind::InvalidArgument,
                std::string(type_name(type)) + " " + id + " is deleted"));
        }

        const Fields image = existing ? overlay(existing->fields, fields) : fields;
        auto valid = validate_fields(type, image, false);
        if (valid.is_err()) {
            return R::err(valid.unwrap_err());
        }

        const bool creating = !existing;
        const Fields changed = creating ? fields : changed_fields(existing->fields, fields);
        if (!creating && changed.empty()) {
            return R::ok(*existing);
        }

        Record base;
        if (existing) {
            base = *existing;
        } else {
            base.type = type;
            base.id = id;
        }
        const Fields base_fields = creating ? Fields{} : project(existing->confirmed_image(), keys_of(changed));
        Record next = with_local_write(std::move(base), changed, txn.now());

        auto saved = txn.save(next, ChangeCause::LocalWrite);
        if (saved.is_err()) {
            return R::err(saved.unwrap_err());
        }

        SyncQueueEntry entry{
            .id = 0,
            .operation_id = Uuid::generate(),
            .entity_type = type,
            .entity_id = id,
            .operation = creating ? Operation::Create : Operation::Update,
            .payload = changed,
            .base_fields = base_fields,
            .base_version = next.remote_version,
            .retry_count = 0,
            .state = EntryState::Pending,
            .enqueued_at = txn.now(),
            .next_attempt_at = txn.now(),
            .last_error = {},
            .checksum = {},
        };
        auto inserted = txn.queue().insert(entry);
        if (inserted.is_err()) {
            return forward_err<Record>(inserted);
        }

        const auto name = display_name(next.fields, id);
        const auto chosen = action.value_or(creating ? ActivityAction::Added : ActivityAction::Updated);
        std::string description = std::string(type_name(type)) + " '" + name + "'";
        if (chosen == ActivityAction::QuantityAdjusted) {
            description += " quantity set to " + display(field_or_null(next.fields, field::Quantity));
        } else if (!creating) {
            description += ": " + joined_keys(changed);
        }
        auto logged = txn.log(chosen, type, id, std::move(description));
        if (logged.is_err()) {
            return R::err(logged.unwrap_err());
        }

        if (type == EntityType::Item && low_stock(next.fields) &&
            !(existing && low_stock(existing->fields))) {
            auto notified = txn.notify(notification_kind::LowStock, "Low stock: " + name,
                name + " is below its minimum quantity");
            if (notified.is_err()) {
                return R::err(notified.unwrap_err());
            }
        }

        qCDebug(larderStoreLog) << "queued" << operation_name(entry.operation).data()
                                << type_name(type).data() << QString::fromStdString(id)
                                << "entry" << inserted.unwrap();
        return R::ok(std::move(next));
    });
    return written;
}

Status LocalStore::remove(EntityType type, const std::string& id) {
    return transact([&](StoreTxn& txn) -> Status {
        auto found = txn.find(type, id);
        if (found.is_err()) {
            return Status::err(found.unwrap_err());
        }
        const auto& existing = found.unwrap();
        if (!existing || existing->tombstoned) {
            return Status::err(not_found(type, id));
        }

        auto entries = txn.queue().for_entity(type, id);
        if (entries.is_err()) {
            return Status::err(entries.unwrap_err());
        }
        // A send that was attempted may have been applied even though its
        // reply was lost, so only an entry that never left the queue proves
        // the backend has not seen the record.
        bool ever_sent = false;
        for (const auto& entry : entries.unwrap()) {
            if (entry.state == EntryState::InFlight) {
                ever_sent = true;
                continue;
            }
            if (entry.retry_count > 0) {
                ever_sent = true;
            }
            if (entry.state == EntryState::Conflicted) {
                qCInfo(larderConflictLog) << "dropping held conflicts of entry" << entry.id
                                          << "superseded by local delete";
            }
            auto removed = txn.queue().remove(entry.id);
            if (removed.is_err()) {
                return removed;
            }
        }

        const auto name = display_name(existing->fields, id);
        auto logged = txn.log(ActivityAction::Deleted, type, id,
                              std::string(type_name(type)) + " '" + name + "' deleted");
        if (logged.is_err()) {
            return logged;
        }

        // Never offered to the backend: nothing to delete remotely.
        if (existing->remote_version == 0 && !ever_sent) {
            return txn.purge(type, id);
        }

        Record tombstone = with_tombstone(*existing, txn.now());
        auto saved = txn.save(tombstone, ChangeCause::LocalWrite);
        if (saved.is_err()) {
            return saved;
        }

        SyncQueueEntry entry{
            .id = 0,
            .operation_id = Uuid::generate(),
            .entity_type = type,
            .entity_id = id,
            .operation = Operation::Delete,
            .payload = {},
            .base_fields = {},
            .base_version = existing->remote_version,
            .retry_count = 0,
            .state = EntryState::Pending,
            .enqueued_at = txn.now(),
            .next_attempt_at = txn.now(),
            .last_error = {},
            .checksum = {},
        };
        auto inserted = txn.queue().insert(entry);
        if (inserted.is_err()) {
            return Status::err(inserted.unwrap_err());
        }
        return Status::ok();
    });
}

storage::RecordQuery LocalStore::query(EntityType type, storage::RecordPredicate predicate) {
    return records_.query(type, std::move(predicate));
}

Result<bool, Error> LocalStore::apply_remote(const network::RemoteRecord& remote) {
    using R = Result<bool, Error>;
    return transact([&](StoreTxn& txn) -> R {
        auto entries = txn.queue().for_entity(remote.type, remote.id);
        if (entries.is_err()) {
            return forward_err<bool>(entries);
        }
        if (!entries.unwrap().empty()) {
            return R::ok(false);
        }

        auto found = txn.find(remote.type, remote.id);
        if (found.is_err()) {
            return forward_err<bool>(found);
        }
        if (found.unwrap() && found.unwrap()->remote_version >= remote.version) {
            return R::ok(false);
        }

        auto saved = txn.save(remote_record(remote.type, remote.id, remote.fields,
                                            remote.version, txn.now()),
                              ChangeCause::RemoteApply);
        if (saved.is_err()) {
            return R::err(saved.unwrap_err());
        }
        return R::ok(true);
    });
}

Result<int64_t, Error> LocalStore::count(EntityType type) {
    return records_.count(type);
}

Result<int64_t, Error> LocalStore::pending_count() {
    return queue_.pending_count();
}

Result<int64_t, Error> LocalStore::conflict_count() {
    return conflicts_.count();
}

Subscription LocalStore::subscribe(std::function<void(const RecordEvent&)> callback) {
    return Subscription(connect(this, &LocalStore::recordChanged, this, std::move(callback)));
}

} // namespace larder::sync
