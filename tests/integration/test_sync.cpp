#include <catch2/catch_test_macros.hpp>
#include "support/engine_fixture.hpp"
#include "storage/drain_lease.hpp"

using namespace larder;
using namespace larder::testing;
using sync::WakeReason;

TEST_CASE("Sync: local create is confirmed and promoted", "[integration][sync]") {
    EngineFixture fx;
    auto written = fx.store().put(EntityType::Item, "i1", widget(3));
    REQUIRE(written.is_ok());
    REQUIRE(written.unwrap().sync_state == SyncState::Unconfirmed);
    REQUIRE(fx.engine->pending_count().unwrap() == 1);

    auto report = fx.drain();
    REQUIRE(report.ran);
    REQUIRE(report.history.confirmed == 1);

    auto record = fx.store().get(EntityType::Item, "i1").unwrap();
    REQUIRE(record.sync_state == SyncState::Confirmed);
    REQUIRE(record.remote_version == 1);
    REQUIRE(record.in_sync());
    REQUIRE(fx.engine->pending_count().unwrap() == 0);
    REQUIRE(fx.remote->find(EntityType::Item, "i1")->fields == widget(3));
    REQUIRE(fx.engine->sync().status() == sync::SyncStatus::Synced);
}

TEST_CASE("Sync: five network failures back off and stay pending", "[integration][sync]") {
    auto config = test_config();
    config.max_attempts = 4;
    EngineFixture fx(config);
    for (int i = 0; i < 5; ++i) {
        REQUIRE(fx.store().put(EntityType::Item, "item-" + std::to_string(i), widget(i)).is_ok());
    }
    fx.remote->always_fail = network_down();

    const Timestamp start = fx.clock.now;
    auto first = fx.drain();
    REQUIRE(first.history.retried == 5);
    REQUIRE(first.failures.empty());
    REQUIRE(fx.engine->sync().status() == sync::SyncStatus::Offline);
    for (const auto& entry : fx.entries()) {
        REQUIRE(entry.state == EntryState::Pending);
        REQUIRE(entry.retry_count == 1);
        REQUIRE(entry.next_attempt_at == start + 1s);
        REQUIRE(entry.last_error == "connection refused");
    }

    SECTION("Nothing is resent before the delay elapses") {
        auto early = fx.drain();
        REQUIRE(early.history.retried == 0);
        REQUIRE(fx.remote->sent.size() == 5);
    }

    SECTION("Delays double on each further failure") {
        fx.clock.advance(1s);
        (void)fx.drain();
        for (const auto& entry : fx.entries()) {
            REQUIRE(entry.retry_count == 2);
            REQUIRE(entry.next_attempt_at == fx.clock.now + 2s);
        }
        fx.clock.advance(2s);
        (void)fx.drain();
        for (const auto& entry : fx.entries()) {
            REQUIRE(entry.retry_count == 3);
            REQUIRE(entry.next_attempt_at == fx.clock.now + 4s);
        }
    }
}

TEST_CASE("Sync: retry ceiling removes the entry and reports the payload", "[integration][sync]") {
    EngineFixture fx;
    fx.seed(EntityType::Item, "i1", widget(2), 1);
    REQUIRE(fx.store().put(EntityType::Item, "i1", Fields{{field::Quantity, int64_t{7}}}).is_ok());
    fx.remote->always_fail = Error::of(ErrorKind::ServerRejection, "HTTP 503", 503);

    std::vector<sync::TerminalFailure> surfaced;
    QObject::connect(&fx.engine->sync(), &sync::SyncManager::terminalFailure,
                     [&](const sync::TerminalFailure& f) { surfaced.push_back(f); });

    (void)fx.drain();
    fx.clock.advance(1s);
    (void)fx.drain();
    REQUIRE(fx.entries().size() == 1);
    fx.clock.advance(2s);
    auto last = fx.drain();

    REQUIRE(fx.remote->sent.size() == 3);
    REQUIRE(last.failures.size() == 1);
    REQUIRE(surfaced.size() == 1);
    REQUIRE(surfaced.front().error.kind == ErrorKind::TerminalSyncFailure);
    REQUIRE(surfaced.front().entry.payload == Fields{{field::Quantity, int64_t{7}}});
    REQUIRE(fx.entries().empty());

    // The tentative write is rolled back to the confirmed image.
    auto record = fx.store().get(EntityType::Item, "i1").unwrap();
    REQUIRE(record.fields == widget(2));
    REQUIRE(record.sync_state == SyncState::Confirmed);
    REQUIRE(record.in_sync());

    auto activity = fx.store().journal().recent_activity(1).unwrap();
    REQUIRE(activity.front().action == ActivityAction::SyncFailed);
    auto notes = fx.store().journal().notifications(true).unwrap();
    REQUIRE(notes.size() == 1);
    REQUIRE(notes.front().kind == notification_kind::SyncFailed);

    fx.clock.advance(1h);
    (void)fx.drain();
    REQUIRE(fx.remote->sent.size() == 3);
}

TEST_CASE("Sync: a never-confirmed create is purged on terminal failure", "[integration][sync]") {
    EngineFixture fx;
    REQUIRE(fx.store().put(EntityType::Item, "new", widget(1)).is_ok());
    REQUIRE(fx.store().put(EntityType::Item, "new", Fields{{field::Quantity, int64_t{2}}}).is_ok());
    fx.remote->always_fail = Error::of(ErrorKind::ServerRejection, "HTTP 422", 422);

    for (int i = 0; i < 3; ++i) {
        (void)fx.drain();
        fx.clock.advance(10s);
    }

    REQUIRE(fx.store().get(EntityType::Item, "new").is_err());
    REQUIRE(fx.entries().empty());
}

TEST_CASE("Sync: per-entity order survives a crash mid-flight", "[integration][sync]") {
    EngineFixture fx;
    REQUIRE(fx.store().put(EntityType::Item, "i1", widget(1)).is_ok());
    REQUIRE(fx.store().put(EntityType::Item, "i1", Fields{{field::Quantity, int64_t{2}}}).is_ok());
    REQUIRE(fx.store().put(EntityType::Item, "i2", widget(9)).is_ok());
    REQUIRE(fx.store().put(EntityType::Item, "i1", Fields{{field::Quantity, int64_t{3}}}).is_ok());

    auto queued = fx.entries();
    REQUIRE(queued.size() == 4);

    // The backend applied the create but the process died before the reply
    // was recorded: the entry is still InFlight on restart.
    REQUIRE(fx.store().queue().set_state(queued[0].id, EntryState::InFlight).is_ok());
    REQUIRE(fx.remote->send(network::MutationRequest{
        .operation_id = queued[0].operation_id,
        .entity_type = EntityType::Item,
        .entity_id = "i1",
        .operation = Operation::Create,
        .payload = queued[0].payload,
        .base_version = 0,
    }).is_ok());
    fx.remote->sent.clear();

    auto report = fx.drain();
    REQUIRE(report.recovered == 1);
    REQUIRE(report.history.confirmed == 4);

    std::vector<std::string> i1_sends;
    for (const auto& request : fx.remote->sent) {
        if (request.entity_id == "i1") {
            i1_sends.push_back(std::string(operation_name(request.operation)) + "@" +
                               std::to_string(request.base_version));
        }
    }
    const std::vector<std::string> expected{"create@0", "update@1", "update@2"};
    REQUIRE(i1_sends == expected);
    REQUIRE(fx.remote->sent.front().operation_id == queued[0].operation_id);

    const auto* remote = fx.remote->find(EntityType::Item, "i1");
    REQUIRE(remote->version == 3);
    REQUIRE(remote->fields.at(field::Quantity) == FieldValue{int64_t{3}});
    REQUIRE(fx.store().get(EntityType::Item, "i1").unwrap().in_sync());
}

TEST_CASE("Sync: wakes during a drain are coalesced", "[integration][sync]") {
    EngineFixture fx;
    for (int i = 0; i < 3; ++i) {
        REQUIRE(fx.store().put(EntityType::Item, "i" + std::to_string(i), widget(i)).is_ok());
    }

    int nested_wakes = 0;
    fx.remote->on_send = [&] {
        auto nested = fx.engine->on_wake(WakeReason::ConnectivityRestored);
        REQUIRE(nested.is_ok());
        REQUIRE_FALSE(nested.unwrap().ran);
        nested_wakes++;
    };

    auto report = fx.drain();
    REQUIRE(report.ran);
    REQUIRE(nested_wakes == 3);
    for (int i = 0; i < 3; ++i) {
        REQUIRE(fx.remote->sends_for("i" + std::to_string(i)) == 1);
    }
    REQUIRE_FALSE(fx.engine->sync().isSyncing());
}

TEST_CASE("Sync: another lease holder keeps this process out", "[integration][sync]") {
    EngineFixture fx;
    REQUIRE(fx.store().put(EntityType::Item, "i1", widget(1)).is_ok());

    storage::DrainLease other(fx.engine->database(), Uuid::generate(), 60s);
    REQUIRE(other.try_acquire(fx.clock.now).unwrap());

    auto blocked = fx.drain();
    REQUIRE_FALSE(blocked.ran);
    REQUIRE(fx.remote->sent.empty());

    SECTION("Released lease") {
        REQUIRE(other.release().is_ok());
        REQUIRE(fx.drain().ran);
        REQUIRE(fx.remote->sent.size() == 1);
    }

    SECTION("Expired lease") {
        fx.clock.advance(61s);
        REQUIRE(fx.drain().ran);
        REQUIRE(fx.remote->sent.size() == 1);
    }
}

TEST_CASE("Sync: abort stops between entries and leaves the rest pending", "[integration][sync]") {
    EngineFixture fx;
    for (int i = 0; i < 3; ++i) {
        REQUIRE(fx.store().put(EntityType::Item, "i" + std::to_string(i), widget(i)).is_ok());
    }
    fx.remote->on_send = [&] { fx.engine->sync().request_abort(); };

    auto report = fx.drain();
    REQUIRE(report.history.aborted);
    REQUIRE(report.history.confirmed == 1);
    REQUIRE(fx.remote->sent.size() == 1);
    auto remaining = fx.entries();
    REQUIRE(remaining.size() == 2);
    for (const auto& entry : remaining) {
        REQUIRE(entry.state == EntryState::Pending);
        REQUIRE(entry.retry_count == 0);
    }
}

TEST_CASE("Sync: corrupted payload fails terminally without a send", "[integration][sync]") {
    EngineFixture fx;
    REQUIRE(fx.store().put(EntityType::Item, "i1", widget(1)).is_ok());
    REQUIRE(fx.engine->database().execute(
        "UPDATE sync_queue SET payload_json = '{\"name\":\"Widget\",\"quantity\":999}';").is_ok());

    auto report = fx.drain();
    REQUIRE(report.failures.size() == 1);
    REQUIRE(report.failures.front().error.kind == ErrorKind::Corrupted);
    REQUIRE(fx.remote->sent.empty());
    REQUIRE(fx.entries().empty());
}

TEST_CASE("Sync: a record deleted remotely is dropped locally", "[integration][sync]") {
    EngineFixture fx;
    fx.seed(EntityType::Item, "i1", widget(2), 1);
    REQUIRE(fx.store().put(EntityType::Item, "i1", Fields{{field::Quantity, int64_t{4}}}).is_ok());
    fx.remote->records.clear();

    auto report = fx.drain();
    REQUIRE(report.failures.size() == 1);
    REQUIRE(report.failures.front().error.kind == ErrorKind::TerminalSyncFailure);
    REQUIRE(fx.store().get(EntityType::Item, "i1").is_err());
}

TEST_CASE("Sync: pull ingests remote records without pending work", "[integration][sync]") {
    auto config = test_config();
    config.pull_remote = true;
    EngineFixture fx(config);
    fx.remote->set(EntityType::Category, "c1", Fields{{field::Name, std::string("Tools")}}, 4);
    fx.remote->set(EntityType::Item, "i1", widget(5), 2);
    REQUIRE(fx.store().put(EntityType::Item, "i2", widget(1)).is_ok());

    auto report = fx.drain();
    REQUIRE(report.history.confirmed == 1);
    // i2 was just confirmed at version 1, so only c1 and i1 are new.
    REQUIRE(report.pulled == 2);
    auto category = fx.store().get(EntityType::Category, "c1").unwrap();
    REQUIRE(category.remote_version == 4);
    REQUIRE(category.sync_state == SyncState::Confirmed);
    REQUIRE(fx.store().count(EntityType::Item).unwrap() == 2);
}

TEST_CASE("Sync: deleting a record whose create was attempted deletes it remotely", "[integration][sync]") {
    auto config = test_config();
    config.pull_remote = true;
    EngineFixture fx(config);
    REQUIRE(fx.store().put(EntityType::Item, "a", widget(1)).is_ok());

    SECTION("The backend applied the create but the reply was lost") {
        fx.remote->on_send = [&] { fx.remote->set(EntityType::Item, "a", widget(1), 1); };
        fx.remote->send_failures.push_back(network_down());
        (void)fx.drain();
        fx.remote->on_send = nullptr;
        REQUIRE(fx.remote->find(EntityType::Item, "a") != nullptr);
        REQUIRE(fx.entries().front().retry_count == 1);

        REQUIRE(fx.store().remove(EntityType::Item, "a").is_ok());
        auto entries = fx.entries();
        REQUIRE(entries.size() == 1);
        REQUIRE(entries.front().operation == Operation::Delete);
        REQUIRE(entries.front().base_version == 0);

        fx.clock.advance(1s);
        auto report = fx.drain();
        REQUIRE(report.history.confirmed == 1);
        REQUIRE(report.pulled == 0);
        REQUIRE(fx.remote->find(EntityType::Item, "a") == nullptr);
    }

    SECTION("The create never arrived") {
        fx.remote->send_failures.push_back(network_down());
        (void)fx.drain();
        REQUIRE(fx.store().remove(EntityType::Item, "a").is_ok());
        REQUIRE(fx.entries().size() == 1);

        fx.clock.advance(1s);
        auto report = fx.drain();
        REQUIRE(report.history.confirmed == 1);
        REQUIRE(fx.remote->find(EntityType::Item, "a") == nullptr);
    }

    REQUIRE(fx.entries().empty());
    REQUIRE(fx.store().get(EntityType::Item, "a").unwrap_err().kind == ErrorKind::NotFound);
    (void)fx.drain();
    REQUIRE(fx.store().get(EntityType::Item, "a").is_err());
}

TEST_CASE("Sync: history and metrics are recorded per drain", "[integration][sync]") {
    EngineFixture fx;
    REQUIRE(fx.store().put(EntityType::Item, "i1", widget(1)).is_ok());
    (void)fx.drain(WakeReason::PeriodicTimer);

    auto history = fx.store().journal().history(10).unwrap();
    REQUIRE(history.size() == 1);
    REQUIRE(history.front().reason == "periodic_timer");
    REQUIRE(history.front().confirmed == 1);

    const auto& metrics = fx.engine->sync().metrics();
    REQUIRE(metrics.total_operations == 1);
    REQUIRE(metrics.successes == 1);
    REQUIRE(metrics.failures == 0);
    REQUIRE(metrics.last_sync.has_value());
}
