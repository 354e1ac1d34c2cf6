#pragma once

#include "support/scripted_remote.hpp"
#include "sync/engine.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>

namespace larder::testing {

using namespace std::chrono_literals;

/**
 * TestClock - Manually advanced time source.
 */
struct TestClock {
    Timestamp now{1'700'000'000'000};

    [[nodiscard]] ClockFn fn() {
        return [this] { return now; };
    }
    void advance(std::chrono::milliseconds d) { now = now + d; }
};

inline config::EngineConfig test_config() {
    config::EngineConfig config;
    config.database_path = QStringLiteral(":memory:");
    config.pull_remote = false;
    config.quota_bytes = int64_t{1} << 30;
    return config;
}

struct EngineFixture {
    TestClock clock;
    ScriptedRemote* remote = nullptr;
    std::unique_ptr<sync::Engine> engine;

    explicit EngineFixture(config::EngineConfig config = test_config()) {
        auto owned = std::make_unique<ScriptedRemote>();
        remote = owned.get();
        auto opened = sync::Engine::open(config, std::move(owned), clock.fn());
        REQUIRE(opened.is_ok());
        engine = std::move(opened).unwrap();
    }

    [[nodiscard]] sync::LocalStore& store() { return engine->store(); }

    // Seed a record both remotely and locally as confirmed.
    void seed(EntityType type, const std::string& id, const Fields& fields, int64_t version) {
        remote->set(type, id, fields, version, clock.now);
        auto applied = store().apply_remote(network::RemoteRecord{type, id, fields, version, clock.now});
        REQUIRE(applied.is_ok());
        REQUIRE(applied.unwrap());
    }

    [[nodiscard]] sync::DrainReport drain(sync::WakeReason reason = sync::WakeReason::SyncNow) {
        auto report = engine->on_wake(reason);
        REQUIRE(report.is_ok());
        return std::move(report).unwrap();
    }

    [[nodiscard]] std::vector<SyncQueueEntry> entries() {
        return store().queue().list_all().unwrap();
    }
};

inline Fields widget(int64_t quantity) {
    return Fields{{field::Name, std::string("Widget")}, {field::Quantity, quantity}};
}

} // namespace larder::testing
