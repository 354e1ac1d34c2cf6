#include <catch2/catch_test_macros.hpp>
#include "support/engine_fixture.hpp"
#include <QJsonArray>
#include <QJsonObject>
#include <algorithm>

using namespace larder;
using namespace larder::testing;

namespace {

bool mentions(const std::vector<std::string>& suggestions, std::string_view needle) {
    return std::any_of(suggestions.begin(), suggestions.end(), [&](const std::string& s) {
        return s.find(needle) != std::string::npos;
    });
}

} // namespace

TEST_CASE("StorageOptimizer: metrics", "[integration][storage]") {
    EngineFixture fx;
    auto metrics = fx.engine->optimizer().update_metrics();
    REQUIRE(metrics.is_ok());
    REQUIRE(metrics.unwrap().used_bytes > 0);
    REQUIRE(metrics.unwrap().quota_bytes == (int64_t{1} << 30));
    // In-memory databases never count as persistent.
    REQUIRE_FALSE(metrics.unwrap().persistent_granted);
    REQUIRE(metrics.unwrap().percent_used() < 1.0);
}

TEST_CASE("StorageOptimizer: critical usage raises one notification", "[integration][storage]") {
    auto config = test_config();
    config.quota_bytes = 1024;
    EngineFixture fx(config);

    REQUIRE(fx.engine->optimizer().update_metrics().is_ok());
    REQUIRE(fx.engine->optimizer().update_metrics().is_ok());
    auto notes = fx.store().journal().notifications(true).unwrap();
    REQUIRE(notes.size() == 1);
    REQUIRE(notes.front().kind == notification_kind::StorageLow);

    REQUIRE_FALSE(fx.engine->optimizer().has_enough_space(1).unwrap());
}

TEST_CASE("StorageOptimizer: cleanup only prunes journals", "[integration][storage]") {
    EngineFixture fx;
    auto item = create_item("i1", "Gloves", 1);
    item.min_quantity = 5;
    REQUIRE(fx.store().put_item(item).is_ok());
    REQUIRE(fx.store().journal().activity_count().unwrap() == 1);
    REQUIRE(fx.store().journal().notification_count().unwrap() == 1);

    fx.clock.advance(std::chrono::hours(24 * 40));
    REQUIRE(fx.store().adjust_quantity("i1", 1).is_ok());

    auto freed = fx.engine->optimizer().cleanup_old_data(30);
    REQUIRE(freed.is_ok());
    REQUIRE(freed.unwrap() > 0);
    REQUIRE(fx.store().journal().activity_count().unwrap() == 1);
    REQUIRE(fx.store().journal().notification_count().unwrap() == 0);

    // Records and queued work are never pruned.
    REQUIRE(fx.store().get(EntityType::Item, "i1").is_ok());
    REQUIRE(fx.entries().size() == 2);

    SECTION("Nothing left to prune") {
        REQUIRE(fx.engine->optimizer().cleanup_old_data(30).unwrap() == 0);
    }

    SECTION("Negative ages are refused") {
        REQUIRE(fx.engine->optimizer().cleanup_old_data(-1).unwrap_err().kind == ErrorKind::InvalidArgument);
    }
}

TEST_CASE("StorageOptimizer: suggestions", "[integration][storage]") {
    EngineFixture fx;

    SECTION("A fresh in-memory store only warns about persistence") {
        auto suggestions = fx.engine->optimizer().get_suggestions().unwrap();
        REQUIRE(suggestions.size() == 1);
        REQUIRE(mentions(suggestions, "persistent"));
    }

    SECTION("Old journals and open conflicts are reported") {
        fx.seed(EntityType::Item, "i1", widget(2), 1);
        REQUIRE(fx.store().put(EntityType::Item, "i1", Fields{{field::Quantity, int64_t{5}}}).is_ok());
        fx.remote->set(EntityType::Item, "i1", widget(8), 2);
        (void)fx.drain();

        fx.clock.advance(std::chrono::hours(24 * 100));
        auto suggestions = fx.engine->optimizer().get_suggestions().unwrap();
        REQUIRE(mentions(suggestions, "Activity log exceeds 90 days"));
        REQUIRE(mentions(suggestions, "1 conflict(s)"));
    }
}

TEST_CASE("StorageOptimizer: compact refuses to run inside a transaction", "[integration][storage]") {
    EngineFixture fx;
    auto& db = fx.engine->database();
    auto inside = db.transaction([&]() -> Result<int64_t, Error> {
        return fx.engine->optimizer().compact();
    });
    REQUIRE(inside.is_err());
    REQUIRE(inside.unwrap_err().kind == ErrorKind::InvalidArgument);

    REQUIRE(fx.engine->optimizer().compact().is_ok());
}

TEST_CASE("StorageOptimizer: export covers every collection", "[integration][storage]") {
    EngineFixture fx;
    REQUIRE(fx.store().put_category(create_category("c1", "Tools")).is_ok());
    REQUIRE(fx.store().put_item(create_item("i1", "Hammer", 2, "c1")).is_ok());
    (void)fx.drain();
    REQUIRE(fx.store().put(EntityType::Item, "i1", Fields{{field::Quantity, int64_t{3}}}).is_ok());

    auto exported = fx.engine->optimizer().export_data();
    REQUIRE(exported.is_ok());
    const auto root = exported.unwrap().object();
    REQUIRE(root.value(QStringLiteral("items")).toArray().size() == 1);
    REQUIRE(root.value(QStringLiteral("categories")).toArray().size() == 1);
    REQUIRE(root.value(QStringLiteral("sync_queue")).toArray().size() == 1);
    REQUIRE(root.value(QStringLiteral("activity_log")).toArray().size() == 3);
    REQUIRE(root.value(QStringLiteral("sync_history")).toArray().size() == 1);

    const auto item = root.value(QStringLiteral("items")).toArray().at(0).toObject();
    REQUIRE(item.value(QStringLiteral("sync_state")).toString() == QStringLiteral("unconfirmed"));
    REQUIRE(item.value(QStringLiteral("fields")).toObject().value(QStringLiteral("quantity")).toInteger() == 3);
}
