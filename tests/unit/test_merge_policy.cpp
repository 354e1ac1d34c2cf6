#include <catch2/catch_test_macros.hpp>
#include "core/merge_policy.hpp"
#include "core/inventory.hpp"
#include <limits>

using namespace larder;

namespace {

Conflict conflict_on(std::string field, FieldValue local, FieldValue remote,
                     std::optional<FieldValue> base = std::nullopt) {
    Conflict c;
    c.id = Uuid::generate();
    c.entity_id = "i1";
    c.field = std::move(field);
    c.local_value = std::move(local);
    c.remote_value = std::move(remote);
    c.base_value = std::move(base);
    c.local_timestamp = Timestamp{1000};
    c.remote_timestamp = Timestamp{2000};
    return c;
}

} // namespace

TEST_CASE("Counters merge by summing both deltas", "[unit][merge]") {
    SECTION("Both sides added stock") {
        auto c = conflict_on(field::Quantity, int64_t{5}, int64_t{8}, int64_t{2});
        REQUIRE(suggest_merge(c) == FieldValue{int64_t{11}});
    }

    SECTION("Opposite movements") {
        auto c = conflict_on(field::Quantity, int64_t{7}, int64_t{4}, int64_t{5});
        REQUIRE(suggest_merge(c) == FieldValue{int64_t{6}});
    }

    SECTION("The result never goes negative") {
        auto c = conflict_on(field::MinQuantity, int64_t{0}, int64_t{1}, int64_t{5});
        REQUIRE(suggest_merge(c) == FieldValue{int64_t{0}});
    }

    SECTION("Without a base the later value wins") {
        auto c = conflict_on(field::Quantity, int64_t{5}, int64_t{8});
        REQUIRE(suggest_merge(c) == FieldValue{int64_t{8}});
    }

    SECTION("Values near the int64 limits") {
        constexpr auto max = std::numeric_limits<int64_t>::max();
        constexpr auto min = std::numeric_limits<int64_t>::min();

        auto unchanged = conflict_on(field::Quantity, max, max, max);
        REQUIRE(suggest_merge(unchanged) == FieldValue{max});

        auto too_large = conflict_on(field::Quantity, max, max, int64_t{0});
        REQUIRE(suggest_merge(too_large) == FieldValue{max});

        auto local_wins = conflict_on(field::Quantity, max, int64_t{1}, int64_t{0});
        local_wins.local_timestamp = Timestamp{3000};
        REQUIRE(suggest_merge(local_wins) == FieldValue{max});

        auto delta_overflows = conflict_on(field::Quantity, max, int64_t{3}, min);
        REQUIRE(suggest_merge(delta_overflows) == FieldValue{int64_t{3}});
    }
}

TEST_CASE("Free text merges line-wise or keeps both", "[unit][merge]") {
    SECTION("Disjoint edits merge") {
        auto c = conflict_on(field::Notes, std::string("top\nmiddle\nbottom-local"),
                             std::string("top-remote\nmiddle\nbottom"),
                             std::string("top\nmiddle\nbottom"));
        REQUIRE(suggest_merge(c) == FieldValue{std::string("top-remote\nmiddle\nbottom-local")});
    }

    SECTION("Overlapping edits are joined") {
        auto c = conflict_on(field::Description, std::string("local"), std::string("remote"),
                             std::string("base"));
        REQUIRE(suggest_merge(c) == FieldValue{std::string("local") + TEXT_MERGE_SEPARATOR + "remote"});
    }

    SECTION("A cleared side yields the other") {
        auto c = conflict_on(field::Notes, std::monostate{}, std::string("remote"), std::string("base"));
        REQUIRE(suggest_merge(c) == FieldValue{std::string("remote")});
    }
}

TEST_CASE("Tags merge as an ordered union", "[unit][merge]") {
    auto c = conflict_on(field::Tags, StringList{"b", "a"}, StringList{"a", "c", "b", "d"});
    REQUIRE(suggest_merge(c) == FieldValue{StringList{"b", "a", "c", "d"}});
}

TEST_CASE("Other fields take the later edit", "[unit][merge]") {
    auto c = conflict_on(field::Location, std::string("Shelf A"), std::string("Shelf B"));
    REQUIRE(suggest_merge(c) == FieldValue{std::string("Shelf B")});
    REQUIRE(suggest_resolution(c) == ResolutionStrategy::KeepRemote);

    SECTION("Ties go to the local edit") {
        c.remote_timestamp = c.local_timestamp;
        REQUIRE(suggest_merge(c) == FieldValue{std::string("Shelf A")});
        REQUIRE(suggest_resolution(c) == ResolutionStrategy::KeepLocal);
    }
}

TEST_CASE("Auto strategies", "[unit][merge]") {
    auto c = conflict_on(field::Quantity, int64_t{5}, int64_t{8}, int64_t{2});

    auto latest = auto_resolution(c, AutoStrategy::LatestWins);
    REQUIRE(latest.strategy == ResolutionStrategy::KeepRemote);
    REQUIRE(latest.resolved_value == FieldValue{int64_t{8}});
    REQUIRE(latest.resolved_by == ResolvedBy::Auto);
    REQUIRE(latest.conflict_id == c.id);

    REQUIRE(auto_resolution(c, AutoStrategy::LocalWins).resolved_value == FieldValue{int64_t{5}});
    REQUIRE(auto_resolution(c, AutoStrategy::RemoteWins).strategy == ResolutionStrategy::KeepRemote);
    REQUIRE(resolved_value_for(c, ResolutionStrategy::Merge) == FieldValue{int64_t{11}});
}

TEST_CASE("Strategy names parse back", "[unit][merge]") {
    for (auto s : {ResolutionStrategy::KeepLocal, ResolutionStrategy::KeepRemote, ResolutionStrategy::Merge}) {
        REQUIRE(parse_strategy(strategy_name(s)) == s);
    }
    for (auto s : {AutoStrategy::LatestWins, AutoStrategy::RemoteWins, AutoStrategy::LocalWins}) {
        REQUIRE(parse_auto_strategy(auto_strategy_name(s)) == s);
    }
    REQUIRE_FALSE(parse_strategy("keep-both").has_value());
}

TEST_CASE("diverging_fields emits one conflict per differing field", "[unit][merge]") {
    Conflict proto;
    proto.entity_id = "i1";
    proto.queue_entry_id = 7;
    proto.remote_version = 3;

    const Fields local{{field::Quantity, int64_t{5}}, {field::Location, std::string("A")},
                       {field::Price, 2.0}};
    const Fields base{{field::Quantity, int64_t{2}}, {field::Location, std::string("A0")},
                      {field::Price, int64_t{1}}};
    const Fields remote{{field::Quantity, int64_t{8}}, {field::Location, std::string("A")},
                        {field::Price, int64_t{2}}};

    const auto conflicts = diverging_fields(proto, local, base, remote);
    REQUIRE(conflicts.size() == 1);
    REQUIRE(conflicts.front().field == field::Quantity);
    REQUIRE(conflicts.front().queue_entry_id == 7);
    REQUIRE(conflicts.front().remote_version == 3);
    REQUIRE(conflicts.front().base_value == FieldValue{int64_t{2}});
    REQUIRE_FALSE(conflicts.front().id.is_nil());

    REQUIRE(diverging_fields(proto, local, base, overlay(remote, {{field::Quantity, int64_t{5}}})).empty());
}
