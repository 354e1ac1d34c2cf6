#include <catch2/catch_test_macros.hpp>
#include "core/record.hpp"
#include "core/sync_entry.hpp"

using namespace larder;

namespace {

const Timestamp T0{1'700'000'000'000};

Fields widget(int64_t quantity) {
    return Fields{{field::Name, std::string("Widget")}, {field::Quantity, quantity}};
}

} // namespace

TEST_CASE("Records move between confirmed and unconfirmed", "[unit][record]") {
    const auto confirmed = remote_record(EntityType::Item, "i1", widget(2), 4, T0);
    REQUIRE(confirmed.in_sync());
    REQUIRE(confirmed.sync_state == SyncState::Confirmed);
    REQUIRE_FALSE(confirmed.prior_fields.has_value());

    SECTION("A local write keeps the confirmed image") {
        const auto written = with_local_write(confirmed, Fields{{field::Quantity, int64_t{5}}}, T0);
        REQUIRE(written.sync_state == SyncState::Unconfirmed);
        REQUIRE(written.local_version == 5);
        REQUIRE(written.remote_version == 4);
        REQUIRE(written.fields == widget(5));
        REQUIRE(written.confirmed_image() == widget(2));

        // A second tentative write keeps the original confirmed image.
        const auto again = with_local_write(written, Fields{{field::Quantity, int64_t{6}}}, T0);
        REQUIRE(again.local_version == 6);
        REQUIRE(again.confirmed_image() == widget(2));
    }

    SECTION("Confirmation with nothing else pending settles the record") {
        const auto written = with_local_write(confirmed, Fields{{field::Quantity, int64_t{5}}}, T0);
        const auto settled = with_confirmation(written, Fields{{field::Quantity, int64_t{5}}}, 5, false, T0);
        REQUIRE(settled.in_sync());
        REQUIRE(settled.remote_version == 5);
        REQUIRE(settled.sync_state == SyncState::Confirmed);
        REQUIRE_FALSE(settled.prior_fields.has_value());
        REQUIRE(settled.fields == widget(5));
    }

    SECTION("Confirmation with later writes advances the confirmed image only") {
        auto written = with_local_write(confirmed, Fields{{field::Quantity, int64_t{5}}}, T0);
        written = with_local_write(written, Fields{{field::Name, std::string("Gadget")}}, T0);
        const auto partial = with_confirmation(written, Fields{{field::Quantity, int64_t{5}}}, 5, true, T0);
        REQUIRE(partial.sync_state == SyncState::Unconfirmed);
        REQUIRE(partial.remote_version == 5);
        REQUIRE(partial.local_version == 6);
        REQUIRE(partial.confirmed_image() == widget(5));
        REQUIRE(partial.fields.at(field::Name) == FieldValue{std::string("Gadget")});
    }

    SECTION("Tombstones remember what to restore") {
        const auto tomb = with_tombstone(confirmed, T0);
        REQUIRE(tomb.tombstoned);
        REQUIRE(tomb.local_version == 5);
        REQUIRE(tomb.confirmed_image() == widget(2));
    }
}

TEST_CASE("A never-confirmed record has no prior image", "[unit][record]") {
    Record fresh;
    fresh.id = "new";
    const auto written = with_local_write(fresh, widget(1), T0);
    REQUIRE_FALSE(written.prior_fields.has_value());
    REQUIRE(written.local_version == 1);
    REQUIRE(written.remote_version == 0);
}

TEST_CASE("Queue entry names parse back", "[unit][queue]") {
    for (auto op : {Operation::Create, Operation::Update, Operation::Delete}) {
        REQUIRE(parse_operation(operation_name(op)) == op);
    }
    for (auto state : {EntryState::Pending, EntryState::InFlight, EntryState::Conflicted}) {
        REQUIRE(parse_entry_state(entry_state_name(state)) == state);
    }
    REQUIRE_FALSE(parse_operation("upsert").has_value());
    REQUIRE(parse_entity_type("category") == EntityType::Category);
}

TEST_CASE("Backoff doubles from the base up to the cap", "[unit][queue]") {
    const Backoff backoff{.base = std::chrono::milliseconds{1000}, .cap = std::chrono::milliseconds{5000}};
    REQUIRE(backoff.delay_for(0).count() == 0);
    REQUIRE(backoff.delay_for(1).count() == 1000);
    REQUIRE(backoff.delay_for(2).count() == 2000);
    REQUIRE(backoff.delay_for(3).count() == 4000);
    REQUIRE(backoff.delay_for(4).count() == 5000);
    REQUIRE(backoff.delay_for(100).count() == 5000);
}

TEST_CASE("Uuid and Timestamp", "[unit][types]") {
    const auto id = Uuid::generate();
    REQUIRE_FALSE(id.is_nil());
    REQUIRE(Uuid::parse(id.to_string()) == id);
    REQUIRE_FALSE(Uuid::parse("not-a-uuid").has_value());
    REQUIRE(id != Uuid::generate());

    REQUIRE(Timestamp{0}.to_iso_string() == "1970-01-01T00:00:00.000Z");
    REQUIRE(Timestamp{1250}.to_iso_string() == "1970-01-01T00:00:01.250Z");
    REQUIRE((T0 + std::chrono::milliseconds{5}) - T0 == std::chrono::milliseconds{5});
}
