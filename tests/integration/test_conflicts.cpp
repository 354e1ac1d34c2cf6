#include <catch2/catch_test_macros.hpp>
#include "support/engine_fixture.hpp"
#include <QJsonArray>
#include <QJsonObject>

using namespace larder;
using namespace larder::testing;

namespace {

Fields quantity(int64_t value) {
    return Fields{{field::Quantity, value}};
}

// Local quantity 5 against a remote edit to 8, both from a base of 2.
struct QuantityConflict : EngineFixture {
    explicit QuantityConflict(config::EngineConfig config = test_config())
        : EngineFixture(std::move(config)) {
        seed(EntityType::Item, "i1", widget(2), 1);
        REQUIRE(store().put(EntityType::Item, "i1", quantity(5)).is_ok());
        clock.advance(5s);
        remote->set(EntityType::Item, "i1", widget(8), 2, clock.now);
        first = drain();
    }

    [[nodiscard]] Conflict only_conflict() {
        auto pending = engine->list_pending_conflicts().unwrap();
        REQUIRE(pending.size() == 1);
        return pending.front();
    }

    [[nodiscard]] sync::ResolutionReport resolve(ResolutionStrategy strategy, FieldValue value = {}) {
        const auto conflict = only_conflict();
        auto applied = engine->apply_resolutions({ConflictResolution{
            .conflict_id = conflict.id,
            .strategy = strategy,
            .resolved_value = std::move(value),
            .resolved_by = ResolvedBy::User,
        }});
        REQUIRE(applied.is_ok());
        return applied.unwrap();
    }

    sync::DrainReport first;
};

} // namespace

TEST_CASE("Conflicts: diverging quantity is held per field", "[integration][conflicts]") {
    QuantityConflict fx;
    REQUIRE(fx.first.history.conflicted == 1);
    REQUIRE(fx.first.conflicts.size() == 1);

    const auto conflict = fx.only_conflict();
    REQUIRE(conflict.field == field::Quantity);
    REQUIRE(conflict.local_value == FieldValue{int64_t{5}});
    REQUIRE(conflict.remote_value == FieldValue{int64_t{8}});
    REQUIRE(conflict.base_value == FieldValue{int64_t{2}});
    REQUIRE(conflict.remote_version == 2);

    auto entries = fx.entries();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries.front().state == EntryState::Conflicted);

    // A held entry is neither pending work nor sent again.
    REQUIRE(fx.engine->pending_count().unwrap() == 0);
    REQUIRE(fx.engine->conflict_count().unwrap() == 1);
    (void)fx.drain();
    REQUIRE(fx.remote->sends_for("i1") == 1);

    SECTION("Suggestions favour the later edit and sum counter deltas") {
        REQUIRE(fx.engine->suggest_resolution(conflict) == ResolutionStrategy::KeepRemote);
        REQUIRE(fx.engine->suggest_merge(conflict) == FieldValue{int64_t{11}});
    }
}

TEST_CASE("Conflicts: keep-local requeues against the remote version", "[integration][conflicts]") {
    QuantityConflict fx;
    auto report = fx.resolve(ResolutionStrategy::KeepLocal);
    REQUIRE(report.applied == 1);
    REQUIRE(report.requeued == 1);

    auto entries = fx.entries();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries.front().state == EntryState::Pending);
    REQUIRE(entries.front().base_version == 2);
    REQUIRE(entries.front().payload == quantity(5));
    REQUIRE(fx.store().get(EntityType::Item, "i1").unwrap().fields.at(field::Quantity) ==
            FieldValue{int64_t{5}});

    auto second = fx.drain();
    REQUIRE(second.history.confirmed == 1);
    REQUIRE(fx.remote->find(EntityType::Item, "i1")->version == 3);
    REQUIRE(fx.remote->find(EntityType::Item, "i1")->fields.at(field::Quantity) == FieldValue{int64_t{5}});

    auto record = fx.store().get(EntityType::Item, "i1").unwrap();
    REQUIRE(record.sync_state == SyncState::Confirmed);
    REQUIRE(record.remote_version == 3);
    REQUIRE(record.in_sync());
}

TEST_CASE("Conflicts: keep-remote settles without another send", "[integration][conflicts]") {
    QuantityConflict fx;
    auto report = fx.resolve(ResolutionStrategy::KeepRemote);
    REQUIRE(report.applied == 1);
    REQUIRE(report.requeued == 0);
    REQUIRE(fx.entries().empty());

    auto record = fx.store().get(EntityType::Item, "i1").unwrap();
    REQUIRE(record.fields == widget(8));
    REQUIRE(record.sync_state == SyncState::Confirmed);
    REQUIRE(record.remote_version == 2);
    REQUIRE(record.in_sync());

    (void)fx.drain();
    REQUIRE(fx.remote->sends_for("i1") == 1);
}

TEST_CASE("Conflicts: merge commits the supplied value", "[integration][conflicts]") {
    QuantityConflict fx;
    const auto merged = fx.engine->suggest_merge(fx.only_conflict());
    auto report = fx.resolve(ResolutionStrategy::Merge, merged);
    REQUIRE(report.applied == 1);

    (void)fx.drain();
    REQUIRE(fx.remote->find(EntityType::Item, "i1")->fields.at(field::Quantity) == FieldValue{int64_t{11}});

    auto history = fx.engine->resolver().history(10).unwrap();
    REQUIRE(history.size() == 1);
    REQUIRE(history.front().strategy == ResolutionStrategy::Merge);
    REQUIRE(history.front().value == FieldValue{int64_t{11}});
    REQUIRE(history.front().resolved_by == ResolvedBy::User);
}

TEST_CASE("Conflicts: a merge value of the wrong kind is rejected", "[integration][conflicts]") {
    QuantityConflict fx;
    const auto conflict = fx.only_conflict();
    auto applied = fx.engine->apply_resolutions({ConflictResolution{
        .conflict_id = conflict.id,
        .strategy = ResolutionStrategy::Merge,
        .resolved_value = std::string("eleven"),
        .resolved_by = ResolvedBy::User,
    }});
    REQUIRE(applied.is_err());
    REQUIRE(applied.unwrap_err().kind == ErrorKind::InvalidArgument);
    REQUIRE(fx.engine->conflict_count().unwrap() == 1);
}

TEST_CASE("Conflicts: applying a resolution twice is a no-op", "[integration][conflicts]") {
    QuantityConflict fx;
    const auto conflict = fx.only_conflict();
    const ConflictResolution resolution{
        .conflict_id = conflict.id,
        .strategy = ResolutionStrategy::KeepLocal,
        .resolved_value = {},
        .resolved_by = ResolvedBy::User,
    };

    auto once = fx.engine->apply_resolutions({resolution});
    REQUIRE(once.unwrap().applied == 1);
    const auto after_once = fx.store().get(EntityType::Item, "i1").unwrap();
    const auto entries_once = fx.entries();

    auto twice = fx.engine->apply_resolutions({resolution});
    REQUIRE(twice.unwrap().applied == 0);
    REQUIRE(twice.unwrap().skipped == 1);
    REQUIRE(fx.store().get(EntityType::Item, "i1").unwrap() == after_once);
    REQUIRE(fx.entries() == entries_once);
    REQUIRE(fx.engine->resolver().history(10).unwrap().size() == 1);
}

TEST_CASE("Conflicts: converged fields are dropped from the held payload", "[integration][conflicts]") {
    EngineFixture fx;
    fx.seed(EntityType::Item, "i1", widget(2), 1);
    REQUIRE(fx.store().put(EntityType::Item, "i1",
                           Fields{{field::Quantity, int64_t{8}}, {field::Location, std::string("Shelf B")}})
                .is_ok());
    auto remote_image = widget(8);
    remote_image[field::Location] = std::string("Shelf A");
    remote_image[field::Notes] = std::string("recounted");
    fx.remote->set(EntityType::Item, "i1", remote_image, 2);

    auto report = fx.drain();
    REQUIRE(report.conflicts.size() == 1);
    REQUIRE(report.conflicts.front().field == field::Location);

    auto entries = fx.entries();
    REQUIRE(entries.front().payload == Fields{{field::Location, std::string("Shelf B")}});

    // Fields without local work follow the remote immediately.
    auto record = fx.store().get(EntityType::Item, "i1").unwrap();
    REQUIRE(record.fields.at(field::Notes) == FieldValue{std::string("recounted")});
    REQUIRE(record.fields.at(field::Location) == FieldValue{std::string("Shelf B")});
}

TEST_CASE("Conflicts: convergent edits confirm without a conflict", "[integration][conflicts]") {
    EngineFixture fx;
    fx.seed(EntityType::Category, "c1", Fields{{field::Name, std::string("Electrics")}}, 1);
    REQUIRE(fx.store().put(EntityType::Category, "c1",
                           Fields{{field::Name, std::string("Electronics")}}).is_ok());
    fx.remote->set(EntityType::Category, "c1", Fields{{field::Name, std::string("Electronics")}}, 2);

    auto report = fx.drain();
    REQUIRE(report.history.confirmed == 1);
    REQUIRE(report.conflicts.empty());
    REQUIRE(fx.engine->conflict_count().unwrap() == 0);

    auto record = fx.store().get(EntityType::Category, "c1").unwrap();
    REQUIRE(record.remote_version == 2);
    REQUIRE(record.sync_state == SyncState::Confirmed);
    REQUIRE(fx.remote->find(EntityType::Category, "c1")->version == 2);
}

TEST_CASE("Conflicts: a local delete supersedes held conflicts", "[integration][conflicts]") {
    QuantityConflict fx;
    const auto conflict = fx.only_conflict();

    REQUIRE(fx.store().remove(EntityType::Item, "i1").is_ok());
    REQUIRE(fx.engine->conflict_count().unwrap() == 0);

    auto late = fx.engine->apply_resolutions({ConflictResolution{
        .conflict_id = conflict.id,
        .strategy = ResolutionStrategy::KeepLocal,
        .resolved_value = {},
        .resolved_by = ResolvedBy::User,
    }});
    REQUIRE(late.unwrap().applied == 0);
    REQUIRE(late.unwrap().skipped == 1);

    auto entries = fx.entries();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries.front().operation == Operation::Delete);
    REQUIRE(entries.front().base_version == 2);

    (void)fx.drain();
    REQUIRE(fx.remote->find(EntityType::Item, "i1") == nullptr);
    REQUIRE(fx.store().get(EntityType::Item, "i1").is_err());
    REQUIRE(fx.store().count(EntityType::Item).unwrap() == 0);
}

TEST_CASE("Conflicts: a delete racing a remote edit still wins", "[integration][conflicts]") {
    EngineFixture fx;
    fx.seed(EntityType::Item, "i1", widget(2), 1);
    REQUIRE(fx.store().remove(EntityType::Item, "i1").is_ok());
    fx.remote->set(EntityType::Item, "i1", widget(9), 2);

    auto report = fx.drain();
    REQUIRE(report.history.confirmed == 1);
    REQUIRE(report.conflicts.empty());
    REQUIRE(fx.remote->sends_for("i1") == 2);
    REQUIRE(fx.remote->sent.back().base_version == 2);
    REQUIRE(fx.remote->find(EntityType::Item, "i1") == nullptr);
    REQUIRE(fx.entries().empty());
}

TEST_CASE("Conflicts: configured auto-resolve settles during the drain", "[integration][conflicts]") {
    auto config = test_config();
    config.auto_resolve = AutoStrategy::LocalWins;
    QuantityConflict fx(config);

    REQUIRE(fx.first.conflicts.size() == 1);
    REQUIRE(fx.engine->conflict_count().unwrap() == 0);
    auto history = fx.engine->resolver().history(10).unwrap();
    REQUIRE(history.size() == 1);
    REQUIRE(history.front().resolved_by == ResolvedBy::Auto);

    (void)fx.drain();
    REQUIRE(fx.remote->find(EntityType::Item, "i1")->fields.at(field::Quantity) == FieldValue{int64_t{5}});
}

TEST_CASE("Conflicts: batch auto-resolve with latest-wins", "[integration][conflicts]") {
    QuantityConflict fx;
    auto report = fx.engine->auto_resolve(AutoStrategy::LatestWins);
    REQUIRE(report.is_ok());
    REQUIRE(report.unwrap().applied == 1);
    // The remote edit is five seconds newer.
    REQUIRE(fx.store().get(EntityType::Item, "i1").unwrap().fields.at(field::Quantity) ==
            FieldValue{int64_t{8}});
    REQUIRE(fx.entries().empty());
}

TEST_CASE("Conflicts: export lists pending conflicts with suggestions", "[integration][conflicts]") {
    QuantityConflict fx;
    auto exported = fx.engine->resolver().export_conflicts();
    REQUIRE(exported.is_ok());

    const auto root = exported.unwrap().object();
    const auto pending = root.value(QStringLiteral("pending")).toArray();
    REQUIRE(pending.size() == 1);
    const auto first = pending.at(0).toObject();
    REQUIRE(first.value(QStringLiteral("field")).toString() == QStringLiteral("quantity"));
    REQUIRE(first.value(QStringLiteral("suggested_strategy")).toString() == QStringLiteral("keep-remote"));
    REQUIRE(first.value(QStringLiteral("suggested_merge")).toInteger() == 11);
    REQUIRE(root.value(QStringLiteral("history")).toArray().isEmpty());
}
