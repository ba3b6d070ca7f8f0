/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE EnvironmentTests
#include <boost/test/unit_test.hpp>

#include "core/Diagnostics.hpp"
#include "mocks/MockEntities.hpp"
#include "world/Environment.hpp"
#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>

using namespace GridForge;
using namespace GridForge::Testing;

using Act = Action<Threading::Single>;
using Env = Environment<Threading::Single>;
using Pop = Population<Threading::Single>;

namespace {

std::unique_ptr<ScriptedEntity<Threading::Single>> idle() {
    return scripted<Threading::Single>();
}

Pop threeIdleEntities() {
    Pop population;
    population.add(idle(), Region::single(Position{0, 0}))
        .add(idle(), Region::single(Position{1, 0}))
        .add(idle(), Region::single(Position{2, 0}));
    return population;
}

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(ConstructionTests)

BOOST_AUTO_TEST_CASE(TestIdentitiesIssuedInInsertionOrder) {
    Env env(Bounds(5, 5), threeIdleEntities());
    BOOST_CHECK_EQUAL(env.size(), 3);
    BOOST_CHECK_EQUAL(env.generation(), 0);
    BOOST_CHECK_EQUAL(env.idAt(0).value(), 1);
    BOOST_CHECK_EQUAL(env.idAt(2).value(), 3);
    BOOST_REQUIRE(env.entity(EntityId{2}) != nullptr);
    BOOST_CHECK(env.entity(EntityId{2})->position() == (Position{1, 0}));
    BOOST_CHECK(env.entity(EntityId{42}) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestExplicitIdentitiesAreReserved) {
    Pop population;
    population.add(idle(), Region::single(Position{0, 0}))
        .add(EntityId{10}, idle(), Region::single(Position{1, 0}))
        .add(idle(), Region::single(Position{2, 0}));

    Env env(Bounds(5, 5), std::move(population));
    BOOST_CHECK_EQUAL(env.idAt(0).value(), 10);
    BOOST_CHECK_EQUAL(env.idAt(1).value(), 11);
    BOOST_CHECK_EQUAL(env.idAt(2).value(), 12);
    BOOST_CHECK_EQUAL(env.lastIssuedId().value(), 12);

    const EntityId inserted = env.insert(idle(), Region::single(Position{3, 3}));
    BOOST_CHECK_EQUAL(inserted.value(), 13);
}

BOOST_AUTO_TEST_CASE(TestInvalidBoundsThrow) {
    BOOST_CHECK_THROW((Env(Bounds(0, 4))), ConfigurationError);
    BOOST_CHECK_THROW((Env(Bounds(4, -1, Topology::Toroidal))), ConfigurationError);
    BOOST_CHECK_NO_THROW((Env(Bounds::unbounded())));
}

BOOST_AUTO_TEST_CASE(TestDuplicateIdentityThrows) {
    Pop population;
    population.add(EntityId{3}, idle(), Region::single(Position{0, 0}))
        .add(EntityId{3}, idle(), Region::single(Position{1, 0}));
    BOOST_CHECK_THROW((Env(Bounds(5, 5), std::move(population))), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(TestUnadmittableFootprintThrows) {
    Pop population;
    population.add(idle(), Region::single(Position{5, 0}));
    BOOST_CHECK_THROW((Env(Bounds(5, 5), std::move(population))), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(TestNullEntityThrows) {
    Pop population;
    population.add(std::unique_ptr<ScriptedEntity<Threading::Single>>{},
                   Region::single(Position{0, 0}));
    BOOST_CHECK_THROW((Env(Bounds(5, 5), std::move(population))), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(TestExhaustedLifespanThrows) {
    Pop population;
    population.add(idle(), Region::single(Position{0, 0}), Lifespan::ephemeral(0));
    BOOST_CHECK_THROW((Env(Bounds(5, 5), std::move(population))), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(TestRejectPolicyRefusesOverlappingPopulation) {
    Pop allowed;
    allowed.add(idle(), Region{0, 0, 2, 2}).add(idle(), Region::single(Position{1, 1}));
    BOOST_CHECK_NO_THROW((Env(Bounds(5, 5), std::move(allowed), CollisionPolicy::Allow)));

    Pop rejected;
    rejected.add(idle(), Region{0, 0, 2, 2}).add(idle(), Region::single(Position{1, 1}));
    BOOST_CHECK_THROW((Env(Bounds(5, 5), std::move(rejected), CollisionPolicy::Reject)),
                      ConfigurationError);
}

BOOST_AUTO_TEST_CASE(TestToroidalFootprintIsCanonical) {
    Pop population;
    population.add(idle(), Region::single(Position{-1, 6}));
    Env env(Bounds(5, 5, Topology::Toroidal), std::move(population));
    BOOST_REQUIRE(env.view(EntityId{1}) != nullptr);
    BOOST_CHECK(env.view(EntityId{1})->footprint.origin == (Position{4, 1}));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CommitTests)

BOOST_AUTO_TEST_CASE(TestMoveUpdatesViewIndexAndEntity) {
    Env env(Bounds(5, 5), threeIdleEntities());
    ActionList<Threading::Single> actions;
    actions.emplace_back(EntityId{1}, Act::moveTo(Position{4, 4}));

    GenerationReport report;
    env.commit(std::move(actions), report);

    BOOST_CHECK_EQUAL(report.moved, 1);
    BOOST_CHECK(!report.hasDiagnostics());
    BOOST_CHECK_EQUAL(env.generation(), 1);
    BOOST_CHECK(env.view(EntityId{1})->footprint.origin == (Position{4, 4}));
    BOOST_CHECK(env.entity(EntityId{1})->position() == (Position{4, 4}));
    BOOST_CHECK(env.entitiesIn(Region::single(Position{0, 0})).empty());
    BOOST_REQUIRE_EQUAL(env.entitiesIn(Region::single(Position{4, 4})).size(), 1);
}

BOOST_AUTO_TEST_CASE(TestMovePlacements) {
    Pop population;
    population.add(idle(), Region{0, 0, 2, 1}).add(idle(), Region{0, 2, 2, 1});
    Env env(Bounds(6, 6), std::move(population));

    ActionList<Threading::Single> actions;
    actions.emplace_back(EntityId{1}, Act::moveTo(Position{3, 3}));
    actions.emplace_back(EntityId{2}, Act::moveBy(1, 2));
    GenerationReport report;
    env.commit(std::move(actions), report);

    BOOST_CHECK(env.view(EntityId{1})->footprint == (Region{3, 3, 2, 1}));
    BOOST_CHECK(env.view(EntityId{2})->footprint == (Region{1, 4, 2, 1}));

    ActionList<Threading::Single> resize;
    resize.emplace_back(EntityId{1}, Act::move(Region{0, 0, 1, 3}));
    env.commit(std::move(resize), report);
    BOOST_CHECK(env.view(EntityId{1})->footprint == (Region{0, 0, 1, 3}));
}

BOOST_AUTO_TEST_CASE(TestMoveByWrapsOnTorus) {
    Pop population;
    population.add(idle(), Region::single(Position{0, 0}));
    Env env(Bounds(4, 4, Topology::Toroidal), std::move(population));

    ActionList<Threading::Single> actions;
    actions.emplace_back(EntityId{1}, Act::moveBy(-1, -1));
    GenerationReport report;
    env.commit(std::move(actions), report);

    BOOST_CHECK(env.view(EntityId{1})->footprint.origin == (Position{3, 3}));
    BOOST_CHECK(!report.hasDiagnostics());
}

BOOST_AUTO_TEST_CASE(TestOutOfBoundsMoveKeepsPosition) {
    Env env(Bounds(3, 3), threeIdleEntities());
    ActionList<Threading::Single> actions;
    actions.emplace_back(EntityId{3}, Act::moveBy(1, 0));
    GenerationReport report;
    report.reset(env.generation());
    env.commit(std::move(actions), report);

    BOOST_CHECK_EQUAL(report.moved, 0);
    BOOST_REQUIRE_EQUAL(report.diagnostics.size(), 1);
    const Diagnostic& diagnostic = report.diagnostics.front();
    BOOST_CHECK(diagnostic.kind == DiagnosticKind::OutOfBounds);
    BOOST_CHECK(diagnostic.action == ActionKind::Move);
    BOOST_CHECK_EQUAL(diagnostic.entity.value(), 3);
    BOOST_CHECK_EQUAL(diagnostic.generation, 0);
    BOOST_CHECK(env.view(EntityId{3})->footprint.origin == (Position{2, 0}));
}

BOOST_AUTO_TEST_CASE(TestTargetsPastCoordinateRangeAreOutOfBounds) {
    constexpr int32_t far = std::numeric_limits<int32_t>::max();
    Pop population;
    population.add(idle(), Region::single(Position{1, 1}));
    Env env(Bounds(3, 3), std::move(population));
    const EntityId id{1};

    ActionList<Threading::Single> anchored;
    anchored.emplace_back(id, Act::moveTo(Position{far, 1}));
    GenerationReport report;
    env.commit(std::move(anchored), report);
    BOOST_CHECK_EQUAL(report.countOf(DiagnosticKind::OutOfBounds), 1);

    ActionList<Threading::Single> shifted;
    shifted.emplace_back(id, Act::moveBy(far, 0));
    report.reset(env.generation());
    env.commit(std::move(shifted), report);
    BOOST_REQUIRE_EQUAL(report.diagnostics.size(), 1);
    BOOST_CHECK(report.diagnostics[0].kind == DiagnosticKind::OutOfBounds);
    BOOST_CHECK(report.diagnostics[0].message.find("coordinate range") != std::string::npos);

    ActionList<Threading::Single> spawned;
    spawned.emplace_back(id, Act::spawn(idle(), Region{far, 0, 2, 1}));
    report.reset(env.generation());
    env.commit(std::move(spawned), report);
    BOOST_CHECK_EQUAL(report.spawned, 0);
    BOOST_CHECK_EQUAL(report.countOf(DiagnosticKind::OutOfBounds), 1);

    // Still registered and indexed where it was
    BOOST_CHECK(env.view(id)->footprint.origin == (Position{1, 1}));
    const std::vector<EntityId> inside = env.entitiesIn(Region{0, 0, 3, 3});
    BOOST_REQUIRE_EQUAL(inside.size(), 1);
    BOOST_CHECK(inside[0] == id);
}

BOOST_AUTO_TEST_CASE(TestUnboundedMovesStopAtCoordinateEdge) {
    constexpr int32_t far = std::numeric_limits<int32_t>::max();
    Pop population;
    population.add(idle(), Region::single(Position{far - 1, 0}));
    Env env(Bounds::unbounded(), std::move(population));
    const EntityId id{1};

    ActionList<Threading::Single> step;
    step.emplace_back(id, Act::moveBy(1, 0));
    GenerationReport report;
    env.commit(std::move(step), report);
    BOOST_CHECK_EQUAL(report.moved, 1);
    BOOST_CHECK(!report.hasDiagnostics());
    BOOST_CHECK_EQUAL(env.entitiesIn(Region::single(Position{far, 0})).size(), 1);

    ActionList<Threading::Single> past;
    past.emplace_back(id, Act::moveBy(1, 0));
    report.reset(env.generation());
    env.commit(std::move(past), report);
    BOOST_CHECK_EQUAL(report.countOf(DiagnosticKind::OutOfBounds), 1);

    ActionList<Threading::Single> wide;
    wide.emplace_back(id, Act::move(Region{far, 0, 2, 1}));
    report.reset(env.generation());
    env.commit(std::move(wide), report);
    BOOST_CHECK_EQUAL(report.countOf(DiagnosticKind::OutOfBounds), 1);
    BOOST_CHECK(env.view(id)->footprint == Region::single(Position{far, 0}));
    BOOST_CHECK_EQUAL(env.entitiesIn(Region::single(Position{far, 0})).size(), 1);
}

BOOST_AUTO_TEST_CASE(TestLargeOffsetWrapsOnTorus) {
    Pop population;
    population.add(idle(), Region::single(Position{1, 1}));
    Env env(Bounds(5, 5, Topology::Toroidal), std::move(population));

    ActionList<Threading::Single> actions;
    actions.emplace_back(EntityId{1}, Act::moveBy(std::numeric_limits<int32_t>::max(), 0));
    GenerationReport report;
    env.commit(std::move(actions), report);

    // 1 + (2^31 - 1) = 2^31, which is 3 mod 5
    BOOST_CHECK(!report.hasDiagnostics());
    BOOST_CHECK(env.view(EntityId{1})->footprint.origin == (Position{3, 1}));
}

BOOST_AUTO_TEST_CASE(TestRemoveRunsBeforeOtherActions) {
    Pop population;
    population.add(idle(), Region::single(Position{0, 0}))
        .add(idle(), Region::single(Position{1, 0}));
    Env env(Bounds(3, 3), std::move(population), CollisionPolicy::Reject);

    // #1 moves into the cell #2 vacates in the same commit
    ActionList<Threading::Single> actions;
    actions.emplace_back(EntityId{1}, Act::moveTo(Position{1, 0}));
    actions.emplace_back(EntityId{2}, Act::remove());
    GenerationReport report;
    env.commit(std::move(actions), report);

    BOOST_CHECK(!report.hasDiagnostics());
    BOOST_CHECK_EQUAL(report.removed, 1);
    BOOST_CHECK_EQUAL(report.moved, 1);
    BOOST_CHECK_EQUAL(env.size(), 1);
    BOOST_CHECK(env.view(EntityId{2}) == nullptr);
    BOOST_CHECK(env.view(EntityId{1})->footprint.origin == (Position{1, 0}));
}

BOOST_AUTO_TEST_CASE(TestDuplicateRemoveIsReportedOnce) {
    Env env(Bounds(3, 3), threeIdleEntities());
    ActionList<Threading::Single> actions;
    actions.emplace_back(EntityId{2}, Act::remove());
    actions.emplace_back(EntityId{2}, Act::remove());
    GenerationReport report;
    env.commit(std::move(actions), report);

    BOOST_CHECK_EQUAL(report.removed, 1);
    BOOST_CHECK_EQUAL(report.countOf(DiagnosticKind::StaleActionReference), 1);
    BOOST_CHECK_EQUAL(report.diagnostics.size(), 1);
    BOOST_CHECK_EQUAL(env.size(), 2);
}

BOOST_AUTO_TEST_CASE(TestActionAfterRemoveIsStale) {
    Env env(Bounds(3, 3), threeIdleEntities());
    ActionList<Threading::Single> actions;
    actions.emplace_back(EntityId{1}, Act::remove());
    actions.emplace_back(EntityId{1}, Act::moveTo(Position{2, 2}));
    GenerationReport report;
    env.commit(std::move(actions), report);

    BOOST_REQUIRE_EQUAL(report.diagnostics.size(), 1);
    BOOST_CHECK(report.diagnostics[0].kind == DiagnosticKind::StaleActionReference);
    BOOST_CHECK(report.diagnostics[0].action == ActionKind::Move);
    BOOST_CHECK(env.entitiesIn(Region::single(Position{2, 2})).empty());
}

BOOST_AUTO_TEST_CASE(TestUnknownIdentityIsStale) {
    Env env(Bounds(3, 3), threeIdleEntities());
    ActionList<Threading::Single> actions;
    actions.emplace_back(EntityId{77}, Act::mutate());
    actions.emplace_back(EntityId{78}, Act::none());
    GenerationReport report;
    env.commit(std::move(actions), report);

    BOOST_REQUIRE_EQUAL(report.diagnostics.size(), 1);
    BOOST_CHECK_EQUAL(report.diagnostics[0].entity.value(), 77);
    BOOST_CHECK(report.diagnostics[0].action == ActionKind::Mutate);
    BOOST_CHECK_EQUAL(env.generation(), 1);
}

BOOST_AUTO_TEST_CASE(TestOnlyMutateRepublishesState) {
    Pop population;
    population.add(idle(), Region::single(Position{0, 0}));
    Env env(Bounds(3, 3), std::move(population));
    auto* entity = static_cast<ScriptedEntity<Threading::Single>*>(env.entity(EntityId{1}));
    entity->value = 5;

    ActionList<Threading::Single> moveOnly;
    moveOnly.emplace_back(EntityId{1}, Act::moveBy(1, 0));
    GenerationReport report;
    env.commit(std::move(moveOnly), report);
    BOOST_CHECK_EQUAL(env.view(EntityId{1})->state, 0);

    ActionList<Threading::Single> mutate;
    mutate.emplace_back(EntityId{1}, Act::mutate());
    env.commit(std::move(mutate), report);
    BOOST_CHECK_EQUAL(env.view(EntityId{1})->state, 5);
    BOOST_CHECK_EQUAL(report.mutated, 1);
}

BOOST_AUTO_TEST_CASE(TestSpawnIsVisibleFromNextGeneration) {
    Env env(Bounds(4, 4), threeIdleEntities());
    const Snapshot before = env.snapshot();

    ActionList<Threading::Single> actions;
    actions.emplace_back(EntityId{1},
                         Act::spawn(idle(), Region::single(Position{3, 3}), Lifespan::ephemeral(4)));
    GenerationReport report;
    env.commit(std::move(actions), report);

    BOOST_CHECK_EQUAL(report.spawned, 1);
    BOOST_CHECK(!before.isCurrent());

    const Snapshot after = env.snapshot();
    BOOST_CHECK_EQUAL(after.size(), 4);
    const EntityView* child = after.find(EntityId{4});
    BOOST_REQUIRE(child != nullptr);
    BOOST_CHECK_EQUAL(child->bornGeneration, 1);
    BOOST_CHECK(child->footprint.origin == (Position{3, 3}));
    BOOST_CHECK(child->lifespan == Lifespan::ephemeral(4));
    BOOST_CHECK_EQUAL(child->kind, SCRIPTED_KIND);
}

BOOST_AUTO_TEST_CASE(TestRejectedSpawnConsumesNoIdentity) {
    Env env(Bounds(3, 3), threeIdleEntities());
    ActionList<Threading::Single> actions;
    actions.emplace_back(EntityId{1}, Act::spawn(idle(), Region::single(Position{3, 3})));
    GenerationReport report;
    env.commit(std::move(actions), report);

    BOOST_CHECK_EQUAL(report.spawned, 0);
    BOOST_REQUIRE_EQUAL(report.diagnostics.size(), 1);
    BOOST_CHECK(report.diagnostics[0].kind == DiagnosticKind::OutOfBounds);
    BOOST_CHECK(report.diagnostics[0].action == ActionKind::Spawn);
    BOOST_CHECK_EQUAL(env.lastIssuedId().value(), 3);
}

BOOST_AUTO_TEST_CASE(TestSpawnOfNullOffspringThrows) {
    BOOST_CHECK_THROW(Act::spawn(std::unique_ptr<ScriptedEntity<Threading::Single>>{},
                                 Region::single(Position{0, 0})),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestRejectPolicyCollisions) {
    Env env(Bounds(3, 3), threeIdleEntities(), CollisionPolicy::Reject);
    ActionList<Threading::Single> actions;
    actions.emplace_back(EntityId{1}, Act::moveTo(Position{1, 0}));
    actions.emplace_back(EntityId{3}, Act::spawn(idle(), Region::single(Position{2, 0})));
    GenerationReport report;
    env.commit(std::move(actions), report);

    BOOST_CHECK_EQUAL(report.countOf(DiagnosticKind::Collision), 2);
    BOOST_CHECK_EQUAL(report.moved, 0);
    BOOST_CHECK_EQUAL(report.spawned, 0);
    BOOST_CHECK(env.view(EntityId{1})->footprint.origin == (Position{0, 0}));
    BOOST_CHECK_EQUAL(env.size(), 3);
}

BOOST_AUTO_TEST_CASE(TestAllowPolicyPermitsOverlap) {
    Env env(Bounds(3, 3), threeIdleEntities());
    ActionList<Threading::Single> actions;
    actions.emplace_back(EntityId{1}, Act::moveTo(Position{1, 0}));
    GenerationReport report;
    env.commit(std::move(actions), report);

    BOOST_CHECK(!report.hasDiagnostics());
    BOOST_CHECK_EQUAL(env.snapshot().occupantsAt(Position{1, 0}).size(), 2);
}

BOOST_AUTO_TEST_CASE(TestEphemeralEntitiesExpire) {
    Pop population;
    population.add(idle(), Region::single(Position{0, 0}), Lifespan::ephemeral(2))
        .add(idle(), Region::single(Position{1, 0}));
    Env env(Bounds(3, 3), std::move(population));

    GenerationReport report;
    env.commit({}, report);
    BOOST_CHECK_EQUAL(report.expired, 0);
    BOOST_CHECK_EQUAL(env.view(EntityId{1})->lifespan.remaining(), 1);

    report.reset(env.generation());
    env.commit({}, report);
    BOOST_CHECK_EQUAL(report.expired, 1);
    BOOST_CHECK(!report.hasDiagnostics());
    BOOST_CHECK(env.view(EntityId{1}) == nullptr);
    BOOST_CHECK_EQUAL(env.size(), 1);
    BOOST_CHECK(env.entitiesIn(Region::single(Position{0, 0})).empty());
}

BOOST_AUTO_TEST_CASE(TestOffspringStartAgeingNextCommit) {
    Env env(Bounds(3, 3), threeIdleEntities());
    ActionList<Threading::Single> actions;
    actions.emplace_back(EntityId{1}, Act::spawn(idle(), Region::single(Position{1, 1}),
                                                 Lifespan::ephemeral(1)));
    GenerationReport report;
    env.commit(std::move(actions), report);
    BOOST_REQUIRE(env.view(EntityId{4}) != nullptr);
    BOOST_CHECK_EQUAL(env.view(EntityId{4})->lifespan.remaining(), 1);

    report.reset(env.generation());
    env.commit({}, report);
    BOOST_CHECK_EQUAL(report.expired, 1);
    BOOST_CHECK(env.view(EntityId{4}) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestIdentitiesAreNeverReused) {
    Env env(Bounds(3, 3), threeIdleEntities());
    ActionList<Threading::Single> actions;
    actions.emplace_back(EntityId{3}, Act::remove());
    GenerationReport report;
    env.commit(std::move(actions), report);

    const EntityId next = env.insert(idle(), Region::single(Position{2, 2}));
    BOOST_CHECK_EQUAL(next.value(), 4);
    BOOST_CHECK(env.view(EntityId{3}) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestForEachVisitsInIdentityOrder) {
    Env env(Bounds(3, 3), threeIdleEntities());
    std::vector<uint64_t> seen;
    env.forEach([&](const EntityView& view, const BasicEntity<Threading::Single>& entity) {
        BOOST_CHECK(view.id == entity.id());
        seen.push_back(view.id.value());
    });
    const std::vector<uint64_t> expected{1, 2, 3};
    BOOST_CHECK(seen == expected);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SnapshotTests)

BOOST_AUTO_TEST_CASE(TestQueries) {
    Pop population;
    population.add(idle(), Region::single(Position{0, 0}))
        .add(std::make_unique<RandomWalker<Threading::Single>>(), Region{1, 1, 2, 2})
        .add(idle(), Region::single(Position{4, 4}));
    Env env(Bounds(5, 5), std::move(population));
    const Snapshot snapshot = env.snapshot();

    BOOST_CHECK_EQUAL(snapshot.generation(), 0);
    BOOST_CHECK(snapshot.contains(EntityId{2}));
    BOOST_CHECK(!snapshot.contains(EntityId{9}));
    BOOST_CHECK_EQUAL(snapshot.entitiesIn(Region{0, 0, 2, 2}).size(), 2);
    BOOST_CHECK_EQUAL(snapshot.neighborhood(Position{0, 0}, 1).size(), 2);
    BOOST_CHECK_EQUAL(snapshot.neighborhood(Position{4, 4}, 0).size(), 1);

    const EntityView* walker = snapshot.firstOfKindAt(Position{2, 2}, WALKER_KIND);
    BOOST_REQUIRE(walker != nullptr);
    BOOST_CHECK_EQUAL(walker->id.value(), 2);
    BOOST_CHECK(snapshot.firstOfKindAt(Position{2, 2}, SCRIPTED_KIND) == nullptr);

    const auto counts = snapshot.countByKind();
    BOOST_CHECK_EQUAL(counts.at(SCRIPTED_KIND), 2);
    BOOST_CHECK_EQUAL(counts.at(WALKER_KIND), 1);
}

BOOST_AUTO_TEST_CASE(TestToroidalNeighborhoodWraps) {
    Pop population;
    population.add(idle(), Region::single(Position{0, 0}))
        .add(idle(), Region::single(Position{4, 4}))
        .add(idle(), Region::single(Position{2, 2}));
    Env env(Bounds(5, 5, Topology::Toroidal), std::move(population));

    const auto around = env.snapshot().neighborhood(Position{0, 0}, 1);
    BOOST_REQUIRE_EQUAL(around.size(), 2);
    BOOST_CHECK_EQUAL(around[0].value(), 1);
    BOOST_CHECK_EQUAL(around[1].value(), 2);
}

BOOST_AUTO_TEST_SUITE_END()
