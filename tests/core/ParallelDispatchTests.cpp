/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ParallelDispatchTests
#include <boost/test/unit_test.hpp>

#include "config/SimulationConfig.hpp"
#include "core/Simulation.hpp"
#include "core/ThreadSystem.hpp"
#include "core/WorkerBudget.hpp"
#include "mocks/MockEntities.hpp"
#include "rules/Patterns.hpp"
#include <cstdint>
#include <memory>
#include <thread>
#include <tuple>
#include <vector>

using namespace GridForge;
using namespace GridForge::Testing;

using SharedSim = Simulation<Threading::Shared>;
using SharedPop = Population<Threading::Shared>;

struct ThreadSystemFixture {
    ThreadSystemFixture() { ThreadSystem::Instance().init(4); }
    ~ThreadSystemFixture() { ThreadSystem::Instance().clean(); }
};

BOOST_GLOBAL_FIXTURE(ThreadSystemFixture);

namespace {

using Record = std::tuple<uint64_t, int32_t, int32_t, int32_t, int32_t, uint64_t, bool, uint32_t>;
using DiagnosticRecord = std::tuple<uint64_t, DiagnosticKind, ActionKind>;

std::vector<Record> capture(const Snapshot& snapshot) {
    std::vector<Record> records;
    for (const EntityView& view : snapshot) {
        records.emplace_back(view.id.value(), view.footprint.origin.x, view.footprint.origin.y,
                             view.footprint.size.width, view.footprint.size.height, view.state,
                             view.lifespan.isImmortal(), view.lifespan.remaining());
    }
    return records;
}

std::vector<DiagnosticRecord> capture(const GenerationReport& report) {
    std::vector<DiagnosticRecord> records;
    for (const Diagnostic& diagnostic : report.diagnostics) {
        records.emplace_back(diagnostic.entity.value(), diagnostic.kind, diagnostic.action);
    }
    return records;
}

SimulationConfig walkerConfig(bool parallel, CollisionPolicy policy) {
    SimulationConfig config;
    config.width = 24;
    config.height = 24;
    config.topology = Topology::Toroidal;
    config.collisionPolicy = policy;
    config.parallel = parallel;
    config.parallelThreshold = 0;
    config.seed = 0x5eed;
    return config;
}

SharedPop walkers(size_t count, int32_t width) {
    SharedPop population;
    for (size_t i = 0; i < count; ++i) {
        const int32_t x = static_cast<int32_t>(i * 2) % width;
        const int32_t y = static_cast<int32_t>(i * 2) / width;
        population.add(std::make_unique<RandomWalker<Threading::Shared>>(),
                       Region::single(Position{x, y}));
    }
    return population;
}

SharedPop idlers(size_t count) {
    SharedPop population;
    for (size_t i = 0; i < count; ++i) {
        population.add(scripted<Threading::Shared>(),
                       Region::single(Position{static_cast<int32_t>(i % 16),
                                               static_cast<int32_t>(i / 16)}));
    }
    return population;
}

void compareRuns(CollisionPolicy policy, size_t generations) {
    SharedSim sequential(walkerConfig(false, policy), walkers(160, 24));
    SharedSim parallel(walkerConfig(true, policy), walkers(160, 24));
    BOOST_REQUIRE(!sequential.isParallel());
    BOOST_REQUIRE(parallel.isParallel());

    for (size_t g = 0; g < generations; ++g) {
        const GenerationReport& a = sequential.advanceGeneration();
        const GenerationReport& b = parallel.advanceGeneration();

        BOOST_REQUIRE_EQUAL(a.dispatched, b.dispatched);
        BOOST_CHECK_EQUAL(a.moved, b.moved);
        BOOST_CHECK_EQUAL(a.mutated, b.mutated);
        BOOST_CHECK_EQUAL(a.spawned, b.spawned);
        BOOST_CHECK_EQUAL(a.removed, b.removed);
        BOOST_CHECK_EQUAL(a.expired, b.expired);
        BOOST_CHECK(capture(a) == capture(b));
        BOOST_REQUIRE(capture(sequential.snapshot()) == capture(parallel.snapshot()));
    }
}

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(DeterminismTests)

BOOST_AUTO_TEST_CASE(TestParallelMatchesSequentialWithOverlap) {
    compareRuns(CollisionPolicy::Allow, 40);
}

BOOST_AUTO_TEST_CASE(TestParallelMatchesSequentialWithCollisions) {
    compareRuns(CollisionPolicy::Reject, 40);
}

BOOST_AUTO_TEST_CASE(TestLifeGridMatchesAcrossModes) {
    SimulationConfig config;
    config.width = 20;
    config.height = 20;
    config.topology = Topology::Toroidal;
    config.parallelThreshold = 0;

    const Rules::Pattern pattern = Rules::acorn();
    SharedSim sequential(config, Rules::lifeGrid<Threading::Shared>(config.bounds(), pattern,
                                                                    Position{6, 8}));
    config.parallel = true;
    SharedSim parallel(config, Rules::lifeGrid<Threading::Shared>(config.bounds(), pattern,
                                                                  Position{6, 8}));

    for (int g = 0; g < 25; ++g) {
        sequential.advanceGeneration();
        parallel.advanceGeneration();
    }
    BOOST_CHECK(capture(sequential.snapshot()) == capture(parallel.snapshot()));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(BatchingTests)

BOOST_AUTO_TEST_CASE(TestLargePopulationIsSplitIntoBatches) {
    SimulationConfig config = walkerConfig(true, CollisionPolicy::Allow);
    config.width = 16;
    config.height = 16;
    SharedSim simulation(config, idlers(64));

    WorkerBudgetManager::Instance().resetTuning();
    const GenerationReport& report = simulation.advanceGeneration();
    BOOST_CHECK(report.parallel);
    BOOST_CHECK_GE(report.batches, 2);
    BOOST_CHECK_EQUAL(report.dispatched, 64);
    BOOST_CHECK_EQUAL(simulation.currentGeneration(), 1);
}

BOOST_AUTO_TEST_CASE(TestBelowThresholdRunsInline) {
    SimulationConfig config = walkerConfig(true, CollisionPolicy::Allow);
    config.parallelThreshold = 1000;
    SharedSim simulation(config, idlers(64));

    const GenerationReport& report = simulation.advanceGeneration();
    BOOST_CHECK(!report.parallel);
    BOOST_CHECK_EQUAL(report.batches, 1);
    BOOST_CHECK_EQUAL(report.dispatched, 64);
}

BOOST_AUTO_TEST_CASE(TestReactionsRunOnWorkers) {
    ThreadRecorder::Log log;
    SharedPop population;
    for (int32_t i = 0; i < 64; ++i) {
        population.add(std::make_unique<ThreadRecorder>(log),
                       Region::single(Position{i % 8, i / 8}));
    }
    SimulationConfig config = walkerConfig(true, CollisionPolicy::Allow);
    SharedSim simulation(config, std::move(population));

    WorkerBudgetManager::Instance().resetTuning();
    BOOST_REQUIRE(simulation.advanceGeneration().parallel);
    BOOST_CHECK(!log.threads.empty());
    BOOST_CHECK(log.threads.count(std::this_thread::get_id()) == 0);
}

BOOST_AUTO_TEST_CASE(TestFailuresAreReportedInIdentityOrder) {
    SharedPop population;
    for (int32_t i = 0; i < 48; ++i) {
        const Region footprint = Region::single(Position{i % 12, i / 12});
        if (i % 5 == 0) {
            population.add(std::make_unique<ThrowingEntity<Threading::Shared>>(), footprint);
        } else {
            population.add(scripted<Threading::Shared>(), footprint);
        }
    }
    SharedSim simulation(walkerConfig(true, CollisionPolicy::Allow), std::move(population));

    WorkerBudgetManager::Instance().resetTuning();
    const GenerationReport& report = simulation.advanceGeneration();
    BOOST_CHECK(report.parallel);
    BOOST_REQUIRE_EQUAL(report.countOf(DiagnosticKind::ReactionFailure), 10);
    for (size_t i = 0; i < report.diagnostics.size(); ++i) {
        BOOST_CHECK_EQUAL(report.diagnostics[i].entity.value(), i * 5 + 1);
    }
}

BOOST_AUTO_TEST_CASE(TestBatchStrategyCoversWorkload) {
    auto& budget = WorkerBudgetManager::Instance();
    budget.resetTuning();

    const auto [count, size] = budget.getBatchStrategy(100, 4);
    BOOST_CHECK_EQUAL(count, 4);
    BOOST_CHECK_GE(count * size, 100);

    const auto [smallCount, smallSize] = budget.getBatchStrategy(12, 4);
    BOOST_CHECK_EQUAL(smallCount, 1);
    BOOST_CHECK_EQUAL(smallSize, 12);

    BOOST_CHECK_EQUAL(budget.getOptimalWorkers(0), 0);
    BOOST_CHECK_EQUAL(budget.getOptimalWorkers(100), 4);
}

BOOST_AUTO_TEST_CASE(TestTuningStaysClamped) {
    auto& budget = WorkerBudgetManager::Instance();
    budget.resetTuning();
    for (int i = 0; i < 500; ++i) {
        budget.reportBatchCompletion(4, 0.0);
    }
    BOOST_CHECK_CLOSE(budget.getBatchMultiplier(), WorkerBudgetManager::MIN_MULTIPLIER, 0.01);

    for (int i = 0; i < 500; ++i) {
        budget.reportBatchCompletion(1, 100.0);
    }
    BOOST_CHECK_CLOSE(budget.getBatchMultiplier(), WorkerBudgetManager::MAX_MULTIPLIER, 0.01);
    budget.resetTuning();
    BOOST_CHECK_CLOSE(budget.getBatchMultiplier(), 1.0f, 0.01);
}

// Runs last: stops the pool the global fixture started
BOOST_AUTO_TEST_CASE(TestStoppedPoolFallsBackToInline) {
    SharedSim simulation(walkerConfig(true, CollisionPolicy::Allow), idlers(64));
    ThreadSystem::Instance().clean();

    const GenerationReport& report = simulation.advanceGeneration();
    BOOST_CHECK(!report.parallel);
    BOOST_CHECK_EQUAL(report.dispatched, 64);
}

BOOST_AUTO_TEST_SUITE_END()
