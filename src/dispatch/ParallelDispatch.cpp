/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "dispatch/ParallelDispatch.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "core/WorkerBudget.hpp"
#include <chrono>
#include <exception>

namespace GridForge {

void ParallelDispatch::dispatch(Environment<Threading::Shared>& environment,
                                const Snapshot& snapshot, const DispatchSettings& settings,
                                ActionList<Threading::Shared>& out, GenerationReport& report) {
    const size_t entityCount = environment.slotCount();
    auto& threadSystem = ThreadSystem::Instance();

    if (entityCount == 0 || entityCount < settings.parallelThreshold ||
        !threadSystem.isInitialized() || threadSystem.isShutdown()) {
        m_inline.dispatch(environment, snapshot, settings, out, report);
        return;
    }

    auto& budgetMgr = WorkerBudgetManager::Instance();
    const size_t optimalWorkerCount = budgetMgr.getOptimalWorkers(entityCount);
    const auto [batchCount, batchSize] =
        budgetMgr.getBatchStrategy(entityCount, optimalWorkerCount);
    (void)batchSize;

    // Single batch: avoid thread overhead
    if (batchCount <= 1) {
        m_inline.dispatch(environment, snapshot, settings, out, report);
        return;
    }

    const auto startTime = std::chrono::steady_clock::now();

    m_results.clear();
    m_results.resize(entityCount);
    m_batchFailures.resize(batchCount);
    for (auto& failures : m_batchFailures) {
        failures.clear();
    }

    const size_t entitiesPerBatch = entityCount / batchCount;
    const size_t remainingEntities = entityCount % batchCount;
    const uint64_t seed = settings.seed;

    m_batchFutures.clear();
    try {
        for (size_t i = 0; i < batchCount; ++i) {
            const size_t start = i * entitiesPerBatch;
            size_t end = start + entitiesPerBatch;
            // Remainder goes to the last batch
            if (i == batchCount - 1) {
                end += remainingEntities;
            }

            m_batchFutures.push_back(threadSystem.enqueueTaskWithResult(
                [this, &environment, &snapshot, start, end, seed, i]() -> void {
                    auto& failures = m_batchFailures[i];
                    for (size_t slot = start; slot < end; ++slot) {
                        m_results[slot] =
                            reactGuarded(environment.entityAt(slot), snapshot, seed, failures);
                    }
                },
                TaskPriority::Critical, "GridForge_DispatchBatch"));
        }
    } catch (const std::exception& e) {
        // Batches already queued still reference this frame's buffers
        DISPATCH_ERROR(std::string("Failed to submit dispatch batch: ") + e.what());
        waitForBatches();
        throw;
    }

    waitForBatches();

    out.clear();
    out.reserve(entityCount);
    for (size_t slot = 0; slot < entityCount; ++slot) {
        out.emplace_back(environment.idAt(slot), std::move(m_results[slot]));
    }
    for (auto& failures : m_batchFailures) {
        for (auto& failure : failures) {
            report.diagnostics.push_back(std::move(failure));
        }
    }

    const double elapsedMs =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - startTime)
            .count();
    budgetMgr.reportBatchCompletion(batchCount, elapsedMs);

    report.parallel = true;
    report.batches = batchCount;

    DISPATCH_DEBUG("Generation " + std::to_string(snapshot.generation()) + " dispatched " +
                   std::to_string(entityCount) + " entities in " + std::to_string(batchCount) +
                   " batches");
}

void ParallelDispatch::waitForBatches() {
    std::exception_ptr firstError;
    for (auto& future : m_batchFutures) {
        if (!future.valid()) {
            continue;
        }
        try {
            future.get();
        } catch (...) {
            if (!firstError) {
                firstError = std::current_exception();
            }
        }
    }
    m_batchFutures.clear();
    if (firstError) {
        std::rethrow_exception(firstError);
    }
}

} // namespace GridForge
