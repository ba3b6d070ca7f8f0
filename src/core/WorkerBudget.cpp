/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/WorkerBudget.hpp"
#include "core/ThreadSystem.hpp"
#include <algorithm>

namespace GridForge {

WorkerBudgetManager& WorkerBudgetManager::Instance() {
    static WorkerBudgetManager instance;
    return instance;
}

WorkerBudget WorkerBudgetManager::getBudget() const {
    WorkerBudget budget;
    const auto& threadSystem = ThreadSystem::Instance();
    if (threadSystem.isInitialized()) {
        budget.totalWorkers = threadSystem.getThreadCount();
    }
    budget.totalWorkers = std::max(budget.totalWorkers, size_t{1});
    return budget;
}

size_t WorkerBudgetManager::getOptimalWorkers(size_t workloadSize) const {
    if (workloadSize == 0) {
        return 0;
    }

    if (getQueuePressure() > QUEUE_PRESSURE_CRITICAL) {
        return 1;
    }

    return getBudget().totalWorkers;
}

std::pair<size_t, size_t> WorkerBudgetManager::getBatchStrategy(
    size_t workloadSize, size_t optimalWorkers) const {

    if (workloadSize == 0 || optimalWorkers == 0) {
        return {1, workloadSize};
    }

    const size_t maxBatches = std::max(size_t{1}, workloadSize / MIN_ITEMS_PER_BATCH);
    const size_t targetBatches = std::min(optimalWorkers, maxBatches);

    const float multiplier = m_batchMultiplier.load(std::memory_order_relaxed);
    size_t batchCount = static_cast<size_t>(static_cast<float>(targetBatches) * multiplier);
    batchCount = std::clamp(batchCount, size_t{1}, maxBatches);

    // Round up so the last batch picks up the remainder
    const size_t batchSize = (workloadSize + batchCount - 1) / batchCount;
    batchCount = (workloadSize + batchSize - 1) / batchSize;

    return {batchCount, batchSize};
}

void WorkerBudgetManager::reportBatchCompletion(size_t batchCount, double totalTimeMs) {
    if (batchCount == 0) {
        return;
    }

    const double perBatchTimeMs = totalTimeMs / static_cast<double>(batchCount);

    // Exponential smoothing, 15% weight to the new sample
    const double oldAvg = m_avgBatchTimeMs.load(std::memory_order_relaxed);
    m_avgBatchTimeMs.store(oldAvg * 0.85 + perBatchTimeMs * 0.15, std::memory_order_relaxed);

    float multiplier = m_batchMultiplier.load(std::memory_order_relaxed);
    if (perBatchTimeMs < DEAD_BAND_LOW_MS) {
        multiplier -= ADJUST_RATE;
    } else if (perBatchTimeMs > DEAD_BAND_HIGH_MS) {
        multiplier += ADJUST_RATE;
    }
    multiplier = std::clamp(multiplier, MIN_MULTIPLIER, MAX_MULTIPLIER);
    m_batchMultiplier.store(multiplier, std::memory_order_relaxed);
}

void WorkerBudgetManager::resetTuning() {
    m_batchMultiplier.store(1.0f, std::memory_order_relaxed);
    m_avgBatchTimeMs.store(0.0, std::memory_order_relaxed);
}

double WorkerBudgetManager::getQueuePressure() const {
    const auto& threadSystem = ThreadSystem::Instance();
    if (!threadSystem.isInitialized()) {
        return 0.0;
    }

    const size_t capacity =
        static_cast<size_t>(threadSystem.getThreadCount()) * QUEUE_DEPTH_PER_WORKER;
    if (capacity == 0) {
        return 0.0;
    }

    return static_cast<double>(threadSystem.getQueueSize()) / static_cast<double>(capacity);
}

} // namespace GridForge
