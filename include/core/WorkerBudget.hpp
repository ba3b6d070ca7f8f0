/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORKER_BUDGET_HPP
#define WORKER_BUDGET_HPP

#include <atomic>
#include <cstddef>
#include <utility>

namespace GridForge {

/**
 * @brief Worker allocation available to one dispatch
 *
 * Dispatches of one simulation never overlap, so each gets every worker.
 */
struct WorkerBudget {
    size_t totalWorkers{0};
};

/**
 * @brief Queue depth per worker considered a saturated pool
 */
static constexpr size_t QUEUE_DEPTH_PER_WORKER = 16;
static constexpr double QUEUE_PRESSURE_CRITICAL = 0.90;

/**
 * @brief Decides how a parallel dispatch is split into batches
 *
 * Batch count starts at one batch per worker and is tuned by a multiplier
 * fed back from reportBatchCompletion(). Batching only changes how the
 * reaction calls are grouped; results are reduced by slot index, so the
 * split never changes what a generation produces.
 *
 * Thread Safety: tuning state is atomic; the manager holds no per-dispatch
 * state.
 */
class WorkerBudgetManager {
public:
    static WorkerBudgetManager& Instance();

    WorkerBudget getBudget() const;

    /**
     * @brief Worker count for a dispatch of workloadSize reactions
     * @return 0 for no work, 1 under critical queue pressure, otherwise every
     * worker
     */
    size_t getOptimalWorkers(size_t workloadSize) const;

    /**
     * @brief Batch split for a dispatch
     * @return Pair of {batchCount, batchSize}; batchCount * batchSize covers
     * workloadSize
     */
    std::pair<size_t, size_t> getBatchStrategy(size_t workloadSize,
                                               size_t optimalWorkers) const;

    /**
     * @brief Feed back the wall time of a finished dispatch
     *
     * Batches finishing under DEAD_BAND_LOW_MS are consolidated, batches
     * over DEAD_BAND_HIGH_MS are split further.
     */
    void reportBatchCompletion(size_t batchCount, double totalTimeMs);

    float getBatchMultiplier() const {
        return m_batchMultiplier.load(std::memory_order_relaxed);
    }

    // Back to one batch per worker
    void resetTuning();

    static constexpr size_t MIN_ITEMS_PER_BATCH = 8;
    static constexpr float MIN_MULTIPLIER = 0.25f;
    static constexpr float MAX_MULTIPLIER = 2.5f;
    static constexpr float ADJUST_RATE = 0.02f;
    static constexpr double DEAD_BAND_LOW_MS = 0.1;
    static constexpr double DEAD_BAND_HIGH_MS = 0.5;

private:
    WorkerBudgetManager() = default;
    ~WorkerBudgetManager() = default;

    WorkerBudgetManager(const WorkerBudgetManager&) = delete;
    WorkerBudgetManager& operator=(const WorkerBudgetManager&) = delete;

    std::atomic<float> m_batchMultiplier{1.0f};
    std::atomic<double> m_avgBatchTimeMs{0.0};

    // 0.0 (idle) to 1.0 (saturated)
    double getQueuePressure() const;
};

} // namespace GridForge

#endif // WORKER_BUDGET_HPP
