/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARALLEL_DISPATCH_HPP
#define PARALLEL_DISPATCH_HPP

#include "dispatch/DispatchStrategy.hpp"
#include "dispatch/SequentialDispatch.hpp"
#include <boost/container/small_vector.hpp>
#include <future>
#include <vector>

namespace GridForge {

/**
 * @brief Reactions split into contiguous slot ranges across the ThreadSystem
 *
 * Only available for SharedEntity populations. Each batch writes its own
 * result slots and its own failure buffer; the calling thread waits for
 * every batch and reduces in slot order, so the action list and the
 * diagnostics are exactly what SequentialDispatch would produce.
 *
 * Populations below DispatchSettings::parallelThreshold, single-batch
 * splits, and dispatches while the ThreadSystem is not running react
 * inline.
 */
class ParallelDispatch final : public DispatchStrategy<Threading::Shared> {
public:
    void dispatch(Environment<Threading::Shared>& environment, const Snapshot& snapshot,
                  const DispatchSettings& settings, ActionList<Threading::Shared>& out,
                  GenerationReport& report) override;

    const char* name() const override { return "parallel"; }
    bool isParallel() const override { return true; }

private:
    SequentialDispatch<Threading::Shared> m_inline;

    // Reused across generations to keep their capacity
    std::vector<Action<Threading::Shared>> m_results;
    std::vector<std::vector<Diagnostic>> m_batchFailures;
    boost::container::small_vector<std::future<void>, 16> m_batchFutures;

    void waitForBatches();
};

} // namespace GridForge

#endif // PARALLEL_DISPATCH_HPP
