/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DISPATCH_STRATEGY_HPP
#define DISPATCH_STRATEGY_HPP

#include "core/Diagnostics.hpp"
#include "entities/Action.hpp"
#include "entities/Entity.hpp"
#include "world/Environment.hpp"
#include "world/Snapshot.hpp"
#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <vector>

namespace GridForge {

struct DispatchSettings {
    uint64_t seed{0};
    // Populations below this react inline even under parallel dispatch
    size_t parallelThreshold{0};
};

/**
 * @brief Dispatch phase of a generation
 *
 * Calls react() once for every live entity against the same snapshot and
 * fills out with one (identity, action) pair per entity in ascending
 * identity order. Reaction failures become None plus a ReactionFailure
 * diagnostic; they never stop the other reactions.
 */
template <Threading T>
class DispatchStrategy {
public:
    virtual ~DispatchStrategy() = default;

    virtual void dispatch(Environment<T>& environment, const Snapshot& snapshot,
                          const DispatchSettings& settings, ActionList<T>& out,
                          GenerationReport& report) = 0;

    virtual const char* name() const = 0;
    virtual bool isParallel() const = 0;
};

/**
 * @brief react() with the per-entity failure boundary
 *
 * Safe to call concurrently for distinct entities when each caller passes
 * its own failures buffer.
 */
template <Threading T>
Action<T> reactGuarded(BasicEntity<T>& entity, const Snapshot& snapshot, uint64_t seed,
                       std::vector<Diagnostic>& failures) {
    std::string reason;
    try {
        return entity.react(ReactionContext{snapshot, seed, entity.id()});
    } catch (const std::exception& e) {
        reason = e.what();
    } catch (...) {
        reason = "unknown exception";
    }
    failures.push_back(Diagnostic{DiagnosticKind::ReactionFailure, snapshot.generation(),
                                  entity.id(), ActionKind::None,
                                  "react() failed: " + reason});
    return Action<T>::none();
}

} // namespace GridForge

#endif // DISPATCH_STRATEGY_HPP
