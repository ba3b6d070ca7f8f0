/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_HPP
#define SIMULATION_HPP

#include "config/SimulationConfig.hpp"
#include "core/Diagnostics.hpp"
#include "dispatch/DispatchStrategy.hpp"
#include "entities/Action.hpp"
#include "entities/Entity.hpp"
#include "world/Environment.hpp"
#include "world/Population.hpp"
#include "world/Snapshot.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace GridForge {

enum class SchedulerState : uint8_t {
    Idle,
    Dispatching,
    Collecting,
    Committing
};

const char* schedulerStateToString(SchedulerState state);

/**
 * @brief Generation scheduler: owns one environment and advances it
 *
 * Each advanceGeneration() is a full Idle -> Dispatching -> Collecting ->
 * Committing -> Idle cycle: snapshot, one reaction per live entity in
 * identity order, then a single commit. The generation counter starts at
 * 0 and grows by exactly one per call.
 *
 * Parallel dispatch is only available to Simulation<Threading::Shared>;
 * asking for it on a single-threaded population is a ConfigurationError.
 * It uses the ThreadSystem, which the application initializes; while the
 * pool is not running the parallel strategy reacts inline.
 *
 * Snapshots and reports handed out are valid until the next
 * advanceGeneration().
 */
template <Threading T>
class Simulation {
public:
    using EntityType = BasicEntity<T>;

    /**
     * @throws ConfigurationError if config fails validation, the population
     * cannot be placed, or parallel dispatch is requested for
     * Threading::Single
     */
    explicit Simulation(const SimulationConfig& config, Population<T> population = {});
    explicit Simulation(const Bounds& bounds, Population<T> population = {});

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    const GenerationReport& advanceGeneration();

    uint64_t currentGeneration() const { return m_environment.generation(); }
    Snapshot snapshot() const { return m_environment.snapshot(); }

    const GenerationReport& lastReport() const { return m_lastReport; }
    const std::vector<Diagnostic>& diagnostics() const { return m_lastReport.diagnostics; }

    template <EntityOf<T> E>
    EntityId insert(std::unique_ptr<E> entity, const Region& footprint,
                    Lifespan lifespan = Lifespan::immortal()) {
        return m_environment.insert(std::move(entity), footprint, lifespan);
    }

    Environment<T>& environment() { return m_environment; }
    const Environment<T>& environment() const { return m_environment; }

    SchedulerState state() const { return m_state; }
    bool isParallel() const { return m_dispatch->isParallel(); }
    const char* dispatchName() const { return m_dispatch->name(); }
    const SimulationConfig& config() const { return m_config; }

private:
    SimulationConfig m_config;
    Environment<T> m_environment;
    std::unique_ptr<DispatchStrategy<T>> m_dispatch;
    DispatchSettings m_settings;
    SchedulerState m_state{SchedulerState::Idle};
    GenerationReport m_lastReport;
    ActionList<T> m_actions;

    static const SimulationConfig& checked(const SimulationConfig& config);
    static std::unique_ptr<DispatchStrategy<T>> makeDispatch(const SimulationConfig& config);
};

extern template class Simulation<Threading::Single>;
extern template class Simulation<Threading::Shared>;

} // namespace GridForge

#endif // SIMULATION_HPP
