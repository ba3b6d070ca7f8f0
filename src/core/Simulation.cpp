/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Simulation.hpp"
#include "core/Logger.hpp"
#include "dispatch/ParallelDispatch.hpp"
#include "dispatch/SequentialDispatch.hpp"
#include <chrono>
#include <string>

namespace GridForge {

const char* schedulerStateToString(SchedulerState state) {
    switch (state) {
    case SchedulerState::Idle:
        return "Idle";
    case SchedulerState::Dispatching:
        return "Dispatching";
    case SchedulerState::Collecting:
        return "Collecting";
    case SchedulerState::Committing:
        return "Committing";
    default:
        return "Unknown";
    }
}

template <Threading T>
const SimulationConfig& Simulation<T>::checked(const SimulationConfig& config) {
    std::string reason;
    if (!config.validate(reason)) {
        throw ConfigurationError("Invalid simulation config: " + reason);
    }
    if constexpr (T == Threading::Single) {
        if (config.parallel) {
            throw ConfigurationError(
                "Parallel dispatch requires a SharedEntity population; "
                "Entity reactions may only run on the simulation thread");
        }
    }
    return config;
}

template <Threading T>
std::unique_ptr<DispatchStrategy<T>> Simulation<T>::makeDispatch(const SimulationConfig& config) {
    if constexpr (T == Threading::Shared) {
        if (config.parallel) {
            return std::make_unique<ParallelDispatch>();
        }
    }
    (void)config;
    return std::make_unique<SequentialDispatch<T>>();
}

template <Threading T>
Simulation<T>::Simulation(const SimulationConfig& config, Population<T> population)
    : m_config(checked(config)),
      m_environment(config.bounds(), std::move(population), config.collisionPolicy),
      m_dispatch(makeDispatch(config)),
      m_settings{config.seed, config.parallelThreshold} {
    SIM_INFO("Simulation created: " + std::to_string(m_environment.size()) + " entities, " +
             std::to_string(config.width) + "x" + std::to_string(config.height) + " " +
             topologyToString(config.topology) + ", " + m_dispatch->name() + " dispatch");
}

template <Threading T>
Simulation<T>::Simulation(const Bounds& bounds, Population<T> population)
    : Simulation(SimulationConfig::forBounds(bounds), std::move(population)) {}

template <Threading T>
const GenerationReport& Simulation<T>::advanceGeneration() {
    const uint64_t generation = m_environment.generation();
    m_lastReport.reset(generation);

    try {
        m_state = SchedulerState::Dispatching;
        const Snapshot snapshot = m_environment.snapshot();
        const auto dispatchStart = std::chrono::steady_clock::now();
        m_dispatch->dispatch(m_environment, snapshot, m_settings, m_actions, m_lastReport);
        const auto dispatchEnd = std::chrono::steady_clock::now();

        m_state = SchedulerState::Collecting;
        m_lastReport.dispatched = m_actions.size();
        m_lastReport.dispatchTimeMs =
            std::chrono::duration<double, std::milli>(dispatchEnd - dispatchStart).count();

        m_state = SchedulerState::Committing;
        m_environment.commit(std::move(m_actions), m_lastReport);
        m_actions.clear();
        m_lastReport.commitTimeMs =
            std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - dispatchEnd)
                .count();
    } catch (const std::exception& e) {
        // Infrastructure fault: the generation did not complete
        m_state = SchedulerState::Idle;
        SIM_CRITICAL("Generation " + std::to_string(generation) + " aborted: " + e.what());
        throw;
    } catch (...) {
        m_state = SchedulerState::Idle;
        SIM_CRITICAL("Generation " + std::to_string(generation) + " aborted");
        throw;
    }

    m_state = SchedulerState::Idle;

    // Opted in through the config, so not compiled out like SIM_WARN
    if (m_config.logDiagnostics) {
        for (const Diagnostic& diagnostic : m_lastReport.diagnostics) {
            Logger::Log(LogLevel::WARNING, "Simulation", diagnostic.toString());
        }
    }
    SIM_DEBUG(m_lastReport.summary());

    return m_lastReport;
}

template class Simulation<Threading::Single>;
template class Simulation<Threading::Shared>;

} // namespace GridForge
