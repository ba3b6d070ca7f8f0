/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

#include "space/Geometry.hpp"
#include "world/Environment.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace GridForge {

class JsonValue;

/**
 * @brief Construction parameters of a Simulation
 *
 * Loaded from JSON with two categories:
 *
 *   {
 *     "environment": { "width": 64, "height": 64,
 *                      "topology": "toroidal", "collision_policy": "allow" },
 *     "scheduler":   { "parallel": true, "parallel_threshold": 256,
 *                      "worker_threads": 0, "seed": 42,
 *                      "log_diagnostics": false }
 *   }
 *
 * Missing keys keep their defaults. Unknown keys are ignored with a
 * warning; a value of the wrong type fails the load.
 */
struct SimulationConfig {
    // environment
    int32_t width{64};
    int32_t height{64};
    Topology topology{Topology::Bounded};
    CollisionPolicy collisionPolicy{CollisionPolicy::Allow};

    // scheduler
    bool parallel{false};
    size_t parallelThreshold{256};
    unsigned int workerThreads{0}; // 0 = hardware concurrency - 1
    uint64_t seed{0};
    bool logDiagnostics{false};

    Bounds bounds() const { return Bounds{width, height, topology}; }

    static SimulationConfig forBounds(const Bounds& bounds);

    /**
     * @brief Checks every value
     * @param reason Set to a description of the first problem found
     * @return true if a Simulation can be built from this configuration
     */
    bool validate(std::string& reason) const;

    /**
     * @brief Overlays values from a JSON file onto this configuration
     * @return false if the file cannot be read or holds invalid values; the
     * configuration is left unchanged and getLastError() says why
     */
    bool loadFromFile(const std::string& filepath);
    bool loadFromString(const std::string& json);

    const std::string& getLastError() const { return m_lastError; }

private:
    std::string m_lastError;

    bool apply(const JsonValue& root, const std::string& source);
};

} // namespace GridForge

#endif // SIMULATION_CONFIG_HPP
