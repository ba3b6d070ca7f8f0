/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "config/SimulationConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <limits>

namespace GridForge {

namespace {

// Largest grid side; keeps width * height and neighborhood math in range
constexpr int64_t MAX_EXTENT = 1 << 20;
constexpr unsigned int MAX_WORKER_THREADS = 1024;

bool readInteger(const JsonValue& value, const std::string& name, int64_t min, int64_t max,
                 int64_t& out, std::string& error) {
    const auto integer = value.tryAsInteger();
    if (!integer) {
        error = "'" + name + "' must be an integer, got " + value.toString();
        return false;
    }
    if (*integer < min || *integer > max) {
        error = "'" + name + "' must be between " + std::to_string(min) + " and " +
                std::to_string(max) + ", got " + std::to_string(*integer);
        return false;
    }
    out = *integer;
    return true;
}

bool readBool(const JsonValue& value, const std::string& name, bool& out, std::string& error) {
    const auto flag = value.tryAsBool();
    if (!flag) {
        error = "'" + name + "' must be a boolean, got " + value.toString();
        return false;
    }
    out = *flag;
    return true;
}

} // anonymous namespace

SimulationConfig SimulationConfig::forBounds(const Bounds& bounds) {
    SimulationConfig config;
    config.width = bounds.size.width;
    config.height = bounds.size.height;
    config.topology = bounds.topology;
    return config;
}

bool SimulationConfig::validate(std::string& reason) const {
    if (topology != Topology::Unbounded) {
        if (width <= 0 || height <= 0) {
            reason = "environment size " + std::to_string(width) + "x" + std::to_string(height) +
                     " must be positive for " + topologyToString(topology) + " topology";
            return false;
        }
        if (width > MAX_EXTENT || height > MAX_EXTENT) {
            reason = "environment size " + std::to_string(width) + "x" + std::to_string(height) +
                     " exceeds " + std::to_string(MAX_EXTENT) + " cells per side";
            return false;
        }
    }
    if (workerThreads > MAX_WORKER_THREADS) {
        reason = "worker_threads " + std::to_string(workerThreads) + " exceeds " +
                 std::to_string(MAX_WORKER_THREADS);
        return false;
    }
    reason.clear();
    return true;
}

bool SimulationConfig::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        m_lastError = reader.getLastError();
        CONFIG_ERROR("Failed to load simulation config from file: " + filepath + " - " +
                     m_lastError);
        return false;
    }
    return apply(reader.getRoot(), filepath);
}

bool SimulationConfig::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        m_lastError = reader.getLastError();
        CONFIG_ERROR("Failed to parse simulation config - " + m_lastError);
        return false;
    }
    return apply(reader.getRoot(), "<string>");
}

bool SimulationConfig::apply(const JsonValue& root, const std::string& source) {
    m_lastError.clear();
    if (!root.isObject()) {
        m_lastError = "config root is not a JSON object";
        CONFIG_ERROR("Simulation config root is not a JSON object: " + source);
        return false;
    }

    // Work on a copy so a failed load leaves this configuration untouched
    SimulationConfig next = *this;
    std::string error;
    bool ok = true;

    for (const auto& [categoryName, category] : root.asObject()) {
        if (categoryName != "environment" && categoryName != "scheduler") {
            CONFIG_WARN("Unknown category '" + categoryName + "' in " + source + ", ignoring");
            continue;
        }
        if (!category.isObject()) {
            error = "category '" + categoryName + "' is not an object";
            ok = false;
            break;
        }

        for (const auto& [key, value] : category.asObject()) {
            const std::string name = categoryName + "." + key;
            int64_t integer = 0;

            if (categoryName == "environment") {
                if (key == "width" || key == "height") {
                    ok = readInteger(value, name, 0, MAX_EXTENT, integer, error);
                    if (ok) {
                        (key == "width" ? next.width : next.height) = static_cast<int32_t>(integer);
                    }
                } else if (key == "topology") {
                    const auto topologyName = value.tryAsString();
                    const auto parsed = topologyName ? topologyFromString(*topologyName) : std::nullopt;
                    if (!parsed) {
                        error = "'" + name + "' must be \"bounded\", \"toroidal\" or \"unbounded\"";
                        ok = false;
                    } else {
                        next.topology = *parsed;
                    }
                } else if (key == "collision_policy") {
                    const auto policyName = value.tryAsString();
                    const auto parsed = policyName ? collisionPolicyFromString(*policyName) : std::nullopt;
                    if (!parsed) {
                        error = "'" + name + "' must be \"allow\" or \"reject\"";
                        ok = false;
                    } else {
                        next.collisionPolicy = *parsed;
                    }
                } else {
                    CONFIG_WARN("Unknown setting '" + name + "' in " + source + ", ignoring");
                }
            } else {
                if (key == "parallel") {
                    ok = readBool(value, name, next.parallel, error);
                } else if (key == "log_diagnostics") {
                    ok = readBool(value, name, next.logDiagnostics, error);
                } else if (key == "parallel_threshold") {
                    ok = readInteger(value, name, 0, std::numeric_limits<int32_t>::max(), integer, error);
                    if (ok) {
                        next.parallelThreshold = static_cast<size_t>(integer);
                    }
                } else if (key == "worker_threads") {
                    ok = readInteger(value, name, 0, MAX_WORKER_THREADS, integer, error);
                    if (ok) {
                        next.workerThreads = static_cast<unsigned int>(integer);
                    }
                } else if (key == "seed") {
                    ok = readInteger(value, name, 0, std::numeric_limits<int64_t>::max(), integer, error);
                    if (ok) {
                        next.seed = static_cast<uint64_t>(integer);
                    }
                } else {
                    CONFIG_WARN("Unknown setting '" + name + "' in " + source + ", ignoring");
                }
            }

            if (!ok) {
                break;
            }
        }

        if (!ok) {
            break;
        }
    }

    if (ok && !next.validate(error)) {
        ok = false;
    }

    if (!ok) {
        m_lastError = error;
        CONFIG_ERROR("Invalid simulation config in " + source + ": " + error);
        return false;
    }

    next.m_lastError.clear();
    *this = std::move(next);
    CONFIG_INFO("Loaded simulation config from " + source);
    return true;
}

} // namespace GridForge
