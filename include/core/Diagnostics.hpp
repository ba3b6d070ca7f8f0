/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DIAGNOSTICS_HPP
#define DIAGNOSTICS_HPP

#include "entities/EntityId.hpp"
#include "entities/EntityTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace GridForge {

/**
 * @brief Fatal construction-time failure
 *
 * Invalid bounds or configuration, duplicate or invalid initial identities,
 * initial footprints the bounds cannot admit, and parallel dispatch
 * requested for a single-threaded entity population.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

enum class DiagnosticKind : uint8_t {
    StaleActionReference, // Action names an identity that is not alive
    OutOfBounds,          // Move or Spawn footprint rejected by the bounds
    ReactionFailure,      // react() threw; the entity's action became None
    Collision             // Move or Spawn overlapped under CollisionPolicy::Reject
};

const char* diagnosticKindToString(DiagnosticKind kind);

/**
 * @brief Non-fatal, generation-local report of a dropped effect
 */
struct Diagnostic {
    DiagnosticKind kind{DiagnosticKind::StaleActionReference};
    uint64_t generation{0}; // Generation whose actions produced it
    EntityId entity{};      // Acting entity
    ActionKind action{ActionKind::None};
    std::string message{};

    std::string toString() const;
};

/**
 * @brief Everything observable about one advanceGeneration() call
 */
struct GenerationReport {
    uint64_t generation{0}; // Generation that was dispatched and committed

    size_t dispatched{0};
    size_t moved{0};
    size_t mutated{0};
    size_t spawned{0};
    size_t removed{0};
    size_t expired{0}; // Ephemeral entities retired by ageing

    bool parallel{false};
    size_t batches{0};
    double dispatchTimeMs{0.0};
    double commitTimeMs{0.0};

    std::vector<Diagnostic> diagnostics{};

    void reset(uint64_t forGeneration);
    size_t countOf(DiagnosticKind kind) const;
    bool hasDiagnostics() const { return !diagnostics.empty(); }
    std::string summary() const;
};

} // namespace GridForge

#endif // DIAGNOSTICS_HPP
