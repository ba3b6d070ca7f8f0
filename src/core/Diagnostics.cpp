/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Diagnostics.hpp"
#include <algorithm>

namespace GridForge {

const char* diagnosticKindToString(DiagnosticKind kind) {
    switch (kind) {
    case DiagnosticKind::StaleActionReference:
        return "StaleActionReference";
    case DiagnosticKind::OutOfBounds:
        return "OutOfBounds";
    case DiagnosticKind::ReactionFailure:
        return "ReactionFailure";
    case DiagnosticKind::Collision:
        return "Collision";
    default:
        return "Unknown";
    }
}

std::string Diagnostic::toString() const {
    std::string text = "[gen " + std::to_string(generation) + "] " +
                       diagnosticKindToString(kind) + " " + entity.toString() + " " +
                       actionKindToString(action);
    if (!message.empty()) {
        text += ": " + message;
    }
    return text;
}

void GenerationReport::reset(uint64_t forGeneration) {
    generation = forGeneration;
    dispatched = 0;
    moved = 0;
    mutated = 0;
    spawned = 0;
    removed = 0;
    expired = 0;
    parallel = false;
    batches = 0;
    dispatchTimeMs = 0.0;
    commitTimeMs = 0.0;
    diagnostics.clear();
}

size_t GenerationReport::countOf(DiagnosticKind kind) const {
    return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
                                             [kind](const Diagnostic& d) { return d.kind == kind; }));
}

std::string GenerationReport::summary() const {
    return "generation " + std::to_string(generation) + ": " + std::to_string(dispatched) +
           " dispatched, " + std::to_string(moved) + " moved, " + std::to_string(mutated) +
           " mutated, " + std::to_string(spawned) + " spawned, " + std::to_string(removed) +
           " removed, " + std::to_string(expired) + " expired, " +
           std::to_string(diagnostics.size()) + " diagnostics" +
           (parallel ? " (parallel, " + std::to_string(batches) + " batches)" : "");
}

} // namespace GridForge
