/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_TYPES_HPP
#define ENTITY_TYPES_HPP

#include <cstdint>

namespace GridForge {

/**
 * @brief Threading capability of an entity population
 *
 * Single: reactions run on the thread that advances the simulation.
 * Shared: the entity type declares its react() safe to run on a worker
 * thread while other entities react concurrently. Only Shared populations
 * can be dispatched in parallel; this is fixed by the type, not checked at
 * run time.
 */
enum class Threading : uint8_t {
    Single,
    Shared
};

// User-defined classification of entities; 0 is "unclassified"
using EntityKind = uint32_t;

enum class ActionKind : uint8_t {
    None,
    Move,
    Mutate,
    Spawn,
    Remove
};

inline const char* actionKindToString(ActionKind kind) {
    switch (kind) {
    case ActionKind::None:
        return "None";
    case ActionKind::Move:
        return "Move";
    case ActionKind::Mutate:
        return "Mutate";
    case ActionKind::Spawn:
        return "Spawn";
    case ActionKind::Remove:
        return "Remove";
    default:
        return "Unknown";
    }
}

} // namespace GridForge

#endif // ENTITY_TYPES_HPP
