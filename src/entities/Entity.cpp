/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Entity.hpp"

namespace GridForge {

namespace {

// splitmix64 finalizer
uint64_t mix(uint64_t value) {
    value += 0x9E3779B97F4A7C15ULL;
    value = (value ^ (value >> 30)) * 0xBF58476D1CE4E5B9ULL;
    value = (value ^ (value >> 27)) * 0x94D049BB133111EBULL;
    return value ^ (value >> 31);
}

} // anonymous namespace

uint64_t deriveReactionSeed(uint64_t runSeed, uint64_t generation, EntityId id) {
    return mix(mix(mix(runSeed) ^ generation) ^ id.value());
}

} // namespace GridForge
