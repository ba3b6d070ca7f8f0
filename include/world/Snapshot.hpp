/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SNAPSHOT_HPP
#define SNAPSHOT_HPP

#include "world/WorldState.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace GridForge {

/**
 * @brief Read-only view of one generation of an environment
 *
 * A snapshot borrows the environment's state; it copies nothing. It is
 * valid until the next commit (isCurrent() turns false) and must not
 * outlive the environment. Every reaction of a generation sees the same
 * snapshot, and nothing a reaction returns is visible through it.
 *
 * Iteration visits entities in identity order.
 */
class Snapshot {
public:
    using const_iterator = std::vector<EntityView>::const_iterator;

    explicit Snapshot(const WorldState& state)
        : m_state(&state), m_generation(state.generation()) {}

    uint64_t generation() const { return m_generation; }
    const Bounds& bounds() const { return m_state->bounds(); }

    size_t size() const { return m_state->size(); }
    bool empty() const { return m_state->size() == 0; }

    const EntityView* find(EntityId id) const { return m_state->find(id); }
    bool contains(EntityId id) const { return m_state->find(id) != nullptr; }

    // Identities covering any cell of region, ascending
    std::vector<EntityId> entitiesIn(const Region& region) const;
    std::vector<EntityId> occupantsAt(Position p) const;
    // Entities within radius cells of center (Chebyshev), ascending
    std::vector<EntityId> neighborhood(Position center, int32_t radius) const;
    // Lowest identity of kind covering p, or nullptr
    const EntityView* firstOfKindAt(Position p, EntityKind kind) const;

    std::map<EntityKind, size_t> countByKind() const;

    // False once the environment committed past this generation
    bool isCurrent() const { return m_state->generation() == m_generation; }

    const_iterator begin() const { return m_state->records().begin(); }
    const_iterator end() const { return m_state->records().end(); }

private:
    const WorldState* m_state;
    uint64_t m_generation;
};

} // namespace GridForge

#endif // SNAPSHOT_HPP
