/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LIFE_CELL_HPP
#define LIFE_CELL_HPP

#include "entities/Action.hpp"
#include "entities/Entity.hpp"
#include <cstddef>
#include <cstdint>

namespace GridForge::Rules {

inline constexpr EntityKind LIFE_CELL_KIND = 1;

/**
 * @brief One cell of a Conway's Game of Life grid
 *
 * Every grid cell is an entity; only its alive flag changes. Neighbours are
 * counted from the snapshot, so the whole grid updates in lockstep.
 */
template <Threading T>
class LifeCell : public BasicEntity<T> {
public:
    explicit LifeCell(bool alive = false) : m_alive(alive) {}

    EntityKind kind() const override { return LIFE_CELL_KIND; }
    uint64_t publishedState() const override { return m_alive ? 1 : 0; }

    bool isAlive() const { return m_alive; }

    Action<T> react(const ReactionContext& context) override {
        const Snapshot& snapshot = context.snapshot();

        size_t liveNeighbours = 0;
        for (const EntityId& id : snapshot.neighborhood(this->position(), 1)) {
            if (id == this->id()) {
                continue;
            }
            const EntityView* neighbour = snapshot.find(id);
            if (neighbour && neighbour->kind == LIFE_CELL_KIND && neighbour->state != 0) {
                ++liveNeighbours;
            }
        }

        const bool next = m_alive ? (liveNeighbours == 2 || liveNeighbours == 3)
                                  : liveNeighbours == 3;
        if (next == m_alive) {
            return Action<T>::none();
        }
        m_alive = next;
        return Action<T>::mutate();
    }

private:
    bool m_alive;
};

} // namespace GridForge::Rules

#endif // LIFE_CELL_HPP
