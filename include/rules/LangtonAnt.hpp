/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LANGTON_ANT_HPP
#define LANGTON_ANT_HPP

#include "entities/Action.hpp"
#include "entities/Entity.hpp"
#include <cstdint>

namespace GridForge::Rules {

inline constexpr EntityKind LANGTON_CELL_KIND = 2;
inline constexpr EntityKind LANGTON_ANT_KIND = 3;

enum class Heading : uint8_t { North, East, South, West };

inline Heading turnRight(Heading heading) {
    return static_cast<Heading>((static_cast<uint8_t>(heading) + 1) % 4);
}

inline Heading turnLeft(Heading heading) {
    return static_cast<Heading>((static_cast<uint8_t>(heading) + 3) % 4);
}

// Screen coordinates: North is -y
inline Position headingOffset(Heading heading) {
    switch (heading) {
    case Heading::North:
        return Position{0, -1};
    case Heading::East:
        return Position{1, 0};
    case Heading::South:
        return Position{0, 1};
    case Heading::West:
    default:
        return Position{-1, 0};
    }
}

/**
 * @brief Floor tile for Langton's ant; white (0) or black (1)
 *
 * Flips whenever the snapshot shows an ant standing on it, i.e. in the same
 * generation the ant reads its colour and walks away.
 */
template <Threading T>
class LangtonCell : public BasicEntity<T> {
public:
    explicit LangtonCell(bool black = false) : m_black(black) {}

    EntityKind kind() const override { return LANGTON_CELL_KIND; }
    uint64_t publishedState() const override { return m_black ? 1 : 0; }

    bool isBlack() const { return m_black; }

    Action<T> react(const ReactionContext& context) override {
        if (!context.snapshot().firstOfKindAt(this->position(), LANGTON_ANT_KIND)) {
            return Action<T>::none();
        }
        m_black = !m_black;
        return Action<T>::mutate();
    }

private:
    bool m_black;
};

/**
 * @brief The ant: on white turn right, on black turn left, then step forward
 *
 * Publishes its heading. Off the edge of a bounded grid the step is refused
 * by the commit and the ant keeps turning in place.
 */
template <Threading T>
class LangtonAnt : public BasicEntity<T> {
public:
    explicit LangtonAnt(Heading heading = Heading::West) : m_heading(heading) {}

    EntityKind kind() const override { return LANGTON_ANT_KIND; }
    uint64_t publishedState() const override { return static_cast<uint64_t>(m_heading); }

    Heading heading() const { return m_heading; }

    Action<T> react(const ReactionContext& context) override {
        const EntityView* tile =
            context.snapshot().firstOfKindAt(this->position(), LANGTON_CELL_KIND);
        const bool black = tile && tile->state != 0;

        m_heading = black ? turnLeft(m_heading) : turnRight(m_heading);
        const Position step = headingOffset(m_heading);
        return Action<T>::moveBy(step.x, step.y);
    }

private:
    Heading m_heading;
};

} // namespace GridForge::Rules

#endif // LANGTON_ANT_HPP
