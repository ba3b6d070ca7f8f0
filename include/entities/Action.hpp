/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTION_HPP
#define ACTION_HPP

#include "entities/Entity.hpp"
#include "entities/EntityId.hpp"
#include "entities/EntityTypes.hpp"
#include "entities/Lifespan.hpp"
#include "space/Geometry.hpp"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

namespace GridForge {

/**
 * @brief The single effect a reaction asks the commit to apply
 *
 * Move-only: a Spawn owns the offspring until the commit adopts it or drops
 * it. A default-constructed action is None.
 */
template <Threading T>
class Action {
public:
    struct None {};
    enum class Placement : uint8_t {
        Footprint, // target is the new footprint
        Anchor,    // target.origin is the new origin, size is kept
        Offset     // target.origin is added to the current origin, size is kept
    };
    struct Move {
        Region target{};
        Placement placement{Placement::Footprint};
    };
    struct Mutate {};
    struct Spawn {
        std::unique_ptr<BasicEntity<T>> offspring{};
        Region footprint{};
        Lifespan lifespan{};
    };
    struct Remove {};

    using Variant = std::variant<None, Move, Mutate, Spawn, Remove>;

    Action() = default;
    Action(Action&&) noexcept = default;
    Action& operator=(Action&&) noexcept = default;
    Action(const Action&) = delete;
    Action& operator=(const Action&) = delete;

    static Action none() { return Action{None{}}; }

    static Action move(const Region& target) { return Action{Move{target, Placement::Footprint}}; }

    // Same size as the current footprint, anchored at p
    static Action moveTo(Position p) {
        return Action{Move{Region{p, Dimension{0, 0}}, Placement::Anchor}};
    }

    // Current footprint shifted by (dx, dy)
    static Action moveBy(int32_t dx, int32_t dy) {
        return Action{Move{Region{Position{dx, dy}, Dimension{0, 0}}, Placement::Offset}};
    }

    // The entity already changed itself; republish its state
    static Action mutate() { return Action{Mutate{}}; }

    /**
     * @brief Create an entity at commit, visible from the next generation
     * @throws std::invalid_argument if offspring is null
     */
    template <EntityOf<T> E>
    static Action spawn(std::unique_ptr<E> offspring, const Region& footprint,
                        Lifespan lifespan = Lifespan::immortal()) {
        if (!offspring) {
            throw std::invalid_argument("Spawn requires an offspring entity");
        }
        return Action{Spawn{std::unique_ptr<BasicEntity<T>>(std::move(offspring)), footprint, lifespan}};
    }

    static Action remove() { return Action{Remove{}}; }

    ActionKind kind() const {
        return static_cast<ActionKind>(m_value.index());
    }

    bool isNone() const { return kind() == ActionKind::None; }

    template <typename Alt> const Alt* getIf() const { return std::get_if<Alt>(&m_value); }
    template <typename Alt> Alt* getIf() { return std::get_if<Alt>(&m_value); }

    const Variant& value() const { return m_value; }

private:
    explicit Action(Variant value) : m_value(std::move(value)) {}

    Variant m_value{};
};

template <Threading T>
using ActionList = std::vector<std::pair<EntityId, Action<T>>>;

} // namespace GridForge

#endif // ACTION_HPP
