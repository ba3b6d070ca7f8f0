/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_ID_HPP
#define ENTITY_ID_HPP

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace GridForge {

/**
 * @brief Stable identity of an entity for the whole run
 *
 * Identities are issued in ascending order by an environment's
 * EntityIdAllocator and are never reused. Value 0 is the invalid id.
 */
class EntityId {
public:
    using ValueType = uint64_t;
    static constexpr ValueType INVALID_VALUE = 0;

    constexpr EntityId() = default;
    constexpr explicit EntityId(ValueType value) : m_value(value) {}

    constexpr ValueType value() const { return m_value; }
    constexpr bool isValid() const { return m_value != INVALID_VALUE; }

    constexpr bool operator==(const EntityId&) const = default;
    constexpr auto operator<=>(const EntityId&) const = default;

    std::string toString() const { return "#" + std::to_string(m_value); }

private:
    ValueType m_value{INVALID_VALUE};
};

struct EntityIdHash {
    size_t operator()(const EntityId& id) const noexcept {
        return std::hash<EntityId::ValueType>{}(id.value());
    }
};

/**
 * @brief Per-environment monotonic identity issuer
 *
 * Unlike a process-wide counter, two environments built from the same
 * population issue the same identities, which keeps runs reproducible.
 */
class EntityIdAllocator {
public:
    EntityId next() { return EntityId{++m_last}; }

    // Never issue anything at or below id again
    void reserveThrough(EntityId id) {
        if (id.value() > m_last) {
            m_last = id.value();
        }
    }

    EntityId lastIssued() const { return EntityId{m_last}; }

private:
    EntityId::ValueType m_last{EntityId::INVALID_VALUE};
};

} // namespace GridForge

template <> struct std::hash<GridForge::EntityId> {
    size_t operator()(const GridForge::EntityId& id) const noexcept {
        return GridForge::EntityIdHash{}(id);
    }
};

#endif // ENTITY_ID_HPP
