/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_STATE_HPP
#define WORLD_STATE_HPP

#include "entities/EntityId.hpp"
#include "entities/EntityTypes.hpp"
#include "entities/Lifespan.hpp"
#include "space/Geometry.hpp"
#include "space/SpatialIndex.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace GridForge {

/**
 * @brief What the engine knows about one live entity
 *
 * This is everything other entities and renderers can observe; the
 * entity's behavioral state stays private to the entity and is exposed
 * only through the published value.
 */
struct EntityView {
    EntityId id{};
    EntityKind kind{0};
    Region footprint{};
    Lifespan lifespan{};
    uint64_t state{0};          // Last published state
    uint64_t bornGeneration{0}; // First generation the entity was visible in
};

template <Threading T> class Environment;

/**
 * @brief Authoritative registry and spatial index of one environment
 *
 * Records are kept sorted by identity. Only the owning Environment writes
 * to it, and only between generations; every Snapshot is a view over it.
 */
class WorldState {
public:
    explicit WorldState(Bounds bounds);

    WorldState(const WorldState&) = delete;
    WorldState& operator=(const WorldState&) = delete;

    const Bounds& bounds() const { return m_bounds; }
    uint64_t generation() const { return m_generation; }

    const std::vector<EntityView>& records() const { return m_records; }
    size_t size() const { return m_records.size(); }

    const EntityView* find(EntityId id) const;
    // Position of id in records(), or npos
    size_t slotOf(EntityId id) const;

    const SpatialIndex& index() const { return m_index; }

    static constexpr size_t npos = static_cast<size_t>(-1);

private:
    template <Threading T> friend class Environment;

    EntityView* findMutable(EntityId id);
    // Identities must be appended in ascending order
    EntityView& append(EntityView record);
    SpatialIndex& mutableIndex() { return m_index; }
    std::vector<EntityView>& mutableRecords() { return m_records; }
    void advanceGeneration() { ++m_generation; }

    Bounds m_bounds;
    uint64_t m_generation{0};
    std::vector<EntityView> m_records;
    SpatialIndex m_index;
};

} // namespace GridForge

#endif // WORLD_STATE_HPP
