/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENVIRONMENT_HPP
#define ENVIRONMENT_HPP

#include "core/Diagnostics.hpp"
#include "entities/Action.hpp"
#include "entities/Entity.hpp"
#include "entities/EntityId.hpp"
#include "entities/Lifespan.hpp"
#include "space/Geometry.hpp"
#include "world/Population.hpp"
#include "world/Snapshot.hpp"
#include "world/WorldState.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace GridForge {

/**
 * @brief What the commit does when a Move or Spawn lands on an occupied cell
 */
enum class CollisionPolicy : uint8_t {
    Allow, // Overlap is legal; actions apply in identity order
    Reject // The overlapping Move or Spawn is dropped with a Collision diagnostic
};

const char* collisionPolicyToString(CollisionPolicy policy);
std::optional<CollisionPolicy> collisionPolicyFromString(const std::string& name);

/**
 * @brief Environment store: sole owner of the entities, their records and
 * the spatial index of one simulation
 *
 * Between generations the registry and index agree exactly: every live
 * entity has one record and one footprint entry. During dispatch the store
 * is only read, through snapshot(). commit() is the only writer; it applies
 * a generation's actions in list order in two passes:
 *
 *  1. every Remove retires its entity from registry and index;
 *  2. Mutate republishes state, Move swaps the footprint entry, Spawn
 *     adopts the offspring under a freshly issued identity.
 *
 * Then ephemeral lifespans age and exhausted entities retire, and the
 * generation counter advances by one.
 *
 * Slots: after every commit the live entities occupy slots 0..slotCount()-1
 * in identity order; dispatch strategies address them by slot.
 */
template <Threading T>
class Environment {
public:
    using EntityType = BasicEntity<T>;

    /**
     * @throws ConfigurationError for invalid bounds or an unusable initial
     * population (duplicate or invalid identities, footprints the bounds do
     * not admit, exhausted lifespans, null entities)
     */
    explicit Environment(Bounds bounds, CollisionPolicy policy = CollisionPolicy::Allow);
    Environment(Bounds bounds, Population<T> population,
                CollisionPolicy policy = CollisionPolicy::Allow);

    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;

    /**
     * @brief Add an entity between generations
     *
     * Visible in the next snapshot taken.
     * @throws ConfigurationError as for the initial population
     */
    template <EntityOf<T> E>
    EntityId insert(std::unique_ptr<E> entity, const Region& footprint,
                    Lifespan lifespan = Lifespan::immortal()) {
        return adopt(std::unique_ptr<EntityType>(std::move(entity)), m_ids.next(), footprint,
                     lifespan);
    }

    Snapshot snapshot() const { return Snapshot{m_world}; }
    std::vector<EntityId> entitiesIn(const Region& region) const;

    uint64_t generation() const { return m_world.generation(); }
    size_t size() const { return m_world.size(); }
    const Bounds& bounds() const { return m_world.bounds(); }
    CollisionPolicy collisionPolicy() const { return m_policy; }
    const WorldState& world() const { return m_world; }
    EntityId lastIssuedId() const { return m_ids.lastIssued(); }

    EntityType* entity(EntityId id);
    const EntityType* entity(EntityId id) const;
    const EntityView* view(EntityId id) const { return m_world.find(id); }

    size_t slotCount() const { return m_entities.size(); }
    EntityType& entityAt(size_t slot) { return *m_entities[slot]; }
    const EntityType& entityAt(size_t slot) const { return *m_entities[slot]; }
    EntityId idAt(size_t slot) const { return m_world.records()[slot].id; }

    // fn(const EntityView&, const EntityType&) in identity order
    template <typename Fn> void forEach(Fn&& fn) const {
        const auto& records = m_world.records();
        for (size_t slot = 0; slot < records.size(); ++slot) {
            fn(records[slot], *m_entities[slot]);
        }
    }

    /**
     * @brief Apply one generation's actions and advance the generation
     *
     * Actions naming an identity that is not alive are dropped with a
     * StaleActionReference diagnostic (None is ignored). Rejected footprints
     * produce OutOfBounds or Collision diagnostics; the entity stays where
     * it was and a rejected offspring is destroyed.
     */
    void commit(ActionList<T> actions, GenerationReport& report);

private:
    EntityId adopt(std::unique_ptr<EntityType> entity, EntityId id, const Region& footprint,
                   Lifespan lifespan);

    size_t liveSlotOf(EntityId id) const;
    void retire(size_t slot);
    void compact();

    void applyMove(size_t slot, const typename Action<T>::Move& move, GenerationReport& report);
    void applySpawn(EntityId parent, typename Action<T>::Spawn&& spawn, GenerationReport& report);
    void addDiagnostic(GenerationReport& report, DiagnosticKind kind, EntityId id,
                       ActionKind action, std::string message) const;

    WorldState m_world;
    CollisionPolicy m_policy;
    EntityIdAllocator m_ids;
    std::vector<std::unique_ptr<EntityType>> m_entities; // Parallel to m_world.records()
    std::vector<uint8_t> m_alive;                         // Parallel to m_world.records()
};

extern template class Environment<Threading::Single>;
extern template class Environment<Threading::Shared>;

} // namespace GridForge

#endif // ENVIRONMENT_HPP
