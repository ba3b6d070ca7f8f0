/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_HPP
#define ENTITY_HPP

#include "entities/EntityId.hpp"
#include "entities/EntityTypes.hpp"
#include "entities/Lifespan.hpp"
#include "space/Geometry.hpp"
#include "world/Snapshot.hpp"
#include <concepts>
#include <cstdint>
#include <random>

namespace GridForge {

template <Threading T> class Action;

/**
 * @brief Deterministic seed for one reaction call
 *
 * Depends only on the run seed, the generation and the entity, never on
 * the dispatching thread or batch, so both dispatch modes hand every
 * entity the same seed.
 */
uint64_t deriveReactionSeed(uint64_t runSeed, uint64_t generation, EntityId id);

/**
 * @brief What an entity gets to look at while reacting
 */
class ReactionContext {
public:
    ReactionContext(const Snapshot& snapshot, uint64_t runSeed, EntityId self)
        : m_snapshot(snapshot), m_generation(snapshot.generation()),
          m_seed(deriveReactionSeed(runSeed, snapshot.generation(), self)) {}

    const Snapshot& snapshot() const { return m_snapshot; }
    uint64_t generation() const { return m_generation; }
    uint64_t seed() const { return m_seed; }

    // Fresh engine per call; reacting twice with the same context repeats
    std::mt19937_64 makeRng() const { return std::mt19937_64(m_seed); }

private:
    const Snapshot& m_snapshot;
    uint64_t m_generation;
    uint64_t m_seed;
};

/**
 * @brief Capability every simulated object implements
 *
 * The environment owns every entity and assigns its identity and
 * footprint; entities only observe them. react() is called once per
 * generation with the generation's snapshot and returns the single effect
 * the entity wants applied at commit. Internal state may be changed freely
 * inside react(); a Mutate action publishes it. The same holds for the
 * lifespan: changes made through ownLifespan() take effect only with a
 * Mutate and are otherwise reset to the environment's value at commit.
 *
 * @tparam T Threading::Shared declares react() safe to call on a worker
 * thread concurrently with other entities' reactions. It must then touch
 * nothing but the entity itself and the snapshot.
 */
template <Threading T>
class BasicEntity {
public:
    static constexpr Threading threading = T;

    virtual ~BasicEntity() = default;

    BasicEntity(const BasicEntity&) = delete;
    BasicEntity& operator=(const BasicEntity&) = delete;

    EntityId id() const { return m_id; }
    const Region& footprint() const { return m_footprint; }
    Position position() const { return m_footprint.origin; }
    const Lifespan& lifespan() const { return m_lifespan; }

    virtual EntityKind kind() const { return 0; }

    // Value other entities observe through snapshots after a Mutate
    virtual uint64_t publishedState() const { return 0; }

    virtual Action<T> react(const ReactionContext& context) = 0;

protected:
    BasicEntity() = default;

    // For use inside react(); see class notes
    Lifespan& ownLifespan() { return m_lifespan; }

private:
    template <Threading> friend class Environment;

    EntityId m_id{};
    Region m_footprint{};
    Lifespan m_lifespan{};
};

using Entity = BasicEntity<Threading::Single>;
using SharedEntity = BasicEntity<Threading::Shared>;

template <typename E, Threading T>
concept EntityOf = std::derived_from<E, BasicEntity<T>>;

} // namespace GridForge

#include "entities/Action.hpp"

#endif // ENTITY_HPP
