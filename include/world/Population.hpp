/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef POPULATION_HPP
#define POPULATION_HPP

#include "entities/Entity.hpp"
#include "entities/EntityId.hpp"
#include "entities/Lifespan.hpp"
#include "space/Geometry.hpp"
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace GridForge {

/**
 * @brief Initial entity set of an environment
 *
 * Entities added without an identity are numbered by the environment after
 * every explicitly numbered one, in the order they were added here.
 */
template <Threading T>
class Population {
public:
    struct Member {
        EntityId id{}; // Invalid: assigned by the environment
        std::unique_ptr<BasicEntity<T>> entity{};
        Region footprint{};
        Lifespan lifespan{};
    };

    Population() = default;
    Population(Population&&) noexcept = default;
    Population& operator=(Population&&) noexcept = default;

    template <EntityOf<T> E>
    Population& add(std::unique_ptr<E> entity, const Region& footprint,
                    Lifespan lifespan = Lifespan::immortal()) {
        m_members.push_back(Member{EntityId{}, std::move(entity), footprint, lifespan});
        return *this;
    }

    template <EntityOf<T> E>
    Population& add(EntityId id, std::unique_ptr<E> entity, const Region& footprint,
                    Lifespan lifespan = Lifespan::immortal()) {
        m_members.push_back(Member{id, std::move(entity), footprint, lifespan});
        return *this;
    }

    size_t size() const { return m_members.size(); }
    bool empty() const { return m_members.empty(); }

    std::vector<Member>& members() { return m_members; }
    const std::vector<Member>& members() const { return m_members; }

private:
    std::vector<Member> m_members;
};

} // namespace GridForge

#endif // POPULATION_HPP
