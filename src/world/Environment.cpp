/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/Environment.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace GridForge {

const char* collisionPolicyToString(CollisionPolicy policy) {
    switch (policy) {
    case CollisionPolicy::Allow:
        return "allow";
    case CollisionPolicy::Reject:
        return "reject";
    default:
        return "unknown";
    }
}

std::optional<CollisionPolicy> collisionPolicyFromString(const std::string& name) {
    if (name == "allow") return CollisionPolicy::Allow;
    if (name == "reject") return CollisionPolicy::Reject;
    return std::nullopt;
}

template <Threading T>
Environment<T>::Environment(Bounds bounds, CollisionPolicy policy)
    : m_world(bounds), m_policy(policy) {
    if (!bounds.isValid()) {
        throw ConfigurationError("Invalid environment bounds " +
                                 std::to_string(bounds.size.width) + "x" +
                                 std::to_string(bounds.size.height) + " (" +
                                 topologyToString(bounds.topology) + ")");
    }
}

template <Threading T>
Environment<T>::Environment(Bounds bounds, Population<T> population, CollisionPolicy policy)
    : Environment(bounds, policy) {
    auto& members = population.members();

    // Explicit identities first, so issued ones never collide with them
    std::vector<EntityId> explicitIds;
    for (const auto& member : members) {
        if (member.id.isValid()) {
            explicitIds.push_back(member.id);
        }
    }
    std::sort(explicitIds.begin(), explicitIds.end());
    auto duplicate = std::adjacent_find(explicitIds.begin(), explicitIds.end());
    if (duplicate != explicitIds.end()) {
        throw ConfigurationError("Duplicate initial identity " + duplicate->toString());
    }
    if (!explicitIds.empty()) {
        m_ids.reserveThrough(explicitIds.back());
    }

    for (auto& member : members) {
        if (!member.id.isValid()) {
            member.id = m_ids.next();
        }
    }
    std::sort(members.begin(), members.end(),
              [](const auto& a, const auto& b) { return a.id < b.id; });

    m_entities.reserve(members.size());
    m_alive.reserve(members.size());
    for (auto& member : members) {
        adopt(std::move(member.entity), member.id, member.footprint, member.lifespan);
    }

    ENV_INFO("Environment created with " + std::to_string(m_world.size()) + " entities");
}

template <Threading T>
EntityId Environment<T>::adopt(std::unique_ptr<EntityType> entity, EntityId id,
                               const Region& footprint, Lifespan lifespan) {
    if (!entity) {
        throw ConfigurationError("Null entity for identity " + id.toString());
    }
    if (!lifespan.isAlive()) {
        throw ConfigurationError("Entity " + id.toString() + " has an exhausted lifespan");
    }
    const auto canonical = m_world.bounds().admit(footprint);
    if (!canonical) {
        throw ConfigurationError("Footprint " + footprint.toString() + " of entity " +
                                 id.toString() + " is outside the environment bounds");
    }
    if (m_policy == CollisionPolicy::Reject &&
        m_world.index().overlapsOther(*canonical, EntityId{})) {
        throw ConfigurationError("Footprint " + canonical->toString() + " of entity " +
                                 id.toString() + " overlaps another entity");
    }

    entity->m_id = id;
    entity->m_footprint = *canonical;
    entity->m_lifespan = lifespan;
    m_world.append(EntityView{id, entity->kind(), *canonical, lifespan,
                              entity->publishedState(), m_world.generation()});
    m_world.mutableIndex().insert(id, *canonical);
    m_entities.push_back(std::move(entity));
    m_alive.push_back(1);
    return id;
}

template <Threading T>
std::vector<EntityId> Environment<T>::entitiesIn(const Region& region) const {
    std::vector<EntityId> ids;
    m_world.index().query(region, ids);
    return ids;
}

template <Threading T>
typename Environment<T>::EntityType* Environment<T>::entity(EntityId id) {
    const size_t slot = m_world.slotOf(id);
    return slot == WorldState::npos ? nullptr : m_entities[slot].get();
}

template <Threading T>
const typename Environment<T>::EntityType* Environment<T>::entity(EntityId id) const {
    const size_t slot = m_world.slotOf(id);
    return slot == WorldState::npos ? nullptr : m_entities[slot].get();
}

template <Threading T>
void Environment<T>::commit(ActionList<T> actions, GenerationReport& report) {
    const size_t survivors = m_entities.size();

    // Removal pass
    for (auto& [id, action] : actions) {
        if (action.kind() != ActionKind::Remove) {
            continue;
        }
        const size_t slot = liveSlotOf(id);
        if (slot == WorldState::npos) {
            addDiagnostic(report, DiagnosticKind::StaleActionReference, id, ActionKind::Remove,
                          "entity is not alive");
            continue;
        }
        retire(slot);
        ++report.removed;
    }

    // Mutation / move / spawn pass
    for (auto& [id, action] : actions) {
        const ActionKind kind = action.kind();
        if (kind == ActionKind::None || kind == ActionKind::Remove) {
            continue;
        }

        const size_t slot = liveSlotOf(id);
        if (slot == WorldState::npos) {
            addDiagnostic(report, DiagnosticKind::StaleActionReference, id, kind,
                          "entity is not alive");
            continue;
        }

        switch (kind) {
        case ActionKind::Mutate: {
            EntityView& record = m_world.mutableRecords()[slot];
            record.state = m_entities[slot]->publishedState();
            record.lifespan = m_entities[slot]->m_lifespan;
            ++report.mutated;
            break;
        }
        case ActionKind::Move:
            applyMove(slot, *action.template getIf<typename Action<T>::Move>(), report);
            break;
        case ActionKind::Spawn:
            applySpawn(id, std::move(*action.template getIf<typename Action<T>::Spawn>()), report);
            break;
        default:
            break;
        }
    }

    // Ageing pass; offspring adopted above start ageing next commit
    auto& records = m_world.mutableRecords();
    for (size_t slot = 0; slot < survivors; ++slot) {
        if (!m_alive[slot]) {
            continue;
        }
        records[slot].lifespan.shorten();
        if (!records[slot].lifespan.isAlive()) {
            ENV_DEBUG("Entity " + records[slot].id.toString() + " expired");
            retire(slot);
            ++report.expired;
            continue;
        }
        m_entities[slot]->m_lifespan = records[slot].lifespan;
    }

    compact();
    m_world.advanceGeneration();
}

template <Threading T>
size_t Environment<T>::liveSlotOf(EntityId id) const {
    const size_t slot = m_world.slotOf(id);
    if (slot == WorldState::npos || !m_alive[slot]) {
        return WorldState::npos;
    }
    return slot;
}

template <Threading T>
void Environment<T>::retire(size_t slot) {
    m_world.mutableIndex().remove(m_world.records()[slot].id);
    m_alive[slot] = 0;
}

template <Threading T>
void Environment<T>::compact() {
    auto& records = m_world.mutableRecords();
    size_t write = 0;
    for (size_t read = 0; read < records.size(); ++read) {
        if (!m_alive[read]) {
            continue;
        }
        if (write != read) {
            records[write] = records[read];
            m_entities[write] = std::move(m_entities[read]);
        }
        ++write;
    }
    records.resize(write);
    m_entities.resize(write);
    m_alive.assign(write, 1);
}

template <Threading T>
void Environment<T>::applyMove(size_t slot, const typename Action<T>::Move& move,
                               GenerationReport& report) {
    using Placement = typename Action<T>::Placement;

    EntityView& record = m_world.mutableRecords()[slot];
    Region target = move.target;
    switch (move.placement) {
    case Placement::Anchor:
        target.size = record.footprint.size;
        break;
    case Placement::Offset: {
        const Position delta = move.target.origin;
        const auto shifted = m_world.bounds().offset(record.footprint, delta.x, delta.y);
        if (!shifted) {
            addDiagnostic(report, DiagnosticKind::OutOfBounds, record.id, ActionKind::Move,
                          "offset " + delta.toString() + " from " + record.footprint.toString() +
                              " leaves the coordinate range");
            return;
        }
        target = *shifted;
        break;
    }
    case Placement::Footprint:
    default:
        break;
    }

    const auto canonical = m_world.bounds().admit(target);
    if (!canonical) {
        addDiagnostic(report, DiagnosticKind::OutOfBounds, record.id, ActionKind::Move,
                      "target " + target.toString() + " is outside the environment bounds");
        return;
    }
    if (m_policy == CollisionPolicy::Reject &&
        m_world.index().overlapsOther(*canonical, record.id)) {
        addDiagnostic(report, DiagnosticKind::Collision, record.id, ActionKind::Move,
                      "target " + canonical->toString() + " is occupied");
        return;
    }

    m_world.mutableIndex().move(record.id, *canonical);
    record.footprint = *canonical;
    m_entities[slot]->m_footprint = *canonical;
    ++report.moved;
}

template <Threading T>
void Environment<T>::applySpawn(EntityId parent, typename Action<T>::Spawn&& spawn,
                                GenerationReport& report) {
    if (!spawn.offspring) {
        addDiagnostic(report, DiagnosticKind::ReactionFailure, parent, ActionKind::Spawn,
                      "spawn without an offspring entity");
        return;
    }

    const auto canonical = m_world.bounds().admit(spawn.footprint);
    if (!canonical) {
        addDiagnostic(report, DiagnosticKind::OutOfBounds, parent, ActionKind::Spawn,
                      "offspring footprint " + spawn.footprint.toString() +
                          " is outside the environment bounds");
        return;
    }
    if (m_policy == CollisionPolicy::Reject &&
        m_world.index().overlapsOther(*canonical, EntityId{})) {
        addDiagnostic(report, DiagnosticKind::Collision, parent, ActionKind::Spawn,
                      "offspring footprint " + canonical->toString() + " is occupied");
        return;
    }

    std::unique_ptr<EntityType> offspring = std::move(spawn.offspring);
    const EntityId id = m_ids.next();
    offspring->m_id = id;
    offspring->m_footprint = *canonical;
    offspring->m_lifespan = spawn.lifespan;
    m_world.append(EntityView{id, offspring->kind(), *canonical, spawn.lifespan,
                              offspring->publishedState(), m_world.generation() + 1});
    m_world.mutableIndex().insert(id, *canonical);
    m_entities.push_back(std::move(offspring));
    m_alive.push_back(1);
    ++report.spawned;
}

template <Threading T>
void Environment<T>::addDiagnostic(GenerationReport& report, DiagnosticKind kind, EntityId id,
                                   ActionKind action, std::string message) const {
    ENV_DEBUG(std::string(diagnosticKindToString(kind)) + " for " + id.toString() + ": " +
              message);
    report.diagnostics.push_back(
        Diagnostic{kind, m_world.generation(), id, action, std::move(message)});
}

template class Environment<Threading::Single>;
template class Environment<Threading::Shared>;

} // namespace GridForge
