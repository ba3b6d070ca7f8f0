/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/Snapshot.hpp"

namespace GridForge {

std::vector<EntityId> Snapshot::entitiesIn(const Region& region) const {
    std::vector<EntityId> ids;
    m_state->index().query(region, ids);
    return ids;
}

std::vector<EntityId> Snapshot::occupantsAt(Position p) const {
    return m_state->index().occupants(p);
}

std::vector<EntityId> Snapshot::neighborhood(Position center, int32_t radius) const {
    return entitiesIn(bounds().neighborhood(center, radius));
}

const EntityView* Snapshot::firstOfKindAt(Position p, EntityKind kind) const {
    for (const EntityId& id : m_state->index().occupants(p)) {
        const EntityView* view = m_state->find(id);
        if (view && view->kind == kind) {
            return view;
        }
    }
    return nullptr;
}

std::map<EntityKind, size_t> Snapshot::countByKind() const {
    std::map<EntityKind, size_t> counts;
    for (const EntityView& view : m_state->records()) {
        ++counts[view.kind];
    }
    return counts;
}

} // namespace GridForge
