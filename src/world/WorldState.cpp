/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/WorldState.hpp"
#include <algorithm>
#include <stdexcept>

namespace GridForge {

WorldState::WorldState(Bounds bounds) : m_bounds(bounds), m_index(bounds) {}

size_t WorldState::slotOf(EntityId id) const {
    auto it = std::lower_bound(m_records.begin(), m_records.end(), id,
                               [](const EntityView& record, EntityId key) { return record.id < key; });
    if (it == m_records.end() || it->id != id) {
        return npos;
    }
    return static_cast<size_t>(it - m_records.begin());
}

const EntityView* WorldState::find(EntityId id) const {
    const size_t slot = slotOf(id);
    return slot == npos ? nullptr : &m_records[slot];
}

EntityView* WorldState::findMutable(EntityId id) {
    const size_t slot = slotOf(id);
    return slot == npos ? nullptr : &m_records[slot];
}

EntityView& WorldState::append(EntityView record) {
    if (!m_records.empty() && !(m_records.back().id < record.id)) {
        throw std::logic_error("WorldState records must be appended in identity order");
    }
    m_records.push_back(record);
    return m_records.back();
}

} // namespace GridForge
