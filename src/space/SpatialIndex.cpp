/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "space/SpatialIndex.hpp"
#include <algorithm>

namespace GridForge {

SpatialIndex::SpatialIndex(Bounds bounds) : m_bounds(bounds) {}

void SpatialIndex::insert(EntityId id, const Region& footprint) {
    if (m_footprints.find(id) != m_footprints.end()) {
        move(id, footprint);
        return;
    }
    m_footprints.emplace(id, footprint);
    forEachCoveredCell(footprint, [&](Position c) { addToCell(c, id); });
}

bool SpatialIndex::remove(EntityId id) {
    auto it = m_footprints.find(id);
    if (it == m_footprints.end()) {
        return false;
    }
    const Region footprint = it->second;
    forEachCoveredCell(footprint, [&](Position c) { removeFromCell(c, id); });
    m_footprints.erase(it);
    return true;
}

void SpatialIndex::move(EntityId id, const Region& footprint) {
    auto it = m_footprints.find(id);
    if (it == m_footprints.end()) {
        insert(id, footprint);
        return;
    }
    if (it->second == footprint) {
        return;
    }

    const Region oldFootprint = it->second;
    forEachCoveredCell(oldFootprint, [&](Position c) { removeFromCell(c, id); });
    forEachCoveredCell(footprint, [&](Position c) { addToCell(c, id); });
    it->second = footprint;
}

void SpatialIndex::query(const Region& area, std::vector<EntityId>& out) const {
    out.clear();
    if (area.isEmpty() || m_footprints.empty()) {
        return;
    }

    // Area larger than the occupied set: walk occupied cells instead
    if (area.size.area() > static_cast<int64_t>(m_cells.size())) {
        for (const auto& [cell, ids] : m_cells) {
            if (coversCell(area, cell)) {
                out.insert(out.end(), ids.begin(), ids.end());
            }
        }
    } else {
        forEachCoveredCell(area, [&](Position c) {
            auto it = m_cells.find(c);
            if (it != m_cells.end()) {
                out.insert(out.end(), it->second.begin(), it->second.end());
            }
        });
    }

    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
}

std::vector<EntityId> SpatialIndex::occupants(Position p) const {
    auto it = m_cells.find(m_bounds.wrap(p));
    if (it == m_cells.end()) {
        return {};
    }
    return std::vector<EntityId>(it->second.begin(), it->second.end());
}

bool SpatialIndex::isOccupied(Position p) const {
    return m_cells.find(m_bounds.wrap(p)) != m_cells.end();
}

bool SpatialIndex::overlapsOther(const Region& area, EntityId ignore) const {
    bool overlap = false;
    forEachCoveredCell(area, [&](Position c) {
        if (overlap) {
            return;
        }
        auto it = m_cells.find(c);
        if (it == m_cells.end()) {
            return;
        }
        for (const EntityId& id : it->second) {
            if (id != ignore) {
                overlap = true;
                return;
            }
        }
    });
    return overlap;
}

std::optional<Region> SpatialIndex::footprintOf(EntityId id) const {
    auto it = m_footprints.find(id);
    if (it == m_footprints.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SpatialIndex::clear() {
    m_cells.clear();
    m_footprints.clear();
}

bool SpatialIndex::coversCell(const Region& area, Position cell) const {
    if (m_bounds.topology != Topology::Toroidal) {
        return area.contains(cell);
    }
    const auto spans = [](int64_t start, int64_t extent, int64_t period, int64_t value) {
        if (extent >= period) {
            return true;
        }
        int64_t offset = (value - start) % period;
        if (offset < 0) {
            offset += period;
        }
        return offset < extent;
    };
    return !area.isEmpty() &&
           spans(area.left(), area.size.width, m_bounds.size.width, cell.x) &&
           spans(area.top(), area.size.height, m_bounds.size.height, cell.y);
}

void SpatialIndex::addToCell(Position cell, EntityId id) {
    auto& ids = m_cells[cell];
    auto pos = std::lower_bound(ids.begin(), ids.end(), id);
    if (pos == ids.end() || *pos != id) {
        ids.insert(pos, id);
    }
}

void SpatialIndex::removeFromCell(Position cell, EntityId id) {
    auto it = m_cells.find(cell);
    if (it == m_cells.end()) {
        return;
    }
    auto& ids = it->second;
    auto pos = std::lower_bound(ids.begin(), ids.end(), id);
    if (pos != ids.end() && *pos == id) {
        ids.erase(pos);
    }
    if (ids.empty()) {
        m_cells.erase(it);
    }
}

} // namespace GridForge
