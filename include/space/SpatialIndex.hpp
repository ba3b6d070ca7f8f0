/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_INDEX_HPP
#define SPATIAL_INDEX_HPP

#include "entities/EntityId.hpp"
#include "space/Geometry.hpp"
#include <boost/container/small_vector.hpp>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace GridForge {

/**
 * @brief Cell-exact index from grid positions to the entities covering them
 *
 * Every indexed entity has exactly one footprint entry, and each cell it
 * covers lists its id once. Cell lists are kept sorted by id so queries
 * return identities in issuance order. On toroidal bounds a footprint that
 * crosses an edge is stored under the wrapped cells.
 */
class SpatialIndex {
public:
    using CellVector = boost::container::small_vector<EntityId, 4>;

    explicit SpatialIndex(Bounds bounds = Bounds::unbounded());

    // Footprints are expected in canonical form (see Bounds::admit)
    void insert(EntityId id, const Region& footprint);
    bool remove(EntityId id);
    // Old cells out, new cells in; inserts if the id is not indexed yet
    void move(EntityId id, const Region& footprint);

    // Sorted, unique ids of every entity covering at least one cell of area
    void query(const Region& area, std::vector<EntityId>& out) const;
    std::vector<EntityId> occupants(Position p) const;
    bool isOccupied(Position p) const;
    // Any entity other than ignore covering a cell of area
    bool overlapsOther(const Region& area, EntityId ignore) const;

    std::optional<Region> footprintOf(EntityId id) const;
    bool contains(EntityId id) const { return m_footprints.find(id) != m_footprints.end(); }

    size_t size() const { return m_footprints.size(); }
    size_t cellCount() const { return m_cells.size(); }
    const Bounds& bounds() const { return m_bounds; }

    void clear();

private:
    Bounds m_bounds;
    std::unordered_map<EntityId, Region, EntityIdHash> m_footprints;
    std::unordered_map<Position, CellVector, PositionHash> m_cells;

    // Cells outside the int32 range are skipped unless the bounds wrap them
    template <typename Fn> void forEachCoveredCell(const Region& area, Fn&& fn) const {
        if (area.isEmpty()) {
            return;
        }
        for (int64_t y = area.top(); y < area.bottom(); ++y) {
            for (int64_t x = area.left(); x < area.right(); ++x) {
                if (const auto cell = m_bounds.wrap(x, y)) {
                    fn(*cell);
                }
            }
        }
    }

    bool coversCell(const Region& area, Position cell) const;
    void addToCell(Position cell, EntityId id);
    void removeFromCell(Position cell, EntityId id);
};

} // namespace GridForge

#endif // SPATIAL_INDEX_HPP
