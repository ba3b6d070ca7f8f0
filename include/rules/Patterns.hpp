/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATTERNS_HPP
#define PATTERNS_HPP

#include "rules/LangtonAnt.hpp"
#include "rules/LifeCell.hpp"
#include "space/Geometry.hpp"
#include "world/Population.hpp"
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace GridForge::Rules {

/**
 * @brief Set of live cells relative to a top-left origin
 */
struct Pattern {
    Dimension size{};
    std::vector<Position> live{};

    bool isLive(Position p) const;
};

// '#' and 'O' are live, anything else is dead; rows may differ in length
Pattern parsePattern(const std::vector<std::string>& rows);

Pattern blinker();
Pattern glider();
Pattern acorn();

/**
 * @brief Full Life grid: one LifeCell per cell of bounds
 *
 * Cells covered by pattern placed at offset start alive. Bounds must be
 * finite.
 */
template <Threading T>
Population<T> lifeGrid(const Bounds& bounds, const Pattern& pattern, Position offset) {
    std::set<Position> live;
    for (const Position& p : pattern.live) {
        live.insert(bounds.wrap(p.translated(offset.x, offset.y)));
    }

    Population<T> population;
    Region{Position{0, 0}, bounds.size}.forEachCell([&](Position cell) {
        population.add(std::make_unique<LifeCell<T>>(live.count(cell) > 0), Region::single(cell));
    });
    return population;
}

/**
 * @brief White Langton floor over bounds with one ant at start
 */
template <Threading T>
Population<T> langtonGrid(const Bounds& bounds, Position start, Heading heading = Heading::West) {
    Population<T> population;
    Region{Position{0, 0}, bounds.size}.forEachCell([&](Position cell) {
        population.add(std::make_unique<LangtonCell<T>>(false), Region::single(cell));
    });
    population.add(std::make_unique<LangtonAnt<T>>(heading), Region::single(start));
    return population;
}

} // namespace GridForge::Rules

#endif // PATTERNS_HPP
