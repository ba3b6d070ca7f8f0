/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "rules/Patterns.hpp"
#include <algorithm>

namespace GridForge::Rules {

bool Pattern::isLive(Position p) const {
    return std::find(live.begin(), live.end(), p) != live.end();
}

Pattern parsePattern(const std::vector<std::string>& rows) {
    Pattern pattern;
    pattern.size.height = static_cast<int32_t>(rows.size());
    for (size_t y = 0; y < rows.size(); ++y) {
        const std::string& row = rows[y];
        pattern.size.width = std::max(pattern.size.width, static_cast<int32_t>(row.size()));
        for (size_t x = 0; x < row.size(); ++x) {
            if (row[x] == '#' || row[x] == 'O') {
                pattern.live.emplace_back(static_cast<int32_t>(x), static_cast<int32_t>(y));
            }
        }
    }
    return pattern;
}

Pattern blinker() {
    return parsePattern({"###"});
}

Pattern glider() {
    return parsePattern({
        ".#.",
        "..#",
        "###",
    });
}

// https://www.conwaylife.com/wiki/Acorn
Pattern acorn() {
    return parsePattern({
        ".#.....",
        "...#...",
        "##..###",
    });
}

} // namespace GridForge::Rules
