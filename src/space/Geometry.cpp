/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "space/Geometry.hpp"
#include <algorithm>

namespace GridForge {

namespace {

int64_t euclideanMod(int64_t value, int64_t modulus) {
    const int64_t r = value % modulus;
    return r < 0 ? r + modulus : r;
}

// Largest radius whose square side still fits in int32
constexpr int64_t MAX_RADIUS = (COORDINATE_MAX - 1) / 2;

} // anonymous namespace

std::string Position::toString() const {
    return "(" + std::to_string(x) + ", " + std::to_string(y) + ")";
}

void Region::forEachCell(const std::function<void(Position)>& fn) const {
    if (isEmpty()) {
        return;
    }
    const int64_t xEnd = std::min(right(), COORDINATE_MAX + 1);
    const int64_t yEnd = std::min(bottom(), COORDINATE_MAX + 1);
    for (int64_t y = top(); y < yEnd; ++y) {
        for (int64_t x = left(); x < xEnd; ++x) {
            fn(Position{static_cast<int32_t>(x), static_cast<int32_t>(y)});
        }
    }
}

std::string Region::toString() const {
    return origin.toString() + " " + std::to_string(size.width) + "x" +
           std::to_string(size.height);
}

const char* topologyToString(Topology topology) {
    switch (topology) {
    case Topology::Bounded:
        return "bounded";
    case Topology::Toroidal:
        return "toroidal";
    case Topology::Unbounded:
        return "unbounded";
    default:
        return "unknown";
    }
}

std::optional<Topology> topologyFromString(const std::string& name) {
    if (name == "bounded") return Topology::Bounded;
    if (name == "toroidal") return Topology::Toroidal;
    if (name == "unbounded") return Topology::Unbounded;
    return std::nullopt;
}

bool Bounds::isValid() const {
    if (topology == Topology::Unbounded) {
        return true;
    }
    return size.width > 0 && size.height > 0;
}

std::optional<Region> Bounds::admit(const Region& footprint) const {
    if (footprint.isEmpty()) {
        return std::nullopt;
    }

    switch (topology) {
    case Topology::Bounded: {
        const Region area{Position{0, 0}, size};
        if (!area.contains(footprint)) {
            return std::nullopt;
        }
        return footprint;
    }
    case Topology::Toroidal:
        if (footprint.size.width > size.width || footprint.size.height > size.height) {
            return std::nullopt;
        }
        return footprint.anchoredAt(wrap(footprint.origin));
    case Topology::Unbounded:
        if (!footprint.isRepresentable()) {
            return std::nullopt;
        }
        return footprint;
    default:
        return std::nullopt;
    }
}

Position Bounds::wrap(Position p) const {
    if (topology != Topology::Toroidal || size.isEmpty()) {
        return p;
    }
    return Position{static_cast<int32_t>(euclideanMod(p.x, size.width)),
                    static_cast<int32_t>(euclideanMod(p.y, size.height))};
}

std::optional<Position> Bounds::wrap(int64_t x, int64_t y) const {
    if (topology == Topology::Toroidal && !size.isEmpty()) {
        return Position{static_cast<int32_t>(euclideanMod(x, size.width)),
                        static_cast<int32_t>(euclideanMod(y, size.height))};
    }
    if (!isCoordinate(x) || !isCoordinate(y)) {
        return std::nullopt;
    }
    return Position{static_cast<int32_t>(x), static_cast<int32_t>(y)};
}

std::optional<Region> Bounds::offset(const Region& footprint, int32_t dx, int32_t dy) const {
    const auto origin = wrap(static_cast<int64_t>(footprint.origin.x) + dx,
                             static_cast<int64_t>(footprint.origin.y) + dy);
    if (!origin) {
        return std::nullopt;
    }
    return footprint.anchoredAt(*origin);
}

Region Bounds::neighborhood(Position center, int32_t radius) const {
    const int64_t r = std::clamp<int64_t>(radius, 0, MAX_RADIUS);
    const int64_t side = 2 * r + 1;

    switch (topology) {
    case Topology::Bounded: {
        const int64_t left = std::max<int64_t>(center.x - r, 0);
        const int64_t top = std::max<int64_t>(center.y - r, 0);
        const int64_t right = std::min<int64_t>(center.x + r + 1, size.width);
        const int64_t bottom = std::min<int64_t>(center.y + r + 1, size.height);
        if (right <= left || bottom <= top) {
            return Region{static_cast<int32_t>(left), static_cast<int32_t>(top), 0, 0};
        }
        return Region{static_cast<int32_t>(left), static_cast<int32_t>(top),
                      static_cast<int32_t>(right - left), static_cast<int32_t>(bottom - top)};
    }
    case Topology::Toroidal: {
        // Larger than the torus would visit cells twice
        const Position home = wrap(center);
        Region square;
        if (side > size.width) {
            square.origin.x = 0;
            square.size.width = size.width;
        } else {
            square.origin.x = static_cast<int32_t>(home.x - r);
            square.size.width = static_cast<int32_t>(side);
        }
        if (side > size.height) {
            square.origin.y = 0;
            square.size.height = size.height;
        } else {
            square.origin.y = static_cast<int32_t>(home.y - r);
            square.size.height = static_cast<int32_t>(side);
        }
        return square;
    }
    case Topology::Unbounded:
    default: {
        const int64_t left = std::max(center.x - r, COORDINATE_MIN);
        const int64_t top = std::max(center.y - r, COORDINATE_MIN);
        const int64_t right = std::min(center.x + r + 1, COORDINATE_MAX + 1);
        const int64_t bottom = std::min(center.y + r + 1, COORDINATE_MAX + 1);
        return Region{static_cast<int32_t>(left), static_cast<int32_t>(top),
                      static_cast<int32_t>(right - left), static_cast<int32_t>(bottom - top)};
    }
    }
}

} // namespace GridForge
