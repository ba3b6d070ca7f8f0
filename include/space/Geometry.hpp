/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GEOMETRY_HPP
#define GEOMETRY_HPP

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>

namespace GridForge {

// Cell coordinates are int32; edges and sums are computed in int64
inline constexpr int64_t COORDINATE_MIN = std::numeric_limits<int32_t>::min();
inline constexpr int64_t COORDINATE_MAX = std::numeric_limits<int32_t>::max();

constexpr bool isCoordinate(int64_t value) {
    return value >= COORDINATE_MIN && value <= COORDINATE_MAX;
}

struct Position {
    int32_t x{0};
    int32_t y{0};

    constexpr Position() = default;
    constexpr Position(int32_t px, int32_t py) : x(px), y(py) {}

    // Wraps modulo 2^32 past the coordinate range; see Bounds::offset
    constexpr Position translated(int32_t dx, int32_t dy) const {
        return Position{static_cast<int32_t>(static_cast<int64_t>(x) + dx),
                        static_cast<int32_t>(static_cast<int64_t>(y) + dy)};
    }

    constexpr bool operator==(const Position&) const = default;
    constexpr auto operator<=>(const Position&) const = default;

    std::string toString() const;
};

struct PositionHash {
    size_t operator()(const Position& p) const noexcept {
        return static_cast<size_t>((static_cast<uint64_t>(static_cast<uint32_t>(p.x)) << 32) ^
                                   static_cast<uint32_t>(p.y));
    }
};

struct Dimension {
    int32_t width{0};
    int32_t height{0};

    constexpr Dimension() = default;
    constexpr Dimension(int32_t w, int32_t h) : width(w), height(h) {}

    constexpr int64_t area() const {
        return isEmpty() ? 0 : static_cast<int64_t>(width) * height;
    }
    constexpr bool isEmpty() const { return width <= 0 || height <= 0; }

    constexpr bool operator==(const Dimension&) const = default;
};

/**
 * @brief Axis aligned block of cells anchored at its top-left origin
 *
 * Used both as an entity footprint and as a query area. Edges returned by
 * right() and bottom() are exclusive.
 */
struct Region {
    Position origin{};
    Dimension size{1, 1};

    constexpr Region() = default;
    constexpr Region(Position o, Dimension s) : origin(o), size(s) {}
    constexpr Region(int32_t x, int32_t y, int32_t w, int32_t h) : origin(x, y), size(w, h) {}

    static constexpr Region single(Position p) { return Region{p, Dimension{1, 1}}; }

    constexpr int32_t left() const { return origin.x; }
    constexpr int32_t top() const { return origin.y; }
    constexpr int64_t right() const { return static_cast<int64_t>(origin.x) + size.width; }
    constexpr int64_t bottom() const { return static_cast<int64_t>(origin.y) + size.height; }
    constexpr bool isEmpty() const { return size.isEmpty(); }

    // Every covered cell has int32 coordinates
    constexpr bool isRepresentable() const {
        return isEmpty() || (right() - 1 <= COORDINATE_MAX && bottom() - 1 <= COORDINATE_MAX);
    }

    constexpr bool contains(Position p) const {
        return !isEmpty() && p.x >= left() && p.x < right() && p.y >= top() && p.y < bottom();
    }

    constexpr bool contains(const Region& other) const {
        return !isEmpty() && !other.isEmpty() && other.left() >= left() &&
               other.right() <= right() && other.top() >= top() && other.bottom() <= bottom();
    }

    constexpr bool intersects(const Region& other) const {
        return !isEmpty() && !other.isEmpty() && other.left() < right() &&
               left() < other.right() && other.top() < bottom() && top() < other.bottom();
    }

    constexpr Region anchoredAt(Position p) const { return Region{p, size}; }

    constexpr Region translated(int32_t dx, int32_t dy) const {
        return Region{origin.translated(dx, dy), size};
    }

    // Row-major, top to bottom
    void forEachCell(const std::function<void(Position)>& fn) const;

    constexpr bool operator==(const Region&) const = default;

    std::string toString() const;
};

enum class Topology : uint8_t {
    Bounded,  // Footprints must lie fully inside the bounds
    Toroidal, // Coordinates wrap around both axes
    Unbounded // Any footprint is accepted
};

const char* topologyToString(Topology topology);
std::optional<Topology> topologyFromString(const std::string& name);

/**
 * @brief Extent and wraparound policy of an environment
 */
struct Bounds {
    Dimension size{};
    Topology topology{Topology::Bounded};

    constexpr Bounds() = default;
    constexpr Bounds(Dimension s, Topology t = Topology::Bounded) : size(s), topology(t) {}
    constexpr Bounds(int32_t width, int32_t height, Topology t = Topology::Bounded)
        : size(width, height), topology(t) {}

    static constexpr Bounds unbounded() { return Bounds{Dimension{0, 0}, Topology::Unbounded}; }

    bool isValid() const;

    /**
     * @brief Canonical form of a requested footprint, or nullopt if the
     * footprint cannot exist in these bounds
     *
     * Bounded requires full containment. Toroidal wraps the origin and
     * requires the footprint to fit in the bounds. Unbounded accepts any
     * non-empty footprint.
     */
    std::optional<Region> admit(const Region& footprint) const;

    // Canonical cell for a position; identity unless toroidal
    Position wrap(Position p) const;

    /**
     * @brief Canonical cell for wide coordinates, or nullopt if they do not
     * name a cell
     *
     * Toroidal bounds reduce any value onto the torus; other topologies
     * require both coordinates to fit in int32.
     */
    std::optional<Position> wrap(int64_t x, int64_t y) const;

    /**
     * @brief Footprint shifted by (dx, dy) without overflow
     *
     * Wraps onto the torus when toroidal. Returns nullopt when the shifted
     * origin leaves the coordinate range; admit() still decides whether the
     * result fits the bounds.
     */
    std::optional<Region> offset(const Region& footprint, int32_t dx, int32_t dy) const;

    /**
     * @brief Square of side 2*radius+1 centred on a cell
     *
     * Clipped to the bounds when bounded. When toroidal the result is
     * returned unwrapped (origin may be negative) and is limited to the
     * bounds' size; cell lookups wrap it.
     */
    Region neighborhood(Position center, int32_t radius) const;

    constexpr bool operator==(const Bounds&) const = default;
};

} // namespace GridForge

#endif // GEOMETRY_HPP
