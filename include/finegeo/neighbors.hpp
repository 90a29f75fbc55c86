#pragma once

#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace finegeo {

// Compass directions, in the order neighbor arrays are returned
enum class Direction : uint8_t {
    North = 0,
    NorthEast = 1,
    East = 2,
    SouthEast = 3,
    South = 4,
    SouthWest = 5,
    West = 6,
    NorthWest = 7,
};

constexpr size_t DIRECTION_COUNT = 8;

constexpr std::array<Direction, DIRECTION_COUNT> ALL_DIRECTIONS = {
    Direction::North, Direction::NorthEast, Direction::East, Direction::SouthEast,
    Direction::South, Direction::SouthWest, Direction::West, Direction::NorthWest,
};

constexpr Direction oppositeDirection(Direction d) {
    return static_cast<Direction>((static_cast<uint8_t>(d) + 4) % DIRECTION_COUNT);
}

// Offset in cell widths as (latitude, longitude)
inline glm::dvec2 directionOffset(Direction d) {
    constexpr std::array<std::array<double, 2>, DIRECTION_COUNT> offsets = {{
        { 1.0,  0.0},  // N
        { 1.0,  1.0},  // NE
        { 0.0,  1.0},  // E
        {-1.0,  1.0},  // SE
        {-1.0,  0.0},  // S
        {-1.0, -1.0},  // SW
        { 0.0, -1.0},  // W
        { 1.0, -1.0},  // NW
    }};
    const auto& o = offsets[static_cast<size_t>(d)];
    return {o[0], o[1]};
}

// "N", "NE", ...
[[nodiscard]] std::string_view directionName(Direction d);

// ============================================================================
// Neighbor derivation
// ============================================================================
//
// Neighbors are found by re-encoding the box center moved one box width in
// each direction, at the same precision. Near the poles and the antimeridian
// the result wraps rather than following true cell adjacency.
//

using StringNeighbors = std::array<std::string, DIRECTION_COUNT>;
using IntNeighbors = std::array<uint64_t, DIRECTION_COUNT>;

[[nodiscard]] StringNeighbors neighbors(std::string_view hash);
[[nodiscard]] std::string neighbor(std::string_view hash, Direction direction);

// Raw integer hashes with `bits` significant bits
[[nodiscard]] IntNeighbors neighborsIntWithPrecision(uint64_t hash, unsigned bits);
[[nodiscard]] uint64_t neighborIntWithPrecision(uint64_t hash, unsigned bits, Direction direction);

// Full 64-bit integer hashes
[[nodiscard]] IntNeighbors neighborsInt(uint64_t hash);
[[nodiscard]] uint64_t neighborInt(uint64_t hash, Direction direction);

}  // namespace finegeo
