#include "finegeo/neighbors.hpp"
#include "finegeo/geohash.hpp"

namespace finegeo {

namespace {

// Center of the neighboring cell in direction d
glm::dvec2 neighborPoint(const Box& box, Direction d) {
    return box.center().toVec() + box.size() * directionOffset(d);
}

}  // namespace

std::string_view directionName(Direction d) {
    constexpr std::array<std::string_view, DIRECTION_COUNT> names = {
        "N", "NE", "E", "SE", "S", "SW", "W", "NW",
    };
    return names[static_cast<size_t>(d)];
}

std::string neighbor(std::string_view hash, Direction direction) {
    glm::dvec2 p = neighborPoint(boundingBox(hash), direction);
    return encodeWithPrecision(p.x, p.y, static_cast<unsigned>(hash.size()));
}

StringNeighbors neighbors(std::string_view hash) {
    Box box = boundingBox(hash);
    auto chars = static_cast<unsigned>(hash.size());

    StringNeighbors result;
    for (Direction d : ALL_DIRECTIONS) {
        glm::dvec2 p = neighborPoint(box, d);
        result[static_cast<size_t>(d)] = encodeWithPrecision(p.x, p.y, chars);
    }
    return result;
}

uint64_t neighborIntWithPrecision(uint64_t hash, unsigned bits, Direction direction) {
    glm::dvec2 p = neighborPoint(boundingBoxIntWithPrecision(hash, bits), direction);
    return encodeIntWithPrecision(p.x, p.y, bits);
}

IntNeighbors neighborsIntWithPrecision(uint64_t hash, unsigned bits) {
    Box box = boundingBoxIntWithPrecision(hash, bits);

    IntNeighbors result{};
    for (Direction d : ALL_DIRECTIONS) {
        glm::dvec2 p = neighborPoint(box, d);
        result[static_cast<size_t>(d)] = encodeIntWithPrecision(p.x, p.y, bits);
    }
    return result;
}

IntNeighbors neighborsInt(uint64_t hash) {
    return neighborsIntWithPrecision(hash, MAX_HASH_BITS);
}

uint64_t neighborInt(uint64_t hash, Direction direction) {
    return neighborIntWithPrecision(hash, MAX_HASH_BITS, direction);
}

}  // namespace finegeo
