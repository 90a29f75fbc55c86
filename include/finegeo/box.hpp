#pragma once

/**
 * @file box.hpp
 * @brief Coordinates, bounding boxes and the precision model
 *
 * Vectors use x = latitude, y = longitude.
 */

#include "finegeo/precision.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <string_view>

namespace finegeo {

// ============================================================================
// LatLng - A point in degrees
// ============================================================================
struct LatLng {
    double lat = 0.0;
    double lng = 0.0;

    constexpr LatLng() = default;
    constexpr LatLng(double lat_, double lng_) : lat(lat_), lng(lng_) {}

    [[nodiscard]] static LatLng fromVec(const glm::dvec2& v) { return {v.x, v.y}; }
    [[nodiscard]] glm::dvec2 toVec() const { return {lat, lng}; }

    constexpr bool operator==(const LatLng& other) const = default;
};

// ============================================================================
// Box - Region of all points sharing a hash at some precision
// ============================================================================
struct Box {
    glm::dvec2 min{0.0};
    glm::dvec2 max{0.0};

    Box() = default;
    Box(const glm::dvec2& min_, const glm::dvec2& max_) : min(min_), max(max_) {}
    Box(double minLat, double maxLat, double minLng, double maxLng)
        : min(minLat, minLng), max(maxLat, maxLng) {}

    [[nodiscard]] double minLat() const { return min.x; }
    [[nodiscard]] double maxLat() const { return max.x; }
    [[nodiscard]] double minLng() const { return min.y; }
    [[nodiscard]] double maxLng() const { return max.y; }

    // Per-axis width
    [[nodiscard]] glm::dvec2 size() const { return max - min; }

    [[nodiscard]] LatLng center() const {
        return LatLng::fromVec((min + max) * 0.5);
    }

    // A point inside the box with as few decimal digits as possible:
    // per axis, the minimum rounded up to a multiple of the largest power of
    // ten not exceeding the width. Always lies inside the box.
    [[nodiscard]] LatLng round() const;

    // Inclusive of edges and corners
    [[nodiscard]] bool contains(double lat, double lng) const {
        return min.x <= lat && lat <= max.x &&
               min.y <= lng && lng <= max.y;
    }

    [[nodiscard]] bool contains(const LatLng& p) const {
        return contains(p.lat, p.lng);
    }

    bool operator==(const Box& other) const {
        return min == other.min && max == other.max;
    }
};

// Largest power of ten not exceeding width
[[nodiscard]] double maxDecimalPower(double width);

// Box of a raw integer hash with `bits` significant bits
[[nodiscard]] Box boundingBoxIntWithPrecision(uint64_t hash, unsigned bits);

// Box of a full 64-bit integer hash
[[nodiscard]] Box boundingBoxInt(uint64_t hash);

// Box of a string hash; precision is 5 bits per symbol
[[nodiscard]] Box boundingBox(std::string_view hash);

}  // namespace finegeo
