#pragma once

/**
 * @file precision.hpp
 * @brief Precision constants and the two integer-hash conventions
 *
 * An integer geohash with `bits` of precision exists in two forms:
 *
 *   raw      the significant bits sit in the low end of the word
 *            (what encodeIntWithPrecision returns to callers)
 *   aligned  the significant bits sit in the high end of the word, low bits
 *            zero (what the interleaver and the base-32 codec work on)
 *
 * Always convert between them with alignHash() / rawHash().
 */

#include <glm/glm.hpp>
#include <algorithm>
#include <cstdint>
#include <cmath>

namespace finegeo {

constexpr unsigned MAX_HASH_BITS = 64;
constexpr unsigned MAX_HASH_CHARS = 12;
constexpr unsigned BITS_PER_CHAR = 5;

// Precision in bits for a string hash of `chars` symbols (chars clamped to 12)
[[nodiscard]] constexpr unsigned charsToBits(unsigned chars) {
    return BITS_PER_CHAR * std::min(chars, MAX_HASH_CHARS);
}

[[nodiscard]] constexpr unsigned clampBits(unsigned bits) {
    return std::min(bits, MAX_HASH_BITS);
}

// Raw -> aligned: move the low `bits` bits to the top of the word
[[nodiscard]] constexpr uint64_t alignHash(uint64_t raw, unsigned bits) {
    bits = clampBits(bits);
    if (bits == 0) return 0;
    return raw << (MAX_HASH_BITS - bits);
}

// Aligned -> raw: keep the top `bits` bits, shifted down
[[nodiscard]] constexpr uint64_t rawHash(uint64_t aligned, unsigned bits) {
    bits = clampBits(bits);
    if (bits == 0) return 0;
    return aligned >> (MAX_HASH_BITS - bits);
}

// Angular size of one cell at the given precision, (latitude, longitude).
// Longitude receives the extra bit when `bits` is odd.
[[nodiscard]] inline glm::dvec2 cellSize(unsigned bits) {
    int total = static_cast<int>(clampBits(bits));
    int latBits = total / 2;
    int lngBits = total - latBits;
    return {std::ldexp(180.0, -latBits), std::ldexp(360.0, -lngBits)};
}

}  // namespace finegeo
