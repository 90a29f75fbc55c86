#pragma once

/**
 * @file geohash.hpp
 * @brief Integer and string geohash encoding, decoding and validation
 *
 * Integer hashes returned by the *WithPrecision functions are raw: the
 * significant bits are right-aligned (see precision.hpp). String hashes are
 * 0-12 symbols of the base-32 alphabet, 5 bits each, and truncating a string
 * hash is the same as encoding at lower precision.
 *
 * Usage:
 * ```cpp
 * std::string hash = finegeo::encodeWithPrecision(57.64911, 10.40744, 11);
 * // "u4pruydqqvj"
 * finegeo::LatLng p = finegeo::decode(hash);
 * finegeo::Box box = finegeo::boundingBox(hash);
 * ```
 *
 * No bounds are checked: latitude outside [-90, 90] and longitude outside
 * [-180, 180] wrap, precision above 12 symbols or 64 bits is clamped.
 */

#include "finegeo/base32.hpp"
#include "finegeo/box.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace finegeo {

// ============================================================================
// Integer hashes
// ============================================================================

// Full 64-bit hash: latitude on even bits, longitude on odd bits
[[nodiscard]] uint64_t encodeInt(double lat, double lng);

// Top `bits` bits of encodeInt, right-aligned
[[nodiscard]] uint64_t encodeIntWithPrecision(double lat, double lng, unsigned bits);

[[nodiscard]] LatLng decodeInt(uint64_t hash);
[[nodiscard]] LatLng decodeIntWithPrecision(uint64_t hash, unsigned bits);

// ============================================================================
// String hashes
// ============================================================================

[[nodiscard]] std::string encode(double lat, double lng);
[[nodiscard]] std::string encodeWithPrecision(double lat, double lng, unsigned chars);

// 12-symbol hash in a fixed buffer
[[nodiscard]] Base32Chars encodeWithMaxPrecision(double lat, double lng);

// Rounded point inside the hash's box (Box::round)
[[nodiscard]] LatLng decode(std::string_view hash);

// Exact center of the hash's box
[[nodiscard]] LatLng decodeCenter(std::string_view hash);

// ============================================================================
// Conversions
// ============================================================================

struct IntHashPrecision {
    uint64_t hash = 0;   // raw
    unsigned bits = 0;

    constexpr bool operator==(const IntHashPrecision&) const = default;
};

// Raw integer hash of a string hash and its precision (5 bits per symbol)
[[nodiscard]] IntHashPrecision convertStringToInt(std::string_view hash);

// String hash of `chars` symbols from a raw hash holding 5*chars bits
[[nodiscard]] std::string convertIntToString(uint64_t hash, unsigned chars);

// ============================================================================
// Validation
// ============================================================================

struct ValidationError {
    enum class Kind : uint8_t {
        TooLong,
        InvalidCharacter,
    };

    Kind kind = Kind::TooLong;
    char character = '\0';   // offending byte (InvalidCharacter only)
    size_t position = 0;     // index of the offending byte

    // "too long" or "invalid character 'x'"
    [[nodiscard]] std::string message() const;
};

// nullopt if hash is a well-formed string geohash
[[nodiscard]] std::optional<ValidationError> validate(std::string_view hash);

// Throws std::invalid_argument with ValidationError::message() on failure
void requireValid(std::string_view hash);

}  // namespace finegeo
