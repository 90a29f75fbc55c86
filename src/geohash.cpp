#include "finegeo/geohash.hpp"
#include "finegeo/interleave.hpp"
#include "finegeo/range_codec.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace finegeo {

// ============================================================================
// Integer hashes
// ============================================================================

uint64_t encodeInt(double lat, double lng) {
    uint32_t latCode = encodeRange(lat, LATITUDE_RANGE);
    uint32_t lngCode = encodeRange(lng, LONGITUDE_RANGE);
    return interleave(latCode, lngCode);
}

uint64_t encodeIntWithPrecision(double lat, double lng, unsigned bits) {
    return rawHash(encodeInt(lat, lng), bits);
}

LatLng decodeInt(uint64_t hash) {
    return decodeIntWithPrecision(hash, MAX_HASH_BITS);
}

LatLng decodeIntWithPrecision(uint64_t hash, unsigned bits) {
    return boundingBoxIntWithPrecision(hash, bits).round();
}

// ============================================================================
// String hashes
// ============================================================================

std::string encode(double lat, double lng) {
    return encodeWithPrecision(lat, lng, MAX_HASH_CHARS);
}

std::string encodeWithPrecision(double lat, double lng, unsigned chars) {
    unsigned bits = charsToBits(chars);
    uint64_t raw = encodeIntWithPrecision(lat, lng, bits);
    return convertIntToString(raw, bits / BITS_PER_CHAR);
}

Base32Chars encodeWithMaxPrecision(double lat, double lng) {
    unsigned bits = charsToBits(MAX_HASH_CHARS);
    return base32::encodeAsChars(alignHash(encodeIntWithPrecision(lat, lng, bits), bits));
}

LatLng decode(std::string_view hash) {
    return boundingBox(hash).round();
}

LatLng decodeCenter(std::string_view hash) {
    return boundingBox(hash).center();
}

// ============================================================================
// Conversions
// ============================================================================

IntHashPrecision convertStringToInt(std::string_view hash) {
    unsigned bits = charsToBits(static_cast<unsigned>(hash.size()));
    return {rawHash(base32::decode(hash), bits), bits};
}

std::string convertIntToString(uint64_t hash, unsigned chars) {
    unsigned bits = charsToBits(chars);
    Base32Chars symbols = base32::encodeAsChars(alignHash(hash, bits));
    return std::string(symbols.begin(), symbols.begin() + bits / BITS_PER_CHAR);
}

// ============================================================================
// Validation
// ============================================================================

std::string ValidationError::message() const {
    if (kind == Kind::TooLong) {
        return "too long";
    }

    unsigned char byte = static_cast<unsigned char>(character);
    if (std::isprint(byte)) {
        return std::string("invalid character '") + character + "'";
    }
    char escaped[8];
    std::snprintf(escaped, sizeof(escaped), "\\x%02x", byte);
    return std::string("invalid character '") + escaped + "'";
}

std::optional<ValidationError> validate(std::string_view hash) {
    if (BITS_PER_CHAR * hash.size() > MAX_HASH_BITS) {
        return ValidationError{ValidationError::Kind::TooLong, '\0', MAX_HASH_CHARS};
    }

    for (size_t i = 0; i < hash.size(); ++i) {
        if (!base32::validByte(hash[i])) {
            return ValidationError{ValidationError::Kind::InvalidCharacter, hash[i], i};
        }
    }
    return std::nullopt;
}

void requireValid(std::string_view hash) {
    if (auto error = validate(hash)) {
        throw std::invalid_argument("Invalid geohash '" + std::string(hash) + "': " + error->message());
    }
}

}  // namespace finegeo
