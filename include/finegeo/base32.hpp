#pragma once

#include "finegeo/precision.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace finegeo {

// Full-precision string hash in a fixed buffer (no terminator)
using Base32Chars = std::array<char, MAX_HASH_CHARS>;

namespace base32 {

// Geohash alphabet: digits then lowercase letters without a, i, l, o
inline constexpr std::string_view ALPHABET = "0123456789bcdefghjkmnpqrstuvwxyz";

// Symbol for a 5-bit value (only the low 5 bits of value are used)
[[nodiscard]] constexpr char symbol(unsigned value) {
    return ALPHABET[value & 0x1f];
}

// Value of a symbol, or -1 if the byte is not in the alphabet
[[nodiscard]] int symbolValue(char c);

// True iff c is one of the 32 alphabet symbols (lowercase only)
[[nodiscard]] bool validByte(char c);

// Encode an aligned hash as 12 symbols covering bits 63..4, MSB first.
// Bits 3..0 are not represented.
[[nodiscard]] Base32Chars encodeAsChars(uint64_t aligned);
[[nodiscard]] std::string encode(uint64_t aligned);

// Decode up to 12 symbols into an aligned hash; the tail past the last
// symbol is zero. Symbols outside the alphabet decode as 0 and symbols past
// the twelfth are ignored, so validate first when the input is untrusted.
[[nodiscard]] uint64_t decode(std::string_view hash);

}  // namespace base32
}  // namespace finegeo
