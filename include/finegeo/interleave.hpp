#pragma once

#include <cstdint>
#include <utility>

namespace finegeo {

// ============================================================================
// Bit interleaving (Morton / Z-order) of two 32-bit axis codes
// ============================================================================
//
// interleave(x, y) puts x on the even bit positions and y on the odd ones,
// so bit 63 of the key is the top bit of y and bit 62 the top bit of x.
//

// Spread the 32 bits of x over the even bit positions of a 64-bit word
[[nodiscard]] constexpr uint64_t spread(uint32_t x) {
    uint64_t v = x;
    v = (v | (v << 16)) & 0x0000ffff0000ffffULL;
    v = (v | (v << 8))  & 0x00ff00ff00ff00ffULL;
    v = (v | (v << 4))  & 0x0f0f0f0f0f0f0f0fULL;
    v = (v | (v << 2))  & 0x3333333333333333ULL;
    v = (v | (v << 1))  & 0x5555555555555555ULL;
    return v;
}

// Collapse the even bit positions of v back into 32 bits.
// Odd bit positions are ignored and may hold anything.
[[nodiscard]] constexpr uint32_t squash(uint64_t v) {
    v &= 0x5555555555555555ULL;
    v = (v | (v >> 1))  & 0x3333333333333333ULL;
    v = (v | (v >> 2))  & 0x0f0f0f0f0f0f0f0fULL;
    v = (v | (v >> 4))  & 0x00ff00ff00ff00ffULL;
    v = (v | (v >> 8))  & 0x0000ffff0000ffffULL;
    v = (v | (v >> 16)) & 0x00000000ffffffffULL;
    return static_cast<uint32_t>(v);
}

[[nodiscard]] constexpr uint64_t interleave(uint32_t x, uint32_t y) {
    return spread(x) | (spread(y) << 1);
}

// Returns (even bits, odd bits)
[[nodiscard]] constexpr std::pair<uint32_t, uint32_t> deinterleave(uint64_t v) {
    return {squash(v), squash(v >> 1)};
}

}  // namespace finegeo
