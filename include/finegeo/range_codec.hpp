#pragma once

#include <cstdint>

namespace finegeo {

// Fixed-point scale for one axis: 2^32
constexpr double AXIS_SCALE = 4294967296.0;

constexpr double LATITUDE_RANGE = 90.0;
constexpr double LONGITUDE_RANGE = 180.0;

// Map x in [-r, r] to a 32-bit axis code: floor((x + r) / 2r * 2^32).
// x == r lands on 2^32 and wraps to 0. Values outside [-r, r] wrap modulo 2^32.
// A scaled value that does not fit in int64_t (or NaN) encodes as 0.
[[nodiscard]] constexpr uint32_t encodeRange(double x, double r) {
    constexpr double INT64_LIMIT = 9223372036854775808.0;  // 2^63

    double scaled = (x + r) / (2.0 * r) * AXIS_SCALE;
    if (!(scaled > -INT64_LIMIT && scaled < INT64_LIMIT)) {
        return 0;
    }
    return static_cast<uint32_t>(static_cast<int64_t>(scaled));
}

// Inverse of encodeRange: the minimum edge of the quantization step X
[[nodiscard]] constexpr double decodeRange(uint32_t x, double r) {
    double p = static_cast<double>(x) / AXIS_SCALE;
    return 2.0 * r * p - r;
}

}  // namespace finegeo
