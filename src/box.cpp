#include "finegeo/box.hpp"
#include "finegeo/base32.hpp"
#include "finegeo/interleave.hpp"
#include "finegeo/range_codec.hpp"

#include <cmath>

namespace finegeo {

double maxDecimalPower(double width) {
    return std::pow(10.0, std::floor(std::log10(width)));
}

LatLng Box::round() const {
    glm::dvec2 extent = size();
    glm::dvec2 step(maxDecimalPower(extent.x), maxDecimalPower(extent.y));
    glm::dvec2 rounded = glm::ceil(min / step) * step;
    // ceil(min / step) * step can miss min by an ulp at the -90/-180 edges
    return LatLng::fromVec(glm::clamp(rounded, min, max));
}

Box boundingBoxIntWithPrecision(uint64_t hash, unsigned bits) {
    auto [latCode, lngCode] = deinterleave(alignHash(hash, bits));
    glm::dvec2 corner(decodeRange(latCode, LATITUDE_RANGE),
                      decodeRange(lngCode, LONGITUDE_RANGE));
    return Box(corner, corner + cellSize(bits));
}

Box boundingBoxInt(uint64_t hash) {
    return boundingBoxIntWithPrecision(hash, MAX_HASH_BITS);
}

Box boundingBox(std::string_view hash) {
    unsigned bits = charsToBits(static_cast<unsigned>(hash.size()));
    return boundingBoxIntWithPrecision(rawHash(base32::decode(hash), bits), bits);
}

}  // namespace finegeo
