#pragma once

/**
 * @file tool_config.hpp
 * @brief Settings for the geohash command-line tool
 *
 * Config file keys:
 *   encode.precision: 12      # string hash length, 1-12
 *   encode.bits: 64           # integer hash precision, 1-64
 *   decode.policy: round      # round | center
 *   log.debug: false
 */

#include "finegeo/box.hpp"
#include "finegeo/config_parser.hpp"
#include "finegeo/precision.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace finegeo {

class Logger;

// Which point of the box a decode reports
enum class DecodePolicy : uint8_t {
    Round,   // Box::round
    Center,  // Box::center
};

[[nodiscard]] std::string_view decodePolicyName(DecodePolicy policy);
[[nodiscard]] std::optional<DecodePolicy> parseDecodePolicy(std::string_view name);

struct ToolConfig {
    int precision = static_cast<int>(MAX_HASH_CHARS);
    int bits = static_cast<int>(MAX_HASH_BITS);
    DecodePolicy decodePolicy = DecodePolicy::Round;
    bool debug = false;

    // Read settings from a document; missing keys keep their defaults and an
    // unknown decode policy is reported and ignored. Result is validated.
    [[nodiscard]] static ToolConfig fromDocument(const ConfigDocument& doc, const Logger& logger);

    // Clamp precision and bits into range, reporting each adjustment
    void validate(const Logger& logger);

    // Apply the configured policy to a box
    [[nodiscard]] LatLng pick(const Box& box) const {
        return decodePolicy == DecodePolicy::Center ? box.center() : box.round();
    }

    [[nodiscard]] unsigned precisionChars() const { return static_cast<unsigned>(precision); }
    [[nodiscard]] unsigned precisionBits() const { return static_cast<unsigned>(bits); }
};

}  // namespace finegeo
