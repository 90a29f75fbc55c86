#include "finegeo/tool_config.hpp"
#include "finegeo/log.hpp"

namespace finegeo {

std::string_view decodePolicyName(DecodePolicy policy) {
    switch (policy) {
        case DecodePolicy::Round: return "round";
        case DecodePolicy::Center: return "center";
    }
    return "round";
}

std::optional<DecodePolicy> parseDecodePolicy(std::string_view name) {
    if (name == "round") return DecodePolicy::Round;
    if (name == "center") return DecodePolicy::Center;
    return std::nullopt;
}

ToolConfig ToolConfig::fromDocument(const ConfigDocument& doc, const Logger& logger) {
    ToolConfig config;
    config.precision = doc.getInt("encode.precision", config.precision);
    config.bits = doc.getInt("encode.bits", config.bits);
    config.debug = doc.getBool("log.debug", config.debug);

    if (auto* entry = doc.get("decode.policy")) {
        auto name = entry->value.asString();
        if (auto policy = parseDecodePolicy(name)) {
            config.decodePolicy = *policy;
        } else {
            logger.warn(entry->location() + ": unknown decode.policy '" +
                        std::string(name) + "', using " +
                        std::string(decodePolicyName(config.decodePolicy)));
        }
    }

    config.validate(logger);
    return config;
}

void ToolConfig::validate(const Logger& logger) {
    constexpr int maxChars = static_cast<int>(MAX_HASH_CHARS);
    constexpr int maxBits = static_cast<int>(MAX_HASH_BITS);

    if (precision < 1 || precision > maxChars) {
        int clamped = precision < 1 ? 1 : maxChars;
        logger.warn("encode.precision " + std::to_string(precision) +
                    " out of range, using " + std::to_string(clamped));
        precision = clamped;
    }

    if (bits < 1 || bits > maxBits) {
        int clamped = bits < 1 ? 1 : maxBits;
        logger.warn("encode.bits " + std::to_string(bits) +
                    " out of range, using " + std::to_string(clamped));
        bits = clamped;
    }
}

}  // namespace finegeo
