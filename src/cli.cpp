#include "finegeo/cli.hpp"
#include "finegeo/geohash.hpp"
#include "finegeo/log.hpp"
#include "finegeo/neighbors.hpp"
#include "finegeo/tool_config.hpp"

#include <cstdint>
#include <iomanip>
#include <optional>
#include <ostream>
#include <stdexcept>

namespace finegeo {

namespace {

struct CliOptions {
    std::string configPath;
    std::optional<int> precision;
    std::optional<int> bits;
    bool center = false;
    bool help = false;
    std::vector<std::string> positional;
};

void printUsage(std::ostream& err) {
    err << "Usage: geohash_cli [--config FILE] [--precision N] [--bits N] [--center]"
           " COMMAND ARGS...\n"
           "Commands: encode LAT LNG | encode-int LAT LNG | decode HASH |"
           " decode-int HEX | bbox HASH | neighbors HASH | validate HASH\n";
}

// Throws std::invalid_argument for a missing or malformed option value
CliOptions parseOptions(const std::vector<std::string>& args) {
    CliOptions options;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        bool takesValue = arg == "--config" || arg == "--precision" || arg == "--bits";

        if (takesValue && i + 1 >= args.size()) {
            throw std::invalid_argument("missing value for " + arg);
        }

        if (arg == "--config") {
            options.configPath = args[++i];
        } else if (arg == "--precision") {
            options.precision = std::stoi(args[++i]);
        } else if (arg == "--bits") {
            options.bits = std::stoi(args[++i]);
        } else if (arg == "--center") {
            options.center = true;
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else {
            options.positional.push_back(arg);
        }
    }

    return options;
}

void printPoint(std::ostream& out, const LatLng& p) {
    out << std::setprecision(10) << p.lat << " " << p.lng << "\n";
}

int runCommand(const std::string& command, const std::vector<std::string>& args,
               const ToolConfig& config, const Logger& logger, std::ostream& out, std::ostream& err) {
    auto expectArgs = [&](size_t count) {
        if (args.size() != count) {
            throw std::invalid_argument(command + " expects " + std::to_string(count) +
                                        " argument(s), got " + std::to_string(args.size()));
        }
    };

    if (command == "encode") {
        expectArgs(2);
        double lat = std::stod(args[0]);
        double lng = std::stod(args[1]);
        out << encodeWithPrecision(lat, lng, config.precisionChars()) << "\n";
        return 0;
    }

    if (command == "encode-int") {
        expectArgs(2);
        double lat = std::stod(args[0]);
        double lng = std::stod(args[1]);
        uint64_t hash = encodeIntWithPrecision(lat, lng, config.precisionBits());
        out << "0x" << std::hex << std::setw(16) << std::setfill('0') << hash
            << std::dec << std::setfill(' ') << "\n";
        return 0;
    }

    if (command == "decode") {
        expectArgs(1);
        requireValid(args[0]);
        printPoint(out, config.pick(boundingBox(args[0])));
        return 0;
    }

    if (command == "decode-int") {
        expectArgs(1);
        uint64_t hash = std::stoull(args[0], nullptr, 16);
        printPoint(out, config.pick(boundingBoxIntWithPrecision(hash, config.precisionBits())));
        return 0;
    }

    if (command == "bbox") {
        expectArgs(1);
        requireValid(args[0]);
        Box box = boundingBox(args[0]);
        out << std::setprecision(10) << box.minLat() << " " << box.maxLat() << " "
            << box.minLng() << " " << box.maxLng() << "\n";
        return 0;
    }

    if (command == "neighbors") {
        expectArgs(1);
        requireValid(args[0]);
        StringNeighbors result = neighbors(args[0]);
        for (Direction d : ALL_DIRECTIONS) {
            out << directionName(d) << " " << result[static_cast<size_t>(d)] << "\n";
        }
        return 0;
    }

    if (command == "validate") {
        expectArgs(1);
        if (auto error = validate(args[0])) {
            out << error->message() << "\n";
            return 1;
        }
        out << "ok\n";
        return 0;
    }

    logger.error("Unknown command: " + command);
    printUsage(err);
    return EXIT_USAGE;
}

}  // namespace

int runCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    Logger logger("geohash", out, err);

    CliOptions options;
    try {
        options = parseOptions(args);
    } catch (const std::exception& e) {
        logger.error(std::string("Bad option: ") + e.what());
        printUsage(err);
        return EXIT_USAGE;
    }

    if (options.help) {
        printUsage(err);
        return 0;
    }
    if (options.positional.empty()) {
        printUsage(err);
        return EXIT_USAGE;
    }

    ToolConfig config;
    if (!options.configPath.empty()) {
        ConfigParser parser;
        auto doc = parser.parseFile(options.configPath);
        if (!doc) {
            logger.error("Failed to open config file: " + options.configPath);
            return 1;
        }
        config = ToolConfig::fromDocument(*doc, logger);
    }
    if (options.precision) config.precision = *options.precision;
    if (options.bits) config.bits = *options.bits;
    if (options.center) config.decodePolicy = DecodePolicy::Center;
    config.validate(logger);
    logger.setDebugEnabled(config.debug);

    logger.debug("precision=" + std::to_string(config.precision) +
                 " bits=" + std::to_string(config.bits) +
                 " decode=" + std::string(decodePolicyName(config.decodePolicy)));

    const std::string& command = options.positional.front();
    std::vector<std::string> commandArgs(options.positional.begin() + 1, options.positional.end());

    try {
        return runCommand(command, commandArgs, config, logger, out, err);
    } catch (const std::exception& e) {
        logger.error(e.what());
        return 1;
    }
}

}  // namespace finegeo
