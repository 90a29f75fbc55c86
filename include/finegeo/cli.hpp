#pragma once

/**
 * @file cli.hpp
 * @brief Command-line front end for the geohash codec
 *
 *   geohash_cli [--config FILE] [--precision N] [--bits N] [--center] COMMAND ARGS...
 *
 * Commands:
 *   encode LAT LNG        string hash
 *   encode-int LAT LNG    raw integer hash (hex)
 *   decode HASH           lat lng
 *   decode-int HEX        lat lng
 *   bbox HASH             minLat maxLat minLng maxLng
 *   neighbors HASH        eight neighbors, N first, clockwise
 *   validate HASH         "ok" or the validation error
 *
 * Command-line options override the config file.
 */

#include <iosfwd>
#include <string>
#include <vector>

namespace finegeo {

// Exit status for malformed command lines
constexpr int EXIT_USAGE = 2;

// Run one command. args excludes the program name. Results go to out;
// log messages and usage go to err. Returns the process exit status:
// 0 on success, 1 on a failed command, EXIT_USAGE on a bad command line.
[[nodiscard]] int runCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

}  // namespace finegeo
