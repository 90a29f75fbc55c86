// Command-line front end for the finegeo codec. See finegeo/cli.hpp for usage.

#include "finegeo/cli.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return finegeo::runCli(args, std::cout, std::cerr);
}
