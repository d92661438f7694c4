//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the perc command-line tool (Per compiler).
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `perc` CLI tool.

#include "tools/perc/cli.hpp"
#include "tools/perc/driver.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    perc::tools::DriverOptions opts;
    std::string error;
    if (!perc::tools::parseArgs(argc, argv, opts, error))
    {
        std::cerr << "perc: error: " << error << "\n\n";
        perc::tools::printUsage(std::cerr);
        return 1;
    }
    if (opts.showHelp)
    {
        perc::tools::printUsage(std::cout);
        return 0;
    }
    if (opts.showVersion)
    {
        perc::tools::printVersion(std::cout);
        return 0;
    }
    return perc::tools::runDriver(opts, std::cout, std::cerr);
}
