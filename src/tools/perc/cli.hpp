//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/perc/cli.hpp
// Purpose: Command-line options of the perc driver and their parser.
// Key invariants: A successfully parsed DriverOptions names a source file
//                 and at least one output target, unless help or version
//                 output was requested.
// Ownership/Lifetime: Plain value types.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/per/Options.hpp"

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace perc::tools
{

/// @brief Artefacts the driver can produce.
enum class Target
{
    Elf,         ///< Linux x86-64 executable
    Pe,          ///< Windows x64 executable
    NvmBytecode, ///< NVM bytecode container (.bin)
    NvmAssembly, ///< NVM assembly text (.asm)
};

/// @brief Short name used in diagnostics ("ELF", "PE", ...).
const char *targetName(Target target);

/// @brief Target used when no target flag is given: PE on Windows, ELF elsewhere.
Target hostDefaultTarget();

/// @brief Output path for @p target derived from the source path.
/// @details ELF strips a trailing `.per`; PE, bytecode and assembly replace
///          it with `.exe`, `.bin` and `.asm`.
std::string defaultOutputPath(std::string_view sourcePath, Target target);

struct DriverOptions
{
    std::string sourcePath;

    /// @brief Explicit output path; empty means derive from the source.
    std::string outputPath;

    std::vector<Target> targets;

    /// @brief Maximum concurrent back ends; 0 picks one per target.
    unsigned jobs = 0;

    bool showHelp = false;
    bool showVersion = false;

    perc::frontends::per::CompilerOptions compiler;
};

/// @brief Parse the arguments after argv[0].
/// @param error Receives a one-line message when parsing fails.
/// @return True on success.
bool parseArgs(int argc, char **argv, DriverOptions &opts, std::string &error);

void printUsage(std::ostream &os);
void printVersion(std::ostream &os);

} // namespace perc::tools
