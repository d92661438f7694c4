//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Argument parsing, output naming and help text for `perc`.

#include "tools/perc/cli.hpp"
#include "perc/version.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>

namespace perc::tools
{

namespace
{

void addTarget(DriverOptions &opts, Target target)
{
    if (std::find(opts.targets.begin(), opts.targets.end(), target) == opts.targets.end())
        opts.targets.push_back(target);
}

bool parseJobs(std::string_view text, unsigned &jobs)
{
    unsigned parsed = 0;
    const char *begin = text.data();
    const char *end = begin + text.size();
    auto fc = std::from_chars(begin, end, parsed);
    if (fc.ec != std::errc() || fc.ptr != end || parsed == 0)
        return false;
    jobs = parsed;
    return true;
}

} // namespace

const char *targetName(Target target)
{
    switch (target)
    {
        case Target::Elf:
            return "ELF";
        case Target::Pe:
            return "PE";
        case Target::NvmBytecode:
            return "NVM bytecode";
        case Target::NvmAssembly:
            return "NVM assembly";
    }
    return "?";
}

Target hostDefaultTarget()
{
#ifdef _WIN32
    return Target::Pe;
#else
    return Target::Elf;
#endif
}

std::string defaultOutputPath(std::string_view sourcePath, Target target)
{
    std::string stem(sourcePath);
    constexpr std::string_view kExt = ".per";
    if (stem.size() > kExt.size() && stem.compare(stem.size() - kExt.size(), kExt.size(), kExt) == 0)
        stem.resize(stem.size() - kExt.size());

    switch (target)
    {
        case Target::Elf:
            // Keep a source without the extension from being overwritten.
            return stem == sourcePath ? stem + ".out" : stem;
        case Target::Pe:
            return stem + ".exe";
        case Target::NvmBytecode:
            return stem + ".bin";
        case Target::NvmAssembly:
            return stem + ".asm";
    }
    return stem;
}

bool parseArgs(int argc, char **argv, DriverOptions &opts, std::string &error)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help")
        {
            opts.showHelp = true;
            return true;
        }
        if (arg == "--version")
        {
            opts.showVersion = true;
            return true;
        }
        if (arg == "--elf")
            addTarget(opts, Target::Elf);
        else if (arg == "--pe")
            addTarget(opts, Target::Pe);
        else if (arg == "--novaria")
            addTarget(opts, Target::NvmBytecode);
        else if (arg == "--nvm-code")
            addTarget(opts, Target::NvmAssembly);
        else if (arg == "--all")
        {
            addTarget(opts, Target::Elf);
            addTarget(opts, Target::Pe);
            addTarget(opts, Target::NvmBytecode);
            addTarget(opts, Target::NvmAssembly);
        }
        else if (arg == "--dump-tokens")
            opts.compiler.dumpTokens = true;
        else if (arg == "--dump-ast")
            opts.compiler.dumpAst = true;
        else if (arg == "--dump-ir")
            opts.compiler.dumpIR = true;
        else if (arg == "-o")
        {
            if (i + 1 >= argc)
            {
                error = "missing path after '-o'";
                return false;
            }
            opts.outputPath = argv[++i];
        }
        else if (arg == "--jobs")
        {
            if (i + 1 >= argc || !parseJobs(argv[i + 1], opts.jobs))
            {
                error = "'--jobs' expects a positive integer";
                return false;
            }
            ++i;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            error = "unknown option '" + std::string(arg) + "'";
            return false;
        }
        else if (opts.sourcePath.empty())
            opts.sourcePath = std::string(arg);
        else
        {
            error = "more than one source file given";
            return false;
        }
    }

    if (opts.sourcePath.empty())
    {
        error = "no source file given";
        return false;
    }
    if (opts.targets.empty())
        opts.targets.push_back(hostDefaultTarget());
    if (!opts.outputPath.empty() && opts.targets.size() > 1)
    {
        error = "'-o' cannot be combined with more than one output target";
        return false;
    }
    return true;
}

void printVersion(std::ostream &os)
{
    os << "perc v" << PERC_VERSION_STR << "\n";
    os << "Per Compiler (ELF64, PE32+, NVM " << PERC_NVM_VERSION << ")\n";
}

void printUsage(std::ostream &os)
{
    os << "perc v" << PERC_VERSION_STR << " - Per Compiler\n"
       << "\n"
       << "Usage: perc <source.per> [target] [options]\n"
       << "\n"
       << "Targets (default: PE on Windows, ELF elsewhere):\n"
       << "  --elf             Linux x86-64 executable (source name without .per)\n"
       << "  --pe              Windows x64 executable (.exe)\n"
       << "  --novaria         NVM bytecode (.bin)\n"
       << "  --nvm-code        NVM assembly text (.asm)\n"
       << "  --all             Every target above\n"
       << "\n"
       << "Options:\n"
       << "  -o <path>         Output path (single target only)\n"
       << "  --dump-tokens     Print the token stream to stderr\n"
       << "  --dump-ast        Print the AST to stderr\n"
       << "  --dump-ir         Print the IR to stderr\n"
       << "  --jobs <n>        Back ends run concurrently (1 disables)\n"
       << "  -h, --help        Show this help\n"
       << "  --version         Show version information\n"
       << "\n"
       << "Set PERC_DEBUG_COMPILE=1 to trace compiler phases.\n";
}

} // namespace perc::tools
