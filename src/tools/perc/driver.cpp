//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Driver pipeline of `perc`: front end, back ends, output files.
/// @details Back ends run on std::async tasks when more than one artefact is
///          requested and `--jobs` is not 1.  Outputs are written only after
///          every back end succeeded.

#include "tools/perc/driver.hpp"
#include "bytecode/NvmDisassembler.hpp"
#include "bytecode/NvmWriter.hpp"
#include "codegen/elf/ElfWriter.hpp"
#include "codegen/pe/PeWriter.hpp"
#include "frontends/per/Compiler.hpp"
#include "support/source_manager.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>

namespace perc::tools
{

using perc::support::Expected;

namespace
{

using Artifact = Expected<std::vector<uint8_t>>;

void debugDriver(const std::string &msg)
{
    if (std::getenv("PERC_DEBUG_COMPILE"))
        std::cerr << "[perc] " << msg << std::endl;
}

std::vector<Artifact> buildAll(const DriverOptions &opts, const perc::ir::Module &module)
{
    std::vector<Artifact> results;
    results.reserve(opts.targets.size());

    const bool parallel = opts.targets.size() > 1 && opts.jobs != 1;
    if (!parallel)
    {
        for (Target target : opts.targets)
            results.push_back(buildArtifact(target, module));
        return results;
    }

    const size_t width = opts.jobs == 0 ? opts.targets.size() : opts.jobs;
    for (size_t first = 0; first < opts.targets.size(); first += width)
    {
        const size_t last = std::min(first + width, opts.targets.size());
        std::vector<std::future<Artifact>> batch;
        for (size_t i = first; i < last; ++i)
        {
            batch.push_back(std::async(std::launch::async,
                                       [target = opts.targets[i], &module]
                                       { return buildArtifact(target, module); }));
        }
        for (auto &task : batch)
            results.push_back(task.get());
    }
    return results;
}

bool writeFile(const std::string &path, const std::vector<uint8_t> &bytes, bool executable)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file)
        return false;
    file.write(reinterpret_cast<const char *>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file)
        return false;
    if (executable)
    {
        std::error_code ec;
        std::filesystem::permissions(path,
                                     std::filesystem::perms::owner_exec |
                                         std::filesystem::perms::group_exec |
                                         std::filesystem::perms::others_exec,
                                     std::filesystem::perm_options::add,
                                     ec);
        if (ec)
            return false;
    }
    return true;
}

} // namespace

Expected<std::vector<uint8_t>> buildArtifact(Target target, const perc::ir::Module &module)
{
    switch (target)
    {
        case Target::Elf:
            return perc::codegen::elf::emitElf(module);
        case Target::Pe:
            return perc::codegen::pe::emitPe(module);
        case Target::NvmBytecode:
            return perc::bytecode::encodeModule(module);
        case Target::NvmAssembly:
        {
            auto text = perc::bytecode::renderAssembly(module);
            if (!text)
                return text.error();
            return std::vector<uint8_t>(text.value().begin(), text.value().end());
        }
    }
    return perc::support::makeError({}, "unknown output target", perc::support::kIoError);
}

int runDriver(const DriverOptions &opts, std::ostream &out, std::ostream &err)
{
    perc::support::SourceManager sm;
    auto result = perc::frontends::per::compileFile(opts.sourcePath, opts.compiler, sm);
    if (!result.succeeded())
    {
        result.diagnostics.printAll(err, &sm);
        return 1;
    }

    debugDriver("Running " + std::to_string(opts.targets.size()) + " back end(s)");
    std::vector<Artifact> artifacts = buildAll(opts, result.module);

    bool failed = false;
    for (size_t i = 0; i < artifacts.size(); ++i)
    {
        if (!artifacts[i])
        {
            perc::support::printDiag(artifacts[i].error(), err, &sm);
            failed = true;
        }
    }
    if (failed)
        return 1;

    std::vector<std::string> paths;
    for (Target target : opts.targets)
    {
        paths.push_back(opts.outputPath.empty() ? defaultOutputPath(opts.sourcePath, target)
                                                : opts.outputPath);
    }

    for (size_t i = 0; i < artifacts.size(); ++i)
    {
        const bool executable = opts.targets[i] == Target::Elf;
        if (!writeFile(paths[i], artifacts[i].value(), executable))
        {
            perc::support::printDiag(
                perc::support::makeError(
                    {}, "cannot write output file: " + paths[i], perc::support::kIoError),
                err,
                &sm);
            // Leave no partial set of outputs behind.
            for (size_t j = 0; j <= i; ++j)
            {
                std::error_code ec;
                std::filesystem::remove(paths[j], ec);
            }
            return 1;
        }
    }

    for (const auto &path : paths)
        out << "Compilation successful: " << path << "\n";
    return 0;
}

} // namespace perc::tools
