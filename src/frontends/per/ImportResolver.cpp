//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file ImportResolver.cpp
/// @brief File lookup, parsing and de-duplication of imported modules.
///
//===----------------------------------------------------------------------===//

#include "frontends/per/ImportResolver.hpp"
#include "frontends/per/Lexer.hpp"
#include "frontends/per/Parser.hpp"
#include "frontends/per/Stdlib.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace perc::frontends::per
{

using perc::support::Severity;
using perc::support::SourceLoc;

namespace
{
std::string normalizePath(const std::string &path)
{
    return std::filesystem::path(path).lexically_normal().generic_string();
}
} // namespace

ImportResolver::ImportResolver(perc::support::DiagnosticEngine &diag,
                               perc::support::SourceManager &sm)
    : diag_(diag), sm_(sm)
{
}

std::string ImportResolver::resolveImportPath(const std::string &name,
                                              const std::string &importingFile) const
{
    namespace fs = std::filesystem;

    fs::path importingDir = fs::path(importingFile).parent_path();
    if (importingDir.empty())
        importingDir = ".";

    fs::path importP(name);
    fs::path resolved = importP.is_absolute() ? importP : (importingDir / importP);
    if (resolved.extension() != ".per")
        resolved += ".per";
    return resolved.lexically_normal().string();
}

std::unique_ptr<Program> ImportResolver::parseSource(std::string source, const std::string &path)
{
    uint32_t fileId = sm_.addFile(path, source);
    Lexer lexer(std::move(source), fileId, diag_);
    Parser parser(lexer, diag_);
    auto program = parser.parseProgram();
    if (!program || parser.hasError())
        return nullptr;
    return program;
}

bool ImportResolver::resolve(const Program &root,
                             const std::string &rootPath,
                             std::vector<LoadedModule> &out)
{
    for (const auto &lib : stdlibModules())
    {
        std::string path = "<stdlib>/" + std::string(lib.name) + ".per";
        auto program = parseSource(std::string(lib.source), path);
        if (!program)
            return false;
        out.push_back(LoadedModule{std::string(lib.name), path, std::move(program), true});
    }

    processedFiles_.insert(normalizePath(rootPath));
    return processImports(root, rootPath, 0, out);
}

bool ImportResolver::processImports(const Program &program,
                                    const std::string &programPath,
                                    size_t depth,
                                    std::vector<LoadedModule> &out)
{
    for (const auto &imp : program.imports)
    {
        if (isBuiltinModule(imp.name))
            continue;

        if (depth >= kMaxImportDepth)
        {
            diag_.report({Severity::Error,
                          "import depth exceeds maximum (" + std::to_string(kMaxImportDepth) +
                              ")",
                          imp.loc,
                          std::string(perc::support::kIoError)});
            return false;
        }

        std::string path = resolveImportPath(imp.name, programPath);
        std::string normalized = normalizePath(path);
        if (!processedFiles_.insert(normalized).second)
            continue;

        std::ifstream file(path, std::ios::binary);
        if (!file)
        {
            diag_.report({Severity::Error,
                          "cannot open imported module '" + imp.name + "' (looked for " + path +
                              ")",
                          imp.loc,
                          std::string(perc::support::kIoError)});
            return false;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();

        std::string moduleName = std::filesystem::path(path).stem().string();
        for (const auto &existing : out)
        {
            if (existing.name == moduleName)
            {
                diag_.report({Severity::Error,
                              "module name '" + moduleName + "' is already used by " +
                                  existing.path,
                              imp.loc,
                              std::string(perc::support::kIoError)});
                return false;
            }
        }

        auto module = parseSource(buffer.str(), path);
        if (!module)
            return false;

        const Program &loaded = *module;
        out.push_back(LoadedModule{moduleName, path, std::move(module), false});
        if (!processImports(loaded, path, depth + 1, out))
            return false;
    }
    return true;
}

} // namespace perc::frontends::per
