//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file ImportResolver.hpp
/// @brief Loads the library modules a program can call.
///
/// The resolver always parses the built-in `math` and `string` sources.  For
/// every `import "name"` that does not name a built-in module it loads
/// `name.per` relative to the importing file, then follows that file's
/// imports as well.  All loaded modules land in one flat list; a file reached
/// twice (including through an import cycle) is loaded once.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/per/ModuleTable.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace perc::frontends::per
{

class ImportResolver
{
  public:
    ImportResolver(perc::support::DiagnosticEngine &diag, perc::support::SourceManager &sm);

    /// @brief Load built-in modules and the imports reachable from @p root.
    /// @param rootPath Path of the root file; imports resolve next to it.
    /// @param out Receives the loaded modules.
    /// @return False after reporting an error.
    bool resolve(const Program &root, const std::string &rootPath, std::vector<LoadedModule> &out);

    static constexpr size_t kMaxImportDepth = 16;

  private:
    std::string resolveImportPath(const std::string &name, const std::string &importingFile) const;

    std::unique_ptr<Program> parseSource(std::string source, const std::string &path);

    bool processImports(const Program &program,
                        const std::string &programPath,
                        size_t depth,
                        std::vector<LoadedModule> &out);

    perc::support::DiagnosticEngine &diag_;
    perc::support::SourceManager &sm_;
    std::set<std::string> processedFiles_;
};

} // namespace perc::frontends::per
