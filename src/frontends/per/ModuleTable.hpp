//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file ModuleTable.hpp
/// @brief Immutable map from module name to the functions it exposes.
///
/// The table is built once before semantic analysis from the `stdio`
/// intrinsics and every loaded library module (the built-in `math` and
/// `string` sources plus imported user files), and never changes afterwards.
///
/// Intrinsic entries carry a fixed ir::IntrinsicId.  Source entries point at
/// the parsed declaration so Sema can check and lower the body.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/per/AST.hpp"
#include "frontends/per/Symbols.hpp"
#include "ir/Intrinsics.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace perc::frontends::per
{

/// @brief A library module parsed from source.
struct LoadedModule
{
    std::string name;
    std::string path;
    std::unique_ptr<Program> program;
    bool builtin = false;
};

struct ModuleFunction
{
    std::string name;
    FunctionSignature signature;

    /// @brief Set for `stdio` functions.
    std::optional<perc::ir::IntrinsicId> intrinsic;

    /// @brief Declaration for source functions; null for intrinsics.
    const FunctionDecl *decl = nullptr;

    /// @brief Importers may call this function.
    bool exported = true;
};

struct ModuleInfo
{
    std::string name;
    bool intrinsic = false;

    /// @brief Parsed source; null for `stdio`.
    const Program *program = nullptr;

    std::map<std::string, ModuleFunction, std::less<>> functions;

    [[nodiscard]] const ModuleFunction *find(std::string_view fn) const
    {
        auto it = functions.find(fn);
        return it == functions.end() ? nullptr : &it->second;
    }
};

class ModuleTable
{
  public:
    /// @brief Build the table from the `stdio` intrinsics and @p modules.
    /// @details @p modules must outlive the table.  Parameter and return
    ///          types of source functions default the same way Sema does.
    static ModuleTable build(const std::vector<LoadedModule> &modules);

    [[nodiscard]] const ModuleInfo *find(std::string_view name) const;

    /// @brief Modules in registration order (`stdio` first).
    [[nodiscard]] const std::vector<ModuleInfo> &modules() const
    {
        return modules_;
    }

  private:
    std::vector<ModuleInfo> modules_;
};

} // namespace perc::frontends::per
