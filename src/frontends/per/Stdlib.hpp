//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Stdlib.hpp
/// @brief Built-in library modules.
///
/// `stdio` is implemented by the back ends as intrinsics and has no source.
/// `math` and `string` are ordinary Per source compiled like user code; only
/// the functions a program actually reaches are lowered.
///
//===----------------------------------------------------------------------===//

#pragma once

#include <span>
#include <string_view>

namespace perc::frontends::per
{

inline constexpr std::string_view kStdioModule = "stdio";

/// @brief Source of a built-in library module.
struct StdlibModule
{
    std::string_view name;
    std::string_view source;
};

/// @brief The built-in modules that are written in Per.
std::span<const StdlibModule> stdlibModules();

/// @brief True for `stdio` and every module in stdlibModules().
bool isBuiltinModule(std::string_view name);

} // namespace perc::frontends::per
