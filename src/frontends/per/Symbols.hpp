//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Symbols.hpp
/// @brief Symbols and function signatures shared by the module table and Sema.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/per/Types.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace perc::frontends::per
{

/// @brief Storage class of a bound name.
enum class SymbolKind
{
    Local,
    Parameter,
    Function,
    ModuleFunction,
};

/// @brief Ordered (name, type) parameters plus the return type.
struct FunctionSignature
{
    std::vector<std::pair<std::string, TypeRef>> params;
    TypeRef returnType;
};

/// @brief A name bound in a scope.
struct Symbol
{
    std::string name;
    SymbolKind kind = SymbolKind::Local;
    TypeRef type;

    /// @brief Frame local id for Local and Parameter symbols.
    uint32_t localId = 0;

    /// @brief Signature for Function symbols.
    const FunctionSignature *signature = nullptr;

    perc::support::SourceLoc loc;
};

} // namespace perc::frontends::per
