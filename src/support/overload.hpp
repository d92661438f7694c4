//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/overload.hpp
// Purpose: Lambda overload set for exhaustive std::visit over AST variants.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace perc::support
{

/// @brief Combine several lambdas into one overloaded callable.
template <typename... Ts> struct Overload : Ts...
{
    using Ts::operator()...;
};

template <typename... Ts> Overload(Ts...) -> Overload<Ts...>;

} // namespace perc::support
