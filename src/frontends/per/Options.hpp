//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Options.hpp
/// @brief Front-end options controlling Per compilation.
///
/// @details Populated from command-line flags by the `perc` driver and passed
/// by const reference into compile().  Dumps are written to stderr.
///
//===----------------------------------------------------------------------===//

#pragma once

namespace perc::frontends::per
{

struct CompilerOptions
{
    /// @brief Print the token stream before parsing.
    bool dumpTokens{false};

    /// @brief Print the AST after parsing.
    bool dumpAst{false};

    /// @brief Print the IR after lowering.
    bool dumpIR{false};

    /// @brief Run the IR verifier after lowering.
    bool verifyIR{true};
};

} // namespace perc::frontends::per
