//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.hpp
/// @brief Human-readable dump of a Per AST, used by `--dump-ast`.
///
/// Example output:
/// @code
///   Program
///     FunctionDecl "main" -> i64 (1:1)
///       Block (1:11)
///         Return (1:13)
///           IntLiteral 0 (1:20)
/// @endcode
///
/// @invariant Output is deterministic for a given tree.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/per/AST.hpp"

#include <string>

namespace perc::frontends::per
{

class AstPrinter
{
  public:
    std::string dump(const Program &program);
};

} // namespace perc::frontends::per
