//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Verifier.hpp
// Purpose: Structural checks every back end relies on before encoding.
// Key invariants: A verified module has in-range slots, locals, strings,
//                 labels and callees, and each label is defined exactly once.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Module.hpp"
#include "support/diag_expected.hpp"

namespace perc::ir
{

class Verifier
{
  public:
    /// @brief Verify @p module.
    /// @return Empty on success, otherwise a CodegenError naming the function.
    static perc::support::Expected<void> verify(const Module &module);
};

} // namespace perc::ir
