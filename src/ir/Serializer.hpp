//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Serializer.hpp
// Purpose: Text rendering of IR modules for `--dump-ir` and tests.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Module.hpp"

#include <ostream>
#include <string>

namespace perc::ir
{

class Serializer
{
  public:
    /// @brief Write @p module to @p os in the textual IR format.
    static void write(const Module &module, std::ostream &os);

    /// @brief Render @p module to a string.
    static std::string toString(const Module &module);

    /// @brief Render a single instruction without indentation or newline.
    static std::string toString(const Instr &instr, const Module &module);

    /// @brief Quote and escape raw bytes as a string literal.
    static std::string quote(const std::string &bytes);
};

} // namespace perc::ir
