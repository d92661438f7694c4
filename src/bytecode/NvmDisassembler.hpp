//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/NvmDisassembler.hpp
// Purpose: Render NVM bytecode as assembly text.
// Key invariants: Assembly text is only ever produced from encoded bytes, so
//                 the text and the bytecode describe the same program.
//                 Every branch target prints as `L<hex offset>:` on its own
//                 line and every function start as `<name>:`.
// Ownership: Returns owned strings; inputs are only read.
// Lifetime: N/A.
// Links: Nvm.hpp, NvmWriter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Module.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace perc::bytecode
{

/// @brief Decode @p bytes and print one instruction per line.
/// @return CodegenError when the container is malformed or truncated.
perc::support::Expected<std::string> disassemble(const std::vector<uint8_t> &bytes);

/// @brief Encode @p module and disassemble the result.
perc::support::Expected<std::string> renderAssembly(const perc::ir::Module &module);

} // namespace perc::bytecode
