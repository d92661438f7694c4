//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/NvmWriter.hpp
// Purpose: Encode an IR module as an NVM bytecode container.
// Key invariants: Output layout follows Nvm.hpp exactly; labels disappear and
//                 branches carry absolute code offsets.
// Ownership: Returns an owned byte buffer; the module is only read.
// Lifetime: N/A.
// Links: Nvm.hpp, NvmDisassembler.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Module.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <vector>

namespace perc::bytecode
{

/// @brief Encode @p module.
/// @return CodegenError when a function exceeds kMaxFrameWords, a parameter
///         count does not fit in 16 bits or a call passes more than
///         kMaxCallArgs arguments.
perc::support::Expected<std::vector<uint8_t>> encodeModule(const perc::ir::Module &module);

} // namespace perc::bytecode
