//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/pe/PeWriter.hpp
// Purpose: PE32+ console executables for Windows x64.
// Key invariants: Three sections in RVA order: .text, .data (string records
//                 followed by zero-filled storage through VirtualSize) and
//                 .idata (KERNEL32 import directory and IAT).  All code
//                 references are RIP-relative, so the image needs no base
//                 relocations.
// Ownership/Lifetime: Pure functions returning owned byte buffers.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/x86_64/MachineCode.hpp"
#include "ir/Module.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <vector>

namespace perc::codegen::pe
{

constexpr uint64_t kImageBase = 0x140000000ULL;
constexpr uint32_t kSectionAlignment = 0x1000;
constexpr uint32_t kFileAlignment = 0x200;
constexpr uint32_t kSizeOfHeaders = 0x200;

/// \brief Wrap already selected machine code into a PE image.
perc::support::Expected<std::vector<uint8_t>> writePe(perc::codegen::x64::MachineCode mc);

/// \brief Select code for @p module with the Windows ABI and emit the image.
perc::support::Expected<std::vector<uint8_t>> emitPe(const perc::ir::Module &module);

} // namespace perc::codegen::pe
