//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/elf/ElfWriter.hpp
// Purpose: Statically linked ELF64 executables for Linux x86-64.
// Key invariants: The image is one RWX PT_LOAD segment mapped at
//                 kImageBase from file offset 0.  Code starts at
//                 kCodeFileOffset, data follows it 16-byte aligned and the
//                 zero-filled area extends the segment through p_memsz.
// Ownership/Lifetime: Pure functions returning owned byte buffers.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/x86_64/MachineCode.hpp"
#include "ir/Module.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <vector>

namespace perc::codegen::elf
{

constexpr uint64_t kImageBase = 0x400000;
constexpr uint64_t kCodeFileOffset = 0x1000;
constexpr uint64_t kSegmentAlign = 0x1000;

/// \brief Wrap already selected machine code into an ELF image.
/// \return CodegenError when the code references imports or a data
///         displacement overflows.
perc::support::Expected<std::vector<uint8_t>> writeElf(perc::codegen::x64::MachineCode mc);

/// \brief Select code for @p module with the Linux ABI and emit the image.
perc::support::Expected<std::vector<uint8_t>> emitElf(const perc::ir::Module &module);

} // namespace perc::codegen::elf
