//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Opcode.hpp
// Purpose: Enumerates IR instruction opcodes.
// Key invariants: Enumeration order matches Opcode.def and is persisted by
//                 the NVM bytecode format.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>

namespace perc::ir
{

enum class Opcode : uint8_t
{
#define PERC_IR_OPCODE(NAME, ...) NAME,
#include "ir/Opcode.def"
#undef PERC_IR_OPCODE
    Count
};

constexpr size_t kNumOpcodes = static_cast<size_t>(Opcode::Count);

/// @brief Static properties of an opcode.
struct OpcodeInfo
{
    const char *mnemonic;

    /// @brief Fixed slot operand count, or -1 when it varies.
    int operands;

    /// @brief True when the opcode always writes its dst slot.
    bool hasResult;
};

/// @brief Look up the properties of @p op.
const OpcodeInfo &getOpcodeInfo(Opcode op);

/// @brief Mnemonic of @p op; empty string when out of range.
const char *toString(Opcode op);

/// @brief True for the opcodes that branch to a label.
[[nodiscard]] inline bool isBranch(Opcode op)
{
    return op == Opcode::Jmp || op == Opcode::Jz || op == Opcode::Jnz;
}

} // namespace perc::ir
