//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Nvm.hpp
// Purpose: NVM bytecode container layout, limits and opcode numbering.
// Key invariants: All fields are little endian.  The opcode byte of an IR
//                 opcode is its index in ir/Opcode.def plus one; zero is never
//                 a valid opcode.  Branch and entry targets are absolute byte
//                 offsets into the code stream.
// Ownership: Header-only constants and helpers.
// Lifetime: N/A.
// Links: NvmWriter.hpp, NvmDisassembler.hpp, ir/Opcode.def
//
//===----------------------------------------------------------------------===//
//
// Container layout:
//
//   offset  size  field
//   0       4     magic "NVM0"
//   4       2     version
//   6       2     flags (0)
//   8       4     entry offset in the code stream
//   12      4     constant pool size in bytes
//   16      4     function count
//   20      4     code size in bytes
//   24      ...   constant pool: u8 kind, u32 length, bytes
//   ...     ...   function table: u32 code offset, u16 params, u16 frame
//                 words, u32 slots, u32 name length, name bytes
//   ...     ...   code stream
//
// Instruction operands follow the opcode byte:
//
//   const          u32 dst, i64 imm
//   str            u32 dst, u32 constant index
//   addr, ldl      u32 dst, u32 frame word
//   stl            u32 frame word, u32 src
//   load           u32 dst, u32 address
//   store          u32 address, u32 value
//   binary ops     u32 dst, u32 lhs, u32 rhs
//   neg, not       u32 dst, u32 src
//   jmp            u32 target
//   jz, jnz        u32 cond, u32 target
//   call           u32 dst, u32 callee, u8 argc, argc x u32
//   ret            u8 has value, u32 src
//   intr           u32 dst, u16 intrinsic id, u8 argc, argc x u32
//
// Frame locals are addressed by their first word; parameter i is word i.

#pragma once

#include "ir/Opcode.hpp"
#include "perc/version.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace perc::bytecode
{

constexpr std::string_view kNvmMagic = "NVM0";
constexpr uint16_t kNvmVersion = PERC_NVM_VERSION;
constexpr uint32_t kNvmHeaderSize = 24;

/// @brief Constant pool entry kinds.
constexpr uint8_t kConstString = 1;

/// @brief dst field value of a call or intrinsic without a result.
constexpr uint32_t kNvmNoDst = 0xFFFFFFFFu;

/// @brief Largest frame, in words, the u16 frame field can describe.
constexpr uint32_t kMaxFrameWords = 0xFFFF;

/// @brief Largest argument count the u8 argc field can describe.
constexpr uint32_t kMaxCallArgs = 0xFF;

inline constexpr uint8_t opcodeByte(perc::ir::Opcode op)
{
    return static_cast<uint8_t>(static_cast<uint8_t>(op) + 1);
}

inline std::optional<perc::ir::Opcode> opcodeFromByte(uint8_t byte)
{
    if (byte == 0 || byte > perc::ir::kNumOpcodes)
        return std::nullopt;
    return static_cast<perc::ir::Opcode>(byte - 1);
}

} // namespace perc::bytecode
