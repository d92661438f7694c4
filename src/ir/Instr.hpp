//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Instr struct, a single instruction of the flat IR
// shared by every back end.  All values are 64-bit words held in virtual
// slots; frame locals are word arrays addressed by local id.
//
// Field usage by opcode:
// - const        dst = imm
// - str          dst = address of string constant `index`
// - addr         dst = address of frame local `index`
// - ldl / stl    dst = local[index] / local[index] = operands[0]
// - load / store dst = *operands[0] / *operands[0] = operands[1]
// - arithmetic   dst = operands[0] op operands[1]  (neg and not take one;
//                not gives 1 for zero and 0 otherwise)
// - comparisons  dst = 1 when the relation holds, else 0
// - label        defines label `index`
// - jmp          goto label `index`
// - jz / jnz     goto label `index` when operands[0] is zero / non-zero
// - call         dst (optional) = function[index](operands...)
// - ret          return operands[0] when present
// - intr         dst (optional) = intrinsic[index](operands...)
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Opcode.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <limits>
#include <vector>

namespace perc::ir
{

/// @brief Marker for an absent dst slot.
inline constexpr uint32_t kNoSlot = std::numeric_limits<uint32_t>::max();

struct Instr
{
    Opcode op;

    /// @brief Destination slot or kNoSlot.
    uint32_t dst = kNoSlot;

    /// @brief Source slots.
    std::vector<uint32_t> operands;

    /// @brief Immediate for const.
    int64_t imm = 0;

    /// @brief Local id, string id, label id, function index or intrinsic id.
    uint32_t index = 0;

    perc::support::SourceLoc loc;

    [[nodiscard]] bool hasDst() const
    {
        return dst != kNoSlot;
    }
};

} // namespace perc::ir
