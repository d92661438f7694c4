//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Opcode.cpp
/// @brief Opcode property table generated from Opcode.def.
///
//===----------------------------------------------------------------------===//

#include "ir/Opcode.hpp"

#include <array>

namespace perc::ir
{

namespace
{
constexpr std::array<OpcodeInfo, kNumOpcodes> kOpcodeTable = {{
#define PERC_IR_OPCODE(NAME, MNEMONIC, OPERANDS, RESULT) {MNEMONIC, OPERANDS, RESULT != 0},
#include "ir/Opcode.def"
#undef PERC_IR_OPCODE
}};

static_assert(kOpcodeTable.size() == kNumOpcodes, "Opcode table must match enum count");
} // namespace

const OpcodeInfo &getOpcodeInfo(Opcode op)
{
    return kOpcodeTable[static_cast<size_t>(op)];
}

const char *toString(Opcode op)
{
    auto index = static_cast<size_t>(op);
    if (index >= kNumOpcodes)
        return "";
    return kOpcodeTable[index].mnemonic;
}

} // namespace perc::ir
