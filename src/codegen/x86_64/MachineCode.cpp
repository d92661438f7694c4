//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/MachineCode.cpp
// Purpose: Final placement of selected code: rel32 patching for data and
//          import references.
// Key invariants: A rel32 field is relative to the address right after it.
// Ownership/Lifetime: Mutates the caller's MachineCode in place.
//
//===----------------------------------------------------------------------===//

#include "codegen/x86_64/MachineCode.hpp"
#include "codegen/common/ByteWriter.hpp"

#include <limits>
#include <string>

namespace perc::codegen::x64
{

using perc::support::Expected;
using perc::support::kCodegenError;
using perc::support::makeError;

namespace
{

Expected<void> patchRel32(std::vector<uint8_t> &code, size_t at, uint64_t fieldAddr, uint64_t target)
{
    const int64_t disp = static_cast<int64_t>(target) - static_cast<int64_t>(fieldAddr + 4);
    if (disp < std::numeric_limits<int32_t>::min() || disp > std::numeric_limits<int32_t>::max())
        return makeError({}, "data displacement out of 32-bit range", kCodegenError);
    perc::codegen::common::ByteWriter(code).patch32(
        at, static_cast<uint32_t>(static_cast<int32_t>(disp)));
    return {};
}

} // namespace

Expected<void> relocate(MachineCode &mc,
                        uint64_t codeAddr,
                        uint64_t dataAddr,
                        const std::vector<uint64_t> &importSlotAddr)
{
    for (const auto &fixup : mc.dataFixups)
    {
        if (auto ok = patchRel32(mc.code, fixup.at, codeAddr + fixup.at, dataAddr + fixup.target);
            !ok)
            return ok;
    }
    for (const auto &fixup : mc.importFixups)
    {
        if (fixup.target >= importSlotAddr.size())
        {
            return makeError(
                {}, "reference to unknown import slot " + std::to_string(fixup.target), kCodegenError);
        }
        if (auto ok = patchRel32(
                mc.code, fixup.at, codeAddr + fixup.at, importSlotAddr[fixup.target]);
            !ok)
            return ok;
    }
    return {};
}

} // namespace perc::codegen::x64
