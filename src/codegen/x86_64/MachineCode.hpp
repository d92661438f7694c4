//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/MachineCode.hpp
// Purpose: Position-independent output of the instruction selector that the
//          ELF and PE writers place into an image.
// Key invariants: The code contains no absolute addresses.  Every reference
//                 to data or to an import slot is a rel32 field listed in
//                 dataFixups or importFixups; the writer patches it with
//                 `target address - (field address + 4)`.
// Ownership/Lifetime: Plain value type.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/x86_64/Encoder.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace perc::codegen::x64
{

/// \brief Code range of one lowered IR function.
struct FunctionRange
{
    std::string name;
    size_t begin = 0;
    size_t end = 0;
};

struct MachineCode
{
    std::vector<uint8_t> code;

    /// \brief Initialized data: the string constant records.
    std::vector<uint8_t> data;

    /// \brief Offset of the zero-filled area, relative to the data start.
    uint32_t bssOffset = 0;

    /// \brief Bytes of zero-filled storage following the data.
    uint32_t bssSize = 0;

    /// \brief rel32 fields whose target is an offset from the data start.
    std::vector<Rel32Fixup> dataFixups;

    /// \brief rel32 fields whose target is an import address slot.
    std::vector<Rel32Fixup> importFixups;

    /// \brief Offset of the process entry stub in `code`.
    size_t entryOffset = 0;

    std::vector<FunctionRange> functions;

    /// \brief Size of data plus zero-filled storage.
    [[nodiscard]] uint32_t memorySize() const
    {
        return bssOffset + bssSize;
    }
};

/// \brief Patch every data and import rel32 field of @p mc in place.
/// \param codeAddr Load address of the first code byte.
/// \param dataAddr Load address of the first data byte.
/// \param importSlotAddr Load address of each import slot, by slot index.
/// \return CodegenError when a displacement does not fit in 32 bits or an
///         import slot is unknown.
perc::support::Expected<void> relocate(MachineCode &mc,
                                       uint64_t codeAddr,
                                       uint64_t dataAddr,
                                       const std::vector<uint64_t> &importSlotAddr);

} // namespace perc::codegen::x64
