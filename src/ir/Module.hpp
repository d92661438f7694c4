//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Module.hpp
// Purpose: IR functions and the module that owns them.
// Key invariants: Parameters are frame locals 0..paramCount-1 and occupy one
//                 word each; `entry` indexes the function named main.
// Ownership/Lifetime: Module owns functions and string constants by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Instr.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace perc::ir
{

struct Function
{
    /// @brief Qualified name; library functions are "module.Name".
    std::string name;

    /// @brief Location of the declaration; back-end limit errors point here.
    perc::support::SourceLoc loc;

    uint32_t paramCount = 0;

    /// @brief Size in words of each frame local, indexed by local id.
    /// @details Kept at full width so back ends see oversized arrays as they
    ///          were declared.
    std::vector<uint64_t> localWords;

    /// @brief Number of virtual slots used by the body.
    uint32_t slotCount = 0;

    /// @brief Number of label ids allocated for the body.
    uint32_t labelCount = 0;

    bool returnsValue = false;

    std::vector<Instr> body;

    /// @brief Total words of all frame locals, saturating at UINT64_MAX.
    [[nodiscard]] uint64_t frameWords() const
    {
        uint64_t words = 0;
        for (uint64_t w : localWords)
            words = w > UINT64_MAX - words ? UINT64_MAX : words + w;
        return words;
    }
};

struct Module
{
    std::vector<Function> functions;

    /// @brief String constants referenced by `str`; raw bytes without the length prefix.
    std::vector<std::string> strings;

    /// @brief Index of the entry function.
    uint32_t entry = 0;
};

} // namespace perc::ir
