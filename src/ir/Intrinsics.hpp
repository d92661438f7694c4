//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Intrinsics.hpp
// Purpose: Fixed numeric identifiers of the stdio intrinsics.
// Key invariants: Identifier values are a persisted ABI shared by the
//                 front end, the IR and every back end; never renumber them.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <span>
#include <string_view>

namespace perc::ir
{

enum class IntrinsicId : uint16_t
{
    Print = 1,      ///< (i64) -> void, decimal without newline
    Println = 2,    ///< (i64) -> void
    PrintStr = 3,   ///< (string) -> void
    PrintlnStr = 4, ///< (string) -> void
    PrintChar = 5,  ///< (i64) -> void, low byte
    ReadInt = 6,    ///< () -> i64, 0 at end of input
    ReadChar = 7,   ///< () -> i64, -1 at end of input
    ReadLine = 8,   ///< () -> string, static buffer
    Flush = 9,      ///< () -> void
};

/// @brief Maximum number of bytes ReadLine keeps from one line.
inline constexpr uint32_t kReadLineCapacity = 4096;

/// @brief Argument shape of an intrinsic.
enum class IntrinsicArg : uint8_t
{
    None,
    Int,
    Str,
};

struct IntrinsicInfo
{
    IntrinsicId id;
    std::string_view name; ///< Function name inside the `stdio` module
    IntrinsicArg arg;
    bool returnsInt;    ///< Result is an i64
    bool returnsString; ///< Result is a string
};

/// @brief Look up an intrinsic by stdio function name.
const IntrinsicInfo *findIntrinsic(std::string_view name);

/// @brief Look up an intrinsic by numeric id.
const IntrinsicInfo *findIntrinsic(uint16_t id);

/// @brief Every intrinsic in id order.
std::span<const IntrinsicInfo> allIntrinsics();

[[nodiscard]] inline bool intrinsicHasResult(const IntrinsicInfo &info)
{
    return info.returnsInt || info.returnsString;
}

} // namespace perc::ir
