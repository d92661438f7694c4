//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "ir/Intrinsics.hpp"

#include <array>

namespace perc::ir
{

namespace
{
constexpr std::array<IntrinsicInfo, 9> kIntrinsics = {{
    {IntrinsicId::Print, "Print", IntrinsicArg::Int, false, false},
    {IntrinsicId::Println, "Println", IntrinsicArg::Int, false, false},
    {IntrinsicId::PrintStr, "PrintStr", IntrinsicArg::Str, false, false},
    {IntrinsicId::PrintlnStr, "PrintlnStr", IntrinsicArg::Str, false, false},
    {IntrinsicId::PrintChar, "PrintChar", IntrinsicArg::Int, false, false},
    {IntrinsicId::ReadInt, "ReadInt", IntrinsicArg::None, true, false},
    {IntrinsicId::ReadChar, "ReadChar", IntrinsicArg::None, true, false},
    {IntrinsicId::ReadLine, "ReadLine", IntrinsicArg::None, false, true},
    {IntrinsicId::Flush, "Flush", IntrinsicArg::None, false, false},
}};
} // namespace

const IntrinsicInfo *findIntrinsic(std::string_view name)
{
    for (const auto &info : kIntrinsics)
    {
        if (info.name == name)
            return &info;
    }
    return nullptr;
}

const IntrinsicInfo *findIntrinsic(uint16_t id)
{
    if (id == 0 || id > kIntrinsics.size())
        return nullptr;
    return &kIntrinsics[id - 1];
}

std::span<const IntrinsicInfo> allIntrinsics()
{
    return kIntrinsics;
}

} // namespace perc::ir
