//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/pe/WindowsAbi.hpp
// Purpose: Windows x64 hooks for the shared instruction selector.
// Key invariants: Calls pass the first four arguments in rcx, rdx, r8, r9
//                 above a 32-byte home area; callees spill them to the home
//                 area so argument i is at [rbp + 16 + 8*i].  Console I/O goes
//                 through KERNEL32 imports called via the IAT.
// Ownership/Lifetime: Stateless.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/x86_64/TargetAbi.hpp"

#include <array>
#include <string_view>

namespace perc::codegen::pe
{

/// \brief Import address table slots, in table order.
enum class ImportSlot : uint32_t
{
    GetStdHandle = 0,
    WriteFile = 1,
    ReadFile = 2,
    ExitProcess = 3,
};

constexpr std::string_view kImportDll = "KERNEL32.dll";

constexpr std::array<std::string_view, 4> kImportNames = {
    "GetStdHandle", "WriteFile", "ReadFile", "ExitProcess"};

constexpr int32_t kStdInputHandle = -10;
constexpr int32_t kStdOutputHandle = -11;

/// \brief Stack pages are committed one guard page at a time.
constexpr uint32_t kStackPageSize = 0x1000;

class WindowsAbi final : public perc::codegen::x64::TargetAbi
{
  public:
    void emitEntry(perc::codegen::x64::X64Encoder &enc,
                   perc::codegen::x64::Label main) const override;
    void emitParamSpill(perc::codegen::x64::X64Encoder &enc, uint32_t paramCount) const override;
    void emitFrameAlloc(perc::codegen::x64::X64Encoder &enc, uint32_t frameSize) const override;
    void emitCall(perc::codegen::x64::X64Encoder &enc,
                  perc::codegen::x64::Label callee,
                  const std::vector<int32_t> &argDisps) const override;
    void emitWrite(perc::codegen::x64::X64Encoder &enc) const override;
    void emitReadByte(perc::codegen::x64::X64Encoder &enc) const override;
};

} // namespace perc::codegen::pe
