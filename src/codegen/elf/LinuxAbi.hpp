//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/elf/LinuxAbi.hpp
// Purpose: Linux x86-64 hooks for the shared instruction selector.
// Key invariants: Arguments are pushed right to left, padded to keep rsp
//                 16-byte aligned at the call; I/O uses raw syscalls.
// Ownership/Lifetime: Stateless.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/x86_64/TargetAbi.hpp"

namespace perc::codegen::elf
{

/// @name Linux syscall numbers
///@{
constexpr int32_t kSysRead = 0;
constexpr int32_t kSysWrite = 1;
constexpr int32_t kSysExit = 60;
///@}

class LinuxAbi final : public perc::codegen::x64::TargetAbi
{
  public:
    void emitEntry(perc::codegen::x64::X64Encoder &enc,
                   perc::codegen::x64::Label main) const override;
    void emitParamSpill(perc::codegen::x64::X64Encoder &enc, uint32_t paramCount) const override;
    void emitCall(perc::codegen::x64::X64Encoder &enc,
                  perc::codegen::x64::Label callee,
                  const std::vector<int32_t> &argDisps) const override;
    void emitWrite(perc::codegen::x64::X64Encoder &enc) const override;
    void emitReadByte(perc::codegen::x64::X64Encoder &enc) const override;
};

} // namespace perc::codegen::elf
