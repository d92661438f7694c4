//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/TargetAbi.hpp
// Purpose: Operating-system hooks of the shared x86-64 instruction selector.
// Key invariants: Hooks that perform calls run with rsp 16-byte aligned and
//                 may clobber rax, rcx, rdx, rsi, rdi and r8-r11.  After the
//                 callee prologue argument i is at [rbp + 16 + 8*i] on every
//                 target.
// Ownership/Lifetime: Implementations are stateless.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/x86_64/Encoder.hpp"

#include <cstdint>
#include <vector>

namespace perc::codegen::x64
{

class TargetAbi
{
  public:
    virtual ~TargetAbi() = default;

    /// \brief Process entry: call @p main and exit with its result.
    virtual void emitEntry(X64Encoder &enc, Label main) const = 0;

    /// \brief Runs right after `push rbp; mov rbp, rsp` of a function with
    ///        @p paramCount parameters.
    virtual void emitParamSpill(X64Encoder &enc, uint32_t paramCount) const = 0;

    /// \brief Lower rsp by @p frameSize bytes right after the parameter spill.
    /// \details The default is a single `sub rsp, frameSize`; targets whose
    ///          stack grows through a guard page touch every page on the way.
    virtual void emitFrameAlloc(X64Encoder &enc, uint32_t frameSize) const
    {
        if (frameSize != 0)
            enc.subImm(Reg::RSP, static_cast<int32_t>(frameSize));
    }

    /// \brief Call @p callee with arguments loaded from `[rbp + disp]`;
    ///        the result is left in rax.
    virtual void emitCall(X64Encoder &enc,
                          Label callee,
                          const std::vector<int32_t> &argDisps) const = 0;

    /// \brief Write rdx bytes starting at rsi to standard output.
    virtual void emitWrite(X64Encoder &enc) const = 0;

    /// \brief Read one byte from standard input into [rsi].
    /// \details Leaves the number of bytes read in rax; zero or less means
    ///          end of input.
    virtual void emitReadByte(X64Encoder &enc) const = 0;
};

} // namespace perc::codegen::x64
