//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/elf/LinuxAbi.cpp
// Purpose: Entry stub, call sequence and syscall I/O for Linux.
// Key invariants: See LinuxAbi.hpp.
// Ownership/Lifetime: Stateless.
//
//===----------------------------------------------------------------------===//

#include "codegen/elf/LinuxAbi.hpp"

namespace perc::codegen::elf
{

using perc::codegen::x64::Label;
using perc::codegen::x64::Reg;
using perc::codegen::x64::X64Encoder;

void LinuxAbi::emitEntry(X64Encoder &enc, Label main) const
{
    // rsp is 16-byte aligned at _start.
    enc.call(main);
    enc.movRegReg(Reg::RDI, Reg::RAX);
    enc.movRegImm(Reg::RAX, kSysExit);
    enc.syscall();
}

void LinuxAbi::emitParamSpill(X64Encoder &, uint32_t) const {}

void LinuxAbi::emitCall(X64Encoder &enc, Label callee, const std::vector<int32_t> &argDisps) const
{
    const size_t count = argDisps.size();
    const bool pad = (count % 2) != 0;
    if (pad)
        enc.subImm(Reg::RSP, 8);
    for (size_t i = count; i-- > 0;)
    {
        enc.load(Reg::RAX, Reg::RBP, argDisps[i]);
        enc.push(Reg::RAX);
    }
    enc.call(callee);
    const size_t release = 8 * (count + (pad ? 1 : 0));
    if (release != 0)
        enc.addImm(Reg::RSP, static_cast<int32_t>(release));
}

void LinuxAbi::emitWrite(X64Encoder &enc) const
{
    enc.movRegImm(Reg::RAX, kSysWrite);
    enc.movRegImm(Reg::RDI, 1);
    enc.syscall();
}

void LinuxAbi::emitReadByte(X64Encoder &enc) const
{
    enc.movRegImm(Reg::RAX, kSysRead);
    enc.movRegImm(Reg::RDI, 0);
    enc.movRegImm(Reg::RDX, 1);
    enc.syscall();
}

} // namespace perc::codegen::elf
