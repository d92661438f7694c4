//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/pe/WindowsAbi.cpp
// Purpose: Entry stub, call sequence and KERNEL32 console I/O for Windows.
// Key invariants: See WindowsAbi.hpp.  The I/O sequences reserve 64 bytes:
//                 [rsp+0,32) home area, [rsp+32] fifth argument,
//                 [rsp+40] byte count, [rsp+48] and [rsp+56] saved inputs.
// Ownership/Lifetime: Stateless.
//
//===----------------------------------------------------------------------===//

#include "codegen/pe/WindowsAbi.hpp"
#include "codegen/common/ByteWriter.hpp"

#include <algorithm>

namespace perc::codegen::pe
{

using perc::codegen::x64::Cond;
using perc::codegen::x64::Label;
using perc::codegen::x64::Reg;
using perc::codegen::x64::X64Encoder;

namespace
{

constexpr Reg kArgRegs[4] = {Reg::RCX, Reg::RDX, Reg::R8, Reg::R9};

constexpr int32_t kHomeArea = 32;
constexpr int32_t kIoFrame = 64;

void callImport(X64Encoder &enc, ImportSlot slot)
{
    enc.callImport(static_cast<uint32_t>(slot));
}

} // namespace

void WindowsAbi::emitEntry(X64Encoder &enc, Label main) const
{
    // rsp is 8 mod 16 at the image entry point.
    enc.subImm(Reg::RSP, 40);
    enc.call(main);
    enc.movRegReg(Reg::RCX, Reg::RAX);
    callImport(enc, ImportSlot::ExitProcess);
    enc.int3();
}

void WindowsAbi::emitParamSpill(X64Encoder &enc, uint32_t paramCount) const
{
    const uint32_t inRegs = std::min<uint32_t>(paramCount, 4);
    for (uint32_t i = 0; i < inRegs; ++i)
        enc.store(Reg::RBP, static_cast<int32_t>(16 + 8 * i), kArgRegs[i]);
}

/// Frames larger than a page are allocated one page at a time, storing to
/// each new page so the guard page below the committed stack moves down in
/// order.  r11 counts the bytes still to allocate.
void WindowsAbi::emitFrameAlloc(X64Encoder &enc, uint32_t frameSize) const
{
    if (frameSize <= kStackPageSize)
    {
        TargetAbi::emitFrameAlloc(enc, frameSize);
        return;
    }

    const auto page = static_cast<int32_t>(kStackPageSize);
    enc.movRegImm(Reg::R11, frameSize);
    Label next = enc.newLabel();
    enc.bind(next);
    enc.subImm(Reg::RSP, page);
    enc.store(Reg::RSP, 0, Reg::R11);
    enc.subImm(Reg::R11, page);
    enc.cmpImm(Reg::R11, page);
    enc.jcc(Cond::A, next);
    enc.sub(Reg::RSP, Reg::R11);
}

void WindowsAbi::emitCall(X64Encoder &enc, Label callee, const std::vector<int32_t> &argDisps) const
{
    const size_t count = argDisps.size();
    const size_t onStack = count > 4 ? count - 4 : 0;
    const auto reserve = static_cast<int32_t>(
        perc::codegen::common::alignUp(kHomeArea + 8 * onStack, 16));

    enc.subImm(Reg::RSP, reserve);
    for (size_t i = 4; i < count; ++i)
    {
        enc.load(Reg::RAX, Reg::RBP, argDisps[i]);
        enc.store(Reg::RSP, static_cast<int32_t>(kHomeArea + 8 * (i - 4)), Reg::RAX);
    }
    for (size_t i = 0; i < count && i < 4; ++i)
        enc.load(kArgRegs[i], Reg::RBP, argDisps[i]);
    enc.call(callee);
    enc.addImm(Reg::RSP, reserve);
}

void WindowsAbi::emitWrite(X64Encoder &enc) const
{
    enc.subImm(Reg::RSP, kIoFrame);
    enc.store(Reg::RSP, 48, Reg::RSI);
    enc.store(Reg::RSP, 56, Reg::RDX);

    enc.movRegImm(Reg::RCX, kStdOutputHandle);
    callImport(enc, ImportSlot::GetStdHandle);

    // WriteFile(handle, buffer, length, &written, nullptr)
    enc.movRegReg(Reg::RCX, Reg::RAX);
    enc.load(Reg::RDX, Reg::RSP, 48);
    enc.load(Reg::R8, Reg::RSP, 56);
    enc.lea(Reg::R9, Reg::RSP, 40);
    enc.storeImm(Reg::RSP, 32, 0);
    callImport(enc, ImportSlot::WriteFile);

    enc.addImm(Reg::RSP, kIoFrame);
}

void WindowsAbi::emitReadByte(X64Encoder &enc) const
{
    enc.subImm(Reg::RSP, kIoFrame);
    enc.store(Reg::RSP, 48, Reg::RSI);
    enc.storeImm(Reg::RSP, 40, 0);

    enc.movRegImm(Reg::RCX, kStdInputHandle);
    callImport(enc, ImportSlot::GetStdHandle);

    // ReadFile(handle, buffer, 1, &read, nullptr)
    enc.movRegReg(Reg::RCX, Reg::RAX);
    enc.load(Reg::RDX, Reg::RSP, 48);
    enc.movRegImm(Reg::R8, 1);
    enc.lea(Reg::R9, Reg::RSP, 40);
    enc.storeImm(Reg::RSP, 32, 0);
    callImport(enc, ImportSlot::ReadFile);

    enc.load(Reg::RAX, Reg::RSP, 40);
    enc.addImm(Reg::RSP, kIoFrame);
}

} // namespace perc::codegen::pe
