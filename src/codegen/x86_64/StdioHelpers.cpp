//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/StdioHelpers.cpp
// Purpose: Bodies of the stdio helper routines.
// Key invariants: See StdioHelpers.hpp.
// Ownership/Lifetime: Stateless.
//
//===----------------------------------------------------------------------===//

#include "codegen/x86_64/StdioHelpers.hpp"
#include "ir/Intrinsics.hpp"

namespace perc::codegen::x64
{

namespace
{

void prologue(X64Encoder &enc, int32_t frameBytes)
{
    enc.push(Reg::RBP);
    enc.movRegReg(Reg::RBP, Reg::RSP);
    enc.subImm(Reg::RSP, frameBytes);
}

void epilogue(X64Encoder &enc)
{
    enc.movRegReg(Reg::RSP, Reg::RBP);
    enc.pop(Reg::RBP);
    enc.ret();
}

/// Digits are produced backwards below rbp; unsigned division after the
/// negation keeps INT64_MIN exact.
void emitPrintI64(X64Encoder &enc, const TargetAbi &abi)
{
    prologue(enc, 48);
    Label digits = enc.newLabel();
    Label loop = enc.newLabel();
    Label write = enc.newLabel();

    enc.movRegReg(Reg::RAX, Reg::RDI);
    enc.movRegImm(Reg::R9, 0);
    enc.test(Reg::RAX, Reg::RAX);
    enc.jcc(Cond::GE, digits);
    enc.neg(Reg::RAX);
    enc.movRegImm(Reg::R9, 1);

    enc.bind(digits);
    enc.movRegReg(Reg::RSI, Reg::RBP);
    enc.movRegImm(Reg::R10, 10);
    enc.bind(loop);
    enc.movRegImm(Reg::RDX, 0);
    enc.div(Reg::R10);
    enc.addImm(Reg::RDX, '0');
    enc.subImm(Reg::RSI, 1);
    enc.storeByte(Reg::RSI, 0, Reg::RDX);
    enc.test(Reg::RAX, Reg::RAX);
    enc.jcc(Cond::NE, loop);

    enc.test(Reg::R9, Reg::R9);
    enc.jcc(Cond::E, write);
    enc.subImm(Reg::RSI, 1);
    enc.storeByteImm(Reg::RSI, 0, '-');

    enc.bind(write);
    enc.movRegReg(Reg::RDX, Reg::RBP);
    enc.sub(Reg::RDX, Reg::RSI);
    abi.emitWrite(enc);
    epilogue(enc);
}

void emitPrintStr(X64Encoder &enc, const TargetAbi &abi)
{
    prologue(enc, 16);
    enc.load(Reg::RDX, Reg::RDI, 0);
    enc.lea(Reg::RSI, Reg::RDI, 8);
    abi.emitWrite(enc);
    epilogue(enc);
}

void emitPrintChar(X64Encoder &enc, const TargetAbi &abi)
{
    prologue(enc, 16);
    enc.store(Reg::RBP, -8, Reg::RDI);
    enc.lea(Reg::RSI, Reg::RBP, -8);
    enc.movRegImm(Reg::RDX, 1);
    abi.emitWrite(enc);
    epilogue(enc);
}

void emitReadChar(X64Encoder &enc, const TargetAbi &abi)
{
    prologue(enc, 16);
    Label eof = enc.newLabel();
    Label done = enc.newLabel();

    enc.storeImm(Reg::RBP, -8, 0);
    enc.lea(Reg::RSI, Reg::RBP, -8);
    abi.emitReadByte(enc);
    enc.cmpImm(Reg::RAX, 0);
    enc.jcc(Cond::LE, eof);
    enc.loadByteZx(Reg::RAX, Reg::RBP, -8);
    enc.jmp(done);

    enc.bind(eof);
    enc.movRegImm(Reg::RAX, -1);
    enc.bind(done);
    epilogue(enc);
}

/// [rbp-8] accumulator, [rbp-16] negative flag.  Leading bytes <= ' ' are
/// skipped and the byte ending the number is consumed.
void emitReadInt(X64Encoder &enc, const StdioHelpers &helpers)
{
    prologue(enc, 32);
    Label skip = enc.newLabel();
    Label digits = enc.newLabel();
    Label finish = enc.newLabel();
    Label out = enc.newLabel();

    enc.storeImm(Reg::RBP, -8, 0);
    enc.storeImm(Reg::RBP, -16, 0);

    enc.bind(skip);
    enc.call(helpers.readChar);
    enc.cmpImm(Reg::RAX, -1);
    enc.jcc(Cond::E, finish);
    enc.cmpImm(Reg::RAX, ' ');
    enc.jcc(Cond::LE, skip);
    enc.cmpImm(Reg::RAX, '-');
    enc.jcc(Cond::NE, digits);
    enc.storeImm(Reg::RBP, -16, 1);
    enc.call(helpers.readChar);

    enc.bind(digits);
    enc.cmpImm(Reg::RAX, '0');
    enc.jcc(Cond::L, finish);
    enc.cmpImm(Reg::RAX, '9');
    enc.jcc(Cond::G, finish);
    enc.subImm(Reg::RAX, '0');
    enc.movRegReg(Reg::RCX, Reg::RAX);
    enc.load(Reg::RAX, Reg::RBP, -8);
    enc.movRegImm(Reg::RDX, 10);
    enc.imul(Reg::RAX, Reg::RDX);
    enc.add(Reg::RAX, Reg::RCX);
    enc.store(Reg::RBP, -8, Reg::RAX);
    enc.call(helpers.readChar);
    enc.jmp(digits);

    enc.bind(finish);
    enc.load(Reg::RAX, Reg::RBP, -8);
    enc.load(Reg::RCX, Reg::RBP, -16);
    enc.test(Reg::RCX, Reg::RCX);
    enc.jcc(Cond::E, out);
    enc.neg(Reg::RAX);
    enc.bind(out);
    epilogue(enc);
}

/// [rbp-8] byte count.  '\r' is dropped; bytes past the capacity are read
/// and discarded up to the end of the line.
void emitReadLine(X64Encoder &enc, const StdioHelpers &helpers, uint32_t lineRecordOffset)
{
    prologue(enc, 16);
    Label loop = enc.newLabel();
    Label done = enc.newLabel();

    enc.storeImm(Reg::RBP, -8, 0);
    enc.bind(loop);
    enc.call(helpers.readChar);
    enc.cmpImm(Reg::RAX, -1);
    enc.jcc(Cond::E, done);
    enc.cmpImm(Reg::RAX, '\n');
    enc.jcc(Cond::E, done);
    enc.cmpImm(Reg::RAX, '\r');
    enc.jcc(Cond::E, loop);
    enc.load(Reg::RCX, Reg::RBP, -8);
    enc.cmpImm(Reg::RCX, static_cast<int32_t>(perc::ir::kReadLineCapacity));
    enc.jcc(Cond::GE, loop);
    enc.leaData(Reg::RDX, lineRecordOffset + 8);
    enc.add(Reg::RDX, Reg::RCX);
    enc.storeByte(Reg::RDX, 0, Reg::RAX);
    enc.addImm(Reg::RCX, 1);
    enc.store(Reg::RBP, -8, Reg::RCX);
    enc.jmp(loop);

    enc.bind(done);
    enc.leaData(Reg::RAX, lineRecordOffset);
    enc.load(Reg::RCX, Reg::RBP, -8);
    enc.store(Reg::RAX, 0, Reg::RCX);
    epilogue(enc);
}

} // namespace

uint32_t stdioHelpersBssSize()
{
    return 8 + perc::ir::kReadLineCapacity;
}

StdioHelpers declareStdioHelpers(X64Encoder &enc)
{
    StdioHelpers helpers;
    helpers.printI64 = enc.newLabel();
    helpers.printStr = enc.newLabel();
    helpers.printChar = enc.newLabel();
    helpers.readInt = enc.newLabel();
    helpers.readChar = enc.newLabel();
    helpers.readLine = enc.newLabel();
    return helpers;
}

void emitStdioHelpers(X64Encoder &enc,
                      const TargetAbi &abi,
                      const StdioHelpers &helpers,
                      uint32_t lineRecordOffset)
{
    enc.bind(helpers.printI64);
    emitPrintI64(enc, abi);
    enc.bind(helpers.printStr);
    emitPrintStr(enc, abi);
    enc.bind(helpers.printChar);
    emitPrintChar(enc, abi);
    enc.bind(helpers.readChar);
    emitReadChar(enc, abi);
    enc.bind(helpers.readInt);
    emitReadInt(enc, helpers);
    enc.bind(helpers.readLine);
    emitReadLine(enc, helpers, lineRecordOffset);
}

} // namespace perc::codegen::x64
