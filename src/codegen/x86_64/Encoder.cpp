//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/Encoder.cpp
// Purpose: REX/ModRM encoding of the X64Encoder instruction set.
// Key invariants: Labels are patched only by resolveLabels().
// Ownership/Lifetime: See Encoder.hpp.
//
//===----------------------------------------------------------------------===//

#include "codegen/x86_64/Encoder.hpp"

#include <limits>
#include <string>

namespace perc::codegen::x64
{

namespace
{

constexpr uint8_t num(Reg r)
{
    return static_cast<uint8_t>(r);
}

constexpr bool fitsInt8(int64_t v)
{
    return v >= std::numeric_limits<int8_t>::min() && v <= std::numeric_limits<int8_t>::max();
}

constexpr bool fitsInt32(int64_t v)
{
    return v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max();
}

/// \brief Byte registers 4..7 name ah..bh unless a REX prefix is present.
constexpr bool needsRexForByte(Reg r)
{
    return num(r) >= 4 && num(r) < 8;
}

} // namespace

const char *regName(Reg reg) noexcept
{
    static constexpr const char *kNames[] = {"rax", "rcx", "rdx", "rbx", "rsp", "rbp",
                                             "rsi", "rdi", "r8",  "r9",  "r10", "r11",
                                             "r12", "r13", "r14", "r15"};
    return kNames[num(reg) & 15];
}

//-----------------------------------------------------------------------------
// Raw emission
//-----------------------------------------------------------------------------

void X64Encoder::emit8(uint8_t v)
{
    bytes_.push_back(v);
}

void X64Encoder::emit32(uint32_t v)
{
    for (int i = 0; i < 4; ++i)
        emit8(static_cast<uint8_t>(v >> (8 * i)));
}

void X64Encoder::emit64(uint64_t v)
{
    for (int i = 0; i < 8; ++i)
        emit8(static_cast<uint8_t>(v >> (8 * i)));
}

void X64Encoder::emitRex(bool w, uint8_t reg, uint8_t rm, bool force)
{
    uint8_t rex = 0x40;
    if (w)
        rex |= 0x08;
    if (reg & 8)
        rex |= 0x04;
    if (rm & 8)
        rex |= 0x01;
    if (rex != 0x40 || force)
        emit8(rex);
}

void X64Encoder::emitMem(uint8_t reg, Reg base, int32_t disp)
{
    const uint8_t b = num(base) & 7;
    uint8_t mod = 2;
    if (disp == 0 && b != 5)
        mod = 0;
    else if (fitsInt8(disp))
        mod = 1;

    emit8(static_cast<uint8_t>((mod << 6) | ((reg & 7) << 3) | b));
    if (b == 4)
        emit8(0x24); // SIB: base only
    if (mod == 1)
        emit8(static_cast<uint8_t>(disp));
    else if (mod == 2)
        emit32(static_cast<uint32_t>(disp));
}

void X64Encoder::emitRegReg(uint8_t opcode, Reg reg, Reg rm)
{
    emitRex(true, num(reg), num(rm));
    emit8(opcode);
    emit8(static_cast<uint8_t>(0xC0 | ((num(reg) & 7) << 3) | (num(rm) & 7)));
}

void X64Encoder::emitAluImm(uint8_t ext, Reg dst, int32_t imm)
{
    emitRex(true, 0, num(dst));
    emit8(0x81);
    emit8(static_cast<uint8_t>(0xC0 | (ext << 3) | (num(dst) & 7)));
    emit32(static_cast<uint32_t>(imm));
}

//-----------------------------------------------------------------------------
// Labels
//-----------------------------------------------------------------------------

Label X64Encoder::newLabel()
{
    labelOffsets_.push_back(-1);
    return Label{static_cast<uint32_t>(labelOffsets_.size() - 1)};
}

void X64Encoder::bind(Label label)
{
    labelOffsets_[label.id] = static_cast<int64_t>(bytes_.size());
}

bool X64Encoder::isBound(Label label) const
{
    return label.id < labelOffsets_.size() && labelOffsets_[label.id] >= 0;
}

size_t X64Encoder::offsetOf(Label label) const
{
    return static_cast<size_t>(labelOffsets_[label.id]);
}

void X64Encoder::emitLabelRel32(Label target)
{
    labelFixups_.push_back({bytes_.size(), target.id});
    emit32(0);
}

perc::support::Expected<void> X64Encoder::resolveLabels()
{
    for (const auto &fixup : labelFixups_)
    {
        if (!isBound(Label{fixup.target}))
        {
            return perc::support::makeError({},
                                            "unbound code label " + std::to_string(fixup.target),
                                            perc::support::kCodegenError);
        }
        int64_t disp = labelOffsets_[fixup.target] - static_cast<int64_t>(fixup.at + 4);
        if (!fitsInt32(disp))
        {
            return perc::support::makeError(
                {}, "branch displacement out of 32-bit range", perc::support::kCodegenError);
        }
        auto v = static_cast<uint32_t>(static_cast<int32_t>(disp));
        for (int i = 0; i < 4; ++i)
            bytes_[fixup.at + i] = static_cast<uint8_t>(v >> (8 * i));
    }
    labelFixups_.clear();
    return {};
}

//-----------------------------------------------------------------------------
// Data movement
//-----------------------------------------------------------------------------

void X64Encoder::movRegReg(Reg dst, Reg src)
{
    emitRegReg(0x89, src, dst);
}

void X64Encoder::movRegImm(Reg dst, int64_t imm)
{
    if (fitsInt32(imm))
    {
        // mov r/m64, imm32 (sign-extended)
        emitRex(true, 0, num(dst));
        emit8(0xC7);
        emit8(static_cast<uint8_t>(0xC0 | (num(dst) & 7)));
        emit32(static_cast<uint32_t>(static_cast<int32_t>(imm)));
        return;
    }
    // movabs r64, imm64
    emitRex(true, 0, num(dst));
    emit8(static_cast<uint8_t>(0xB8 | (num(dst) & 7)));
    emit64(static_cast<uint64_t>(imm));
}

void X64Encoder::load(Reg dst, Reg base, int32_t disp)
{
    emitRex(true, num(dst), num(base));
    emit8(0x8B);
    emitMem(num(dst), base, disp);
}

void X64Encoder::store(Reg base, int32_t disp, Reg src)
{
    emitRex(true, num(src), num(base));
    emit8(0x89);
    emitMem(num(src), base, disp);
}

void X64Encoder::storeImm(Reg base, int32_t disp, int32_t imm)
{
    emitRex(true, 0, num(base));
    emit8(0xC7);
    emitMem(0, base, disp);
    emit32(static_cast<uint32_t>(imm));
}

void X64Encoder::lea(Reg dst, Reg base, int32_t disp)
{
    emitRex(true, num(dst), num(base));
    emit8(0x8D);
    emitMem(num(dst), base, disp);
}

void X64Encoder::loadByteZx(Reg dst, Reg base, int32_t disp)
{
    emitRex(true, num(dst), num(base));
    emit8(0x0F);
    emit8(0xB6);
    emitMem(num(dst), base, disp);
}

void X64Encoder::storeByte(Reg base, int32_t disp, Reg src)
{
    emitRex(false, num(src), num(base), needsRexForByte(src));
    emit8(0x88);
    emitMem(num(src), base, disp);
}

void X64Encoder::storeByteImm(Reg base, int32_t disp, uint8_t imm)
{
    emitRex(false, 0, num(base));
    emit8(0xC6);
    emitMem(0, base, disp);
    emit8(imm);
}

void X64Encoder::leaData(Reg dst, uint32_t dataOffset)
{
    emitRex(true, num(dst), 0);
    emit8(0x8D);
    emit8(static_cast<uint8_t>(0x05 | ((num(dst) & 7) << 3))); // [rip + disp32]
    dataFixups_.push_back({bytes_.size(), dataOffset});
    emit32(0);
}

void X64Encoder::push(Reg reg)
{
    if (num(reg) & 8)
        emit8(0x41);
    emit8(static_cast<uint8_t>(0x50 | (num(reg) & 7)));
}

void X64Encoder::pop(Reg reg)
{
    if (num(reg) & 8)
        emit8(0x41);
    emit8(static_cast<uint8_t>(0x58 | (num(reg) & 7)));
}

//-----------------------------------------------------------------------------
// Arithmetic
//-----------------------------------------------------------------------------

void X64Encoder::add(Reg dst, Reg src)
{
    emitRegReg(0x01, src, dst);
}

void X64Encoder::sub(Reg dst, Reg src)
{
    emitRegReg(0x29, src, dst);
}

void X64Encoder::imul(Reg dst, Reg src)
{
    emitRex(true, num(dst), num(src));
    emit8(0x0F);
    emit8(0xAF);
    emit8(static_cast<uint8_t>(0xC0 | ((num(dst) & 7) << 3) | (num(src) & 7)));
}

void X64Encoder::cmp(Reg lhs, Reg rhs)
{
    emitRegReg(0x39, rhs, lhs);
}

void X64Encoder::test(Reg lhs, Reg rhs)
{
    emitRegReg(0x85, rhs, lhs);
}

void X64Encoder::addImm(Reg dst, int32_t imm)
{
    emitAluImm(0, dst, imm);
}

void X64Encoder::subImm(Reg dst, int32_t imm)
{
    emitAluImm(5, dst, imm);
}

void X64Encoder::cmpImm(Reg lhs, int32_t imm)
{
    emitAluImm(7, lhs, imm);
}

void X64Encoder::neg(Reg reg)
{
    emitRex(true, 0, num(reg));
    emit8(0xF7);
    emit8(static_cast<uint8_t>(0xD8 | (num(reg) & 7)));
}

void X64Encoder::cqo()
{
    emit8(0x48);
    emit8(0x99);
}

void X64Encoder::idiv(Reg divisor)
{
    emitRex(true, 0, num(divisor));
    emit8(0xF7);
    emit8(static_cast<uint8_t>(0xF8 | (num(divisor) & 7)));
}

void X64Encoder::div(Reg divisor)
{
    emitRex(true, 0, num(divisor));
    emit8(0xF7);
    emit8(static_cast<uint8_t>(0xF0 | (num(divisor) & 7)));
}

void X64Encoder::setcc(Cond cond, Reg dst)
{
    emitRex(false, 0, num(dst), needsRexForByte(dst));
    emit8(0x0F);
    emit8(static_cast<uint8_t>(0x90 | static_cast<uint8_t>(cond)));
    emit8(static_cast<uint8_t>(0xC0 | (num(dst) & 7)));

    // movzx dst, dst8
    emitRex(true, num(dst), num(dst));
    emit8(0x0F);
    emit8(0xB6);
    emit8(static_cast<uint8_t>(0xC0 | ((num(dst) & 7) << 3) | (num(dst) & 7)));
}

//-----------------------------------------------------------------------------
// Control flow
//-----------------------------------------------------------------------------

void X64Encoder::jmp(Label target)
{
    emit8(0xE9);
    emitLabelRel32(target);
}

void X64Encoder::jcc(Cond cond, Label target)
{
    emit8(0x0F);
    emit8(static_cast<uint8_t>(0x80 | static_cast<uint8_t>(cond)));
    emitLabelRel32(target);
}

void X64Encoder::call(Label target)
{
    emit8(0xE8);
    emitLabelRel32(target);
}

void X64Encoder::callImport(uint32_t slot)
{
    emit8(0xFF);
    emit8(0x15);
    importFixups_.push_back({bytes_.size(), slot});
    emit32(0);
}

void X64Encoder::ret()
{
    emit8(0xC3);
}

void X64Encoder::syscall()
{
    emit8(0x0F);
    emit8(0x05);
}

void X64Encoder::int3()
{
    emit8(0xCC);
}

} // namespace perc::codegen::x64
