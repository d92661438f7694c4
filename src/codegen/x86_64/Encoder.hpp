//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/Encoder.hpp
// Purpose: Binary encoder for the x86-64 instructions the instruction
//          selector and the stdio helpers use.
// Key invariants: Every rel32 field is either a bound label (patched by
//                 resolveLabels), a data reference or an import slot (patched
//                 by the container writer).  All memory operands are 64-bit
//                 unless the method name says Byte.
// Ownership/Lifetime: The encoder owns its byte buffer; callers move it out
//                     with takeBytes() after resolveLabels().
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace perc::codegen::x64
{

/// \brief General-purpose registers in hardware encoding order.
enum class Reg : uint8_t
{
    RAX = 0,
    RCX = 1,
    RDX = 2,
    RBX = 3,
    RSP = 4,
    RBP = 5,
    RSI = 6,
    RDI = 7,
    R8 = 8,
    R9 = 9,
    R10 = 10,
    R11 = 11,
    R12 = 12,
    R13 = 13,
    R14 = 14,
    R15 = 15,
};

/// \brief Condition codes as encoded in Jcc/SETcc.
enum class Cond : uint8_t
{
    B = 0x2,
    AE = 0x3,
    E = 0x4,
    NE = 0x5,
    BE = 0x6,
    A = 0x7,
    L = 0xC,
    GE = 0xD,
    LE = 0xE,
    G = 0xF,
};

/// \brief Canonical Intel name of a register ("rax").
[[nodiscard]] const char *regName(Reg reg) noexcept;

/// \brief A code position that branches may target before it is bound.
struct Label
{
    uint32_t id = 0;
};

/// \brief A rel32 field that refers outside the code buffer.
/// \details `target` is a byte offset into the data image for data
///          references and an import slot index for import calls.
struct Rel32Fixup
{
    size_t at = 0;
    uint32_t target = 0;
};

class X64Encoder
{
  public:
    //-------------------------------------------------------------------------
    // Labels
    //-------------------------------------------------------------------------

    Label newLabel();
    void bind(Label label);
    [[nodiscard]] bool isBound(Label label) const;
    [[nodiscard]] size_t offsetOf(Label label) const;

    /// \brief Patch every branch and call to a label.
    /// \return CodegenError when a referenced label was never bound.
    perc::support::Expected<void> resolveLabels();

    //-------------------------------------------------------------------------
    // Data movement
    //-------------------------------------------------------------------------

    void movRegReg(Reg dst, Reg src);

    /// \brief Load an immediate; uses the short sign-extended form when it fits.
    void movRegImm(Reg dst, int64_t imm);

    void load(Reg dst, Reg base, int32_t disp);
    void store(Reg base, int32_t disp, Reg src);
    void storeImm(Reg base, int32_t disp, int32_t imm);
    void lea(Reg dst, Reg base, int32_t disp);
    void loadByteZx(Reg dst, Reg base, int32_t disp);
    void storeByte(Reg base, int32_t disp, Reg src);
    void storeByteImm(Reg base, int32_t disp, uint8_t imm);

    /// \brief `lea dst, [rip + data]`; records a data fixup.
    void leaData(Reg dst, uint32_t dataOffset);

    void push(Reg reg);
    void pop(Reg reg);

    //-------------------------------------------------------------------------
    // Arithmetic
    //-------------------------------------------------------------------------

    void add(Reg dst, Reg src);
    void sub(Reg dst, Reg src);
    void imul(Reg dst, Reg src);
    void cmp(Reg lhs, Reg rhs);
    void test(Reg lhs, Reg rhs);
    void addImm(Reg dst, int32_t imm);
    void subImm(Reg dst, int32_t imm);
    void cmpImm(Reg lhs, int32_t imm);
    void neg(Reg reg);
    void cqo();
    void idiv(Reg divisor);
    void div(Reg divisor);

    /// \brief `setcc dst8; movzx dst, dst8`.
    void setcc(Cond cond, Reg dst);

    //-------------------------------------------------------------------------
    // Control flow
    //-------------------------------------------------------------------------

    void jmp(Label target);
    void jcc(Cond cond, Label target);
    void call(Label target);

    /// \brief `call qword [rip + import slot]`; records an import fixup.
    void callImport(uint32_t slot);

    void ret();
    void syscall();
    void int3();

    //-------------------------------------------------------------------------
    // Output
    //-------------------------------------------------------------------------

    [[nodiscard]] size_t size() const
    {
        return bytes_.size();
    }

    [[nodiscard]] const std::vector<uint8_t> &bytes() const
    {
        return bytes_;
    }

    std::vector<uint8_t> takeBytes()
    {
        return std::move(bytes_);
    }

    [[nodiscard]] const std::vector<Rel32Fixup> &dataFixups() const
    {
        return dataFixups_;
    }

    [[nodiscard]] const std::vector<Rel32Fixup> &importFixups() const
    {
        return importFixups_;
    }

  private:
    void emit8(uint8_t v);
    void emit32(uint32_t v);
    void emit64(uint64_t v);

    /// \brief Emit a REX prefix; `force` emits 0x40 for byte access to sil/dil.
    void emitRex(bool w, uint8_t reg, uint8_t rm, bool force = false);

    /// \brief ModRM (+SIB, +displacement) for `[base + disp]`.
    void emitMem(uint8_t reg, Reg base, int32_t disp);

    /// \brief REX.W op /r with both operands registers.
    void emitRegReg(uint8_t opcode, Reg reg, Reg rm);

    /// \brief REX.W 81 /ext id.
    void emitAluImm(uint8_t ext, Reg dst, int32_t imm);

    /// \brief Emit a zero rel32 field bound to @p target.
    void emitLabelRel32(Label target);

    std::vector<uint8_t> bytes_;
    std::vector<int64_t> labelOffsets_;
    std::vector<Rel32Fixup> labelFixups_;
    std::vector<Rel32Fixup> dataFixups_;
    std::vector<Rel32Fixup> importFixups_;
};

} // namespace perc::codegen::x64
