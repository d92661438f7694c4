//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/NvmWriter.cpp
// Purpose: Implementation of the NVM bytecode encoder.
// Key invariants: Each function's branches are patched once its labels are
//                 all bound; unbound labels are reported, never left zero.
// Ownership: See NvmWriter.hpp.
// Lifetime: N/A.
// Links: Nvm.hpp
//
//===----------------------------------------------------------------------===//

#include "bytecode/NvmWriter.hpp"
#include "bytecode/Nvm.hpp"
#include "codegen/common/ByteWriter.hpp"

#include <string>
#include <utility>

namespace perc::bytecode
{

using perc::codegen::common::ByteWriter;
using perc::ir::Instr;
using perc::ir::Opcode;
using perc::support::Expected;
using perc::support::kCodegenError;
using perc::support::makeError;

namespace
{

struct EncodedFunction
{
    uint32_t codeOffset = 0;
    uint16_t params = 0;
    uint16_t frameWords = 0;
};

class FunctionEncoder
{
  public:
    explicit FunctionEncoder(std::vector<uint8_t> &code) : code_(code), w_(code) {}

    Expected<EncodedFunction> encode(const perc::ir::Function &fn)
    {
        const uint64_t frameWords = fn.frameWords();
        if (frameWords > kMaxFrameWords)
        {
            return makeError(fn.loc,
                             "function '" + fn.name + "' needs " + std::to_string(frameWords) +
                                 " frame words; bytecode frames are limited to " +
                                 std::to_string(kMaxFrameWords),
                             kCodegenError);
        }
        if (fn.paramCount > 0xFFFF)
        {
            return makeError(
                fn.loc, "function '" + fn.name + "' has too many parameters", kCodegenError);
        }

        // Word offset of each local; parameters occupy words 0..paramCount-1.
        localWord_.clear();
        uint32_t cursor = 0;
        for (uint64_t words : fn.localWords)
        {
            localWord_.push_back(cursor);
            cursor += static_cast<uint32_t>(words);
        }

        labelOffsets_.assign(fn.labelCount, -1);
        fixups_.clear();

        EncodedFunction out;
        out.codeOffset = static_cast<uint32_t>(code_.size());
        out.params = static_cast<uint16_t>(fn.paramCount);
        out.frameWords = static_cast<uint16_t>(frameWords);

        for (const Instr &instr : fn.body)
        {
            if (auto ok = encodeInstr(fn, instr); !ok)
                return ok.error();
        }

        for (const auto &[at, label] : fixups_)
        {
            if (label >= labelOffsets_.size() || labelOffsets_[label] < 0)
            {
                return makeError(fn.loc,
                                 "function '" + fn.name + "' branches to unbound label " +
                                     std::to_string(label),
                                 kCodegenError);
            }
            w_.patch32(at, static_cast<uint32_t>(labelOffsets_[label]));
        }
        return out;
    }

  private:
    void op(Opcode opcode)
    {
        w_.u8(opcodeByte(opcode));
    }

    void target(uint32_t label)
    {
        fixups_.emplace_back(code_.size(), label);
        w_.u32(0);
    }

    Expected<void> args(const perc::ir::Function &fn, const Instr &instr)
    {
        if (instr.operands.size() > kMaxCallArgs)
        {
            return makeError(instr.loc,
                             "call in function '" + fn.name + "' passes " +
                                 std::to_string(instr.operands.size()) +
                                 " arguments; bytecode calls are limited to " +
                                 std::to_string(kMaxCallArgs),
                             kCodegenError);
        }
        w_.u8(static_cast<uint8_t>(instr.operands.size()));
        for (uint32_t slot : instr.operands)
            w_.u32(slot);
        return {};
    }

    Expected<void> encodeInstr(const perc::ir::Function &fn, const Instr &instr)
    {
        switch (instr.op)
        {
            case Opcode::Label:
                if (instr.index < labelOffsets_.size())
                    labelOffsets_[instr.index] = static_cast<int64_t>(code_.size());
                return {};
            case Opcode::Const:
                op(instr.op);
                w_.u32(instr.dst);
                w_.i64(instr.imm);
                return {};
            case Opcode::StrAddr:
                op(instr.op);
                w_.u32(instr.dst);
                w_.u32(instr.index);
                return {};
            case Opcode::LocalAddr:
            case Opcode::LoadLocal:
                op(instr.op);
                w_.u32(instr.dst);
                w_.u32(localWord_[instr.index]);
                return {};
            case Opcode::StoreLocal:
                op(instr.op);
                w_.u32(localWord_[instr.index]);
                w_.u32(instr.operands[0]);
                return {};
            case Opcode::Store:
                op(instr.op);
                w_.u32(instr.operands[0]);
                w_.u32(instr.operands[1]);
                return {};
            case Opcode::Jmp:
                op(instr.op);
                target(instr.index);
                return {};
            case Opcode::Jz:
            case Opcode::Jnz:
                op(instr.op);
                w_.u32(instr.operands[0]);
                target(instr.index);
                return {};
            case Opcode::Call:
                op(instr.op);
                w_.u32(instr.hasDst() ? instr.dst : kNvmNoDst);
                w_.u32(instr.index);
                return args(fn, instr);
            case Opcode::Intrinsic:
                op(instr.op);
                w_.u32(instr.hasDst() ? instr.dst : kNvmNoDst);
                w_.u16(static_cast<uint16_t>(instr.index));
                return args(fn, instr);
            case Opcode::Ret:
                op(instr.op);
                w_.u8(instr.operands.empty() ? 0 : 1);
                w_.u32(instr.operands.empty() ? 0 : instr.operands[0]);
                return {};
            default:
                // load, arithmetic, comparisons, neg, not: dst then sources.
                op(instr.op);
                w_.u32(instr.dst);
                for (uint32_t slot : instr.operands)
                    w_.u32(slot);
                return {};
        }
    }

    std::vector<uint8_t> &code_;
    ByteWriter w_;
    std::vector<uint32_t> localWord_;
    std::vector<int64_t> labelOffsets_;
    std::vector<std::pair<size_t, uint32_t>> fixups_;
};

} // namespace

Expected<std::vector<uint8_t>> encodeModule(const perc::ir::Module &module)
{
    if (module.entry >= module.functions.size())
        return makeError({}, "module has no entry function", kCodegenError);

    std::vector<uint8_t> code;
    std::vector<EncodedFunction> encoded;
    encoded.reserve(module.functions.size());
    FunctionEncoder encoder(code);
    for (const auto &fn : module.functions)
    {
        auto result = encoder.encode(fn);
        if (!result)
            return result.error();
        encoded.push_back(result.value());
    }

    std::vector<uint8_t> pool;
    ByteWriter pw(pool);
    for (const auto &s : module.strings)
    {
        pw.u8(kConstString);
        pw.u32(static_cast<uint32_t>(s.size()));
        pw.text(s);
    }

    std::vector<uint8_t> out;
    ByteWriter w(out);
    w.text(kNvmMagic);
    w.u16(kNvmVersion);
    w.u16(0);
    w.u32(encoded[module.entry].codeOffset);
    w.u32(static_cast<uint32_t>(pool.size()));
    w.u32(static_cast<uint32_t>(module.functions.size()));
    w.u32(static_cast<uint32_t>(code.size()));
    w.bytes(pool);

    for (size_t i = 0; i < module.functions.size(); ++i)
    {
        const auto &fn = module.functions[i];
        w.u32(encoded[i].codeOffset);
        w.u16(encoded[i].params);
        w.u16(encoded[i].frameWords);
        w.u32(fn.slotCount);
        w.u32(static_cast<uint32_t>(fn.name.size()));
        w.text(fn.name);
    }

    w.bytes(code);
    return out;
}

} // namespace perc::bytecode
