//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/ISel.cpp
// Purpose: Frame-slot instruction selection from the IR to x86-64 machine code.
// Key invariants: rax, rcx and rdx are the only registers live across the
//                 selection of a single instruction; nothing survives between
//                 instructions except the frame contents.  rsp stays 16-byte
//                 aligned throughout every function body.
// Ownership/Lifetime: FunctionSelector borrows the encoder and the ABI for
//                     the duration of one function.
//
//===----------------------------------------------------------------------===//

#include "codegen/x86_64/ISel.hpp"
#include "codegen/x86_64/StdioHelpers.hpp"
#include "ir/Intrinsics.hpp"

#include <string>

namespace perc::codegen::x64
{

using perc::ir::Instr;
using perc::ir::IntrinsicId;
using perc::ir::Opcode;
using perc::support::Expected;
using perc::support::kCodegenError;
using perc::support::makeError;

namespace
{

constexpr uint32_t align8(uint32_t v)
{
    return (v + 7u) & ~7u;
}

/// \brief Append the length-prefixed string records and return their offsets.
std::vector<uint32_t> buildStringData(const perc::ir::Module &module, std::vector<uint8_t> &data)
{
    std::vector<uint32_t> offsets;
    offsets.reserve(module.strings.size());
    for (const auto &s : module.strings)
    {
        data.resize(align8(static_cast<uint32_t>(data.size())), 0);
        offsets.push_back(static_cast<uint32_t>(data.size()));
        const uint64_t len = s.size();
        for (int i = 0; i < 8; ++i)
            data.push_back(static_cast<uint8_t>(len >> (8 * i)));
        data.insert(data.end(), s.begin(), s.end());
    }
    return offsets;
}

Cond compareCond(Opcode op)
{
    switch (op)
    {
        case Opcode::Eq:
            return Cond::E;
        case Opcode::Ne:
            return Cond::NE;
        case Opcode::Lt:
            return Cond::L;
        case Opcode::Le:
            return Cond::LE;
        case Opcode::Gt:
            return Cond::G;
        default:
            return Cond::GE;
    }
}

/// \brief Selects one IR function into the shared encoder.
class FunctionSelector
{
  public:
    FunctionSelector(X64Encoder &enc,
                     const TargetAbi &abi,
                     const StdioHelpers &helpers,
                     const std::vector<Label> &functionLabels,
                     const std::vector<uint32_t> &stringOffsets,
                     uint32_t stringCount)
        : enc_(enc), abi_(abi), helpers_(helpers), functionLabels_(functionLabels),
          stringOffsets_(stringOffsets), stringCount_(stringCount)
    {
    }

    Expected<void> select(const perc::ir::Function &fn)
    {
        auto frame = layoutFrame(fn);
        if (!frame)
            return frame.error();
        frame_ = std::move(frame.value());

        labels_.clear();
        for (uint32_t i = 0; i < fn.labelCount; ++i)
            labels_.push_back(enc_.newLabel());

        emitPrologue(fn);
        for (const Instr &instr : fn.body)
        {
            if (auto ok = selectInstr(fn, instr); !ok)
                return ok;
        }
        return {};
    }

  private:
    void emitPrologue(const perc::ir::Function &fn)
    {
        enc_.push(Reg::RBP);
        enc_.movRegReg(Reg::RBP, Reg::RSP);
        abi_.emitParamSpill(enc_, fn.paramCount);
        abi_.emitFrameAlloc(enc_, frame_.frameSize);
        for (uint32_t i = 0; i < fn.paramCount; ++i)
        {
            enc_.load(Reg::RAX, Reg::RBP, static_cast<int32_t>(16 + 8 * i));
            enc_.store(Reg::RBP, frame_.localDisp[i], Reg::RAX);
        }
    }

    void emitEpilogue()
    {
        enc_.movRegReg(Reg::RSP, Reg::RBP);
        enc_.pop(Reg::RBP);
        enc_.ret();
    }

    void loadSlot(Reg dst, uint32_t slot)
    {
        enc_.load(dst, Reg::RBP, frame_.slotDisp[slot]);
    }

    void storeSlot(uint32_t slot, Reg src)
    {
        enc_.store(Reg::RBP, frame_.slotDisp[slot], src);
    }

    Expected<void> fail(const Instr &instr, const perc::ir::Function &fn, std::string msg)
    {
        return makeError(instr.loc, "in function '" + fn.name + "': " + msg, kCodegenError);
    }

    Expected<void> selectInstr(const perc::ir::Function &fn, const Instr &instr)
    {
        switch (instr.op)
        {
            case Opcode::Const:
                enc_.movRegImm(Reg::RAX, instr.imm);
                storeSlot(instr.dst, Reg::RAX);
                break;
            case Opcode::StrAddr:
                if (instr.index >= stringCount_)
                    return fail(instr, fn, "string constant out of range");
                enc_.leaData(Reg::RAX, stringOffsets_[instr.index]);
                storeSlot(instr.dst, Reg::RAX);
                break;
            case Opcode::LocalAddr:
                enc_.lea(Reg::RAX, Reg::RBP, frame_.localDisp[instr.index]);
                storeSlot(instr.dst, Reg::RAX);
                break;
            case Opcode::LoadLocal:
                enc_.load(Reg::RAX, Reg::RBP, frame_.localDisp[instr.index]);
                storeSlot(instr.dst, Reg::RAX);
                break;
            case Opcode::StoreLocal:
                loadSlot(Reg::RAX, instr.operands[0]);
                enc_.store(Reg::RBP, frame_.localDisp[instr.index], Reg::RAX);
                break;
            case Opcode::Load:
                loadSlot(Reg::RAX, instr.operands[0]);
                enc_.load(Reg::RAX, Reg::RAX, 0);
                storeSlot(instr.dst, Reg::RAX);
                break;
            case Opcode::Store:
                loadSlot(Reg::RAX, instr.operands[0]);
                loadSlot(Reg::RCX, instr.operands[1]);
                enc_.store(Reg::RAX, 0, Reg::RCX);
                break;
            case Opcode::Add:
            case Opcode::Sub:
            case Opcode::Mul:
                loadSlot(Reg::RAX, instr.operands[0]);
                loadSlot(Reg::RCX, instr.operands[1]);
                if (instr.op == Opcode::Add)
                    enc_.add(Reg::RAX, Reg::RCX);
                else if (instr.op == Opcode::Sub)
                    enc_.sub(Reg::RAX, Reg::RCX);
                else
                    enc_.imul(Reg::RAX, Reg::RCX);
                storeSlot(instr.dst, Reg::RAX);
                break;
            case Opcode::Div:
            case Opcode::Rem:
                loadSlot(Reg::RAX, instr.operands[0]);
                loadSlot(Reg::RCX, instr.operands[1]);
                enc_.cqo();
                enc_.idiv(Reg::RCX);
                storeSlot(instr.dst, instr.op == Opcode::Div ? Reg::RAX : Reg::RDX);
                break;
            case Opcode::Neg:
                loadSlot(Reg::RAX, instr.operands[0]);
                enc_.neg(Reg::RAX);
                storeSlot(instr.dst, Reg::RAX);
                break;
            case Opcode::Not:
                loadSlot(Reg::RAX, instr.operands[0]);
                enc_.test(Reg::RAX, Reg::RAX);
                enc_.setcc(Cond::E, Reg::RAX);
                storeSlot(instr.dst, Reg::RAX);
                break;
            case Opcode::Eq:
            case Opcode::Ne:
            case Opcode::Lt:
            case Opcode::Le:
            case Opcode::Gt:
            case Opcode::Ge:
                loadSlot(Reg::RAX, instr.operands[0]);
                loadSlot(Reg::RCX, instr.operands[1]);
                enc_.cmp(Reg::RAX, Reg::RCX);
                enc_.setcc(compareCond(instr.op), Reg::RAX);
                storeSlot(instr.dst, Reg::RAX);
                break;
            case Opcode::Label:
                enc_.bind(labels_[instr.index]);
                break;
            case Opcode::Jmp:
                enc_.jmp(labels_[instr.index]);
                break;
            case Opcode::Jz:
            case Opcode::Jnz:
                loadSlot(Reg::RAX, instr.operands[0]);
                enc_.test(Reg::RAX, Reg::RAX);
                enc_.jcc(instr.op == Opcode::Jz ? Cond::E : Cond::NE, labels_[instr.index]);
                break;
            case Opcode::Call:
            {
                if (instr.index >= functionLabels_.size())
                    return fail(instr, fn, "call to unknown function " + std::to_string(instr.index));
                std::vector<int32_t> argDisps;
                argDisps.reserve(instr.operands.size());
                for (uint32_t slot : instr.operands)
                    argDisps.push_back(frame_.slotDisp[slot]);
                abi_.emitCall(enc_, functionLabels_[instr.index], argDisps);
                if (instr.hasDst())
                    storeSlot(instr.dst, Reg::RAX);
                break;
            }
            case Opcode::Ret:
                if (!instr.operands.empty())
                    loadSlot(Reg::RAX, instr.operands[0]);
                emitEpilogue();
                break;
            case Opcode::Intrinsic:
                return selectIntrinsic(fn, instr);
        }
        return {};
    }

    Expected<void> selectIntrinsic(const perc::ir::Function &fn, const Instr &instr)
    {
        if (!instr.operands.empty())
            loadSlot(Reg::RDI, instr.operands[0]);

        switch (static_cast<IntrinsicId>(instr.index))
        {
            case IntrinsicId::Print:
                enc_.call(helpers_.printI64);
                break;
            case IntrinsicId::Println:
                enc_.call(helpers_.printI64);
                emitNewline();
                break;
            case IntrinsicId::PrintStr:
                enc_.call(helpers_.printStr);
                break;
            case IntrinsicId::PrintlnStr:
                enc_.call(helpers_.printStr);
                emitNewline();
                break;
            case IntrinsicId::PrintChar:
                enc_.call(helpers_.printChar);
                break;
            case IntrinsicId::ReadInt:
                enc_.call(helpers_.readInt);
                break;
            case IntrinsicId::ReadChar:
                enc_.call(helpers_.readChar);
                break;
            case IntrinsicId::ReadLine:
                enc_.call(helpers_.readLine);
                break;
            case IntrinsicId::Flush:
                // Output is unbuffered.
                break;
            default:
                return fail(instr, fn, "unknown intrinsic " + std::to_string(instr.index));
        }
        if (instr.hasDst())
            storeSlot(instr.dst, Reg::RAX);
        return {};
    }

    void emitNewline()
    {
        enc_.movRegImm(Reg::RDI, '\n');
        enc_.call(helpers_.printChar);
    }

    X64Encoder &enc_;
    const TargetAbi &abi_;
    const StdioHelpers &helpers_;
    const std::vector<Label> &functionLabels_;
    const std::vector<uint32_t> &stringOffsets_;
    uint32_t stringCount_;
    FrameLayout frame_;
    std::vector<Label> labels_;
};

} // namespace

Expected<FrameLayout> layoutFrame(const perc::ir::Function &fn)
{
    FrameLayout frame;
    int64_t cursor = 0;

    frame.localDisp.reserve(fn.localWords.size());
    for (uint64_t words : fn.localWords)
    {
        if (words > static_cast<uint64_t>(kMaxFrameBytes - cursor) / 8)
        {
            cursor = kMaxFrameBytes + 1;
            break;
        }
        cursor += 8 * static_cast<int64_t>(words);
        frame.localDisp.push_back(static_cast<int32_t>(-cursor));
    }

    frame.slotDisp.reserve(fn.slotCount);
    for (uint32_t i = 0; i < fn.slotCount && cursor <= kMaxFrameBytes; ++i)
    {
        cursor += 8;
        frame.slotDisp.push_back(static_cast<int32_t>(-cursor));
    }

    cursor = (cursor + 15) & ~int64_t{15};
    if (cursor > kMaxFrameBytes)
    {
        return makeError(fn.loc,
                         "stack frame of function '" + fn.name + "' exceeds " +
                             std::to_string(kMaxFrameBytes) + " bytes",
                         kCodegenError);
    }
    frame.frameSize = static_cast<uint32_t>(cursor);
    return frame;
}

Expected<MachineCode> selectModule(const perc::ir::Module &module, const TargetAbi &abi)
{
    if (module.entry >= module.functions.size())
        return makeError({}, "module has no entry function", kCodegenError);

    MachineCode out;
    std::vector<uint32_t> stringOffsets = buildStringData(module, out.data);
    out.bssOffset = align8(static_cast<uint32_t>(out.data.size()));
    out.bssSize = stdioHelpersBssSize();

    X64Encoder enc;
    std::vector<Label> functionLabels;
    functionLabels.reserve(module.functions.size());
    for (size_t i = 0; i < module.functions.size(); ++i)
        functionLabels.push_back(enc.newLabel());
    StdioHelpers helpers = declareStdioHelpers(enc);

    out.entryOffset = enc.size();
    abi.emitEntry(enc, functionLabels[module.entry]);

    FunctionSelector selector(enc,
                              abi,
                              helpers,
                              functionLabels,
                              stringOffsets,
                              static_cast<uint32_t>(module.strings.size()));
    for (size_t i = 0; i < module.functions.size(); ++i)
    {
        const auto &fn = module.functions[i];
        FunctionRange range;
        range.name = fn.name;
        range.begin = enc.size();
        enc.bind(functionLabels[i]);
        if (auto ok = selector.select(fn); !ok)
            return ok.error();
        range.end = enc.size();
        out.functions.push_back(std::move(range));
    }

    emitStdioHelpers(enc, abi, helpers, out.bssOffset);

    if (auto ok = enc.resolveLabels(); !ok)
        return ok.error();

    out.dataFixups = enc.dataFixups();
    out.importFixups = enc.importFixups();
    out.code = enc.takeBytes();
    return out;
}

} // namespace perc::codegen::x64
