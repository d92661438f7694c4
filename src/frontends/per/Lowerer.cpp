//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lowerer.cpp
/// @brief Function layout and instruction emission for the Per lowerer.
///
//===----------------------------------------------------------------------===//

#include "frontends/per/Lowerer.hpp"

namespace perc::frontends::per
{

using perc::ir::Instr;
using perc::ir::kNoSlot;

Lowerer::Lowerer(const SemanticModel &model) : model_(model) {}

perc::ir::Module Lowerer::lower()
{
    const auto &checked = model_.functions();

    // Number the reachable functions first so calls can refer forward.
    functionIds_.assign(checked.size(), -1);
    for (size_t i = 0; i < checked.size(); ++i)
    {
        if (!checked[i].reachable)
            continue;
        functionIds_[i] = static_cast<int64_t>(module_.functions.size());
        module_.functions.emplace_back();
    }
    module_.entry = static_cast<uint32_t>(functionIds_[model_.entry()]);

    for (size_t i = 0; i < checked.size(); ++i)
    {
        if (functionIds_[i] >= 0)
            lowerFunction(checked[i], module_.functions[functionIds_[i]]);
    }
    return std::move(module_);
}

void Lowerer::lowerFunction(const CheckedFunction &checked, perc::ir::Function &fn)
{
    fn_ = &fn;
    fn.name = checked.symbol;
    fn.loc = checked.decl->loc;
    fn.paramCount = static_cast<uint32_t>(checked.decl->params.size());
    fn.returnsValue = !checked.returnType->isVoid();
    for (const auto &local : checked.locals)
        fn.localWords.push_back(frameWords(*local.type));

    lowerBlock(checked.decl->body);

    // Falling off the end returns 0 from value-returning functions.
    if (fn.body.empty() || fn.body.back().op != Opcode::Ret)
    {
        uint32_t zero = fn.returnsValue ? emitConst(0, checked.decl->loc) : kNoSlot;
        Instr &ret = emit(Opcode::Ret, checked.decl->loc);
        if (zero != kNoSlot)
            ret.operands.push_back(zero);
    }
    fn_ = nullptr;
}

//=============================================================================
// Emission helpers
//=============================================================================

Instr &Lowerer::emit(Opcode op, SourceLoc loc)
{
    Instr instr;
    instr.op = op;
    instr.loc = loc;
    fn_->body.push_back(std::move(instr));
    return fn_->body.back();
}

uint32_t Lowerer::emitValue(Opcode op, std::vector<uint32_t> operands, SourceLoc loc)
{
    uint32_t dst = newSlot();
    Instr &instr = emit(op, loc);
    instr.dst = dst;
    instr.operands = std::move(operands);
    return dst;
}

uint32_t Lowerer::emitConst(int64_t value, SourceLoc loc)
{
    uint32_t dst = newSlot();
    Instr &instr = emit(Opcode::Const, loc);
    instr.dst = dst;
    instr.imm = value;
    return dst;
}

uint32_t Lowerer::emitLocalAddr(uint32_t local, SourceLoc loc)
{
    uint32_t dst = newSlot();
    Instr &instr = emit(Opcode::LocalAddr, loc);
    instr.dst = dst;
    instr.index = local;
    return dst;
}

uint32_t Lowerer::emitLoadLocal(uint32_t local, SourceLoc loc)
{
    uint32_t dst = newSlot();
    Instr &instr = emit(Opcode::LoadLocal, loc);
    instr.dst = dst;
    instr.index = local;
    return dst;
}

void Lowerer::emitStoreLocal(uint32_t local, uint32_t value, SourceLoc loc)
{
    Instr &instr = emit(Opcode::StoreLocal, loc);
    instr.index = local;
    instr.operands.push_back(value);
}

void Lowerer::emitStore(uint32_t address, uint32_t value, SourceLoc loc)
{
    emit(Opcode::Store, loc).operands = {address, value};
}

void Lowerer::emitLabel(uint32_t label, SourceLoc loc)
{
    emit(Opcode::Label, loc).index = label;
}

void Lowerer::emitJump(uint32_t label, SourceLoc loc)
{
    emit(Opcode::Jmp, loc).index = label;
}

void Lowerer::emitBranch(Opcode op, uint32_t cond, uint32_t label, SourceLoc loc)
{
    Instr &instr = emit(op, loc);
    instr.operands.push_back(cond);
    instr.index = label;
}

uint32_t Lowerer::newSlot()
{
    return fn_->slotCount++;
}

uint32_t Lowerer::newLabel()
{
    return fn_->labelCount++;
}

uint32_t Lowerer::newHiddenLocal()
{
    fn_->localWords.push_back(1);
    return static_cast<uint32_t>(fn_->localWords.size() - 1);
}

uint32_t Lowerer::internString(const std::string &bytes)
{
    auto it = stringIds_.find(bytes);
    if (it != stringIds_.end())
        return it->second;
    uint32_t id = static_cast<uint32_t>(module_.strings.size());
    module_.strings.push_back(bytes);
    stringIds_.emplace(bytes, id);
    return id;
}

} // namespace perc::frontends::per
