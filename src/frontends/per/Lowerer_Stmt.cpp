//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lowerer_Stmt.cpp
/// @brief Statement lowering for the Per lowerer.
///
//===----------------------------------------------------------------------===//

#include "frontends/per/Lowerer.hpp"
#include "support/overload.hpp"

namespace perc::frontends::per
{

using perc::support::Overload;

void Lowerer::lowerBlock(const Block &block)
{
    for (const auto &stmt : block.stmts)
        lowerStmt(*stmt);
}

void Lowerer::lowerStmt(const Stmt &stmt)
{
    std::visit(Overload{
                   [&](const Block &block) { lowerBlock(block); },
                   [&](const VarDecl &decl) { lowerVarDecl(stmt, decl); },
                   [&](const Assignment &assign) { lowerAssignment(stmt, assign); },
                   [&](const If &s) { lowerIf(stmt, s); },
                   [&](const For &s) { lowerFor(stmt, s); },
                   [&](const Return &ret) { lowerReturn(stmt, ret); },
                   [&](const ExprStmt &s) { lowerExpr(*s.expr); },
               },
               stmt.node);
}

void Lowerer::lowerVarDecl(const Stmt &stmt, const VarDecl &decl)
{
    uint32_t local = *model_.localOf(&stmt);
    if (decl.init)
    {
        uint32_t value = lowerExpr(*decl.init);
        emitStoreLocal(local, value, stmt.loc);
        return;
    }
    zeroFill(local, *decl.declaredType, stmt.loc);
}

void Lowerer::zeroFill(uint32_t local, const Type &type, SourceLoc loc)
{
    if (!type.isArray())
    {
        uint32_t zero = emitConst(0, loc);
        emitStoreLocal(local, zero, loc);
        return;
    }

    if (type.length <= kUnrolledZeroFillLimit)
    {
        uint32_t base = emitLocalAddr(local, loc);
        uint32_t zero = emitConst(0, loc);
        for (int64_t i = 0; i < type.length; ++i)
        {
            uint32_t target = base;
            if (i != 0)
            {
                uint32_t offset = emitConst(i * 8, loc);
                target = emitValue(Opcode::Add, {base, offset}, loc);
            }
            emitStore(target, zero, loc);
        }
        return;
    }

    // Larger arrays: a counted loop over a hidden index local.
    uint32_t counter = newHiddenLocal();
    uint32_t head = newLabel();
    uint32_t exit = newLabel();

    emitStoreLocal(counter, emitConst(0, loc), loc);
    emitLabel(head, loc);
    uint32_t i = emitLoadLocal(counter, loc);
    uint32_t length = emitConst(type.length, loc);
    uint32_t more = emitValue(Opcode::Lt, {i, length}, loc);
    emitBranch(Opcode::Jz, more, exit, loc);

    uint32_t base = emitLocalAddr(local, loc);
    uint32_t eight = emitConst(8, loc);
    uint32_t offset = emitValue(Opcode::Mul, {i, eight}, loc);
    uint32_t target = emitValue(Opcode::Add, {base, offset}, loc);
    emitStore(target, emitConst(0, loc), loc);

    uint32_t one = emitConst(1, loc);
    emitStoreLocal(counter, emitValue(Opcode::Add, {i, one}, loc), loc);
    emitJump(head, loc);
    emitLabel(exit, loc);
}

void Lowerer::lowerAssignment(const Stmt &stmt, const Assignment &assign)
{
    if (std::holds_alternative<Identifier>(assign.target->node))
    {
        uint32_t value = lowerExpr(*assign.value);
        emitStoreLocal(*model_.localOf(assign.target.get()), value, stmt.loc);
        return;
    }

    uint32_t address = lowerAddress(*assign.target);
    uint32_t value = lowerExpr(*assign.value);
    emitStore(address, value, stmt.loc);
}

void Lowerer::lowerIf(const Stmt &stmt, const If &s)
{
    uint32_t cond = lowerExpr(*s.cond);

    if (!s.elseBody)
    {
        uint32_t end = newLabel();
        emitBranch(Opcode::Jz, cond, end, stmt.loc);
        lowerBlock(s.thenBody);
        emitLabel(end, stmt.loc);
        return;
    }

    uint32_t elseLabel = newLabel();
    uint32_t end = newLabel();
    emitBranch(Opcode::Jz, cond, elseLabel, stmt.loc);
    lowerBlock(s.thenBody);
    emitJump(end, stmt.loc);
    emitLabel(elseLabel, stmt.loc);
    lowerBlock(*s.elseBody);
    emitLabel(end, stmt.loc);
}

void Lowerer::lowerFor(const Stmt &stmt, const For &s)
{
    if (s.init)
        lowerStmt(*s.init);

    uint32_t head = newLabel();
    uint32_t exit = newLabel();
    emitLabel(head, stmt.loc);
    if (s.cond)
    {
        uint32_t cond = lowerExpr(*s.cond);
        emitBranch(Opcode::Jz, cond, exit, stmt.loc);
    }
    lowerBlock(s.body);
    if (s.step)
        lowerStmt(*s.step);
    emitJump(head, stmt.loc);
    emitLabel(exit, stmt.loc);
}

void Lowerer::lowerReturn(const Stmt &stmt, const Return &ret)
{
    if (!ret.value)
    {
        emit(Opcode::Ret, stmt.loc);
        return;
    }
    uint32_t value = lowerExpr(*ret.value);
    emit(Opcode::Ret, stmt.loc).operands.push_back(value);
}

} // namespace perc::frontends::per
