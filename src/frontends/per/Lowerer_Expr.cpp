//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lowerer_Expr.cpp
/// @brief Expression, lvalue and call lowering for the Per lowerer.
///
//===----------------------------------------------------------------------===//

#include "frontends/per/Lowerer.hpp"
#include "support/overload.hpp"

namespace perc::frontends::per
{

using perc::ir::Instr;
using perc::ir::kNoSlot;
using perc::support::Overload;

namespace
{

perc::ir::Opcode binaryOpcode(BinaryOpKind op)
{
    using perc::ir::Opcode;
    switch (op)
    {
        case BinaryOpKind::Add:
            return Opcode::Add;
        case BinaryOpKind::Sub:
            return Opcode::Sub;
        case BinaryOpKind::Mul:
            return Opcode::Mul;
        case BinaryOpKind::Div:
            return Opcode::Div;
        case BinaryOpKind::Rem:
            return Opcode::Rem;
        case BinaryOpKind::Eq:
            return Opcode::Eq;
        case BinaryOpKind::Ne:
            return Opcode::Ne;
        case BinaryOpKind::Lt:
            return Opcode::Lt;
        case BinaryOpKind::Le:
            return Opcode::Le;
        case BinaryOpKind::Gt:
            return Opcode::Gt;
        case BinaryOpKind::Ge:
            return Opcode::Ge;
        case BinaryOpKind::And:
        case BinaryOpKind::Or:
            break;
    }
    return Opcode::Add;
}

} // namespace

uint32_t Lowerer::lowerExpr(const Expr &expr)
{
    return std::visit(
        Overload{
            [&](const IntLiteral &e) { return emitConst(e.value, expr.loc); },
            [&](const StringLiteral &e)
            {
                uint32_t dst = newSlot();
                Instr &instr = emit(Opcode::StrAddr, expr.loc);
                instr.dst = dst;
                instr.index = internString(e.value);
                return dst;
            },
            [&](const Identifier &)
            { return emitLoadLocal(*model_.localOf(&expr), expr.loc); },
            [&](const BinaryOp &e) { return lowerBinary(expr, e); },
            [&](const UnaryOp &e)
            {
                uint32_t operand = lowerExpr(*e.operand);
                return emitValue(e.op == UnaryOpKind::Neg ? Opcode::Neg : Opcode::Not,
                                 {operand},
                                 expr.loc);
            },
            [&](const AddressOf &e) { return lowerAddress(*e.operand); },
            [&](const Deref &e)
            {
                uint32_t pointer = lowerExpr(*e.operand);
                return emitValue(Opcode::Load, {pointer}, expr.loc);
            },
            [&](const ArrayIndex &)
            {
                uint32_t address = lowerAddress(expr);
                return emitValue(Opcode::Load, {address}, expr.loc);
            },
            [&](const Call &e) { return lowerCall(expr, e); },
        },
        expr.node);
}

uint32_t Lowerer::lowerAddress(const Expr &expr)
{
    if (std::holds_alternative<Identifier>(expr.node))
        return emitLocalAddr(*model_.localOf(&expr), expr.loc);

    if (const auto *deref = std::get_if<Deref>(&expr.node))
        return lowerExpr(*deref->operand);

    const auto &index = std::get<ArrayIndex>(expr.node);
    uint32_t base = lowerAddress(*index.base);
    uint32_t i = lowerExpr(*index.index);
    uint32_t eight = emitConst(8, expr.loc);
    uint32_t offset = emitValue(Opcode::Mul, {i, eight}, expr.loc);
    return emitValue(Opcode::Add, {base, offset}, expr.loc);
}

uint32_t Lowerer::lowerBinary(const Expr &expr, const BinaryOp &op)
{
    if (op.op == BinaryOpKind::And || op.op == BinaryOpKind::Or)
        return lowerShortCircuit(expr, op);

    uint32_t lhs = lowerExpr(*op.lhs);
    uint32_t rhs = lowerExpr(*op.rhs);
    return emitValue(binaryOpcode(op.op), {lhs, rhs}, expr.loc);
}

uint32_t Lowerer::lowerShortCircuit(const Expr &expr, const BinaryOp &op)
{
    // a && b: both operands non-zero gives 1; a || b: either non-zero gives 1.
    const bool isAnd = op.op == BinaryOpKind::And;
    const Opcode skip = isAnd ? Opcode::Jz : Opcode::Jnz;

    uint32_t result = newHiddenLocal();
    uint32_t decided = newLabel();
    uint32_t end = newLabel();

    uint32_t lhs = lowerExpr(*op.lhs);
    emitBranch(skip, lhs, decided, expr.loc);
    uint32_t rhs = lowerExpr(*op.rhs);
    emitBranch(skip, rhs, decided, expr.loc);
    emitStoreLocal(result, emitConst(isAnd ? 1 : 0, expr.loc), expr.loc);
    emitJump(end, expr.loc);

    emitLabel(decided, expr.loc);
    emitStoreLocal(result, emitConst(isAnd ? 0 : 1, expr.loc), expr.loc);
    emitLabel(end, expr.loc);
    return emitLoadLocal(result, expr.loc);
}

uint32_t Lowerer::lowerCall(const Expr &expr, const Call &call)
{
    const CallTarget &target = *model_.callTarget(&expr);

    std::vector<uint32_t> args;
    args.reserve(call.args.size());
    for (const auto &arg : call.args)
        args.push_back(lowerExpr(*arg));

    uint32_t dst = target.returnType->isVoid() ? kNoSlot : newSlot();
    if (target.kind == CallTarget::Kind::Intrinsic)
    {
        Instr &instr = emit(Opcode::Intrinsic, expr.loc);
        instr.dst = dst;
        instr.index = static_cast<uint32_t>(target.intrinsic);
        instr.operands = std::move(args);
    }
    else
    {
        Instr &instr = emit(Opcode::Call, expr.loc);
        instr.dst = dst;
        instr.index = static_cast<uint32_t>(functionIds_[target.function]);
        instr.operands = std::move(args);
    }
    return dst;
}

} // namespace perc::frontends::per
