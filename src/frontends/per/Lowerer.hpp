//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lowerer.hpp
/// @brief Lowers an analyzed Per program to the flat IR.
///
/// @details The lowerer walks the AST of every reachable function and emits a
/// linear instruction list per function.  It never reports errors: Sema has
/// already rejected every program the lowerer could not handle.
///
/// ## Control flow shapes
///
/// ```
/// if c {T} else {E}     for I; c; S {B}
///   jz c, .Lelse          I
///   T                   .Lhead:
///   jmp .Lend             jz c, .Lexit
/// .Lelse:                 B
///   E                     S
/// .Lend:                  jmp .Lhead
///                       .Lexit:
/// ```
///
/// `&&` and `||` evaluate their right operand only when needed and collect
/// the 0/1 result in a hidden frame local.
///
/// ## Storage
///
/// Parameters are frame locals 0..n-1, followed by every `var` in
/// declaration order and then the hidden locals the lowerer allocates.
/// Every expression result is a fresh slot.  Variables start out zeroed;
/// an array element `a[i]` lives at `addr a + i * 8`.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/per/AST.hpp"
#include "frontends/per/Sema.hpp"
#include "ir/Module.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace perc::frontends::per
{

class Lowerer
{
  public:
    explicit Lowerer(const SemanticModel &model);

    /// @brief Lower every reachable function of the model.
    perc::ir::Module lower();

    /// @brief Largest array zero-filled with straight-line stores.
    static constexpr int64_t kUnrolledZeroFillLimit = 8;

  private:
    using Opcode = perc::ir::Opcode;

    void lowerFunction(const CheckedFunction &checked, perc::ir::Function &fn);

    //=========================================================================
    /// @name Statements
    /// @{
    //=========================================================================

    void lowerBlock(const Block &block);
    void lowerStmt(const Stmt &stmt);
    void lowerVarDecl(const Stmt &stmt, const VarDecl &decl);
    void lowerAssignment(const Stmt &stmt, const Assignment &assign);
    void lowerIf(const Stmt &stmt, const If &s);
    void lowerFor(const Stmt &stmt, const For &s);
    void lowerReturn(const Stmt &stmt, const Return &ret);
    void zeroFill(uint32_t local, const Type &type, SourceLoc loc);

    /// @}
    //=========================================================================
    /// @name Expressions
    /// @{
    //=========================================================================

    /// @brief Lower @p expr and return the slot holding its value.
    uint32_t lowerExpr(const Expr &expr);

    /// @brief Lower an lvalue to the slot holding its address.
    uint32_t lowerAddress(const Expr &expr);

    uint32_t lowerBinary(const Expr &expr, const BinaryOp &op);
    uint32_t lowerShortCircuit(const Expr &expr, const BinaryOp &op);

    /// @brief Lower a call; returns kNoSlot when the callee yields no value.
    uint32_t lowerCall(const Expr &expr, const Call &call);

    /// @}
    //=========================================================================
    /// @name Emission
    /// @{
    //=========================================================================

    perc::ir::Instr &emit(Opcode op, SourceLoc loc);
    uint32_t emitValue(Opcode op, std::vector<uint32_t> operands, SourceLoc loc);
    uint32_t emitConst(int64_t value, SourceLoc loc);
    uint32_t emitLocalAddr(uint32_t local, SourceLoc loc);
    uint32_t emitLoadLocal(uint32_t local, SourceLoc loc);
    void emitStoreLocal(uint32_t local, uint32_t value, SourceLoc loc);
    void emitStore(uint32_t address, uint32_t value, SourceLoc loc);
    void emitLabel(uint32_t label, SourceLoc loc);
    void emitJump(uint32_t label, SourceLoc loc);
    void emitBranch(Opcode op, uint32_t cond, uint32_t label, SourceLoc loc);

    uint32_t newSlot();
    uint32_t newLabel();
    uint32_t newHiddenLocal();
    uint32_t internString(const std::string &bytes);

    /// @}

    const SemanticModel &model_;
    perc::ir::Module module_;

    /// @brief IR function index per checked function; -1 when unreachable.
    std::vector<int64_t> functionIds_;

    std::unordered_map<std::string, uint32_t> stringIds_;

    perc::ir::Function *fn_ = nullptr;
};

} // namespace perc::frontends::per
