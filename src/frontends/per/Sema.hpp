//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Sema.hpp
/// @brief Name resolution and type checking for Per programs.
///
/// @details The analyzer never modifies the AST.  Its result is a
/// SemanticModel: side tables keyed by node address that record the type of
/// every expression, the frame local every variable reference binds to, and
/// the target of every call.
///
/// ## Phases
///
/// **Phase 1: Signatures**
/// - Registers every function of the root program and of every loaded
///   library module, so calls may refer forward.
/// - Validates parameter and return types and the shape of `main`.
///
/// **Phase 2: Bodies**
/// - Checks each body in a fresh function scope.  Blocks push nested scopes
///   onto an arena of Scope records that link to their parent by index.
///
/// **Phase 3: Reachability**
/// - Marks the root program's functions and every library function they
///   reach through calls.  Only reachable functions are lowered.
///
/// ## Errors
///
/// Analysis stops at the first TypeError (code P3000).
///
/// ```cpp
/// Sema sema(diag);
/// if (sema.analyze(*program, table))
///     Lowerer(sema.model()).lower();
/// ```
///
/// @invariant Every local id recorded in the model indexes the `locals` of
///            the function whose body contains the node.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/per/AST.hpp"
#include "frontends/per/ModuleTable.hpp"
#include "frontends/per/Symbols.hpp"
#include "ir/Intrinsics.hpp"
#include "support/diagnostics.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace perc::frontends::per
{

//===----------------------------------------------------------------------===//
/// @name Semantic model
/// @{
//===----------------------------------------------------------------------===//

/// @brief Resolved target of a call expression.
struct CallTarget
{
    enum class Kind
    {
        Function,
        Intrinsic,
    };

    Kind kind = Kind::Function;

    /// @brief Index into SemanticModel::functions() for Kind::Function.
    size_t function = 0;

    /// @brief Intrinsic id for Kind::Intrinsic.
    perc::ir::IntrinsicId intrinsic = perc::ir::IntrinsicId::Print;

    TypeRef returnType;
};

/// @brief A frame local of a checked function.
struct LocalInfo
{
    std::string name;
    TypeRef type;
    SourceLoc loc;
    bool isParam = false;
};

/// @brief A function whose signature and body passed analysis.
struct CheckedFunction
{
    const FunctionDecl *decl = nullptr;

    /// @brief IR name: "main" for root functions, "math.Abs" for library ones.
    std::string symbol;

    /// @brief Owning library module; empty for the root program.
    std::string module;

    /// @brief Parameters first, then every `var` in declaration order.
    std::vector<LocalInfo> locals;

    TypeRef returnType;

    /// @brief Indices of the functions this body calls.
    std::vector<size_t> callees;

    /// @brief Reached from the root program.
    bool reachable = false;
};

class SemanticModel
{
  public:
    /// @brief Type of @p expr, or null if it was never analyzed.
    [[nodiscard]] TypeRef typeOf(const Expr *expr) const;

    /// @brief Local id an Identifier expression refers to.
    [[nodiscard]] std::optional<uint32_t> localOf(const Expr *expr) const;

    /// @brief Local id a VarDecl statement introduces.
    [[nodiscard]] std::optional<uint32_t> localOf(const Stmt *stmt) const;

    /// @brief Target of a Call expression.
    [[nodiscard]] const CallTarget *callTarget(const Expr *expr) const;

    [[nodiscard]] const std::vector<CheckedFunction> &functions() const
    {
        return functions_;
    }

    /// @brief Index of `main` in functions().
    [[nodiscard]] size_t entry() const
    {
        return entry_;
    }

  private:
    friend class Sema;

    std::unordered_map<const Expr *, TypeRef> exprTypes_;
    std::unordered_map<const Expr *, uint32_t> identLocals_;
    std::unordered_map<const Stmt *, uint32_t> varLocals_;
    std::unordered_map<const Expr *, CallTarget> calls_;
    std::vector<CheckedFunction> functions_;
    size_t entry_ = 0;
};

/// @}

//===----------------------------------------------------------------------===//
/// @name Analyzer
/// @{
//===----------------------------------------------------------------------===//

class Sema
{
  public:
    explicit Sema(perc::support::DiagnosticEngine &diag);

    /// @brief Analyze @p root against the loaded library modules.
    /// @return True when no error was reported.
    bool analyze(const Program &root, const ModuleTable &table);

    /// @brief Result of a successful analyze().
    [[nodiscard]] const SemanticModel &model() const
    {
        return model_;
    }

  private:
    /// @brief One lexical scope; `parent` is an index into scopes_ or -1.
    struct Scope
    {
        int parent = -1;
        std::unordered_map<std::string, Symbol> symbols;
    };

    //=========================================================================
    /// @name Declarations
    /// @{
    //=========================================================================

    bool declareFunctions(const Program &program, const ModuleInfo *module);
    bool checkSignature(const FunctionDecl &fn, const std::string &module, CheckedFunction &out);
    bool checkMain(const Program &root);
    bool checkBody(size_t index);
    void markReachable();

    /// @brief Reject array and void forms that have no storage layout.
    bool checkStorableType(const TypeRef &type, SourceLoc loc, const std::string &what);

    /// @}
    //=========================================================================
    /// @name Statements
    /// @{
    //=========================================================================

    bool checkBlock(const Block &block);
    bool checkStmt(const Stmt &stmt);
    bool checkVarDecl(const Stmt &stmt, const VarDecl &decl);
    bool checkAssignment(const Assignment &assign);
    bool checkIf(const If &stmt);
    bool checkFor(const For &stmt);
    bool checkReturn(const Stmt &stmt, const Return &ret);
    bool checkExprStmt(const ExprStmt &stmt);
    bool checkCondition(const Expr &cond, const char *construct);

    /// @}
    //=========================================================================
    /// @name Expressions
    /// @{
    //=========================================================================

    /// @brief Analyze @p expr; arrays are allowed (index base, `&` operand).
    TypeRef checkExpr(const Expr &expr);

    /// @brief Analyze @p expr as a word-sized value.
    TypeRef checkValue(const Expr &expr);

    TypeRef checkIdentifier(const Expr &expr, const Identifier &ident);
    TypeRef checkBinary(const Expr &expr, const BinaryOp &op);
    TypeRef checkUnary(const Expr &expr, const UnaryOp &op);
    TypeRef checkAddressOf(const Expr &expr, const AddressOf &op);
    TypeRef checkDeref(const Expr &expr, const Deref &op);
    TypeRef checkIndex(const Expr &expr, const ArrayIndex &op);
    TypeRef checkCall(const Expr &expr, const Call &call);
    bool checkArguments(const Expr &expr,
                        const std::string &name,
                        const FunctionSignature &sig,
                        const std::vector<ExprPtr> &args);

    [[nodiscard]] static bool isLvalue(const Expr &expr);

    /// @}
    //=========================================================================
    /// @name Scopes
    /// @{
    //=========================================================================

    void pushScope();
    void popScope();
    bool declareLocal(const std::string &name, TypeRef type, SourceLoc loc, bool isParam,
                      uint32_t &id);
    const Symbol *lookup(const std::string &name) const;

    /// @}

    void error(SourceLoc loc, const std::string &message);

    perc::support::DiagnosticEngine &diag_;
    SemanticModel model_;
    const ModuleTable *table_ = nullptr;
    std::vector<Scope> scopes_;
    int currentScope_ = -1;

    /// @brief Root functions by name.
    std::map<std::string, size_t> rootFunctions_;

    /// @brief Library functions by (module, name).
    std::map<std::pair<std::string, std::string>, size_t> moduleFunctions_;

    /// @brief Function whose body is being checked.
    CheckedFunction *current_ = nullptr;
    size_t currentIndex_ = 0;
};

/// @}

} // namespace perc::frontends::per
