//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.hpp
/// @brief Abstract syntax tree for the Per language.
///
/// Expression and statement kinds are closed sets held in std::variant
/// payloads, so every pass dispatches with an exhaustive std::visit and a new
/// node kind fails to compile until each pass handles it.
///
/// ## Ownership
///
/// The tree is strict: every node owns its children through std::unique_ptr
/// (or by value for blocks).  Passes that need per-node facts, such as the
/// semantic analyzer, store them in side tables keyed by node address and
/// never modify the tree.
///
/// @invariant Every Expr and Stmt carries the location of its first token.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/per/Types.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace perc::frontends::per
{

using perc::support::SourceLoc;

struct Expr;
struct Stmt;
using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;

//===----------------------------------------------------------------------===//
// Expressions
//===----------------------------------------------------------------------===//

enum class BinaryOpKind
{
    Add,
    Sub,
    Mul,
    Div,
    Rem,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    And,
    Or,
};

enum class UnaryOpKind
{
    Neg,
    Not,
};

struct IntLiteral
{
    int64_t value = 0;
};

struct StringLiteral
{
    std::string value;
};

struct Identifier
{
    std::string name;
};

struct BinaryOp
{
    BinaryOpKind op;
    ExprPtr lhs;
    ExprPtr rhs;
};

struct UnaryOp
{
    UnaryOpKind op;
    ExprPtr operand;
};

struct AddressOf
{
    ExprPtr operand;
};

struct Deref
{
    ExprPtr operand;
};

struct ArrayIndex
{
    ExprPtr base;
    ExprPtr index;
};

/// @brief Function call; `module` is empty for unqualified calls.
struct Call
{
    std::string module;
    std::string callee;
    std::vector<ExprPtr> args;

    [[nodiscard]] bool isQualified() const
    {
        return !module.empty();
    }
};

struct Expr
{
    SourceLoc loc;
    std::variant<IntLiteral,
                 StringLiteral,
                 Identifier,
                 BinaryOp,
                 UnaryOp,
                 AddressOf,
                 Deref,
                 ArrayIndex,
                 Call>
        node;
};

//===----------------------------------------------------------------------===//
// Statements
//===----------------------------------------------------------------------===//

struct Block
{
    std::vector<StmtPtr> stmts;
};

/// @brief `var name: T = init`; either the type or the initializer may be absent.
struct VarDecl
{
    std::string name;
    TypeRef declaredType;
    ExprPtr init;
};

struct Assignment
{
    ExprPtr target;
    ExprPtr value;
};

struct If
{
    ExprPtr cond;
    Block thenBody;
    std::unique_ptr<Block> elseBody;
};

/// @brief Three-clause loop; every clause is optional.
struct For
{
    StmtPtr init;
    ExprPtr cond;
    StmtPtr step;
    Block body;
};

struct Return
{
    ExprPtr value;
};

struct ExprStmt
{
    ExprPtr expr;
};

struct Stmt
{
    SourceLoc loc;
    std::variant<Block, VarDecl, Assignment, If, For, Return, ExprStmt> node;
};

//===----------------------------------------------------------------------===//
// Declarations
//===----------------------------------------------------------------------===//

struct Param
{
    std::string name;
    TypeRef type;
    SourceLoc loc;
};

struct FunctionDecl
{
    std::string name;
    std::vector<Param> params;

    /// @brief Declared return type, or null when `->` was omitted.
    TypeRef returnType;

    bool isPublic = false;
    Block body;
    SourceLoc loc;

    /// @brief Visible to importers: marked `pub` or capitalised.
    [[nodiscard]] bool isExported() const
    {
        return isPublic || (!name.empty() && name[0] >= 'A' && name[0] <= 'Z');
    }
};

struct Package
{
    std::string name;
    SourceLoc loc;
};

struct Import
{
    std::string name;
    SourceLoc loc;
};

/// @brief One parsed source file.
struct Program
{
    std::optional<Package> package;
    std::vector<Import> imports;
    std::vector<FunctionDecl> functions;
    uint32_t fileId = 0;
};

} // namespace perc::frontends::per
