//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Sema_Stmt.cpp
/// @brief Statement analysis for the Per semantic analyzer.
///
//===----------------------------------------------------------------------===//

#include "frontends/per/Sema.hpp"
#include "support/overload.hpp"

namespace perc::frontends::per
{

using perc::support::Overload;

//=============================================================================
// Statement Analysis
//=============================================================================

bool Sema::checkStmt(const Stmt &stmt)
{
    return std::visit(Overload{
                          [&](const Block &block) { return checkBlock(block); },
                          [&](const VarDecl &decl) { return checkVarDecl(stmt, decl); },
                          [&](const Assignment &assign) { return checkAssignment(assign); },
                          [&](const If &s) { return checkIf(s); },
                          [&](const For &s) { return checkFor(s); },
                          [&](const Return &ret) { return checkReturn(stmt, ret); },
                          [&](const ExprStmt &s) { return checkExprStmt(s); },
                      },
                      stmt.node);
}

bool Sema::checkBlock(const Block &block)
{
    pushScope();
    for (const auto &s : block.stmts)
    {
        if (!checkStmt(*s))
            return false;
    }
    popScope();
    return true;
}

bool Sema::checkVarDecl(const Stmt &stmt, const VarDecl &decl)
{
    TypeRef type = decl.declaredType;
    if (type)
    {
        if (!checkStorableType(type, stmt.loc, "variable '" + decl.name + "'"))
            return false;
        if (type->isVoid())
        {
            error(stmt.loc, "variable '" + decl.name + "' cannot have type void");
            return false;
        }
    }

    if (decl.init)
    {
        if (type && type->isArray())
        {
            error(stmt.loc, "array variable '" + decl.name + "' cannot have an initializer");
            return false;
        }
        // The initializer is checked before the name is bound.
        TypeRef initType = checkValue(*decl.init);
        if (!initType)
            return false;
        if (type && !sameType(*type, *initType))
        {
            error(decl.init->loc,
                  "cannot initialize '" + decl.name + "' of type " + typeToString(*type) +
                      " with a value of type " + typeToString(*initType));
            return false;
        }
        if (!type)
            type = initType;
    }
    else if (!type)
    {
        error(stmt.loc, "variable '" + decl.name + "' needs a type or an initializer");
        return false;
    }

    uint32_t id = 0;
    if (!declareLocal(decl.name, type, stmt.loc, false, id))
        return false;
    model_.varLocals_[&stmt] = id;
    return true;
}

bool Sema::checkAssignment(const Assignment &assign)
{
    if (!isLvalue(*assign.target))
    {
        error(assign.target->loc, "left side of assignment is not assignable");
        return false;
    }

    TypeRef targetType = checkExpr(*assign.target);
    if (!targetType)
        return false;
    if (targetType->isArray())
    {
        error(assign.target->loc, "arrays are not assignable");
        return false;
    }

    TypeRef valueType = checkValue(*assign.value);
    if (!valueType)
        return false;
    if (!sameType(*targetType, *valueType))
    {
        error(assign.value->loc,
              "cannot assign a value of type " + typeToString(*valueType) + " to " +
                  typeToString(*targetType));
        return false;
    }
    return true;
}

bool Sema::checkIf(const If &stmt)
{
    if (!checkCondition(*stmt.cond, "if"))
        return false;
    if (!checkBlock(stmt.thenBody))
        return false;
    return !stmt.elseBody || checkBlock(*stmt.elseBody);
}

bool Sema::checkFor(const For &stmt)
{
    // The init clause gets its own scope around the body.
    pushScope();
    if (stmt.init && !checkStmt(*stmt.init))
        return false;
    if (stmt.cond && !checkCondition(*stmt.cond, "for"))
        return false;
    if (stmt.step && !checkStmt(*stmt.step))
        return false;
    if (!checkBlock(stmt.body))
        return false;
    popScope();
    return true;
}

bool Sema::checkReturn(const Stmt &stmt, const Return &ret)
{
    const TypeRef &expected = current_->returnType;
    const std::string &name = current_->decl->name;

    if (!ret.value)
    {
        if (!expected->isVoid())
        {
            error(stmt.loc,
                  "function '" + name + "' must return a value of type " +
                      typeToString(*expected));
            return false;
        }
        return true;
    }

    if (expected->isVoid())
    {
        error(ret.value->loc, "void function '" + name + "' cannot return a value");
        return false;
    }

    TypeRef actual = checkValue(*ret.value);
    if (!actual)
        return false;
    if (!sameType(*expected, *actual))
    {
        error(ret.value->loc,
              "function '" + name + "' returns " + typeToString(*expected) +
                  ", not " + typeToString(*actual));
        return false;
    }
    return true;
}

bool Sema::checkExprStmt(const ExprStmt &stmt)
{
    if (!std::holds_alternative<Call>(stmt.expr->node))
    {
        error(stmt.expr->loc, "expression result is unused; only calls can be statements");
        return false;
    }
    // A call statement may discard any result, including void.
    return checkExpr(*stmt.expr) != nullptr;
}

bool Sema::checkCondition(const Expr &cond, const char *construct)
{
    TypeRef type = checkValue(cond);
    if (!type)
        return false;
    if (!type->isI64())
    {
        error(cond.loc,
              std::string("condition of '") + construct + "' must be i64, got " +
                  typeToString(*type));
        return false;
    }
    return true;
}

} // namespace perc::frontends::per
