//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Sema_Expr.cpp
/// @brief Expression typing and call resolution for the Per analyzer.
///
//===----------------------------------------------------------------------===//

#include "frontends/per/Sema.hpp"
#include "frontends/per/Stdlib.hpp"
#include "support/overload.hpp"

namespace perc::frontends::per
{

using perc::support::Overload;

namespace
{

const char *binaryOpSpelling(BinaryOpKind op)
{
    switch (op)
    {
        case BinaryOpKind::Add:
            return "+";
        case BinaryOpKind::Sub:
            return "-";
        case BinaryOpKind::Mul:
            return "*";
        case BinaryOpKind::Div:
            return "/";
        case BinaryOpKind::Rem:
            return "%";
        case BinaryOpKind::Eq:
            return "==";
        case BinaryOpKind::Ne:
            return "!=";
        case BinaryOpKind::Lt:
            return "<";
        case BinaryOpKind::Le:
            return "<=";
        case BinaryOpKind::Gt:
            return ">";
        case BinaryOpKind::Ge:
            return ">=";
        case BinaryOpKind::And:
            return "&&";
        case BinaryOpKind::Or:
            return "||";
    }
    return "?";
}

bool isComparison(BinaryOpKind op)
{
    switch (op)
    {
        case BinaryOpKind::Eq:
        case BinaryOpKind::Ne:
        case BinaryOpKind::Lt:
        case BinaryOpKind::Le:
        case BinaryOpKind::Gt:
        case BinaryOpKind::Ge:
            return true;
        default:
            return false;
    }
}

FunctionSignature signatureOf(const CheckedFunction &fn)
{
    FunctionSignature sig;
    for (const auto &p : fn.decl->params)
        sig.params.emplace_back(p.name, p.type);
    sig.returnType = fn.returnType;
    return sig;
}

} // namespace

//=============================================================================
// Expression Analysis
//=============================================================================

TypeRef Sema::checkExpr(const Expr &expr)
{
    TypeRef type = std::visit(
        Overload{
            [](const IntLiteral &) -> TypeRef { return types::i64(); },
            [](const StringLiteral &) -> TypeRef { return types::string(); },
            [&](const Identifier &e) { return checkIdentifier(expr, e); },
            [&](const BinaryOp &e) { return checkBinary(expr, e); },
            [&](const UnaryOp &e) { return checkUnary(expr, e); },
            [&](const AddressOf &e) { return checkAddressOf(expr, e); },
            [&](const Deref &e) { return checkDeref(expr, e); },
            [&](const ArrayIndex &e) { return checkIndex(expr, e); },
            [&](const Call &e) { return checkCall(expr, e); },
        },
        expr.node);

    if (type)
        model_.exprTypes_[&expr] = type;
    return type;
}

TypeRef Sema::checkValue(const Expr &expr)
{
    TypeRef type = checkExpr(expr);
    if (!type)
        return nullptr;

    if (type->isVoid())
    {
        if (const auto *call = std::get_if<Call>(&expr.node))
            error(expr.loc, "function '" + call->callee + "' returns void and has no value");
        else
            error(expr.loc, "expression of type void has no value");
        return nullptr;
    }
    if (type->isArray())
    {
        error(expr.loc,
              "array of type " + typeToString(*type) +
                  " cannot be used as a value; index it or take its address");
        return nullptr;
    }
    return type;
}

TypeRef Sema::checkIdentifier(const Expr &expr, const Identifier &ident)
{
    const Symbol *sym = lookup(ident.name);
    if (!sym)
    {
        error(expr.loc, "undeclared identifier '" + ident.name + "'");
        return nullptr;
    }
    model_.identLocals_[&expr] = sym->localId;
    return sym->type;
}

TypeRef Sema::checkBinary(const Expr &expr, const BinaryOp &op)
{
    TypeRef lhs = checkValue(*op.lhs);
    if (!lhs)
        return nullptr;
    TypeRef rhs = checkValue(*op.rhs);
    if (!rhs)
        return nullptr;

    if (isComparison(op.op))
    {
        if (!sameType(*lhs, *rhs) || !(lhs->isI64() || lhs->isPointer()))
        {
            error(expr.loc,
                  std::string("cannot compare ") + typeToString(*lhs) + " and " +
                      typeToString(*rhs) + " with '" + binaryOpSpelling(op.op) + "'");
            return nullptr;
        }
        return types::i64();
    }

    if (!lhs->isI64() || !rhs->isI64())
    {
        error(expr.loc,
              std::string("operator '") + binaryOpSpelling(op.op) + "' requires i64 operands, got " +
                  typeToString(*lhs) + " and " + typeToString(*rhs));
        return nullptr;
    }
    return types::i64();
}

TypeRef Sema::checkUnary(const Expr &expr, const UnaryOp &op)
{
    TypeRef operand = checkValue(*op.operand);
    if (!operand)
        return nullptr;
    if (!operand->isI64())
    {
        error(expr.loc,
              std::string("operator '") + (op.op == UnaryOpKind::Neg ? "-" : "!") +
                  "' requires an i64 operand, got " + typeToString(*operand));
        return nullptr;
    }
    return types::i64();
}

TypeRef Sema::checkAddressOf(const Expr &expr, const AddressOf &op)
{
    if (!isLvalue(*op.operand))
    {
        error(expr.loc, "cannot take the address of a value that is not a variable");
        return nullptr;
    }
    TypeRef operand = checkExpr(*op.operand);
    if (!operand)
        return nullptr;
    return types::pointer(operand);
}

TypeRef Sema::checkDeref(const Expr &expr, const Deref &op)
{
    TypeRef operand = checkValue(*op.operand);
    if (!operand)
        return nullptr;
    if (!operand->isPointer())
    {
        error(expr.loc, "cannot dereference a value of type " + typeToString(*operand));
        return nullptr;
    }
    return operand->elem;
}

TypeRef Sema::checkIndex(const Expr &expr, const ArrayIndex &op)
{
    if (!isLvalue(*op.base))
    {
        error(op.base->loc, "only array variables can be indexed");
        return nullptr;
    }
    TypeRef base = checkExpr(*op.base);
    if (!base)
        return nullptr;
    if (!base->isArray())
    {
        error(expr.loc, "cannot index a value of type " + typeToString(*base));
        return nullptr;
    }

    TypeRef index = checkValue(*op.index);
    if (!index)
        return nullptr;
    if (!index->isI64())
    {
        error(op.index->loc, "array index must be i64, got " + typeToString(*index));
        return nullptr;
    }
    return base->elem;
}

//=============================================================================
// Calls
//=============================================================================

TypeRef Sema::checkCall(const Expr &expr, const Call &call)
{
    CallTarget target;

    if (call.isQualified())
    {
        const ModuleInfo *module = table_->find(call.module);
        if (!module)
        {
            error(expr.loc, "unknown module '" + call.module + "'");
            return nullptr;
        }
        const ModuleFunction *fn = module->find(call.callee);
        if (!fn)
        {
            error(expr.loc,
                  "module '" + call.module + "' has no function '" + call.callee + "'");
            return nullptr;
        }
        if (!fn->exported)
        {
            error(expr.loc,
                  "function '" + call.callee + "' of module '" + call.module +
                      "' is not exported");
            return nullptr;
        }

        const std::string qualified = call.module + "." + call.callee;
        if (!checkArguments(expr, qualified, fn->signature, call.args))
            return nullptr;

        if (fn->intrinsic)
        {
            target.kind = CallTarget::Kind::Intrinsic;
            target.intrinsic = *fn->intrinsic;
            target.returnType = fn->signature.returnType;
        }
        else
        {
            target.kind = CallTarget::Kind::Function;
            target.function = moduleFunctions_.at({call.module, call.callee});
            target.returnType = model_.functions_[target.function].returnType;
        }
    }
    else
    {
        if (!current_->module.empty())
        {
            const ModuleInfo *own = table_->find(current_->module);
            if (own && own->find(call.callee))
            {
                error(expr.loc,
                      "module-internal call to '" + call.callee + "' in module '" +
                          current_->module + "' is not supported");
            }
            else
            {
                error(expr.loc, "undeclared function '" + call.callee + "'");
            }
            return nullptr;
        }

        auto it = rootFunctions_.find(call.callee);
        if (it == rootFunctions_.end())
        {
            if (lookup(call.callee))
                error(expr.loc, "'" + call.callee + "' is a variable, not a function");
            else if (isBuiltinModule(call.callee))
                error(expr.loc, "'" + call.callee + "' is a module, not a function");
            else
                error(expr.loc, "undeclared function '" + call.callee + "'");
            return nullptr;
        }

        const CheckedFunction &fn = model_.functions_[it->second];
        if (!checkArguments(expr, call.callee, signatureOf(fn), call.args))
            return nullptr;

        target.kind = CallTarget::Kind::Function;
        target.function = it->second;
        target.returnType = fn.returnType;
    }

    if (target.kind == CallTarget::Kind::Function)
        current_->callees.push_back(target.function);

    TypeRef result = target.returnType;
    model_.calls_[&expr] = std::move(target);
    return result;
}

bool Sema::checkArguments(const Expr &expr,
                          const std::string &name,
                          const FunctionSignature &sig,
                          const std::vector<ExprPtr> &args)
{
    if (args.size() != sig.params.size())
    {
        error(expr.loc,
              "function '" + name + "' expects " + std::to_string(sig.params.size()) +
                  " argument" + (sig.params.size() == 1 ? "" : "s") + ", got " +
                  std::to_string(args.size()));
        return false;
    }

    for (size_t i = 0; i < args.size(); ++i)
    {
        TypeRef actual = checkValue(*args[i]);
        if (!actual)
            return false;
        const TypeRef &expected = sig.params[i].second;
        if (!sameType(*expected, *actual))
        {
            error(args[i]->loc,
                  "argument " + std::to_string(i + 1) + " of '" + name + "' has type " +
                      typeToString(*actual) + ", expected " + typeToString(*expected));
            return false;
        }
    }
    return true;
}

bool Sema::isLvalue(const Expr &expr)
{
    return std::holds_alternative<Identifier>(expr.node) ||
           std::holds_alternative<ArrayIndex>(expr.node) ||
           std::holds_alternative<Deref>(expr.node);
}

} // namespace perc::frontends::per
