//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Sema.cpp
/// @brief Signature registration, scopes and reachability for the analyzer.
///
//===----------------------------------------------------------------------===//

#include "frontends/per/Sema.hpp"

#include <deque>

namespace perc::frontends::per
{

using perc::support::Severity;

//=============================================================================
// SemanticModel
//=============================================================================

TypeRef SemanticModel::typeOf(const Expr *expr) const
{
    auto it = exprTypes_.find(expr);
    return it == exprTypes_.end() ? nullptr : it->second;
}

std::optional<uint32_t> SemanticModel::localOf(const Expr *expr) const
{
    auto it = identLocals_.find(expr);
    if (it == identLocals_.end())
        return std::nullopt;
    return it->second;
}

std::optional<uint32_t> SemanticModel::localOf(const Stmt *stmt) const
{
    auto it = varLocals_.find(stmt);
    if (it == varLocals_.end())
        return std::nullopt;
    return it->second;
}

const CallTarget *SemanticModel::callTarget(const Expr *expr) const
{
    auto it = calls_.find(expr);
    return it == calls_.end() ? nullptr : &it->second;
}

//=============================================================================
// Analysis driver
//=============================================================================

Sema::Sema(perc::support::DiagnosticEngine &diag) : diag_(diag) {}

bool Sema::analyze(const Program &root, const ModuleTable &table)
{
    table_ = &table;

    if (!declareFunctions(root, nullptr))
        return false;
    for (const auto &module : table.modules())
    {
        if (module.program && !declareFunctions(*module.program, &module))
            return false;
    }
    if (!checkMain(root))
        return false;

    for (size_t i = 0; i < model_.functions_.size(); ++i)
    {
        if (!checkBody(i))
            return false;
    }

    markReachable();
    return true;
}

bool Sema::declareFunctions(const Program &program, const ModuleInfo *module)
{
    const std::string moduleName = module ? module->name : std::string();
    for (const auto &fn : program.functions)
    {
        bool fresh = module ? moduleFunctions_.count({moduleName, fn.name}) == 0
                            : rootFunctions_.count(fn.name) == 0;
        if (!fresh)
        {
            error(fn.loc, "redeclaration of function '" + fn.name + "'");
            return false;
        }

        CheckedFunction checked;
        if (!checkSignature(fn, moduleName, checked))
            return false;

        size_t index = model_.functions_.size();
        model_.functions_.push_back(std::move(checked));
        if (module)
            moduleFunctions_[{moduleName, fn.name}] = index;
        else
            rootFunctions_[fn.name] = index;
    }
    return true;
}

bool Sema::checkSignature(const FunctionDecl &fn, const std::string &module, CheckedFunction &out)
{
    out.decl = &fn;
    out.module = module;
    out.symbol = module.empty() ? fn.name : module + "." + fn.name;

    for (const auto &param : fn.params)
    {
        if (!checkStorableType(param.type, param.loc, "parameter '" + param.name + "'"))
            return false;
        if (!param.type->isWord())
        {
            error(param.loc,
                  "parameter '" + param.name + "' cannot have type " + typeToString(*param.type));
            return false;
        }
    }

    if (fn.returnType)
    {
        if (!checkStorableType(fn.returnType, fn.loc, "return type of '" + fn.name + "'"))
            return false;
        if (fn.returnType->isArray())
        {
            error(fn.loc, "function '" + fn.name + "' cannot return an array");
            return false;
        }
        out.returnType = fn.returnType;
    }
    else if (module.empty() && fn.name == "main")
    {
        out.returnType = types::i64();
    }
    else
    {
        out.returnType = types::voidType();
    }
    return true;
}

bool Sema::checkMain(const Program &root)
{
    auto it = rootFunctions_.find("main");
    if (it == rootFunctions_.end())
    {
        error(SourceLoc{root.fileId, 1, 1}, "program has no 'main' function");
        return false;
    }

    const CheckedFunction &main = model_.functions_[it->second];
    if (!main.decl->params.empty())
    {
        error(main.decl->loc, "function 'main' must not take parameters");
        return false;
    }
    if (!main.returnType->isI64())
    {
        error(main.decl->loc, "function 'main' must return i64");
        return false;
    }
    model_.entry_ = it->second;
    return true;
}

bool Sema::checkBody(size_t index)
{
    currentIndex_ = index;
    current_ = &model_.functions_[index];
    scopes_.clear();
    currentScope_ = -1;

    pushScope();
    for (const auto &param : current_->decl->params)
    {
        uint32_t id = 0;
        if (!declareLocal(param.name, param.type, param.loc, true, id))
            return false;
    }

    // The body shares the parameter scope, so a `var` cannot hide a parameter.
    for (const auto &stmt : current_->decl->body.stmts)
    {
        if (!checkStmt(*stmt))
            return false;
    }
    popScope();
    current_ = nullptr;
    return true;
}

void Sema::markReachable()
{
    std::deque<size_t> work;
    for (const auto &[name, index] : rootFunctions_)
    {
        model_.functions_[index].reachable = true;
        work.push_back(index);
    }

    while (!work.empty())
    {
        size_t index = work.front();
        work.pop_front();
        for (size_t callee : model_.functions_[index].callees)
        {
            auto &fn = model_.functions_[callee];
            if (!fn.reachable)
            {
                fn.reachable = true;
                work.push_back(callee);
            }
        }
    }
}

bool Sema::checkStorableType(const TypeRef &type, SourceLoc loc, const std::string &what)
{
    switch (type->kind)
    {
        case TypeKind::I64:
        case TypeKind::String:
        case TypeKind::Void:
            return true;
        case TypeKind::Array:
            if (!type->elem->isWord())
            {
                error(loc, what + ": arrays of " + typeToString(*type->elem) + " are not supported");
                return false;
            }
            return true;
        case TypeKind::Pointer:
            if (type->elem->isVoid())
            {
                error(loc, what + ": pointers to void are not supported");
                return false;
            }
            return checkStorableType(type->elem, loc, what);
    }
    return true;
}

//=============================================================================
// Scopes
//=============================================================================

void Sema::pushScope()
{
    Scope scope;
    scope.parent = currentScope_;
    scopes_.push_back(std::move(scope));
    currentScope_ = static_cast<int>(scopes_.size() - 1);
}

void Sema::popScope()
{
    if (currentScope_ >= 0)
        currentScope_ = scopes_[currentScope_].parent;
}

bool Sema::declareLocal(const std::string &name, TypeRef type, SourceLoc loc, bool isParam,
                        uint32_t &id)
{
    auto &symbols = scopes_[currentScope_].symbols;
    if (symbols.count(name))
    {
        error(loc, "redeclaration of '" + name + "'");
        return false;
    }

    id = static_cast<uint32_t>(current_->locals.size());
    current_->locals.push_back(LocalInfo{name, type, loc, isParam});

    Symbol sym;
    sym.name = name;
    sym.kind = isParam ? SymbolKind::Parameter : SymbolKind::Local;
    sym.type = std::move(type);
    sym.localId = id;
    sym.loc = loc;
    symbols.emplace(name, std::move(sym));
    return true;
}

const Symbol *Sema::lookup(const std::string &name) const
{
    for (int scope = currentScope_; scope >= 0; scope = scopes_[scope].parent)
    {
        const auto &symbols = scopes_[scope].symbols;
        auto it = symbols.find(name);
        if (it != symbols.end())
            return &it->second;
    }
    return nullptr;
}

void Sema::error(SourceLoc loc, const std::string &message)
{
    diag_.report({Severity::Error, message, loc, std::string(perc::support::kTypeError)});
}

} // namespace perc::frontends::per
