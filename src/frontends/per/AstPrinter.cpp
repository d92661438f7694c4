//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "frontends/per/AstPrinter.hpp"
#include "support/overload.hpp"

#include <sstream>

namespace perc::frontends::per
{

namespace
{

using perc::support::Overload;

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

class Printer
{
  public:
    explicit Printer(std::ostringstream &os) : os_(os) {}

    void program(const Program &program)
    {
        line(0) << "Program";
        if (program.package)
            os_ << " package " << program.package->name;
        os_ << '\n';
        for (const auto &imp : program.imports)
        {
            line(1) << "Import \"" << imp.name << "\"";
            loc(imp.loc);
        }
        for (const auto &fn : program.functions)
            function(fn, 1);
    }

  private:
    std::ostringstream &line(int depth)
    {
        for (int i = 0; i < depth; ++i)
            os_ << "  ";
        return os_;
    }

    void loc(const SourceLoc &l)
    {
        os_ << " (" << l.line << ':' << l.column << ")\n";
    }

    void function(const FunctionDecl &fn, int depth)
    {
        line(depth) << "FunctionDecl " << (fn.isPublic ? "pub " : "") << '"' << fn.name << '"';
        if (fn.returnType)
            os_ << " -> " << typeToString(*fn.returnType);
        loc(fn.loc);
        for (const auto &p : fn.params)
        {
            line(depth + 1) << "Param \"" << p.name << "\": " << typeToString(*p.type);
            loc(p.loc);
        }
        block(fn.body, fn.loc, depth + 1);
    }

    void block(const Block &b, const SourceLoc &l, int depth)
    {
        line(depth) << "Block";
        loc(l);
        for (const auto &s : b.stmts)
            stmt(*s, depth + 1);
    }

    void stmt(const Stmt &s, int depth)
    {
        std::visit(Overload{
                       [&](const Block &b) { block(b, s.loc, depth); },
                       [&](const VarDecl &v)
                       {
                           line(depth) << "VarDecl \"" << v.name << '"';
                           if (v.declaredType)
                               os_ << ": " << typeToString(*v.declaredType);
                           loc(s.loc);
                           if (v.init)
                               expr(*v.init, depth + 1);
                       },
                       [&](const Assignment &a)
                       {
                           line(depth) << "Assignment";
                           loc(s.loc);
                           expr(*a.target, depth + 1);
                           expr(*a.value, depth + 1);
                       },
                       [&](const If &i)
                       {
                           line(depth) << "If";
                           loc(s.loc);
                           expr(*i.cond, depth + 1);
                           block(i.thenBody, s.loc, depth + 1);
                           if (i.elseBody)
                           {
                               line(depth) << "Else\n";
                               block(*i.elseBody, s.loc, depth + 1);
                           }
                       },
                       [&](const For &f)
                       {
                           line(depth) << "For";
                           loc(s.loc);
                           if (f.init)
                               stmt(*f.init, depth + 1);
                           if (f.cond)
                               expr(*f.cond, depth + 1);
                           if (f.step)
                               stmt(*f.step, depth + 1);
                           block(f.body, s.loc, depth + 1);
                       },
                       [&](const Return &r)
                       {
                           line(depth) << "Return";
                           loc(s.loc);
                           if (r.value)
                               expr(*r.value, depth + 1);
                       },
                       [&](const ExprStmt &e)
                       {
                           line(depth) << "ExprStmt";
                           loc(s.loc);
                           expr(*e.expr, depth + 1);
                       },
                   },
                   s.node);
    }

    void expr(const Expr &e, int depth)
    {
        std::visit(Overload{
                       [&](const IntLiteral &n)
                       {
                           line(depth) << "IntLiteral " << n.value;
                           loc(e.loc);
                       },
                       [&](const StringLiteral &n)
                       {
                           line(depth) << "StringLiteral " << n.value.size() << " bytes";
                           loc(e.loc);
                       },
                       [&](const Identifier &n)
                       {
                           line(depth) << "Identifier \"" << n.name << '"';
                           loc(e.loc);
                       },
                       [&](const BinaryOp &n)
                       {
                           line(depth) << "BinaryOp (" << binaryOpSpelling(n.op) << ')';
                           loc(e.loc);
                           expr(*n.lhs, depth + 1);
                           expr(*n.rhs, depth + 1);
                       },
                       [&](const UnaryOp &n)
                       {
                           line(depth) << "UnaryOp (" << (n.op == UnaryOpKind::Neg ? "-" : "!")
                                       << ')';
                           loc(e.loc);
                           expr(*n.operand, depth + 1);
                       },
                       [&](const AddressOf &n)
                       {
                           line(depth) << "AddressOf";
                           loc(e.loc);
                           expr(*n.operand, depth + 1);
                       },
                       [&](const Deref &n)
                       {
                           line(depth) << "Deref";
                           loc(e.loc);
                           expr(*n.operand, depth + 1);
                       },
                       [&](const ArrayIndex &n)
                       {
                           line(depth) << "ArrayIndex";
                           loc(e.loc);
                           expr(*n.base, depth + 1);
                           expr(*n.index, depth + 1);
                       },
                       [&](const Call &n)
                       {
                           line(depth) << "Call \"";
                           if (n.isQualified())
                               os_ << n.module << '.';
                           os_ << n.callee << '"';
                           loc(e.loc);
                           for (const auto &arg : n.args)
                               expr(*arg, depth + 1);
                       },
                   },
                   e.node);
    }

    std::ostringstream &os_;
};

} // namespace

std::string AstPrinter::dump(const Program &program)
{
    std::ostringstream os;
    Printer(os).program(program);
    return os.str();
}

} // namespace perc::frontends::per
