// File: tests/unit/test_per_parser.cpp
// Purpose: AST shapes produced by the Per parser, precedence, line-break
//          statement termination and first-error reporting.
// Key invariants: Parsing stops at the first error and reports exactly one
//                 P2000 diagnostic; lexical errors are not reported twice.
// Ownership/Lifetime: Parsed programs are owned by the test.
// Links: src/frontends/per/Parser_Decl.cpp, src/frontends/per/Parser_Expr.cpp,
//        src/frontends/per/Parser_Stmt.cpp

#include "frontends/per/AST.hpp"
#include "frontends/per/AstPrinter.hpp"
#include "frontends/per/Lexer.hpp"
#include "frontends/per/Parser.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <variant>

using namespace perc::frontends::per;
using perc::support::DiagnosticEngine;

namespace
{

struct Parsed
{
    DiagnosticEngine diag;
    std::unique_ptr<Program> program;
};

std::unique_ptr<Parsed> parse(const std::string &src)
{
    auto out = std::make_unique<Parsed>();
    Lexer lexer(src, 1, out->diag);
    Parser parser(lexer, out->diag);
    out->program = parser.parseProgram();
    return out;
}

ExprPtr parseExpr(const std::string &src, DiagnosticEngine &diag)
{
    Lexer lexer(src, 1, diag);
    Parser parser(lexer, diag);
    return parser.parseExpression();
}

const Block &mainBody(const Parsed &p)
{
    return p.program->functions.front().body;
}

} // namespace

TEST(PerParser, PackageImportsAndSignatures)
{
    auto p = parse("package demo;\n"
                   "import \"stdio\"\n"
                   "import math\n"
                   "pub fn add(a: i64, b: *i64) -> i64 { return a + *b }\n"
                   "fn main() { return 0 }\n");
    ASSERT_TRUE(p->program) << "unexpected diagnostics";
    ASSERT_TRUE(p->program->package.has_value());
    EXPECT_EQ(p->program->package->name, "demo");
    ASSERT_EQ(p->program->imports.size(), 2u);
    EXPECT_EQ(p->program->imports[0].name, "stdio");
    EXPECT_EQ(p->program->imports[1].name, "math");

    ASSERT_EQ(p->program->functions.size(), 2u);
    const FunctionDecl &add = p->program->functions[0];
    EXPECT_EQ(add.name, "add");
    EXPECT_TRUE(add.isPublic);
    ASSERT_EQ(add.params.size(), 2u);
    EXPECT_EQ(typeToString(*add.params[1].type), "*i64");
    ASSERT_TRUE(add.returnType);
    EXPECT_TRUE(add.returnType->isI64());

    const FunctionDecl &main = p->program->functions[1];
    EXPECT_FALSE(main.returnType);
    EXPECT_FALSE(main.isExported());
}

TEST(PerParser, ArrayTypeRequiresLiteralLength)
{
    auto ok = parse("fn main() { var a: [i64; 3]\n return 0 }");
    ASSERT_TRUE(ok->program);
    const auto *decl = std::get_if<VarDecl>(&mainBody(*ok).stmts[0]->node);
    ASSERT_NE(decl, nullptr);
    EXPECT_EQ(typeToString(*decl->declaredType), "[i64; 3]");

    auto bad = parse("fn main() { var a: [i64; n] }");
    EXPECT_FALSE(bad->program);
    ASSERT_EQ(bad->diag.errorCount(), 1u);
    EXPECT_EQ(bad->diag.diagnostics()[0].code, "P2000");
    EXPECT_NE(bad->diag.diagnostics()[0].message.find("expected array length literal"),
              std::string::npos);
}

TEST(PerParser, MultiplicationBindsTighterThanAddition)
{
    DiagnosticEngine diag;
    ExprPtr e = parseExpr("x + y * 2", diag);
    ASSERT_TRUE(e);
    const auto *add = std::get_if<BinaryOp>(&e->node);
    ASSERT_NE(add, nullptr);
    EXPECT_EQ(add->op, BinaryOpKind::Add);
    const auto *mul = std::get_if<BinaryOp>(&add->rhs->node);
    ASSERT_NE(mul, nullptr);
    EXPECT_EQ(mul->op, BinaryOpKind::Mul);
}

TEST(PerParser, LogicalOperatorsAreLowestPrecedence)
{
    DiagnosticEngine diag;
    ExprPtr e = parseExpr("a < b && c == d || !e", diag);
    ASSERT_TRUE(e);
    const auto *orOp = std::get_if<BinaryOp>(&e->node);
    ASSERT_NE(orOp, nullptr);
    EXPECT_EQ(orOp->op, BinaryOpKind::Or);
    const auto *andOp = std::get_if<BinaryOp>(&orOp->lhs->node);
    ASSERT_NE(andOp, nullptr);
    EXPECT_EQ(andOp->op, BinaryOpKind::And);
    EXPECT_EQ(std::get<BinaryOp>(andOp->lhs->node).op, BinaryOpKind::Lt);
    EXPECT_EQ(std::get<BinaryOp>(andOp->rhs->node).op, BinaryOpKind::Eq);
    const auto *notOp = std::get_if<UnaryOp>(&orOp->rhs->node);
    ASSERT_NE(notOp, nullptr);
    EXPECT_EQ(notOp->op, UnaryOpKind::Not);
}

TEST(PerParser, UnaryAddressAndDerefForms)
{
    DiagnosticEngine diag;
    ExprPtr e = parseExpr("-*p + &arr[1]", diag);
    ASSERT_TRUE(e);
    const auto &add = std::get<BinaryOp>(e->node);
    const auto &neg = std::get<UnaryOp>(add.lhs->node);
    EXPECT_EQ(neg.op, UnaryOpKind::Neg);
    EXPECT_TRUE(std::holds_alternative<Deref>(neg.operand->node));
    const auto &addr = std::get<AddressOf>(add.rhs->node);
    EXPECT_TRUE(std::holds_alternative<ArrayIndex>(addr.operand->node));
}

TEST(PerParser, QualifiedCallKeepsModuleName)
{
    DiagnosticEngine diag;
    ExprPtr e = parseExpr("stdio.Println(x + 1)", diag);
    ASSERT_TRUE(e);
    const auto *call = std::get_if<Call>(&e->node);
    ASSERT_NE(call, nullptr);
    EXPECT_TRUE(call->isQualified());
    EXPECT_EQ(call->module, "stdio");
    EXPECT_EQ(call->callee, "Println");
    EXPECT_EQ(call->args.size(), 1u);
}

TEST(PerParser, LineBreakEndsStatementBeforeDeref)
{
    auto p = parse("fn swap(a: *i64, b: *i64) {\n"
                   "    var t: i64 = *a\n"
                   "    *a = *b\n"
                   "    *b = t\n"
                   "}\n"
                   "fn main() { return 0 }\n");
    ASSERT_TRUE(p->program);
    const Block &body = p->program->functions[0].body;
    ASSERT_EQ(body.stmts.size(), 3u);
    const auto &decl = std::get<VarDecl>(body.stmts[0]->node);
    EXPECT_TRUE(std::holds_alternative<Deref>(decl.init->node));
    const auto &assign = std::get<Assignment>(body.stmts[1]->node);
    EXPECT_TRUE(std::holds_alternative<Deref>(assign.target->node));
    EXPECT_TRUE(std::holds_alternative<Deref>(assign.value->node));
}

TEST(PerParser, OptionalSemicolonsAndSameLineStatements)
{
    auto p = parse("fn main() { var x: i64 = 2; var y: i64 = 3; stdio.Println(x + y * 2); return 0 }");
    ASSERT_TRUE(p->program);
    EXPECT_EQ(mainBody(*p).stmts.size(), 4u);

    auto bad = parse("fn main() { var x: i64 = 2 var y: i64 = 3 }");
    EXPECT_FALSE(bad->program);
    ASSERT_EQ(bad->diag.errorCount(), 1u);
    EXPECT_NE(bad->diag.diagnostics()[0].message.find("expected ';' or line break"),
              std::string::npos);
}

TEST(PerParser, ForLoopClauses)
{
    auto p = parse("fn main() {\n"
                   "  for var i: i64 = 0; i < 5; i = i + 1 { stdio.Println(i) }\n"
                   "  for ; ; { return 1 }\n"
                   "  return 0\n"
                   "}\n");
    ASSERT_TRUE(p->program);
    const auto &full = std::get<For>(mainBody(*p).stmts[0]->node);
    ASSERT_TRUE(full.init);
    EXPECT_TRUE(std::holds_alternative<VarDecl>(full.init->node));
    ASSERT_TRUE(full.cond);
    ASSERT_TRUE(full.step);
    EXPECT_TRUE(std::holds_alternative<Assignment>(full.step->node));
    EXPECT_EQ(full.body.stmts.size(), 1u);

    const auto &bare = std::get<For>(mainBody(*p).stmts[1]->node);
    EXPECT_FALSE(bare.init);
    EXPECT_FALSE(bare.cond);
    EXPECT_FALSE(bare.step);
}

TEST(PerParser, IfElseAndNoElseIfSugar)
{
    auto p = parse("fn main() {\n"
                   "  if 1 { return 1 } else { if 0 { return 2 } }\n"
                   "  return 0\n"
                   "}\n");
    ASSERT_TRUE(p->program);
    const auto &stmt = std::get<If>(mainBody(*p).stmts[0]->node);
    ASSERT_TRUE(stmt.elseBody);
    EXPECT_TRUE(std::holds_alternative<If>(stmt.elseBody->stmts[0]->node));

    auto bad = parse("fn main() { if 1 { return 1 } else if 0 { return 2 } }");
    EXPECT_FALSE(bad->program);
    ASSERT_EQ(bad->diag.errorCount(), 1u);
    EXPECT_NE(bad->diag.diagnostics()[0].message.find("nest the if"), std::string::npos);
}

TEST(PerParser, ReportsExpectedAndGot)
{
    auto p = parse("fn main( { }");
    EXPECT_FALSE(p->program);
    ASSERT_EQ(p->diag.errorCount(), 1u);
    const auto &d = p->diag.diagnostics()[0];
    EXPECT_EQ(d.code, "P2000");
    EXPECT_NE(d.message.find("expected parameter name, got"), std::string::npos) << d.message;
    EXPECT_EQ(d.loc.line, 1u);
    EXPECT_EQ(d.loc.column, 10u);
}

TEST(PerParser, LexicalErrorIsReportedOnce)
{
    auto p = parse("fn main() { var s = \"open\n }");
    EXPECT_FALSE(p->program);
    ASSERT_EQ(p->diag.errorCount(), 1u);
    EXPECT_EQ(p->diag.diagnostics()[0].code, "P1000");
}

TEST(PerParser, AstPrinterShowsStructure)
{
    auto p = parse("fn main() { var a: [i64; 2]\n a[0] = 5\n return a[0] }");
    ASSERT_TRUE(p->program);
    AstPrinter printer;
    std::string dump = printer.dump(*p->program);
    EXPECT_NE(dump.find("Program"), std::string::npos);
    EXPECT_NE(dump.find("main"), std::string::npos);
    EXPECT_NE(dump.find("[i64; 2]"), std::string::npos);
}
