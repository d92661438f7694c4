// File: tests/unit/test_per_sema.cpp
// Purpose: Name resolution and type rules of the Per semantic analyzer.
// Key invariants: Every ill-typed program is rejected with exactly one P3000
//                 diagnostic and never reaches lowering; accepted programs
//                 carry a type for every analyzed expression.
// Ownership/Lifetime: Programs, module tables and analyzers live on the test
//                     stack; the semantic model refers into the parsed AST.
// Links: src/frontends/per/Sema.cpp, src/frontends/per/Sema_Expr.cpp,
//        src/frontends/per/Sema_Stmt.cpp

#include "frontends/per/Compiler.hpp"
#include "frontends/per/ImportResolver.hpp"
#include "frontends/per/Lexer.hpp"
#include "frontends/per/ModuleTable.hpp"
#include "frontends/per/Parser.hpp"
#include "frontends/per/Sema.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <variant>
#include <vector>

using namespace perc::frontends::per;
using perc::support::DiagnosticEngine;
using perc::support::SourceManager;

namespace
{

CompilerResult compileSource(const std::string &src)
{
    SourceManager sm;
    CompilerInput input{src, "sema_test.per"};
    CompilerOptions opts;
    return compile(input, opts, sm);
}

/// Runs the front end up to Sema and keeps every stage alive for inspection.
struct Analyzed
{
    SourceManager sm;
    DiagnosticEngine diag;
    std::unique_ptr<Program> program;
    std::vector<LoadedModule> modules;
    ModuleTable table;
    std::unique_ptr<Sema> sema;
    bool ok = false;
};

std::unique_ptr<Analyzed> analyze(const std::string &src)
{
    auto a = std::make_unique<Analyzed>();
    uint32_t fileId = a->sm.addFile("sema_model.per");
    Lexer lexer(src, fileId, a->diag);
    Parser parser(lexer, a->diag);
    a->program = parser.parseProgram();
    if (!a->program)
        return a;
    ImportResolver resolver(a->diag, a->sm);
    if (!resolver.resolve(*a->program, "sema_model.per", a->modules))
        return a;
    a->table = ModuleTable::build(a->modules);
    a->sema = std::make_unique<Sema>(a->diag);
    a->ok = a->sema->analyze(*a->program, a->table);
    return a;
}

} // namespace

TEST(PerSema, AcceptsArithmeticScenario)
{
    auto result = compileSource(
        "fn main() { var x: i64 = 2; var y: i64 = 3; stdio.Println(x + y * 2); return 0 }");
    EXPECT_TRUE(result.succeeded());
}

TEST(PerSema, ForwardReferenceWithinFile)
{
    auto result = compileSource("fn main() -> i64 {\n"
                                "    return twice(21)\n"
                                "}\n"
                                "fn twice(n: i64) -> i64 {\n"
                                "    return n * 2\n"
                                "}\n");
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.module.functions.size(), 2u);
}

TEST(PerSema, ShadowingInInnerBlockIsAllowed)
{
    auto result = compileSource("fn main() {\n"
                                "    var x: i64 = 1\n"
                                "    if x { var x: string = \"inner\"\n stdio.PrintlnStr(x) }\n"
                                "    return x\n"
                                "}\n");
    EXPECT_TRUE(result.succeeded());
}

TEST(PerSema, PointerSwapTypes)
{
    auto result = compileSource("fn swap(a: *i64, b: *i64) {\n"
                                "    var t: i64 = *a\n"
                                "    *a = *b\n"
                                "    *b = t\n"
                                "}\n"
                                "fn main() {\n"
                                "    var x: i64 = 10\n"
                                "    var y: i64 = 20\n"
                                "    swap(&x, &y)\n"
                                "    return 0\n"
                                "}\n");
    EXPECT_TRUE(result.succeeded());
}

TEST(PerSema, ModelRecordsTypesAndTargets)
{
    auto a = analyze("fn main() {\n"
                     "    var p: *i64 = &n()\n"
                     "    return 0\n"
                     "}\n"
                     "fn n() -> i64 { return 1 }\n");
    // `&n()` is not an lvalue.
    EXPECT_FALSE(a->ok);

    auto b = analyze("fn main() {\n"
                     "    var s = \"hi\"\n"
                     "    var v = math.Abs(0 - 5)\n"
                     "    stdio.PrintlnStr(s)\n"
                     "    return v\n"
                     "}\n");
    ASSERT_TRUE(b->ok);
    const SemanticModel &model = b->sema->model();
    const Block &body = b->program->functions[0].body;

    const auto &decl = std::get<VarDecl>(body.stmts[0]->node);
    ASSERT_TRUE(model.typeOf(decl.init.get()));
    EXPECT_EQ(model.typeOf(decl.init.get())->kind, TypeKind::String);
    EXPECT_TRUE(model.localOf(body.stmts[0].get()).has_value());

    const auto &absDecl = std::get<VarDecl>(body.stmts[1]->node);
    const CallTarget *abs = model.callTarget(absDecl.init.get());
    ASSERT_NE(abs, nullptr);
    EXPECT_EQ(abs->kind, CallTarget::Kind::Function);
    EXPECT_EQ(model.functions()[abs->function].symbol, "math.Abs");
    EXPECT_TRUE(model.functions()[abs->function].reachable);

    const auto &print = std::get<ExprStmt>(body.stmts[2]->node);
    const CallTarget *intr = model.callTarget(print.expr.get());
    ASSERT_NE(intr, nullptr);
    EXPECT_EQ(intr->kind, CallTarget::Kind::Intrinsic);
    EXPECT_EQ(intr->intrinsic, perc::ir::IntrinsicId::PrintlnStr);

    EXPECT_EQ(model.functions()[model.entry()].symbol, "main");
}

TEST(PerSema, UncalledLibraryFunctionsAreUnreachable)
{
    auto a = analyze("fn main() { return math.Max(1, 2) }");
    ASSERT_TRUE(a->ok);
    for (const auto &fn : a->sema->model().functions())
    {
        if (fn.symbol == "math.Max" || fn.symbol == "main")
            EXPECT_TRUE(fn.reachable) << fn.symbol;
        else
            EXPECT_FALSE(fn.reachable) << fn.symbol;
    }
}

struct TypeErrorCase
{
    const char *name;
    const char *source;
    const char *fragment;
};

class PerSemaErrors : public ::testing::TestWithParam<TypeErrorCase>
{
};

TEST_P(PerSemaErrors, RejectsWithTypeError)
{
    auto result = compileSource(GetParam().source);
    EXPECT_FALSE(result.succeeded());
    ASSERT_EQ(result.diagnostics.errorCount(), 1u);
    const auto &d = result.diagnostics.diagnostics().front();
    EXPECT_EQ(d.code, "P3000");
    EXPECT_NE(d.message.find(GetParam().fragment), std::string::npos) << d.message;
    EXPECT_TRUE(result.module.functions.empty());
}

INSTANTIATE_TEST_SUITE_P(
    Cases,
    PerSemaErrors,
    ::testing::Values(
        TypeErrorCase{"StringIntoI64",
                      "fn main() { var x: i64 = \"s\"\n return 0 }",
                      "cannot initialize 'x' of type i64 with a value of type string"},
        TypeErrorCase{"UnknownStdioFunction",
                      "fn main() { stdio.Foo(1)\n return 0 }",
                      "module 'stdio' has no function 'Foo'"},
        TypeErrorCase{"UnknownModule", "fn main() { nope.Bar()\n return 0 }", "unknown module 'nope'"},
        TypeErrorCase{"Redeclaration",
                      "fn main() { var x: i64 = 1\n var x: i64 = 2\n return 0 }",
                      "redeclaration of 'x'"},
        TypeErrorCase{"NotAnLvalue", "fn main() { 1 = 2\n return 0 }", "not assignable"},
        TypeErrorCase{"AssignMismatch",
                      "fn main() { var x: i64 = 1\n x = \"s\"\n return 0 }",
                      "cannot assign a value of type string to i64"},
        TypeErrorCase{"ArityMismatch",
                      "fn f(a: i64, b: i64) -> i64 { return a }\nfn main() { return f(1) }",
                      "function 'f' expects 2 arguments, got 1"},
        TypeErrorCase{"ArgumentMismatch",
                      "fn f(a: i64) -> i64 { return a }\nfn main() { return f(\"s\") }",
                      "argument 1 of 'f' has type string, expected i64"},
        TypeErrorCase{"IntrinsicArgumentMismatch",
                      "fn main() { stdio.Println(\"s\")\n return 0 }",
                      "argument 1 of 'stdio.Println' has type string, expected i64"},
        TypeErrorCase{"AddressOfRvalue",
                      "fn main() { var p: *i64 = &1\n return 0 }",
                      "cannot take the address"},
        TypeErrorCase{"DerefNonPointer",
                      "fn main() { var x: i64 = 1\n return *x }",
                      "cannot dereference a value of type i64"},
        TypeErrorCase{"PointerMismatch",
                      "fn main() { var x: i64 = 1\n var p: *string = &x\n return 0 }",
                      "cannot initialize 'p' of type *string"},
        TypeErrorCase{"IndexNonArray",
                      "fn main() { var x: i64 = 1\n return x[0] }",
                      "cannot index a value of type i64"},
        TypeErrorCase{"StringIndex",
                      "fn main() { var a: [i64; 2]\n return a[\"0\"] }",
                      "array index must be i64"},
        TypeErrorCase{"ArrayAssignment",
                      "fn main() { var a: [i64; 2]\n var b: [i64; 2]\n a = b\n return 0 }",
                      "arrays are not assignable"},
        TypeErrorCase{"ArrayInitializer",
                      "fn main() { var a: [i64; 2] = 0\n return 0 }",
                      "cannot have an initializer"},
        TypeErrorCase{"ArithmeticOnString",
                      "fn main() { var s = \"a\"\n return s + 1 }",
                      "operator '+' requires i64 operands"},
        TypeErrorCase{"CompareStrings",
                      "fn main() { if \"a\" == \"b\" { return 1 }\n return 0 }",
                      "cannot compare string and string"},
        TypeErrorCase{"StringCondition",
                      "fn main() { var s = \"a\"\n if s { return 1 }\n return 0 }",
                      "condition of 'if' must be i64, got string"},
        TypeErrorCase{"VoidValue",
                      "fn main() { var x = stdio.Println(1)\n return 0 }",
                      "returns void and has no value"},
        TypeErrorCase{"ReturnValueFromVoid",
                      "fn f() { return 1 }\nfn main() { f()\n return 0 }",
                      "void function 'f' cannot return a value"},
        TypeErrorCase{"MissingReturnValue",
                      "fn f() -> i64 { return }\nfn main() { return f() }",
                      "must return a value of type i64"},
        TypeErrorCase{"WrongReturnType",
                      "fn f() -> i64 { return \"s\" }\nfn main() { return f() }",
                      "returns i64, not string"},
        TypeErrorCase{"UndeclaredIdentifier", "fn main() { return y }", "undeclared identifier 'y'"},
        TypeErrorCase{"UndeclaredFunction", "fn main() { return g() }", "undeclared function 'g'"},
        TypeErrorCase{"NoMain", "fn helper() -> i64 { return 0 }", "program has no 'main' function"},
        TypeErrorCase{"MainWithParams",
                      "fn main(a: i64) -> i64 { return a }",
                      "'main' must not take parameters"},
        TypeErrorCase{"MainReturnsString",
                      "fn main() -> string { return \"s\" }",
                      "'main' must return i64"},
        TypeErrorCase{"UnusedExpression",
                      "fn main() { var x: i64 = 1\n x + 1\n return 0 }",
                      "only calls can be statements"},
        TypeErrorCase{"DuplicateFunction",
                      "fn f() {}\nfn f() {}\nfn main() { return 0 }",
                      "redeclaration of function 'f'"}),
    [](const ::testing::TestParamInfo<TypeErrorCase> &info) { return info.param.name; });
