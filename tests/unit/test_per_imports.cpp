// File: tests/unit/test_per_imports.cpp
// Purpose: Loading of user `.per` modules through `import`, the flat module
//          table and the module-internal call limitation.
// Key invariants: Each file is loaded once even through cycles; only exported
//                 functions are callable from other modules; load failures are
//                 P5000 diagnostics.
// Ownership/Lifetime: Each test writes its sources into a private temporary
//                     directory and removes it on teardown.
// Links: src/frontends/per/ImportResolver.cpp, src/frontends/per/ModuleTable.cpp

#include "frontends/per/Compiler.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>

using namespace perc::frontends::per;
namespace fs = std::filesystem;

namespace
{

class PerImports : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("perc_imports_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write(const std::string &rel, const std::string &text)
    {
        fs::path p = dir_ / rel;
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << text;
        return p.string();
    }

    CompilerResult compileMain(const std::string &text)
    {
        std::string path = write("main.per", text);
        CompilerOptions opts;
        return compileFile(path, opts, sm_);
    }

    static bool hasFunction(const CompilerResult &result, const std::string &name)
    {
        const auto &fns = result.module.functions;
        return std::any_of(fns.begin(), fns.end(), [&](const auto &fn) { return fn.name == name; });
    }

    static std::string firstMessage(const CompilerResult &result)
    {
        const auto &diags = result.diagnostics.diagnostics();
        return diags.empty() ? std::string() : diags.front().message;
    }

    static std::string firstCode(const CompilerResult &result)
    {
        const auto &diags = result.diagnostics.diagnostics();
        return diags.empty() ? std::string() : diags.front().code;
    }

    fs::path dir_;
    perc::support::SourceManager sm_;
};

} // namespace

TEST_F(PerImports, CallsExportedFunctionOfImportedFile)
{
    write("util.per",
          "package util\n"
          "pub fn Triple(x: i64) -> i64 { return x * 3 }\n"
          "fn helper() -> i64 { return 1 }\n");
    auto result = compileMain("import \"util\"\n"
                              "fn main() { return util.Triple(2) }\n");
    ASSERT_TRUE(result.succeeded()) << firstMessage(result);
    EXPECT_TRUE(hasFunction(result, "util.Triple"));
    EXPECT_FALSE(hasFunction(result, "util.helper"));
}

TEST_F(PerImports, CapitalisedNameIsExported)
{
    write("util.per", "fn Square(x: i64) -> i64 { return x * x }\n");
    auto result = compileMain("import \"util\"\nfn main() { return util.Square(3) }\n");
    EXPECT_TRUE(result.succeeded()) << firstMessage(result);
}

TEST_F(PerImports, PrivateFunctionIsRejected)
{
    write("util.per", "fn helper() -> i64 { return 1 }\n");
    auto result = compileMain("import \"util\"\nfn main() { return util.helper() }\n");
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(firstCode(result), "P3000");
    EXPECT_NE(firstMessage(result).find("is not exported"), std::string::npos);
}

TEST_F(PerImports, MissingFileIsAnIoError)
{
    auto result = compileMain("import \"absent\"\nfn main() { return 0 }\n");
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(firstCode(result), "P5000");
    EXPECT_NE(firstMessage(result).find("cannot open imported module 'absent'"), std::string::npos);
}

TEST_F(PerImports, TransitiveModulesShareOneTable)
{
    write("a.per", "import \"b\"\npub fn A() -> i64 { return b.B() + 1 }\n");
    write("b.per", "pub fn B() -> i64 { return 41 }\n");
    auto result = compileMain("import \"a\"\n"
                              "fn main() { return a.A() + b.B() }\n");
    ASSERT_TRUE(result.succeeded()) << firstMessage(result);
    EXPECT_TRUE(hasFunction(result, "a.A"));
    EXPECT_TRUE(hasFunction(result, "b.B"));
}

TEST_F(PerImports, CyclicImportsLoadOnce)
{
    write("a.per", "import \"b\"\npub fn A() -> i64 { return 1 }\n");
    write("b.per", "import \"a\"\npub fn B() -> i64 { return a.A() }\n");
    auto result = compileMain("import \"a\"\nfn main() { return b.B() }\n");
    ASSERT_TRUE(result.succeeded()) << firstMessage(result);
    EXPECT_TRUE(hasFunction(result, "a.A"));
}

TEST_F(PerImports, DuplicateModuleNameIsRejected)
{
    write("dup.per", "pub fn F() -> i64 { return 1 }\n");
    write("sub/dup.per", "pub fn G() -> i64 { return 2 }\n");
    auto result = compileMain("import \"dup\"\nimport \"sub/dup\"\nfn main() { return 0 }\n");
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(firstCode(result), "P5000");
    EXPECT_NE(firstMessage(result).find("module name 'dup' is already used"), std::string::npos);
}

TEST_F(PerImports, ModuleInternalCallIsNotSupported)
{
    write("util.per",
          "pub fn Twice(x: i64) -> i64 { return x * 2 }\n"
          "pub fn Quad(x: i64) -> i64 { return Twice(Twice(x)) }\n");
    auto result = compileMain("import \"util\"\nfn main() { return util.Quad(1) }\n");
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(firstCode(result), "P3000");
    EXPECT_NE(firstMessage(result).find("module-internal call to 'Twice'"), std::string::npos);
}

TEST_F(PerImports, BuiltinModulesNeedNoFile)
{
    auto result = compileMain("import \"stdio\"\nimport \"math\"\nimport \"string\"\n"
                              "fn main() { return math.Gcd(12, 18) + string.ToUpper(97) }\n");
    ASSERT_TRUE(result.succeeded()) << firstMessage(result);
    EXPECT_TRUE(hasFunction(result, "math.Gcd"));
    EXPECT_TRUE(hasFunction(result, "string.ToUpper"));
}

TEST_F(PerImports, SyntaxErrorInImportedFileNamesThatFile)
{
    write("util.per", "pub fn Broken( { }\n");
    auto result = compileMain("import \"util\"\nfn main() { return 0 }\n");
    EXPECT_FALSE(result.succeeded());
    ASSERT_FALSE(result.diagnostics.diagnostics().empty());
    const auto &d = result.diagnostics.diagnostics().front();
    EXPECT_EQ(d.code, "P2000");
    EXPECT_EQ(fs::path(std::string(sm_.getPath(d.loc.file_id))).filename().string(), "util.per");
}
