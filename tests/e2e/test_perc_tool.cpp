// File: tests/e2e/test_perc_tool.cpp
// Purpose: Drive the built `perc` binary the way a user would and
//          check exit codes, messages and produced files.
// Key invariants: A failed compilation exits nonzero and leaves no output
//                 file; success reports every written path.
// Ownership/Lifetime: Each test owns a temporary directory of sources.
// Links: src/tools/perc/main.cpp, src/tools/perc/driver.cpp

#include "common/RunProcess.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#ifndef PERC_BINARY
#    error "PERC_BINARY must name the perc executable"
#endif

namespace fs = std::filesystem;
using perc::common::RunOptions;
using perc::common::runProcess;

namespace
{

class PercTool : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("perc_tool_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write(const std::string &name, const std::string &text)
    {
        fs::path p = dir_ / name;
        std::ofstream(p, std::ios::binary) << text;
        return p.string();
    }

    perc::common::RunResult runPerc(std::vector<std::string> args)
    {
        args.insert(args.begin(), PERC_BINARY);
        RunOptions options;
        options.mergeStderr = true;
        return runProcess(args, options);
    }

    static std::string slurp(const fs::path &p)
    {
        std::ifstream in(p, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path dir_;
};

} // namespace

TEST_F(PercTool, VersionAndHelp)
{
    auto version = runPerc({"--version"});
    EXPECT_EQ(version.exitCode, 0);
    EXPECT_EQ(version.out.rfind("perc v", 0), 0u) << version.out;

    auto help = runPerc({"--help"});
    EXPECT_EQ(help.exitCode, 0);
    EXPECT_NE(help.out.find("Usage: perc"), std::string::npos);
}

TEST_F(PercTool, BadCommandLineShowsUsage)
{
    auto r = runPerc({"--frobnicate"});
    EXPECT_NE(r.exitCode, 0);
    EXPECT_NE(r.out.find("unknown option '--frobnicate'"), std::string::npos) << r.out;
}

TEST_F(PercTool, UndeclaredModuleFunctionFails)
{
    const std::string src = write("bad.per", "fn main() {\n    stdio.Foo(1)\n    return 0\n}\n");
    auto r = runPerc({src, "--elf"});
    EXPECT_NE(r.exitCode, 0);
    EXPECT_NE(r.out.find("[TypeError]"), std::string::npos) << r.out;
    EXPECT_NE(r.out.find("bad.per:2:"), std::string::npos) << r.out;
    EXPECT_FALSE(fs::exists(dir_ / "bad"));
}

TEST_F(PercTool, SyntaxErrorIsReportedWithLocation)
{
    const std::string src = write("syntax.per", "fn main() {\n    var = 3\n}\n");
    auto r = runPerc({src, "--novaria"});
    EXPECT_NE(r.exitCode, 0);
    EXPECT_NE(r.out.find("[ParseError]"), std::string::npos) << r.out;
    EXPECT_FALSE(fs::exists(dir_ / "syntax.bin"));
}

TEST_F(PercTool, WritesAssemblyListing)
{
    const std::string src = write("hello.per", "fn main() {\n    stdio.PrintlnStr(\"hi\")\n    return 0\n}\n");
    auto r = runPerc({src, "--nvm-code"});
    ASSERT_EQ(r.exitCode, 0) << r.out;
    const fs::path listing = dir_ / "hello.asm";
    EXPECT_NE(r.out.find("Compilation successful: " + listing.string()), std::string::npos) << r.out;
    ASSERT_TRUE(fs::exists(listing));
    const std::string text = slurp(listing);
    EXPECT_EQ(text.rfind(".entry main\n.const 0 \"hi\"\n", 0), 0u) << text;
    EXPECT_NE(text.find("intr PrintlnStr("), std::string::npos);
}

TEST_F(PercTool, AllTargetsWithJobs)
{
    const std::string src = write("multi.per", "fn main() { return math.Sign(-4) + 1 }\n");
    auto r = runPerc({src, "--all", "--jobs", "2"});
    ASSERT_EQ(r.exitCode, 0) << r.out;
    for (const char *name : {"multi", "multi.exe", "multi.bin", "multi.asm"})
        EXPECT_TRUE(fs::exists(dir_ / name)) << name;
    EXPECT_EQ(slurp(dir_ / "multi.bin").substr(0, 4), "NVM0");
    EXPECT_EQ(slurp(dir_ / "multi.exe").substr(0, 2), "MZ");
}

TEST_F(PercTool, ExplicitOutputAndRun)
{
    const std::string src = write("ret.per", "fn main() {\n    stdio.Println(-3)\n    return 7\n}\n");
    const std::string exe = (dir_ / "custom-name").string();
    auto r = runPerc({src, "--elf", "-o", exe});
    ASSERT_EQ(r.exitCode, 0) << r.out;
    ASSERT_TRUE(fs::exists(exe));
#if defined(__linux__) && defined(__x86_64__)
    auto run = runProcess({exe});
    EXPECT_EQ(run.out, "-3\n");
    EXPECT_EQ(run.exitCode, 7);
#endif
}

TEST_F(PercTool, MissingSourceFile)
{
    auto r = runPerc({(dir_ / "nope.per").string()});
    EXPECT_NE(r.exitCode, 0);
    EXPECT_NE(r.out.find("[IoError]"), std::string::npos) << r.out;
}
