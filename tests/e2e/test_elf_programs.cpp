// File: tests/e2e/test_elf_programs.cpp
// Purpose: Compile Per programs to ELF64 images, run them and compare their
//          standard output and exit status.
// Key invariants: Programs see no libc; all I/O goes through raw syscalls.
// Ownership/Lifetime: Executables live in a per-test temporary directory.
// Links: src/codegen/elf/ElfWriter.cpp, src/codegen/x86_64/StdioHelpers.cpp

#include "codegen/elf/ElfWriter.hpp"
#include "common/RunProcess.hpp"
#include "frontends/per/Compiler.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using perc::common::RunOptions;
using perc::common::RunResult;

namespace
{

class ElfPrograms : public ::testing::Test
{
  protected:
    void SetUp() override
    {
#if !(defined(__linux__) && defined(__x86_64__))
        GTEST_SKIP() << "ELF images only run on Linux x86-64";
#endif
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("perc_elf_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    /// \brief Compile @p source, write the image and run it.
    RunResult run(const std::string &source, std::optional<std::string> input = std::nullopt)
    {
        perc::support::SourceManager sm;
        perc::frontends::per::CompilerOptions opts;
        auto result = perc::frontends::per::compile({source, "prog.per"}, opts, sm);
        if (!result.succeeded())
        {
            std::ostringstream os;
            result.diagnostics.printAll(os, &sm);
            ADD_FAILURE() << os.str();
            return {-1, {}};
        }
        auto image = perc::codegen::elf::emitElf(result.module);
        if (!image)
        {
            ADD_FAILURE() << image.error().message;
            return {-1, {}};
        }

        const fs::path exe = dir_ / "prog";
        {
            std::ofstream out(exe, std::ios::binary | std::ios::trunc);
            out.write(reinterpret_cast<const char *>(image.value().data()),
                      static_cast<std::streamsize>(image.value().size()));
        }
        fs::permissions(exe, fs::perms::owner_all, fs::perm_options::replace);

        RunOptions options;
        if (input)
        {
            const fs::path in = dir_ / "stdin.txt";
            std::ofstream(in, std::ios::binary) << *input;
            options.stdinPath = in.string();
        }
        return perc::common::runProcess({exe.string()}, options);
    }

    fs::path dir_;
};

} // namespace

TEST_F(ElfPrograms, Arithmetic)
{
    auto r = run("fn main() { var x: i64 = 2; var y: i64 = 3; stdio.Println(x + y * 2); return 0 }");
    EXPECT_EQ(r.out, "8\n");
    EXPECT_EQ(r.exitCode, 0);
}

TEST_F(ElfPrograms, PointerSwap)
{
    auto r = run("fn swap(a: *i64, b: *i64) {\n"
                 "    var t: i64 = *a\n"
                 "    *a = *b\n"
                 "    *b = t\n"
                 "}\n"
                 "fn main() {\n"
                 "    var x: i64 = 10\n"
                 "    var y: i64 = 20\n"
                 "    stdio.Println(x)\n"
                 "    stdio.Println(y)\n"
                 "    swap(&x, &y)\n"
                 "    stdio.Println(x)\n"
                 "    stdio.Println(y)\n"
                 "    return 0\n"
                 "}\n");
    EXPECT_EQ(r.out, "10\n20\n20\n10\n");
    EXPECT_EQ(r.exitCode, 0);
}

TEST_F(ElfPrograms, ArrayIndexing)
{
    auto r = run("fn main() {\n"
                 "    var arr: [i64; 3]\n"
                 "    arr[0] = 5\n"
                 "    arr[1] = arr[0] + 1\n"
                 "    stdio.Println(arr[1])\n"
                 "    stdio.Println(arr[2])\n"
                 "    var big: [i64; 40]\n"
                 "    big[39] = big[0] + 7\n"
                 "    stdio.Println(big[39])\n"
                 "    return 0\n"
                 "}\n");
    EXPECT_EQ(r.out, "6\n0\n7\n");
}

TEST_F(ElfPrograms, ForLoop)
{
    auto r = run("fn main() { for var i: i64 = 0; i < 5; i = i + 1 { stdio.Println(i) }\n return 0 }");
    EXPECT_EQ(r.out, "0\n1\n2\n3\n4\n");
}

TEST_F(ElfPrograms, ExitStatusIsMainResult)
{
    EXPECT_EQ(run("fn main() { return 42 }").exitCode, 42);
    EXPECT_EQ(run("fn main() { }").exitCode, 0);
}

TEST_F(ElfPrograms, PrintsNegativeNumbersAndStrings)
{
    auto r = run("fn main() {\n"
                 "    stdio.Print(-1234)\n"
                 "    stdio.PrintChar(32)\n"
                 "    stdio.PrintStr(\"a\\tb\")\n"
                 "    stdio.PrintlnStr(\"!\")\n"
                 "    stdio.Println(0 - 9223372036854775807 - 1)\n"
                 "    stdio.Flush()\n"
                 "    return 0\n"
                 "}\n");
    EXPECT_EQ(r.out, "-1234 a\tb!\n-9223372036854775808\n");
}

TEST_F(ElfPrograms, ReadsStandardInput)
{
    auto r = run("fn main() {\n"
                 "    var a: i64 = stdio.ReadInt()\n"
                 "    var b: i64 = stdio.ReadInt()\n"
                 "    stdio.Println(a + b)\n"
                 "    var c: i64 = stdio.ReadChar()\n"
                 "    var line: string = stdio.ReadLine()\n"
                 "    stdio.PrintlnStr(line)\n"
                 "    stdio.Println(stdio.ReadChar())\n"
                 "    return c\n"
                 "}\n",
                 std::string("  17 -5\nXhello world\n"));
    // ReadInt consumes the byte that ends the number.
    EXPECT_EQ(r.out, "12\nhello world\n-1\n");
    EXPECT_EQ(r.exitCode, 'X');
}

TEST_F(ElfPrograms, LibraryFunctions)
{
    auto r = run("fn main() {\n"
                 "    stdio.Println(math.Abs(-7))\n"
                 "    stdio.Println(math.Pow(2, 10))\n"
                 "    stdio.Println(math.Gcd(84, 36))\n"
                 "    stdio.Println(math.Clamp(15, 0, 10))\n"
                 "    stdio.PrintChar(string.ToUpper(113))\n"
                 "    stdio.Println(string.IsDigit(55))\n"
                 "    return 0\n"
                 "}\n");
    EXPECT_EQ(r.out, "7\n1024\n12\n10\nQ1\n");
}

TEST_F(ElfPrograms, RecursionAndShortCircuit)
{
    auto r = run("fn fib(n: i64) -> i64 { if n < 2 { return n }\n return fib(n - 1) + fib(n - 2) }\n"
                 "fn loud(v: i64) -> i64 { stdio.Println(v)\n return v }\n"
                 "fn main() {\n"
                 "    stdio.Println(fib(15))\n"
                 "    if loud(0) && loud(1) { stdio.Println(99) }\n"
                 "    if loud(2) || loud(3) { stdio.Println(7 / 2 + 7 % 2 + -7 / 2) }\n"
                 "    return 0\n"
                 "}\n");
    EXPECT_EQ(r.out, "610\n0\n2\n1\n");
}

TEST_F(ElfPrograms, DivisionByZeroTraps)
{
    auto r = run("fn main() { var z: i64 = 0\n stdio.Println(1)\n return 5 / z }");
    EXPECT_EQ(r.out, "1\n");
    EXPECT_NE(r.exitCode, 0);
}
