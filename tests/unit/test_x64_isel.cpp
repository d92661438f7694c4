// File: tests/unit/test_x64_isel.cpp
// Purpose: Frame layout, module selection and relocation of the shared
//          x86-64 instruction selector.
// Key invariants: Frames stay 16-byte aligned; a function body that neither
//                 calls nor touches parameters is the same bytes under both
//                 calling conventions.
// Ownership/Lifetime: Modules and machine code are owned by each test.
// Links: src/codegen/x86_64/ISel.cpp, src/codegen/x86_64/MachineCode.cpp

#include "IrTestUtil.hpp"
#include "codegen/elf/LinuxAbi.hpp"
#include "codegen/pe/WindowsAbi.hpp"
#include "codegen/x86_64/ISel.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace perc::codegen::x64;
using perc::ir::Function;
using perc::test::compileToIr;
using perc::test::constantMain;
using perc::test::moduleWith;

namespace
{

const FunctionRange *rangeOf(const MachineCode &mc, const std::string &name)
{
    for (const auto &range : mc.functions)
    {
        if (range.name == name)
            return &range;
    }
    return nullptr;
}

std::vector<uint8_t> bytesOf(const MachineCode &mc, const FunctionRange &range)
{
    return {mc.code.begin() + static_cast<std::ptrdiff_t>(range.begin),
            mc.code.begin() + static_cast<std::ptrdiff_t>(range.end)};
}

bool contains(const std::vector<uint8_t> &haystack, const std::vector<uint8_t> &needle)
{
    return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end()) !=
           haystack.end();
}

std::vector<uint8_t> frameAllocBytes(const TargetAbi &abi, uint32_t frameSize)
{
    X64Encoder enc;
    abi.emitFrameAlloc(enc, frameSize);
    EXPECT_TRUE(enc.resolveLabels().hasValue());
    return enc.bytes();
}

} // namespace

TEST(X64ISel, FrameLayoutIsSixteenByteAligned)
{
    Function fn = constantMain(0);
    fn.localWords = {1, 3};
    fn.slotCount = 3;
    auto frame = layoutFrame(fn);
    ASSERT_TRUE(frame.hasValue());
    const FrameLayout &layout = frame.value();
    ASSERT_EQ(layout.localDisp.size(), 2u);
    EXPECT_EQ(layout.localDisp[0], -8);
    EXPECT_EQ(layout.localDisp[1], -32);
    ASSERT_EQ(layout.slotDisp.size(), 3u);
    EXPECT_EQ(layout.slotDisp[0], -40);
    EXPECT_EQ(layout.slotDisp[2], -56);
    EXPECT_EQ(layout.frameSize, 64u);
    EXPECT_EQ(layout.frameSize % 16, 0u);
}

TEST(X64ISel, OversizedFrameIsRejected)
{
    Function fn = constantMain(0);
    fn.localWords = {0x10000000u}; // 2 GiB
    auto frame = layoutFrame(fn);
    ASSERT_FALSE(frame.hasValue());
    EXPECT_EQ(frame.error().code, "P4000");
    EXPECT_NE(frame.error().message.find("stack frame of function 'main'"), std::string::npos);
}

TEST(X64ISel, FrameSizeArithmeticSaturates)
{
    Function fn = constantMain(0);
    fn.localWords = {UINT64_MAX, 1};
    EXPECT_EQ(fn.frameWords(), UINT64_MAX);
    auto frame = layoutFrame(fn);
    ASSERT_FALSE(frame.hasValue());
    EXPECT_EQ(frame.error().code, "P4000");
}

TEST(X64ISel, HugeArrayLocalIsRejectedAtItsFunction)
{
    // 2^32 + 1 words would wrap to a one-word frame if truncated to 32 bits.
    auto module = compileToIr("fn main() {\n"
                              "    var a: [i64; 4294967297]\n"
                              "    a[0] = 1\n"
                              "    return a[0]\n"
                              "}\n");
    ASSERT_EQ(module.functions.size(), 1u);
    perc::codegen::elf::LinuxAbi abi;
    auto mc = selectModule(module, abi);
    ASSERT_FALSE(mc.hasValue());
    const auto &diag = mc.error();
    EXPECT_EQ(diag.code, "P4000");
    EXPECT_NE(diag.message.find("stack frame of function 'main' exceeds"), std::string::npos);
    EXPECT_EQ(diag.loc.line, 1u);
    EXPECT_NE(diag.loc.file_id, 0u);
}

TEST(X64ISel, SmallFramesAllocateWithOneSubtract)
{
    // sub rsp, 0x40
    const std::vector<uint8_t> sub64{0x48, 0x81, 0xEC, 0x40, 0x00, 0x00, 0x00};
    EXPECT_EQ(frameAllocBytes(perc::codegen::pe::WindowsAbi{}, 64), sub64);
    EXPECT_EQ(frameAllocBytes(perc::codegen::elf::LinuxAbi{}, 64), sub64);
    EXPECT_TRUE(frameAllocBytes(perc::codegen::pe::WindowsAbi{}, 0).empty());

    // Linux grows its stack on any fault below the guard, so a large frame
    // is still a single subtract.
    const std::vector<uint8_t> sub40c0{0x48, 0x81, 0xEC, 0xC0, 0x40, 0x00, 0x00};
    EXPECT_EQ(frameAllocBytes(perc::codegen::elf::LinuxAbi{}, 0x40C0), sub40c0);
}

TEST(X64ISel, WindowsTouchesEachPageOfALargeFrame)
{
    const std::vector<uint8_t> expected{
        0x49, 0xC7, 0xC3, 0xC0, 0x40, 0x00, 0x00, // mov r11, 0x40c0
        0x48, 0x81, 0xEC, 0x00, 0x10, 0x00, 0x00, // next: sub rsp, 0x1000
        0x4C, 0x89, 0x1C, 0x24,                   // mov [rsp], r11
        0x49, 0x81, 0xEB, 0x00, 0x10, 0x00, 0x00, // sub r11, 0x1000
        0x49, 0x81, 0xFB, 0x00, 0x10, 0x00, 0x00, // cmp r11, 0x1000
        0x0F, 0x87, 0xE1, 0xFF, 0xFF, 0xFF,       // ja next
        0x4C, 0x29, 0xDC,                         // sub rsp, r11
    };
    EXPECT_EQ(frameAllocBytes(perc::codegen::pe::WindowsAbi{}, 0x40C0), expected);
}

TEST(X64ISel, LargeLocalArrayFramesDifferOnlyOnWindows)
{
    auto module = compileToIr("fn main() {\n"
                              "    var a: [i64; 2048]\n"
                              "    a[2047] = 3\n"
                              "    return a[2047]\n"
                              "}\n");
    perc::codegen::elf::LinuxAbi sysv;
    perc::codegen::pe::WindowsAbi win64;
    auto elfCode = selectModule(module, sysv);
    auto peCode = selectModule(module, win64);
    ASSERT_TRUE(elfCode.hasValue());
    ASSERT_TRUE(peCode.hasValue());

    const FunctionRange *onLinux = rangeOf(elfCode.value(), "main");
    const FunctionRange *onWindows = rangeOf(peCode.value(), "main");
    ASSERT_NE(onLinux, nullptr);
    ASSERT_NE(onWindows, nullptr);

    // sub rsp, 0x1000; mov [rsp], r11
    const std::vector<uint8_t> pageStep{0x48, 0x81, 0xEC, 0x00, 0x10, 0x00, 0x00,
                                        0x4C, 0x89, 0x1C, 0x24};
    EXPECT_TRUE(contains(bytesOf(peCode.value(), *onWindows), pageStep));
    EXPECT_FALSE(contains(bytesOf(elfCode.value(), *onLinux), pageStep));
}

TEST(X64ISel, MissingEntryIsRejected)
{
    perc::codegen::elf::LinuxAbi abi;
    auto mc = selectModule(moduleWith({constantMain(0)}, 1), abi);
    ASSERT_FALSE(mc.hasValue());
    EXPECT_EQ(mc.error().code, "P4000");
}

TEST(X64ISel, FunctionRangesCoverEachFunction)
{
    perc::codegen::elf::LinuxAbi abi;
    auto module = compileToIr("fn seven() -> i64 { return 7 }\n"
                              "fn main() { stdio.PrintlnStr(\"x\")\n return seven() }\n");
    auto mc = selectModule(module, abi);
    ASSERT_TRUE(mc.hasValue());
    const MachineCode &code = mc.value();
    ASSERT_EQ(code.functions.size(), module.functions.size());
    for (size_t i = 1; i < code.functions.size(); ++i)
        EXPECT_EQ(code.functions[i].begin, code.functions[i - 1].end);
    EXPECT_LT(code.entryOffset, code.functions.front().begin);

    const FunctionRange *seven = rangeOf(code, "seven");
    ASSERT_NE(seven, nullptr);
    // push rbp; mov rbp, rsp opens every function.
    ASSERT_GE(seven->end - seven->begin, 4u);
    EXPECT_EQ(code.code[seven->begin], 0x55);
    EXPECT_EQ(code.code[seven->end - 1], 0xC3);

    EXPECT_FALSE(code.data.empty());
    EXPECT_FALSE(code.dataFixups.empty());
    EXPECT_TRUE(code.importFixups.empty());
    EXPECT_GE(code.memorySize(), code.data.size());
}

TEST(X64ISel, CallFreeBodiesMatchAcrossConventions)
{
    auto module = compileToIr("fn calc() -> i64 {\n"
                              "    var a: i64 = 6\n"
                              "    var b: [i64; 2]\n"
                              "    b[1] = a * 7\n"
                              "    if b[1] > 40 && a != 0 { return b[1] / 2 % 5 }\n"
                              "    return -a\n"
                              "}\n"
                              "fn main() { return calc() }\n");
    perc::codegen::elf::LinuxAbi sysv;
    perc::codegen::pe::WindowsAbi win64;
    auto elfCode = selectModule(module, sysv);
    auto peCode = selectModule(module, win64);
    ASSERT_TRUE(elfCode.hasValue());
    ASSERT_TRUE(peCode.hasValue());

    const FunctionRange *onLinux = rangeOf(elfCode.value(), "calc");
    const FunctionRange *onWindows = rangeOf(peCode.value(), "calc");
    ASSERT_NE(onLinux, nullptr);
    ASSERT_NE(onWindows, nullptr);
    EXPECT_EQ(bytesOf(elfCode.value(), *onLinux), bytesOf(peCode.value(), *onWindows));

    // Only the Windows image exits through an import.
    EXPECT_FALSE(peCode.value().importFixups.empty());
    EXPECT_TRUE(elfCode.value().importFixups.empty());
}

TEST(X64ISel, RelocatePatchesRelativeDisplacements)
{
    MachineCode mc;
    mc.code.assign(16, 0);
    mc.dataFixups.push_back({2, 0x10});
    mc.importFixups.push_back({8, 1});
    auto ok = relocate(mc, 0x1000, 0x2000, {0x3000, 0x3008});
    ASSERT_TRUE(ok.hasValue());

    // 0x2010 - (0x1002 + 4) = 0x100A
    EXPECT_EQ(mc.code[2], 0x0A);
    EXPECT_EQ(mc.code[3], 0x10);
    EXPECT_EQ(mc.code[4], 0x00);
    // 0x3008 - (0x1008 + 4) = 0x1FFC
    EXPECT_EQ(mc.code[8], 0xFC);
    EXPECT_EQ(mc.code[9], 0x1F);
}

TEST(X64ISel, RelocateRejectsUnknownImportSlot)
{
    MachineCode mc;
    mc.code.assign(8, 0);
    mc.importFixups.push_back({0, 4});
    auto ok = relocate(mc, 0x1000, 0x2000, {0x3000});
    ASSERT_FALSE(ok.hasValue());
    EXPECT_NE(ok.error().message.find("unknown import slot 4"), std::string::npos);
}
