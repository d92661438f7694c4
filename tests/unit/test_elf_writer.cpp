// File: tests/unit/test_elf_writer.cpp
// Purpose: Layout of the static ELF64 executables written for Linux x86-64.
// Key invariants: One RWX PT_LOAD maps the file from offset 0 at the image
//                 base; code starts at kCodeFileOffset; the zero-filled area
//                 is covered by p_memsz only.
// Ownership/Lifetime: Images are byte vectors owned by each test.
// Links: src/codegen/elf/ElfWriter.cpp, src/codegen/elf/ElfFormat.hpp

#include "IrTestUtil.hpp"
#include "codegen/elf/ElfFormat.hpp"
#include "codegen/elf/ElfWriter.hpp"
#include "codegen/elf/LinuxAbi.hpp"
#include "codegen/x86_64/ISel.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace perc::codegen::elf;
using perc::test::compileToIr;

namespace
{

uint64_t readLe(const std::vector<uint8_t> &b, size_t at, int width)
{
    uint64_t v = 0;
    for (int i = width - 1; i >= 0; --i)
        v = (v << 8) | b.at(at + static_cast<size_t>(i));
    return v;
}

} // namespace

TEST(ElfWriter, HeaderDescribesStaticExecutable)
{
    auto module = compileToIr("fn main() { stdio.PrintlnStr(\"hello\")\n return 3 }");
    auto mc = perc::codegen::x64::selectModule(module, LinuxAbi{});
    ASSERT_TRUE(mc.hasValue());
    const size_t entryOffset = mc.value().entryOffset;

    auto image = writeElf(mc.value());
    ASSERT_TRUE(image.hasValue());
    const auto &b = image.value();
    ASSERT_GT(b.size(), kCodeFileOffset);

    EXPECT_EQ(b[0], 0x7F);
    EXPECT_EQ(b[1], 'E');
    EXPECT_EQ(b[2], 'L');
    EXPECT_EQ(b[3], 'F');
    EXPECT_EQ(b[4], 2); // ELFCLASS64
    EXPECT_EQ(b[5], 1); // little endian
    EXPECT_EQ(readLe(b, 16, 2), 2u);  // ET_EXEC
    EXPECT_EQ(readLe(b, 18, 2), 62u); // EM_X86_64
    EXPECT_EQ(readLe(b, 24, 8), kImageBase + kCodeFileOffset + entryOffset);
    EXPECT_EQ(readLe(b, 32, 8), kEhdrSize); // e_phoff
    EXPECT_EQ(readLe(b, 52, 2), kEhdrSize);
    EXPECT_EQ(readLe(b, 54, 2), kPhdrSize);
    EXPECT_EQ(readLe(b, 56, 2), 1u); // e_phnum
}

TEST(ElfWriter, SingleLoadSegmentCoversZeroFill)
{
    auto image = emitElf(compileToIr("fn main() { return stdio.ReadInt() }"));
    ASSERT_TRUE(image.hasValue());
    const auto &b = image.value();
    const size_t ph = kEhdrSize;

    EXPECT_EQ(readLe(b, ph + 0, 4), 1u);  // PT_LOAD
    EXPECT_EQ(readLe(b, ph + 4, 4), 7u);  // R | W | X
    EXPECT_EQ(readLe(b, ph + 8, 8), 0u);  // p_offset
    EXPECT_EQ(readLe(b, ph + 16, 8), kImageBase);
    const uint64_t filesz = readLe(b, ph + 32, 8);
    const uint64_t memsz = readLe(b, ph + 40, 8);
    EXPECT_EQ(filesz, b.size());
    EXPECT_GT(memsz, filesz);
    EXPECT_EQ(readLe(b, ph + 48, 8), kSegmentAlign);

    // Code begins with the entry stub on a page boundary; the gap is zero.
    for (size_t i = kEhdrSize + kPhdrSize; i < kCodeFileOffset; ++i)
        ASSERT_EQ(b[i], 0) << "at " << i;
}

TEST(ElfWriter, StringDataIsPlacedAfterCode)
{
    auto image = emitElf(compileToIr("fn main() { stdio.PrintStr(\"marker-text\")\n return 0 }"));
    ASSERT_TRUE(image.hasValue());
    const auto &b = image.value();
    const std::string text(b.begin(), b.end());
    const size_t at = text.find("marker-text");
    ASSERT_NE(at, std::string::npos);
    EXPECT_GT(at, kCodeFileOffset);
    // The record carries its length in the preceding word.
    EXPECT_EQ(readLe(b, at - 8, 8), 11u);
}

TEST(ElfWriter, ImportReferencesAreRejected)
{
    perc::codegen::x64::MachineCode mc;
    mc.code.assign(8, 0x90);
    mc.importFixups.push_back({2, 0});
    auto image = writeElf(mc);
    ASSERT_FALSE(image.hasValue());
    EXPECT_EQ(image.error().code, "P4000");
}
