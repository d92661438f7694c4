//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/elf/ElfWriter.cpp
// Purpose: Layout and serialization of the ELF64 executable image.
// Key invariants: See ElfWriter.hpp.
// Ownership/Lifetime: The MachineCode argument is consumed.
//
//===----------------------------------------------------------------------===//

#include "codegen/elf/ElfWriter.hpp"
#include "codegen/common/ByteWriter.hpp"
#include "codegen/elf/ElfFormat.hpp"
#include "codegen/elf/LinuxAbi.hpp"
#include "codegen/x86_64/ISel.hpp"

namespace perc::codegen::elf
{

using perc::codegen::common::alignUp;
using perc::codegen::common::ByteWriter;
using perc::support::Expected;

Expected<std::vector<uint8_t>> writeElf(perc::codegen::x64::MachineCode mc)
{
    if (!mc.importFixups.empty())
    {
        return perc::support::makeError(
            {}, "ELF images cannot call imported functions", perc::support::kCodegenError);
    }

    const uint64_t codeAddr = kImageBase + kCodeFileOffset;
    const uint64_t dataFileOffset = alignUp(kCodeFileOffset + mc.code.size(), 16);
    const uint64_t dataAddr = kImageBase + dataFileOffset;

    if (auto ok = perc::codegen::x64::relocate(mc, codeAddr, dataAddr, {}); !ok)
        return ok.error();

    Elf64_Ehdr ehdr;
    ehdr.e_ident[EI_MAG0] = ELFMAG0;
    ehdr.e_ident[EI_MAG1] = ELFMAG1;
    ehdr.e_ident[EI_MAG2] = ELFMAG2;
    ehdr.e_ident[EI_MAG3] = ELFMAG3;
    ehdr.e_ident[EI_CLASS] = ELFCLASS64;
    ehdr.e_ident[EI_DATA] = ELFDATA2LSB;
    ehdr.e_ident[EI_VERSION] = EV_CURRENT;
    ehdr.e_type = ET_EXEC;
    ehdr.e_machine = EM_X86_64;
    ehdr.e_version = EV_CURRENT;
    ehdr.e_entry = codeAddr + mc.entryOffset;
    ehdr.e_phoff = kEhdrSize;
    ehdr.e_ehsize = kEhdrSize;
    ehdr.e_phentsize = kPhdrSize;
    ehdr.e_phnum = 1;

    Elf64_Phdr load;
    load.p_type = PT_LOAD;
    load.p_flags = PF_R | PF_W | PF_X;
    load.p_offset = 0;
    load.p_vaddr = kImageBase;
    load.p_paddr = kImageBase;
    load.p_filesz = dataFileOffset + mc.data.size();
    load.p_memsz = dataFileOffset + mc.memorySize();
    load.p_align = kSegmentAlign;

    std::vector<uint8_t> image;
    image.reserve(static_cast<size_t>(load.p_filesz));
    ByteWriter w(image);
    writeEhdr(w, ehdr);
    writePhdr(w, load);
    w.padToOffset(kCodeFileOffset);
    w.bytes(mc.code);
    w.padToOffset(dataFileOffset);
    w.bytes(mc.data);
    return image;
}

Expected<std::vector<uint8_t>> emitElf(const perc::ir::Module &module)
{
    LinuxAbi abi;
    auto mc = perc::codegen::x64::selectModule(module, abi);
    if (!mc)
        return mc.error();
    return writeElf(std::move(mc.value()));
}

} // namespace perc::codegen::elf
