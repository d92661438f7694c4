//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/elf/ElfFormat.hpp
// Purpose: The subset of the ELF64 format needed to write a static
//          executable: the file header and program headers.
// Key invariants: Field order and widths mirror Elf64_Ehdr and Elf64_Phdr;
//                 the write helpers emit them little endian, field by field.
// Ownership/Lifetime: Plain value types.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/common/ByteWriter.hpp"

#include <cstdint>

namespace perc::codegen::elf
{

struct Elf64_Ehdr
{
    uint8_t e_ident[16]{};  // Magic number and other info
    uint16_t e_type = 0;    // Object file type
    uint16_t e_machine = 0; // Architecture
    uint32_t e_version = 0; // Object file version
    uint64_t e_entry = 0;   // Entry point virtual address
    uint64_t e_phoff = 0;   // Program header table file offset
    uint64_t e_shoff = 0;   // Section header table file offset
    uint32_t e_flags = 0;   // Processor-specific flags
    uint16_t e_ehsize = 0;
    uint16_t e_phentsize = 0;
    uint16_t e_phnum = 0;
    uint16_t e_shentsize = 0;
    uint16_t e_shnum = 0;
    uint16_t e_shstrndx = 0;
};

struct Elf64_Phdr
{
    uint32_t p_type = 0;
    uint32_t p_flags = 0;
    uint64_t p_offset = 0; // Segment file offset
    uint64_t p_vaddr = 0;
    uint64_t p_paddr = 0;
    uint64_t p_filesz = 0; // Segment size in file
    uint64_t p_memsz = 0;  // Segment size in memory
    uint64_t p_align = 0;
};

/// @name ELF magic number bytes
///@{
constexpr uint8_t ELFMAG0 = 0x7f;
constexpr uint8_t ELFMAG1 = 'E';
constexpr uint8_t ELFMAG2 = 'L';
constexpr uint8_t ELFMAG3 = 'F';
///@}

/// @name Indices into `e_ident`
///@{
constexpr int EI_MAG0 = 0;
constexpr int EI_MAG1 = 1;
constexpr int EI_MAG2 = 2;
constexpr int EI_MAG3 = 3;
constexpr int EI_CLASS = 4;
constexpr int EI_DATA = 5;
constexpr int EI_VERSION = 6;
///@}

constexpr uint8_t ELFCLASS64 = 2;
constexpr uint8_t ELFDATA2LSB = 1; // Little endian
constexpr uint8_t EV_CURRENT = 1;

constexpr uint16_t ET_EXEC = 2;
constexpr uint16_t EM_X86_64 = 62;

constexpr uint32_t PT_LOAD = 1;

/// @name Program header permission flags (`p_flags`)
///@{
constexpr uint32_t PF_X = 1;
constexpr uint32_t PF_W = 2;
constexpr uint32_t PF_R = 4;
///@}

constexpr uint16_t kEhdrSize = 64;
constexpr uint16_t kPhdrSize = 56;

inline void writeEhdr(perc::codegen::common::ByteWriter &w, const Elf64_Ehdr &h)
{
    w.bytes(h.e_ident, sizeof(h.e_ident));
    w.u16(h.e_type);
    w.u16(h.e_machine);
    w.u32(h.e_version);
    w.u64(h.e_entry);
    w.u64(h.e_phoff);
    w.u64(h.e_shoff);
    w.u32(h.e_flags);
    w.u16(h.e_ehsize);
    w.u16(h.e_phentsize);
    w.u16(h.e_phnum);
    w.u16(h.e_shentsize);
    w.u16(h.e_shnum);
    w.u16(h.e_shstrndx);
}

inline void writePhdr(perc::codegen::common::ByteWriter &w, const Elf64_Phdr &p)
{
    w.u32(p.p_type);
    w.u32(p.p_flags);
    w.u64(p.p_offset);
    w.u64(p.p_vaddr);
    w.u64(p.p_paddr);
    w.u64(p.p_filesz);
    w.u64(p.p_memsz);
    w.u64(p.p_align);
}

} // namespace perc::codegen::elf
