//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/pe/PeFormat.hpp
// Purpose: PE32+ header structures and constants for x64 console images.
// Key invariants: Field order and widths match the on-disk layout; the
//                 write helpers serialize them little endian, field by field.
// Ownership/Lifetime: Plain value types.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/common/ByteWriter.hpp"

#include <cstdint>
#include <string>

namespace perc::codegen::pe
{

constexpr uint32_t kPeHeaderOffset = 0x80; ///< e_lfanew
constexpr uint16_t kMachineAmd64 = 0x8664;
constexpr uint16_t kOptionalMagicPe32Plus = 0x20B;
constexpr uint16_t kSubsystemConsole = 3;
constexpr uint16_t kFileExecutable = 0x0002;
constexpr uint16_t kFileLargeAddressAware = 0x0020;
constexpr uint16_t kDllDynamicBase = 0x0040;
constexpr uint16_t kDllNxCompat = 0x0100;
constexpr uint32_t kSectionCode = 0x60000020;     ///< CODE | EXECUTE | READ
constexpr uint32_t kSectionReadWrite = 0xC0000040; ///< INITIALIZED_DATA | READ | WRITE
constexpr uint32_t kDirImport = 1;
constexpr uint32_t kDirIat = 12;
constexpr uint64_t kStackReserve = 8 << 20; ///< Same as the usual Linux stack limit.

constexpr uint32_t kCoffHeaderSize = 20;
constexpr uint32_t kOptionalHeaderSize = 240;
constexpr uint32_t kSectionHeaderSize = 40;
constexpr uint32_t kImportDescriptorSize = 20;

struct DosHeader
{
    uint16_t e_magic = 0x5A4D; // MZ
    uint16_t e_cblp = 0x0090;
    uint16_t e_cp = 0x0003;
    uint16_t e_crlc = 0;
    uint16_t e_cparhdr = 0x0004;
    uint16_t e_minalloc = 0;
    uint16_t e_maxalloc = 0xFFFF;
    uint16_t e_ss = 0;
    uint16_t e_sp = 0x00B8;
    uint16_t e_csum = 0;
    uint16_t e_ip = 0;
    uint16_t e_cs = 0;
    uint16_t e_lfarlc = 0x0040;
    uint16_t e_ovno = 0;
    uint32_t e_lfanew = kPeHeaderOffset;
};

struct CoffHeader
{
    uint16_t Machine = kMachineAmd64;
    uint16_t NumberOfSections = 0;
    uint32_t TimeDateStamp = 0;
    uint32_t PointerToSymbolTable = 0;
    uint32_t NumberOfSymbols = 0;
    uint16_t SizeOfOptionalHeader = kOptionalHeaderSize;
    uint16_t Characteristics = kFileExecutable | kFileLargeAddressAware;
};

struct DataDir
{
    uint32_t VirtualAddress = 0;
    uint32_t Size = 0;
};

struct OptionalHeader64
{
    uint16_t Magic = kOptionalMagicPe32Plus;
    uint8_t MajorLinkerVersion = 1;
    uint8_t MinorLinkerVersion = 0;
    uint32_t SizeOfCode = 0;
    uint32_t SizeOfInitializedData = 0;
    uint32_t SizeOfUninitializedData = 0;
    uint32_t AddressOfEntryPoint = 0;
    uint32_t BaseOfCode = 0;
    uint64_t ImageBase = 0;
    uint32_t SectionAlignment = 0;
    uint32_t FileAlignment = 0;
    uint16_t MajorOperatingSystemVersion = 6;
    uint16_t MinorOperatingSystemVersion = 0;
    uint16_t MajorImageVersion = 0;
    uint16_t MinorImageVersion = 0;
    uint16_t MajorSubsystemVersion = 6;
    uint16_t MinorSubsystemVersion = 0;
    uint32_t Win32VersionValue = 0;
    uint32_t SizeOfImage = 0;
    uint32_t SizeOfHeaders = 0;
    uint32_t CheckSum = 0;
    uint16_t Subsystem = kSubsystemConsole;
    uint16_t DllCharacteristics = kDllDynamicBase | kDllNxCompat;
    uint64_t SizeOfStackReserve = kStackReserve;
    uint64_t SizeOfStackCommit = 1 << 12;
    uint64_t SizeOfHeapReserve = 1 << 20;
    uint64_t SizeOfHeapCommit = 1 << 12;
    uint32_t LoaderFlags = 0;
    uint32_t NumberOfRvaAndSizes = 16;
    DataDir DataDirectory[16]{};
};

struct SectionHeader
{
    std::string Name;
    uint32_t VirtualSize = 0;
    uint32_t VirtualAddress = 0;
    uint32_t SizeOfRawData = 0;
    uint32_t PointerToRawData = 0;
    uint32_t Characteristics = 0;
};

inline void writeDosHeader(perc::codegen::common::ByteWriter &w, const DosHeader &h)
{
    w.u16(h.e_magic);
    w.u16(h.e_cblp);
    w.u16(h.e_cp);
    w.u16(h.e_crlc);
    w.u16(h.e_cparhdr);
    w.u16(h.e_minalloc);
    w.u16(h.e_maxalloc);
    w.u16(h.e_ss);
    w.u16(h.e_sp);
    w.u16(h.e_csum);
    w.u16(h.e_ip);
    w.u16(h.e_cs);
    w.u16(h.e_lfarlc);
    w.u16(h.e_ovno);
    w.zeros(8);  // e_res
    w.zeros(4);  // e_oemid, e_oeminfo
    w.zeros(20); // e_res2
    w.u32(h.e_lfanew);
}

inline void writeCoffHeader(perc::codegen::common::ByteWriter &w, const CoffHeader &h)
{
    w.text("PE");
    w.u16(0);
    w.u16(h.Machine);
    w.u16(h.NumberOfSections);
    w.u32(h.TimeDateStamp);
    w.u32(h.PointerToSymbolTable);
    w.u32(h.NumberOfSymbols);
    w.u16(h.SizeOfOptionalHeader);
    w.u16(h.Characteristics);
}

inline void writeOptionalHeader(perc::codegen::common::ByteWriter &w, const OptionalHeader64 &h)
{
    w.u16(h.Magic);
    w.u8(h.MajorLinkerVersion);
    w.u8(h.MinorLinkerVersion);
    w.u32(h.SizeOfCode);
    w.u32(h.SizeOfInitializedData);
    w.u32(h.SizeOfUninitializedData);
    w.u32(h.AddressOfEntryPoint);
    w.u32(h.BaseOfCode);
    w.u64(h.ImageBase);
    w.u32(h.SectionAlignment);
    w.u32(h.FileAlignment);
    w.u16(h.MajorOperatingSystemVersion);
    w.u16(h.MinorOperatingSystemVersion);
    w.u16(h.MajorImageVersion);
    w.u16(h.MinorImageVersion);
    w.u16(h.MajorSubsystemVersion);
    w.u16(h.MinorSubsystemVersion);
    w.u32(h.Win32VersionValue);
    w.u32(h.SizeOfImage);
    w.u32(h.SizeOfHeaders);
    w.u32(h.CheckSum);
    w.u16(h.Subsystem);
    w.u16(h.DllCharacteristics);
    w.u64(h.SizeOfStackReserve);
    w.u64(h.SizeOfStackCommit);
    w.u64(h.SizeOfHeapReserve);
    w.u64(h.SizeOfHeapCommit);
    w.u32(h.LoaderFlags);
    w.u32(h.NumberOfRvaAndSizes);
    for (const auto &dir : h.DataDirectory)
    {
        w.u32(dir.VirtualAddress);
        w.u32(dir.Size);
    }
}

inline void writeSectionHeader(perc::codegen::common::ByteWriter &w, const SectionHeader &s)
{
    w.fixedText(s.Name, 8);
    w.u32(s.VirtualSize);
    w.u32(s.VirtualAddress);
    w.u32(s.SizeOfRawData);
    w.u32(s.PointerToRawData);
    w.u32(0); // PointerToRelocations
    w.u32(0); // PointerToLinenumbers
    w.u16(0); // NumberOfRelocations
    w.u16(0); // NumberOfLinenumbers
    w.u32(s.Characteristics);
}

} // namespace perc::codegen::pe
