//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/pe/PeWriter.cpp
// Purpose: Section layout, import table construction and serialization of
//          the PE32+ image.
// Key invariants: See PeWriter.hpp.
// Ownership/Lifetime: The MachineCode argument is consumed.
//
//===----------------------------------------------------------------------===//

#include "codegen/pe/PeWriter.hpp"
#include "codegen/common/ByteWriter.hpp"
#include "codegen/pe/PeFormat.hpp"
#include "codegen/pe/WindowsAbi.hpp"
#include "codegen/x86_64/ISel.hpp"

namespace perc::codegen::pe
{

using perc::codegen::common::alignUp;
using perc::codegen::common::ByteWriter;
using perc::support::Expected;

namespace
{

constexpr char kDosStub[] = "This program cannot be run in DOS mode.\r\r\n$";

uint32_t align32(uint64_t value, uint32_t align)
{
    return static_cast<uint32_t>(alignUp(value, align));
}

/// \brief Contents of .idata with section-relative offsets of its tables.
struct ImportSection
{
    std::vector<uint8_t> bytes;
    uint32_t descriptors = 0;
    uint32_t lookupTable = 0;
    uint32_t addressTable = 0;
    uint32_t dllName = 0;
    std::vector<uint32_t> hintNames;

    [[nodiscard]] uint32_t tableBytes() const
    {
        return static_cast<uint32_t>((kImportNames.size() + 1) * 8);
    }
};

/// \brief Lay out one import descriptor (plus terminator), the lookup and
///        address tables and the hint/name entries.  RVAs are patched by
///        bindImports once the section address is known.
ImportSection buildImports()
{
    ImportSection imp;
    ByteWriter w(imp.bytes);

    imp.descriptors = static_cast<uint32_t>(w.size());
    w.zeros(2 * kImportDescriptorSize);

    w.padTo(8);
    imp.lookupTable = static_cast<uint32_t>(w.size());
    w.zeros(imp.tableBytes());

    w.padTo(8);
    imp.addressTable = static_cast<uint32_t>(w.size());
    w.zeros(imp.tableBytes());

    imp.dllName = static_cast<uint32_t>(w.size());
    w.text(kImportDll);
    w.u8(0);

    for (std::string_view name : kImportNames)
    {
        w.padTo(2);
        imp.hintNames.push_back(static_cast<uint32_t>(w.size()));
        w.u16(0); // hint
        w.text(name);
        w.u8(0);
    }
    return imp;
}

void bindImports(ImportSection &imp, uint32_t rva)
{
    ByteWriter w(imp.bytes);
    w.patch32(imp.descriptors + 0, rva + imp.lookupTable); // OriginalFirstThunk
    w.patch32(imp.descriptors + 12, rva + imp.dllName);    // Name
    w.patch32(imp.descriptors + 16, rva + imp.addressTable); // FirstThunk
    for (size_t i = 0; i < imp.hintNames.size(); ++i)
    {
        const uint64_t hintName = rva + imp.hintNames[i];
        w.patch64(imp.lookupTable + 8 * i, hintName);
        w.patch64(imp.addressTable + 8 * i, hintName);
    }
}

} // namespace

Expected<std::vector<uint8_t>> writePe(perc::codegen::x64::MachineCode mc)
{
    ImportSection imports = buildImports();

    const uint32_t textRva = kSectionAlignment;
    const uint32_t dataRva = textRva + align32(mc.code.size(), kSectionAlignment);
    const uint32_t dataVirtualSize = mc.memorySize();
    const uint32_t idataRva = dataRva + align32(dataVirtualSize == 0 ? 1 : dataVirtualSize,
                                                kSectionAlignment);
    bindImports(imports, idataRva);

    std::vector<uint64_t> slotAddrs;
    for (size_t i = 0; i < kImportNames.size(); ++i)
        slotAddrs.push_back(kImageBase + idataRva + imports.addressTable + 8 * i);
    if (auto ok = perc::codegen::x64::relocate(mc, kImageBase + textRva, kImageBase + dataRva, slotAddrs);
        !ok)
        return ok.error();

    SectionHeader text;
    text.Name = ".text";
    text.VirtualSize = static_cast<uint32_t>(mc.code.size());
    text.VirtualAddress = textRva;
    text.SizeOfRawData = align32(mc.code.size(), kFileAlignment);
    text.PointerToRawData = kSizeOfHeaders;
    text.Characteristics = kSectionCode;

    SectionHeader data;
    data.Name = ".data";
    data.VirtualSize = dataVirtualSize;
    data.VirtualAddress = dataRva;
    data.SizeOfRawData = align32(mc.data.size(), kFileAlignment);
    data.PointerToRawData = data.SizeOfRawData == 0 ? 0 : text.PointerToRawData + text.SizeOfRawData;
    data.Characteristics = kSectionReadWrite;

    SectionHeader idata;
    idata.Name = ".idata";
    idata.VirtualSize = static_cast<uint32_t>(imports.bytes.size());
    idata.VirtualAddress = idataRva;
    idata.SizeOfRawData = align32(imports.bytes.size(), kFileAlignment);
    idata.PointerToRawData = text.PointerToRawData + text.SizeOfRawData + data.SizeOfRawData;
    idata.Characteristics = kSectionReadWrite;

    CoffHeader coff;
    coff.NumberOfSections = 3;

    OptionalHeader64 opt;
    opt.SizeOfCode = text.SizeOfRawData;
    opt.SizeOfInitializedData = data.SizeOfRawData + idata.SizeOfRawData;
    opt.AddressOfEntryPoint = textRva + static_cast<uint32_t>(mc.entryOffset);
    opt.BaseOfCode = textRva;
    opt.ImageBase = kImageBase;
    opt.SectionAlignment = kSectionAlignment;
    opt.FileAlignment = kFileAlignment;
    opt.SizeOfImage = align32(uint64_t{idataRva} + idata.VirtualSize, kSectionAlignment);
    opt.SizeOfHeaders = kSizeOfHeaders;
    opt.DataDirectory[kDirImport] = {idataRva + imports.descriptors, 2 * kImportDescriptorSize};
    opt.DataDirectory[kDirIat] = {idataRva + imports.addressTable, imports.tableBytes()};

    std::vector<uint8_t> image;
    ByteWriter w(image);
    writeDosHeader(w, DosHeader{});
    w.text(kDosStub);
    w.padToOffset(kPeHeaderOffset);
    writeCoffHeader(w, coff);
    writeOptionalHeader(w, opt);
    writeSectionHeader(w, text);
    writeSectionHeader(w, data);
    writeSectionHeader(w, idata);

    w.padToOffset(text.PointerToRawData);
    w.bytes(mc.code);
    w.padToOffset(text.PointerToRawData + text.SizeOfRawData);
    w.bytes(mc.data);
    w.padToOffset(idata.PointerToRawData);
    w.bytes(imports.bytes);
    w.padToOffset(idata.PointerToRawData + idata.SizeOfRawData);
    return image;
}

Expected<std::vector<uint8_t>> emitPe(const perc::ir::Module &module)
{
    WindowsAbi abi;
    auto mc = perc::codegen::x64::selectModule(module, abi);
    if (!mc)
        return mc.error();
    return writePe(std::move(mc.value()));
}

} // namespace perc::codegen::pe
