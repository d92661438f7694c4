//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/NvmDisassembler.cpp
// Purpose: Decoder and text printer for NVM bytecode containers.
// Key invariants: Every read is bounds checked; a short or inconsistent
//                 container yields an error instead of partial text.
// Ownership: See NvmDisassembler.hpp.
// Lifetime: N/A.
// Links: Nvm.hpp
//
//===----------------------------------------------------------------------===//
//
// Output shape:
//
//   .entry main
//   .const 0 "hi\n"
//
//   main:
//   ; params=0 frame=1 slots=3
//       const %0, 5
//       stl $0, %0
//   L0012:
//       ldl %1, $0
//       intr Println(%1)
//       ret %1

#include "bytecode/NvmDisassembler.hpp"
#include "bytecode/Nvm.hpp"
#include "bytecode/NvmWriter.hpp"
#include "codegen/common/ByteWriter.hpp"
#include "ir/Intrinsics.hpp"
#include "ir/Serializer.hpp"

#include <cstdio>
#include <map>
#include <optional>
#include <set>
#include <sstream>

namespace perc::bytecode
{

using perc::ir::Opcode;
using perc::support::Expected;
using perc::support::kCodegenError;
using perc::support::makeError;

namespace
{

/// @brief Bounds-checked little-endian cursor over [pos, end).
class Reader
{
  public:
    Reader(const std::vector<uint8_t> &bytes, size_t begin, size_t end)
        : bytes_(bytes), pos_(begin), end_(end)
    {
    }

    [[nodiscard]] size_t pos() const
    {
        return pos_;
    }

    [[nodiscard]] bool atEnd() const
    {
        return pos_ >= end_;
    }

    bool u8(uint8_t &v)
    {
        uint64_t raw = 0;
        if (!read(raw, 1))
            return false;
        v = static_cast<uint8_t>(raw);
        return true;
    }

    bool u16(uint16_t &v)
    {
        uint64_t raw = 0;
        if (!read(raw, 2))
            return false;
        v = static_cast<uint16_t>(raw);
        return true;
    }

    bool u32(uint32_t &v)
    {
        uint64_t raw = 0;
        if (!read(raw, 4))
            return false;
        v = static_cast<uint32_t>(raw);
        return true;
    }

    bool i64(int64_t &v)
    {
        uint64_t raw = 0;
        if (!read(raw, 8))
            return false;
        v = static_cast<int64_t>(raw);
        return true;
    }

    bool text(size_t n, std::string &out)
    {
        if (end_ - pos_ < n)
            return false;
        out.assign(bytes_.begin() + static_cast<std::ptrdiff_t>(pos_),
                   bytes_.begin() + static_cast<std::ptrdiff_t>(pos_ + n));
        pos_ += n;
        return true;
    }

  private:
    bool read(uint64_t &v, int n)
    {
        if (pos_ > end_ || end_ - pos_ < static_cast<size_t>(n))
            return false;
        v = perc::codegen::common::readLE(bytes_, pos_, n);
        pos_ += static_cast<size_t>(n);
        return true;
    }

    const std::vector<uint8_t> &bytes_;
    size_t pos_;
    size_t end_;
};

struct FunctionEntry
{
    uint32_t codeOffset = 0;
    uint16_t params = 0;
    uint16_t frameWords = 0;
    uint32_t slots = 0;
    std::string name;
};

/// @brief One decoded instruction; the branch target, if any, is rendered
///        after `operands` once all label positions are known.
struct Decoded
{
    uint32_t offset = 0;
    Opcode op = Opcode::Const;
    std::string operands;
    std::optional<uint32_t> target;
};

perc::support::Diag malformed(const std::string &what)
{
    return makeError({}, "malformed NVM bytecode: " + what, kCodegenError);
}

std::string slot(uint32_t s)
{
    return "%" + std::to_string(s);
}

std::string labelName(uint32_t offset)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "L%04x", offset);
    return buf;
}

class Decoder
{
  public:
    Decoder(Reader &reader, const std::vector<FunctionEntry> &functions, size_t codeBegin)
        : r_(reader), functions_(functions), codeBegin_(codeBegin)
    {
    }

    Expected<Decoded> next()
    {
        Decoded d;
        d.offset = static_cast<uint32_t>(r_.pos() - codeBegin_);
        uint8_t byte = 0;
        if (!r_.u8(byte))
            return malformed("truncated instruction");
        auto op = opcodeFromByte(byte);
        if (!op || *op == Opcode::Label)
            return malformed("bad opcode byte " + std::to_string(byte) + " at " + labelName(d.offset));
        d.op = *op;

        uint32_t a = 0;
        uint32_t b = 0;
        uint32_t c = 0;
        switch (d.op)
        {
            case Opcode::Const:
            {
                int64_t imm = 0;
                if (!r_.u32(a) || !r_.i64(imm))
                    return truncated(d);
                d.operands = slot(a) + ", " + std::to_string(imm);
                break;
            }
            case Opcode::StrAddr:
                if (!r_.u32(a) || !r_.u32(b))
                    return truncated(d);
                d.operands = slot(a) + ", #" + std::to_string(b);
                break;
            case Opcode::LocalAddr:
            case Opcode::LoadLocal:
                if (!r_.u32(a) || !r_.u32(b))
                    return truncated(d);
                d.operands = slot(a) + ", $" + std::to_string(b);
                break;
            case Opcode::StoreLocal:
                if (!r_.u32(a) || !r_.u32(b))
                    return truncated(d);
                d.operands = "$" + std::to_string(a) + ", " + slot(b);
                break;
            case Opcode::Store:
                if (!r_.u32(a) || !r_.u32(b))
                    return truncated(d);
                d.operands = slot(a) + ", " + slot(b);
                break;
            case Opcode::Jmp:
                if (!r_.u32(a))
                    return truncated(d);
                d.target = a;
                break;
            case Opcode::Jz:
            case Opcode::Jnz:
                if (!r_.u32(a) || !r_.u32(b))
                    return truncated(d);
                d.operands = slot(a);
                d.target = b;
                break;
            case Opcode::Call:
            {
                if (!r_.u32(a) || !r_.u32(b))
                    return truncated(d);
                if (b >= functions_.size())
                    return malformed("call to unknown function " + std::to_string(b));
                auto list = argList(d);
                if (!list)
                    return list.error();
                d.operands = (a == kNvmNoDst ? "" : slot(a) + ", ") + functions_[b].name + list.value();
                break;
            }
            case Opcode::Intrinsic:
            {
                uint16_t id = 0;
                if (!r_.u32(a) || !r_.u16(id))
                    return truncated(d);
                const perc::ir::IntrinsicInfo *info = perc::ir::findIntrinsic(id);
                if (!info)
                    return malformed("unknown intrinsic " + std::to_string(id));
                auto list = argList(d);
                if (!list)
                    return list.error();
                d.operands =
                    (a == kNvmNoDst ? "" : slot(a) + ", ") + std::string(info->name) + list.value();
                break;
            }
            case Opcode::Ret:
            {
                uint8_t hasValue = 0;
                if (!r_.u8(hasValue) || !r_.u32(a))
                    return truncated(d);
                if (hasValue)
                    d.operands = slot(a);
                break;
            }
            default:
            {
                const int sources = perc::ir::getOpcodeInfo(d.op).operands;
                if (!r_.u32(a) || !r_.u32(b))
                    return truncated(d);
                d.operands = slot(a) + ", " + slot(b);
                if (sources == 2)
                {
                    if (!r_.u32(c))
                        return truncated(d);
                    d.operands += ", " + slot(c);
                }
                break;
            }
        }
        return d;
    }

  private:
    perc::support::Diag truncated(const Decoded &d)
    {
        return malformed(std::string("truncated ") + perc::ir::toString(d.op) + " at " +
                         labelName(d.offset));
    }

    Expected<std::string> argList(const Decoded &d)
    {
        uint8_t argc = 0;
        if (!r_.u8(argc))
            return truncated(d);
        std::string out = "(";
        for (uint8_t i = 0; i < argc; ++i)
        {
            uint32_t s = 0;
            if (!r_.u32(s))
                return truncated(d);
            if (i != 0)
                out += ", ";
            out += slot(s);
        }
        return out + ")";
    }

    Reader &r_;
    const std::vector<FunctionEntry> &functions_;
    size_t codeBegin_;
};

} // namespace

Expected<std::string> disassemble(const std::vector<uint8_t> &bytes)
{
    Reader header(bytes, 0, bytes.size());
    std::string magic;
    if (!header.text(kNvmMagic.size(), magic) || magic != kNvmMagic)
        return malformed("missing NVM0 magic");

    uint16_t version = 0;
    uint16_t flags = 0;
    uint32_t entry = 0;
    uint32_t poolSize = 0;
    uint32_t functionCount = 0;
    uint32_t codeSize = 0;
    if (!header.u16(version) || !header.u16(flags) || !header.u32(entry) ||
        !header.u32(poolSize) || !header.u32(functionCount) || !header.u32(codeSize))
        return malformed("truncated header");
    if (version != kNvmVersion)
        return malformed("unsupported version " + std::to_string(version));
    if (flags != 0)
        return malformed("unsupported flags " + std::to_string(flags));

    const size_t poolBegin = kNvmHeaderSize;
    if (bytes.size() - poolBegin < poolSize)
        return malformed("constant pool exceeds file");
    std::vector<std::string> constants;
    Reader pool(bytes, poolBegin, poolBegin + poolSize);
    while (!pool.atEnd())
    {
        uint8_t kind = 0;
        uint32_t len = 0;
        std::string value;
        if (!pool.u8(kind) || !pool.u32(len) || !pool.text(len, value))
            return malformed("truncated constant pool");
        if (kind != kConstString)
            return malformed("unknown constant kind " + std::to_string(kind));
        constants.push_back(std::move(value));
    }

    Reader table(bytes, poolBegin + poolSize, bytes.size());
    std::vector<FunctionEntry> functions;
    for (uint32_t i = 0; i < functionCount; ++i)
    {
        FunctionEntry fn;
        uint32_t nameLen = 0;
        if (!table.u32(fn.codeOffset) || !table.u16(fn.params) || !table.u16(fn.frameWords) ||
            !table.u32(fn.slots) || !table.u32(nameLen) || !table.text(nameLen, fn.name))
            return malformed("truncated function table");
        functions.push_back(std::move(fn));
    }

    const size_t codeBegin = table.pos();
    if (bytes.size() - codeBegin != codeSize)
        return malformed("code size does not match file size");

    std::vector<Decoded> decoded;
    std::set<uint32_t> targets;
    Reader code(bytes, codeBegin, bytes.size());
    Decoder decoder(code, functions, codeBegin);
    while (!code.atEnd())
    {
        auto d = decoder.next();
        if (!d)
            return d.error();
        if (d.value().target)
        {
            if (*d.value().target >= codeSize)
                return malformed("branch target outside the code stream");
            targets.insert(*d.value().target);
        }
        decoded.push_back(std::move(d.value()));
    }

    std::map<uint32_t, const FunctionEntry *> starts;
    for (const auto &fn : functions)
        starts.emplace(fn.codeOffset, &fn);

    std::ostringstream os;
    auto entryIt = starts.find(entry);
    os << ".entry " << (entryIt != starts.end() ? entryIt->second->name : labelName(entry))
       << '\n';
    for (size_t i = 0; i < constants.size(); ++i)
        os << ".const " << i << ' ' << perc::ir::Serializer::quote(constants[i]) << '\n';

    for (const auto &d : decoded)
    {
        if (auto it = starts.find(d.offset); it != starts.end())
        {
            const FunctionEntry &fn = *it->second;
            os << '\n' << fn.name << ":\n"
               << "; params=" << fn.params << " frame=" << fn.frameWords << " slots=" << fn.slots
               << '\n';
        }
        if (targets.count(d.offset))
            os << labelName(d.offset) << ":\n";

        os << "    " << perc::ir::toString(d.op);
        std::string operands = d.operands;
        if (d.target)
            operands += (operands.empty() ? "" : ", ") + labelName(*d.target);
        if (!operands.empty())
            os << ' ' << operands;
        os << '\n';
    }
    return os.str();
}

Expected<std::string> renderAssembly(const perc::ir::Module &module)
{
    auto bytes = encodeModule(module);
    if (!bytes)
        return bytes.error();
    return disassemble(bytes.value());
}

} // namespace perc::bytecode
