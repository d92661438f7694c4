//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Serializer.cpp
/// @brief Textual IR printer.
///
/// @details Output looks like:
/// @code
///   entry main
///   string 0 "hi\n"
///
///   func main(params=0) locals=[1] slots=3 -> value
///     %0 = const 5
///     stl $0, %0
///   .L0:
///     %1 = ldl $0
///     intr Println(%1)
///     ret %1
///   end
/// @endcode
/// Slots print as `%N`, frame locals as `$N`, labels as `.LN`.
///
//===----------------------------------------------------------------------===//

#include "ir/Serializer.hpp"
#include "ir/Intrinsics.hpp"

#include <cstdio>
#include <sstream>

namespace perc::ir
{

namespace
{

std::string slot(uint32_t s)
{
    return "%" + std::to_string(s);
}

std::string joinSlots(const std::vector<uint32_t> &slots)
{
    std::string out;
    for (size_t i = 0; i < slots.size(); ++i)
    {
        if (i != 0)
            out += ", ";
        out += slot(slots[i]);
    }
    return out;
}

} // namespace

std::string Serializer::quote(const std::string &bytes)
{
    std::string out = "\"";
    for (unsigned char c : bytes)
    {
        switch (c)
        {
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '"':
                out += "\\\"";
                break;
            default:
                if (c < 0x20 || c >= 0x7f)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                    out += buf;
                }
                else
                {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    out += '"';
    return out;
}

std::string Serializer::toString(const Instr &instr, const Module &module)
{
    std::string out;
    if (instr.hasDst())
        out = slot(instr.dst) + " = ";
    out += ir::toString(instr.op);

    switch (instr.op)
    {
        case Opcode::Const:
            out += " " + std::to_string(instr.imm);
            break;
        case Opcode::StrAddr:
            out += " #" + std::to_string(instr.index);
            break;
        case Opcode::LocalAddr:
        case Opcode::LoadLocal:
            out += " $" + std::to_string(instr.index);
            break;
        case Opcode::StoreLocal:
            out += " $" + std::to_string(instr.index) + ", " + joinSlots(instr.operands);
            break;
        case Opcode::Label:
            return ".L" + std::to_string(instr.index) + ":";
        case Opcode::Jmp:
            out += " .L" + std::to_string(instr.index);
            break;
        case Opcode::Jz:
        case Opcode::Jnz:
            out += " " + joinSlots(instr.operands) + ", .L" + std::to_string(instr.index);
            break;
        case Opcode::Call:
        {
            std::string callee = instr.index < module.functions.size()
                                     ? module.functions[instr.index].name
                                     : "?" + std::to_string(instr.index);
            out += " " + callee + "(" + joinSlots(instr.operands) + ")";
            break;
        }
        case Opcode::Intrinsic:
        {
            const IntrinsicInfo *info = findIntrinsic(static_cast<uint16_t>(instr.index));
            std::string name = info ? std::string(info->name) : "?" + std::to_string(instr.index);
            out += " " + name + "(" + joinSlots(instr.operands) + ")";
            break;
        }
        default:
            if (!instr.operands.empty())
                out += " " + joinSlots(instr.operands);
            break;
    }
    return out;
}

void Serializer::write(const Module &module, std::ostream &os)
{
    if (module.entry < module.functions.size())
        os << "entry " << module.functions[module.entry].name << '\n';
    for (size_t i = 0; i < module.strings.size(); ++i)
        os << "string " << i << ' ' << quote(module.strings[i]) << '\n';

    for (const auto &fn : module.functions)
    {
        os << "\nfunc " << fn.name << "(params=" << fn.paramCount << ") locals=[";
        for (size_t i = 0; i < fn.localWords.size(); ++i)
        {
            if (i != 0)
                os << ',';
            os << fn.localWords[i];
        }
        os << "] slots=" << fn.slotCount << (fn.returnsValue ? " -> value" : "") << '\n';
        for (const auto &instr : fn.body)
        {
            if (instr.op == Opcode::Label)
                os << toString(instr, module) << '\n';
            else
                os << "  " << toString(instr, module) << '\n';
        }
        os << "end\n";
    }
}

std::string Serializer::toString(const Module &module)
{
    std::ostringstream os;
    write(module, os);
    return os.str();
}

} // namespace perc::ir
