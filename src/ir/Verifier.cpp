//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Verifier.cpp
/// @brief IR structural verifier.
///
/// @details The lowerer only produces well-formed IR; the verifier guards the
/// back ends against hand-built or future producers so they never encode an
/// out-of-range field.
///
//===----------------------------------------------------------------------===//

#include "ir/Verifier.hpp"
#include "ir/Intrinsics.hpp"
#include "ir/Serializer.hpp"

#include <vector>

namespace perc::ir
{

using perc::support::Expected;
using perc::support::makeError;

namespace
{

Expected<void> fail(const Function &fn, const Instr *instr, const Module &module,
                    const std::string &what)
{
    std::string msg = "malformed IR in function '" + fn.name + "': " + what;
    if (instr)
        msg += " in '" + Serializer::toString(*instr, module) + "'";
    return makeError(instr ? instr->loc : perc::support::SourceLoc{},
                     msg,
                     perc::support::kCodegenError);
}

Expected<void> verifyFunction(const Function &fn, const Module &module)
{
    if (fn.localWords.size() < fn.paramCount)
        return fail(fn, nullptr, module, "fewer locals than parameters");
    for (uint32_t i = 0; i < fn.paramCount; ++i)
    {
        if (fn.localWords[i] != 1)
            return fail(fn, nullptr, module, "parameter local is not one word");
    }

    std::vector<int> labelDefs(fn.labelCount, 0);
    std::vector<bool> labelUsed(fn.labelCount, false);
    for (const auto &instr : fn.body)
    {
        const OpcodeInfo &info = getOpcodeInfo(instr.op);
        if (info.operands >= 0 && instr.operands.size() != static_cast<size_t>(info.operands))
            return fail(fn, &instr, module, "wrong operand count");
        if (info.hasResult && !instr.hasDst())
            return fail(fn, &instr, module, "missing destination slot");
        if (instr.hasDst() && instr.dst >= fn.slotCount)
            return fail(fn, &instr, module, "destination slot out of range");
        for (uint32_t s : instr.operands)
        {
            if (s >= fn.slotCount)
                return fail(fn, &instr, module, "operand slot out of range");
        }

        switch (instr.op)
        {
            case Opcode::StrAddr:
                if (instr.index >= module.strings.size())
                    return fail(fn, &instr, module, "string id out of range");
                break;
            case Opcode::LocalAddr:
            case Opcode::LoadLocal:
            case Opcode::StoreLocal:
                if (instr.index >= fn.localWords.size())
                    return fail(fn, &instr, module, "local id out of range");
                break;
            case Opcode::Label:
                if (instr.index >= fn.labelCount)
                    return fail(fn, &instr, module, "label id out of range");
                if (++labelDefs[instr.index] > 1)
                    return fail(fn, &instr, module, "label defined twice");
                break;
            case Opcode::Jmp:
            case Opcode::Jz:
            case Opcode::Jnz:
                if (instr.index >= fn.labelCount)
                    return fail(fn, &instr, module, "label id out of range");
                labelUsed[instr.index] = true;
                break;
            case Opcode::Call:
            {
                if (instr.index >= module.functions.size())
                    return fail(fn, &instr, module, "callee index out of range");
                const Function &callee = module.functions[instr.index];
                if (instr.operands.size() != callee.paramCount)
                    return fail(fn, &instr, module, "argument count mismatch");
                if (instr.hasDst() && !callee.returnsValue)
                    return fail(fn, &instr, module, "result taken from a void function");
                break;
            }
            case Opcode::Ret:
                if (instr.operands.size() > 1)
                    return fail(fn, &instr, module, "ret takes at most one operand");
                if (fn.returnsValue != (instr.operands.size() == 1))
                    return fail(fn, &instr, module, "ret does not match the function result");
                break;
            case Opcode::Intrinsic:
            {
                const IntrinsicInfo *intr = findIntrinsic(static_cast<uint16_t>(instr.index));
                if (!intr)
                    return fail(fn, &instr, module, "unknown intrinsic");
                size_t want = intr->arg == IntrinsicArg::None ? 0 : 1;
                if (instr.operands.size() != want)
                    return fail(fn, &instr, module, "intrinsic argument count mismatch");
                if (instr.hasDst() && !intrinsicHasResult(*intr))
                    return fail(fn, &instr, module, "result taken from a void intrinsic");
                break;
            }
            default:
                break;
        }
    }

    for (uint32_t label = 0; label < fn.labelCount; ++label)
    {
        if (labelUsed[label] && labelDefs[label] == 0)
            return fail(fn, nullptr, module, "branch to undefined label .L" + std::to_string(label));
    }

    if (fn.body.empty() || fn.body.back().op != Opcode::Ret)
        return fail(fn, nullptr, module, "body does not end with ret");
    return {};
}

} // namespace

Expected<void> Verifier::verify(const Module &module)
{
    if (module.entry >= module.functions.size())
        return makeError({}, "malformed IR: entry function missing", perc::support::kCodegenError);
    const Function &entry = module.functions[module.entry];
    if (entry.paramCount != 0 || !entry.returnsValue)
        return makeError({},
                         "malformed IR: entry function must take no parameters and return a value",
                         perc::support::kCodegenError);

    for (const auto &fn : module.functions)
    {
        if (auto ok = verifyFunction(fn, module); !ok)
            return ok;
    }
    return {};
}

} // namespace perc::ir
