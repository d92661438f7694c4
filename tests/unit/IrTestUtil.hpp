// File: tests/unit/IrTestUtil.hpp
// Purpose: Helpers shared by the IR and back-end unit tests for building IR
//          by hand or from Per source.
// Key invariants: Hand-built modules have `main` at index 0 unless noted.
// Ownership/Lifetime: All helpers return modules by value.
// Links: src/ir/Module.hpp, src/frontends/per/Compiler.hpp

#pragma once

#include "frontends/per/Compiler.hpp"
#include "ir/Module.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace perc::test
{

inline ir::Instr makeInstr(ir::Opcode op,
                           uint32_t dst = ir::kNoSlot,
                           std::vector<uint32_t> operands = {},
                           int64_t imm = 0,
                           uint32_t index = 0)
{
    ir::Instr instr;
    instr.op = op;
    instr.dst = dst;
    instr.operands = std::move(operands);
    instr.imm = imm;
    instr.index = index;
    return instr;
}

/// \brief `main` returning the constant @p value.
inline ir::Function constantMain(int64_t value)
{
    ir::Function fn;
    fn.name = "main";
    fn.returnsValue = true;
    fn.slotCount = 1;
    fn.body.push_back(makeInstr(ir::Opcode::Const, 0, {}, value));
    fn.body.push_back(makeInstr(ir::Opcode::Ret, ir::kNoSlot, {0}));
    return fn;
}

inline ir::Module moduleWith(std::vector<ir::Function> functions, uint32_t entry = 0)
{
    ir::Module module;
    module.functions = std::move(functions);
    module.entry = entry;
    return module;
}

/// \brief Compile Per @p source to IR; fails the current test on errors.
inline ir::Module compileToIr(const std::string &source)
{
    support::SourceManager sm;
    frontends::per::CompilerInput input{source, "test.per"};
    frontends::per::CompilerOptions opts;
    auto result = frontends::per::compile(input, opts, sm);
    if (!result.succeeded())
    {
        for (const auto &d : result.diagnostics.diagnostics())
            ADD_FAILURE() << d.code << ": " << d.message;
    }
    return std::move(result.module);
}

} // namespace perc::test
