//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "frontends/per/ModuleTable.hpp"
#include "frontends/per/Stdlib.hpp"

namespace perc::frontends::per
{

namespace
{

FunctionSignature intrinsicSignature(const perc::ir::IntrinsicInfo &info)
{
    FunctionSignature sig;
    switch (info.arg)
    {
        case perc::ir::IntrinsicArg::None:
            break;
        case perc::ir::IntrinsicArg::Int:
            sig.params.emplace_back("value", types::i64());
            break;
        case perc::ir::IntrinsicArg::Str:
            sig.params.emplace_back("text", types::string());
            break;
    }
    if (info.returnsInt)
        sig.returnType = types::i64();
    else if (info.returnsString)
        sig.returnType = types::string();
    else
        sig.returnType = types::voidType();
    return sig;
}

} // namespace

ModuleTable ModuleTable::build(const std::vector<LoadedModule> &modules)
{
    ModuleTable table;

    ModuleInfo stdio;
    stdio.name = std::string(kStdioModule);
    stdio.intrinsic = true;
    for (const auto &info : perc::ir::allIntrinsics())
    {
        ModuleFunction fn;
        fn.name = std::string(info.name);
        fn.signature = intrinsicSignature(info);
        fn.intrinsic = info.id;
        stdio.functions.emplace(fn.name, std::move(fn));
    }
    table.modules_.push_back(std::move(stdio));

    for (const auto &loaded : modules)
    {
        ModuleInfo info;
        info.name = loaded.name;
        info.program = loaded.program.get();
        for (const auto &decl : loaded.program->functions)
        {
            ModuleFunction fn;
            fn.name = decl.name;
            for (const auto &p : decl.params)
                fn.signature.params.emplace_back(p.name, p.type);
            fn.signature.returnType = decl.returnType ? decl.returnType : types::voidType();
            fn.decl = &decl;
            fn.exported = decl.isExported();
            // First definition wins; Sema reports the duplicate.
            info.functions.emplace(fn.name, std::move(fn));
        }
        table.modules_.push_back(std::move(info));
    }
    return table;
}

const ModuleInfo *ModuleTable::find(std::string_view name) const
{
    for (const auto &m : modules_)
    {
        if (m.name == name)
            return &m;
    }
    return nullptr;
}

} // namespace perc::frontends::per
