//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Compiler.cpp
/// @brief Implementation of the Per compiler driver.
///
//===----------------------------------------------------------------------===//

#include "frontends/per/Compiler.hpp"
#include "frontends/per/AstPrinter.hpp"
#include "frontends/per/ImportResolver.hpp"
#include "frontends/per/Lexer.hpp"
#include "frontends/per/Lowerer.hpp"
#include "frontends/per/ModuleTable.hpp"
#include "frontends/per/Parser.hpp"
#include "frontends/per/Sema.hpp"
#include "ir/Serializer.hpp"
#include "ir/Verifier.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace perc::frontends::per
{

namespace
{

/// @brief Print every token from the source to stderr.
/// @details Uses its own lexer and diagnostic engine so the real parse
///          reports lexical errors exactly once.
void dumpTokenStream(const std::string &source, uint32_t fileId)
{
    perc::support::DiagnosticEngine scratch;
    Lexer lexer(source, fileId, scratch);
    std::cerr << "=== Per Token Stream ===\n";
    for (;;)
    {
        Token tok = lexer.next();
        std::cerr << tok.loc.line << ':' << tok.loc.column << '\t'
                  << tokenKindToString(tok.kind);
        if (!tok.text.empty())
            std::cerr << "\t\"" << tok.text << '"';
        if (tok.kind == TokenKind::IntegerLiteral)
            std::cerr << "\tvalue=" << tok.intValue;
        std::cerr << '\n';
        if (tok.kind == TokenKind::Eof || tok.kind == TokenKind::Error)
            break;
    }
    std::cerr << "=== End Token Stream ===\n";
}

void debugPhase(const char *phase)
{
    if (std::getenv("PERC_DEBUG_COMPILE"))
        std::cerr << "[perc] " << phase << std::endl;
}

} // namespace

bool CompilerResult::succeeded() const
{
    return diagnostics.errorCount() == 0;
}

CompilerResult compile(const CompilerInput &input,
                       const CompilerOptions &options,
                       perc::support::SourceManager &sm)
{
    CompilerResult result{};
    result.fileId = input.fileId ? *input.fileId
                                 : sm.addFile(std::string(input.path), std::string(input.source));

    if (options.dumpTokens)
        dumpTokenStream(std::string(input.source), result.fileId);

    debugPhase("Phase 1: Lexing and parsing");
    Lexer lexer(std::string(input.source), result.fileId, result.diagnostics);
    Parser parser(lexer, result.diagnostics);
    auto program = parser.parseProgram();
    if (!program || parser.hasError())
        return result;

    if (options.dumpAst)
    {
        AstPrinter printer;
        std::cerr << "=== AST after parsing ===\n"
                  << printer.dump(*program) << "=== End AST ===\n";
    }

    debugPhase("Phase 2: Import resolution");
    std::vector<LoadedModule> modules;
    ImportResolver resolver(result.diagnostics, sm);
    if (!resolver.resolve(*program, std::string(input.path), modules))
        return result;
    ModuleTable table = ModuleTable::build(modules);

    debugPhase("Phase 3: Semantic analysis");
    Sema sema(result.diagnostics);
    if (!sema.analyze(*program, table))
        return result;

    debugPhase("Phase 4: IR lowering");
    Lowerer lowerer(sema.model());
    result.module = lowerer.lower();

    if (options.dumpIR)
    {
        std::cerr << "=== IR after lowering ===\n";
        perc::ir::Serializer::write(result.module, std::cerr);
        std::cerr << "=== End IR ===\n";
    }

    if (options.verifyIR)
    {
        debugPhase("Phase 5: IR verification");
        if (auto ok = perc::ir::Verifier::verify(result.module); !ok)
            result.diagnostics.report(ok.error());
    }

    debugPhase("Done");
    return result;
}

CompilerResult compileFile(const std::string &path,
                           const CompilerOptions &options,
                           perc::support::SourceManager &sm)
{
    std::ifstream file(path, std::ios::binary);
    if (!file)
    {
        CompilerResult result{};
        result.diagnostics.report({perc::support::Severity::Error,
                                   "cannot open source file: " + path,
                                   perc::support::SourceLoc{},
                                   std::string(perc::support::kIoError)});
        return result;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string source = buffer.str();

    CompilerInput input;
    input.source = source;
    input.path = path;
    return compile(input, options, sm);
}

} // namespace perc::frontends::per
