//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Compiler.hpp
/// @brief Per compiler driver: source text to IR.
///
/// @details Runs the front-end phases in order and stops at the first phase
/// that reports an error:
///
/// 1. **Lexing** and **Parsing** of the root file (Lexer, Parser)
/// 2. **Import Resolution** of library modules (ImportResolver)
/// 3. **Semantic Analysis** (Sema)
/// 4. **IR Lowering** (Lowerer), followed by the IR verifier
///
/// ```cpp
/// SourceManager sm;
/// CompilerResult result = compileFile("main.per", CompilerOptions{}, sm);
/// if (result.succeeded())
///     auto bytes = perc::codegen::elf::emitElf(result.module);
/// ```
///
/// Setting the environment variable `PERC_DEBUG_COMPILE` traces each phase
/// on stderr.
///
/// @invariant The module is meaningful only when succeeded() returns true.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/per/Options.hpp"
#include "ir/Module.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace perc::frontends::per
{

/// @brief Source to compile.
struct CompilerInput
{
    /// @brief Per source text.
    std::string_view source;

    /// @brief Path used for diagnostics and for resolving imports.
    std::string_view path{"<input>"};

    /// @brief Existing file id within the supplied source manager, if any.
    std::optional<uint32_t> fileId{};
};

struct CompilerResult
{
    /// @brief Diagnostics reported by every phase that ran.
    perc::support::DiagnosticEngine diagnostics{};

    /// @brief File id of the root source.
    uint32_t fileId{0};

    /// @brief Lowered IR.
    perc::ir::Module module{};

    [[nodiscard]] bool succeeded() const;
};

/// @brief Compile Per source text into IR.
CompilerResult compile(const CompilerInput &input,
                       const CompilerOptions &options,
                       perc::support::SourceManager &sm);

/// @brief Compile the Per source file at @p path.
/// @details An unreadable file is reported as an IoError (P5000).
CompilerResult compileFile(const std::string &path,
                           const CompilerOptions &options,
                           perc::support::SourceManager &sm);

} // namespace perc::frontends::per
