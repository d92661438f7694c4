//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Diagnostic record, the stage codes that classify compile errors
//          and the engine that collects them across the front end.
// Key invariants: errorCount() and warningCount() match the reported records.
// Ownership/Lifetime: DiagnosticEngine owns its records.
// Links: support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace perc::support
{

class SourceManager;

enum class Severity
{
    Note,
    Warning,
    Error
};

/// @name Stage codes
/// @brief Each compile error carries the code of the stage that raised it;
///        printDiag shows the matching kind name instead of the number.
/// @{
inline constexpr std::string_view kLexError = "P1000";
inline constexpr std::string_view kParseError = "P2000";
inline constexpr std::string_view kTypeError = "P3000";
inline constexpr std::string_view kCodegenError = "P4000";
inline constexpr std::string_view kIoError = "P5000";
/// @}

struct Diagnostic
{
    Severity severity = Severity::Error;
    std::string message;
    SourceLoc loc;    ///< May be unknown for whole-program failures.
    std::string code; ///< Stage code such as "P3000"; empty when unclassified.
};

/// @brief Kind name for a stage code: "P2000" yields "ParseError".
/// @return Empty string for codes outside the table.
const char *diagCodeName(std::string_view code);

/// @brief Ordered collection of diagnostics for one compilation.
class DiagnosticEngine
{
  public:
    void report(Diagnostic d);

    /// @brief printDiag every record in report order.
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    [[nodiscard]] size_t errorCount() const
    {
        return errors_;
    }

    [[nodiscard]] size_t warningCount() const
    {
        return warnings_;
    }

    [[nodiscard]] bool hasErrors() const
    {
        return errors_ != 0;
    }

    [[nodiscard]] const std::vector<Diagnostic> &diagnostics() const
    {
        return records_;
    }

  private:
    std::vector<Diagnostic> records_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};

} // namespace perc::support
