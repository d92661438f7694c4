//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file diagnostics.cpp
/// @brief Stage-code naming and the DiagnosticEngine.
/// @details The lexer, parser, import loader and Sema report into one engine;
///          the driver prints it after the front end stops.  Every error is
///          terminal, so an engine rarely holds more than one.
///
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"
#include "support/diag_expected.hpp"

#include <utility>

namespace perc::support
{
namespace
{

struct CodeName
{
    std::string_view code;
    const char *name;
};

constexpr CodeName kCodeNames[] = {
    {kLexError, "LexError"},
    {kParseError, "ParseError"},
    {kTypeError, "TypeError"},
    {kCodegenError, "CodegenError"},
    {kIoError, "IoError"},
};

} // namespace

const char *diagCodeName(std::string_view code)
{
    for (const auto &entry : kCodeNames)
    {
        if (entry.code == code)
            return entry.name;
    }
    return "";
}

void DiagnosticEngine::report(Diagnostic d)
{
    switch (d.severity)
    {
        case Severity::Error:
            ++errors_;
            break;
        case Severity::Warning:
            ++warnings_;
            break;
        case Severity::Note:
            break;
    }
    records_.push_back(std::move(d));
}

void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &record : records_)
        printDiag(record, os, sm);
}

} // namespace perc::support
