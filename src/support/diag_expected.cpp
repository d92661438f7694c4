//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Diagnostic construction and rendering.  Every message the driver prints,
// whether collected by a DiagnosticEngine or returned in an Expected, goes
// through printDiag.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

#include <string_view>

namespace perc::support
{
namespace
{

/// @brief `path:line:col: ` for locations the manager can name; empty otherwise.
void printLocation(const SourceLoc &loc, std::ostream &os, const SourceManager *sm)
{
    if (!sm || !loc.hasFile())
        return;
    const std::string_view path = sm->getPath(loc.file_id);
    if (path.empty())
        return;

    os << path;
    if (loc.hasLine())
    {
        os << ':' << loc.line;
        if (loc.hasColumn())
            os << ':' << loc.column;
    }
    os << ": ";
}

/// @brief Source line and caret; tabs are kept so the caret lines up.
void printExcerpt(const SourceLoc &loc, std::ostream &os, const SourceManager *sm)
{
    if (!sm || !loc.isValid())
        return;
    const std::string_view text = sm->lineText(loc.file_id, loc.line);
    if (text.empty())
        return;

    os << "    " << text << "\n    ";
    if (loc.hasColumn())
    {
        const size_t column = loc.column - 1;
        for (size_t i = 0; i < column && i < text.size(); ++i)
            os << (text[i] == '\t' ? '\t' : ' ');
        os << '^';
    }
    os << '\n';
}

} // namespace

namespace detail
{
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "error";
}
} // namespace detail

Diag makeError(SourceLoc loc, std::string msg, std::string_view code)
{
    Diag diag;
    diag.severity = Severity::Error;
    diag.message = std::move(msg);
    diag.loc = loc;
    diag.code = std::string(code);
    return diag;
}

void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    printLocation(diag.loc, os, sm);
    os << detail::diagSeverityToString(diag.severity) << ": ";

    if (!diag.code.empty())
    {
        const std::string_view kind = diagCodeName(diag.code);
        os << '[' << (kind.empty() ? std::string_view(diag.code) : kind) << "] ";
    }
    os << diag.message << '\n';

    printExcerpt(diag.loc, os, sm);
}

} // namespace perc::support
