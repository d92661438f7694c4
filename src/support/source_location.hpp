//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Position of a token or AST node inside a registered Per file.
// Key invariants: A zero field means "unknown"; known lines and columns are
//                 1-based and columns count bytes.
// Ownership/Lifetime: Plain value, copied freely.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace perc::support
{

/// @brief File id, line and column of a construct.
struct SourceLoc
{
    uint32_t file_id = 0; ///< SourceManager id; 0 when the file is unknown.
    uint32_t line = 0;
    uint32_t column = 0;

    [[nodiscard]] bool hasFile() const
    {
        return file_id != 0;
    }

    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }

    /// @brief Enough information for a `path:line` diagnostic prefix.
    [[nodiscard]] bool isValid() const
    {
        return hasFile() && hasLine();
    }
};

} // namespace perc::support
