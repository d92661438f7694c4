//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Registry of every Per file a compilation reads: the user's source,
//          imported modules and the embedded library modules.
// Key invariants: Ids start at 1 and are never reused; one normalized path
//                 maps to one id.
// Ownership/Lifetime: Owns paths and source texts; returned views stay valid
//                     for the manager's lifetime.
// Links: support/diag_expected.hpp (printDiag renders excerpts from here)
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace perc::support
{

class SourceManager
{
  public:
    /// @brief Register @p path and return its id.
    /// @details A path already known (after lexical normalization) keeps its
    ///          id; non-empty @p text replaces the stored contents.
    /// @return File id, or 0 when no further ids are available.
    uint32_t addFile(std::string path, std::string text = {});

    /// @brief Normalized path of @p file_id; empty when unknown.
    [[nodiscard]] std::string_view getPath(uint32_t file_id) const;

    /// @brief Text of line @p line (1-based) without its terminator.
    /// @return Empty when the file has no recorded text or the line is absent.
    [[nodiscard]] std::string_view lineText(uint32_t file_id, uint32_t line) const;

    [[nodiscard]] size_t fileCount() const
    {
        return entries_.size();
    }

  private:
    struct Entry
    {
        std::string path;
        std::string text;
        std::vector<size_t> lineStarts; ///< Offsets of each line; built on registration.
    };

    void indexLines(Entry &entry);

    std::deque<Entry> entries_; ///< entries_[id - 1]; deque keeps views stable.
    std::unordered_map<std::string, uint32_t> ids_;
};

} // namespace perc::support
