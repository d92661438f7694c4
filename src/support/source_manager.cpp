//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File registration for diagnostics.  `./a/../prog.per` and `prog.per` share
// one id, so a module imported twice through different spellings is reported
// under a single path.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"
#include "support/diag_expected.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

namespace perc::support
{

uint32_t SourceManager::addFile(std::string path, std::string text)
{
    std::string key = std::filesystem::path(std::move(path)).lexically_normal().generic_string();

    auto known = ids_.find(key);
    if (known != ids_.end())
    {
        if (!text.empty())
        {
            Entry &entry = entries_[known->second - 1];
            entry.text = std::move(text);
            indexLines(entry);
        }
        return known->second;
    }

    if (entries_.size() >= std::numeric_limits<uint32_t>::max())
    {
        printDiag(makeError({}, "too many source files in one compilation", kIoError), std::cerr);
        return 0;
    }

    entries_.push_back(Entry{key, std::move(text), {}});
    indexLines(entries_.back());
    const auto id = static_cast<uint32_t>(entries_.size());
    ids_.emplace(std::move(key), id);
    return id;
}

void SourceManager::indexLines(Entry &entry)
{
    entry.lineStarts.assign(1, 0);
    for (size_t i = 0; i < entry.text.size(); ++i)
    {
        if (entry.text[i] == '\n')
            entry.lineStarts.push_back(i + 1);
    }
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > entries_.size())
        return {};
    return entries_[file_id - 1].path;
}

std::string_view SourceManager::lineText(uint32_t file_id, uint32_t line) const
{
    if (file_id == 0 || file_id > entries_.size() || line == 0)
        return {};
    const Entry &entry = entries_[file_id - 1];
    if (entry.text.empty() || line > entry.lineStarts.size())
        return {};

    const size_t begin = entry.lineStarts[line - 1];
    size_t end = line < entry.lineStarts.size() ? entry.lineStarts[line] - 1 : entry.text.size();
    if (end > begin && entry.text[end - 1] == '\r')
        --end;
    return std::string_view(entry.text).substr(begin, end - begin);
}

} // namespace perc::support
