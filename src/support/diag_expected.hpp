//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Result type returned by the back ends, the import loader and the
//          bytecode reader, plus the printer that renders one diagnostic.
// Key invariants: An Expected holds a value or exactly one diagnostic, never
//                 both.
// Ownership/Lifetime: Expected owns whichever alternative it holds.
// Links: support/diagnostics.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace perc::support
{
using Diag = Diagnostic;

/// @brief A value of type @p T or the diagnostic explaining its absence.
template <class T> class Expected
{
  public:
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>>>
    Expected(U &&value) : state_(std::in_place_index<0>, std::forward<U>(value))
    {
    }

    Expected(Diag diag) : state_(std::in_place_index<1>, std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return state_.index() == 0;
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    T &value()
    {
        return std::get<0>(state_);
    }

    const T &value() const
    {
        return std::get<0>(state_);
    }

    /// @brief Failure diagnostic; only meaningful when hasValue() is false.
    const Diag &error() const &
    {
        return std::get<1>(state_);
    }

  private:
    std::variant<T, Diag> state_;
};

/// @brief Success carries no payload; default construction means success.
template <> class Expected<void>
{
  public:
    Expected() = default;

    Expected(Diag diag) : failed_(true), diag_(std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return !failed_;
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    const Diag &error() const &
    {
        return diag_;
    }

  private:
    bool failed_ = false;
    Diag diag_{};
};

namespace detail
{
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Error diagnostic at @p loc tagged with stage @p code (e.g. kTypeError).
Diag makeError(SourceLoc loc, std::string msg, std::string_view code = {});

/// @brief Render @p diag as `path:line:col: error: [TypeError] message`.
/// @details With a SourceManager that recorded the file's text, the offending
///          line follows with a caret under the column.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm = nullptr);

} // namespace perc::support
