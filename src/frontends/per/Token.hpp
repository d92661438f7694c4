//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Token.hpp
/// @brief Token kinds and token structure for the Per lexer.
///
/// Tokens are grouped into special tokens (end of input, error), literals,
/// keywords, operators and delimiters.  A token is an immutable value that
/// owns its lexeme text.
///
/// Line breaks are not tokens.  Instead every token records whether a line
/// break separated it from the previous token; the parser uses that bit to
/// end an expression at a line that starts with `*`, `-`, `&`, `(` or `[`.
///
/// @invariant IntegerLiteral tokens carry their decoded value in intValue.
/// @invariant StringLiteral tokens carry the unescaped bytes in stringValue.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <string>

namespace perc::frontends::per
{

enum class TokenKind
{
    Eof,
    Error,

    // Literals
    IntegerLiteral,
    StringLiteral,
    Identifier,

    // Keywords
    KwPackage,
    KwImport,
    KwFn,
    KwVar,
    KwIf,
    KwElse,
    KwFor,
    KwReturn,
    KwPub,

    // Arithmetic operators
    Plus,
    Minus,
    Star,
    Slash,
    Percent,

    // Comparison operators
    EqualEqual,
    NotEqual,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,

    // Logical and address operators
    AmpAmp,
    PipePipe,
    Bang,
    Ampersand,

    // Delimiters
    Equal,
    Semicolon,
    Comma,
    Colon,
    Dot,
    Arrow,
    LParen,
    RParen,
    LBrace,
    RBrace,
    LBracket,
    RBracket,
};

/// @brief Printable name of a token kind, e.g. "identifier" or "'{'".
const char *tokenKindToString(TokenKind kind);

/// @brief A single lexical token.
struct Token
{
    TokenKind kind = TokenKind::Eof;

    /// @brief Source spelling (for strings, including the quotes).
    std::string text;

    perc::support::SourceLoc loc{};

    /// @brief Decoded value of an integer literal.
    int64_t intValue = 0;

    /// @brief Unescaped contents of a string literal.
    std::string stringValue;

    /// @brief True when at least one line break precedes this token.
    bool newlineBefore = false;

    [[nodiscard]] bool is(TokenKind k) const
    {
        return kind == k;
    }

    [[nodiscard]] bool isKeyword() const
    {
        return kind >= TokenKind::KwPackage && kind <= TokenKind::KwPub;
    }
};

} // namespace perc::frontends::per
