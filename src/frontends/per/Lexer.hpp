//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.hpp
/// @brief Lexical analyzer for Per source code.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/per/Token.hpp"
#include "support/diagnostics.hpp"

#include <optional>
#include <string>
#include <vector>

namespace perc::frontends::per
{

/// @brief Lexical analyzer for Per source code.
///
/// @details Transforms source text into tokens on demand.  Whitespace, `//`
/// line comments and `/* */` block comments are skipped.  The first lexical
/// error is reported to the diagnostic engine with code P1000 and yields a
/// TokenKind::Error token; after that the lexer keeps returning Eof.
///
/// @invariant pos_ <= source_.size()
class Lexer
{
  public:
    /// @param source Source code text; the lexer keeps its own copy.
    /// @param fileId File identifier embedded in every token location.
    /// @param diag Diagnostic engine; must outlive the lexer.
    Lexer(std::string source, uint32_t fileId, perc::support::DiagnosticEngine &diag);

    /// @brief Consume and return the next token.
    Token next();

    /// @brief Look at the next token without consuming it.
    /// @note The returned reference is valid until the next call to next().
    const Token &peek();

    /// @brief Lex the whole input; the last token is Eof or Error.
    std::vector<Token> tokenize();

  private:
    char peekChar() const;
    char peekChar(size_t offset) const;
    char getChar();
    bool eof() const;
    perc::support::SourceLoc currentLoc() const;

    Token errorToken(perc::support::SourceLoc loc, const std::string &message);

    /// @brief Skip whitespace and comments.
    /// @return False after reporting an unterminated block comment.
    bool skipWhitespaceAndComments(perc::support::SourceLoc &errorLoc);

    Token lexIdentifierOrKeyword();
    Token lexNumber();
    Token lexString();
    Token lexToken();

    static std::optional<TokenKind> lookupKeyword(const std::string &name);

    std::string source_;
    size_t pos_ = 0;
    uint32_t fileId_;
    uint32_t line_ = 1;
    uint32_t column_ = 1;
    bool sawNewline_ = false;
    bool failed_ = false;
    std::optional<Token> peeked_;
    perc::support::DiagnosticEngine &diag_;
};

} // namespace perc::frontends::per
