//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Tokens.cpp
/// @brief Token buffering and error reporting for the Per parser.
///
//===----------------------------------------------------------------------===//

#include "frontends/per/Parser.hpp"

namespace perc::frontends::per
{

Parser::Parser(Lexer &lexer, perc::support::DiagnosticEngine &diag) : lexer_(lexer), diag_(diag)
{
    tokens_.push_back(lexer_.next());
}

const Token &Parser::peek(size_t offset)
{
    while (tokens_.size() <= tokenPos_ + offset)
    {
        tokens_.push_back(lexer_.next());
    }
    return tokens_[tokenPos_ + offset];
}

Token Parser::advance()
{
    Token cur = peek();
    if (cur.kind != TokenKind::Eof && cur.kind != TokenKind::Error)
        ++tokenPos_;
    return cur;
}

bool Parser::check(TokenKind kind, size_t offset)
{
    return peek(offset).kind == kind;
}

bool Parser::match(TokenKind kind, Token *out)
{
    if (check(kind))
    {
        Token tok = advance();
        if (out)
            *out = tok;
        return true;
    }
    return false;
}

bool Parser::expect(TokenKind kind, const char *what, Token *out)
{
    if (check(kind))
    {
        Token tok = advance();
        if (out)
            *out = tok;
        return true;
    }
    const Token &got = peek();
    std::string shown = got.kind == TokenKind::Identifier || got.isKeyword()
                            ? "'" + got.text + "'"
                            : std::string(tokenKindToString(got.kind));
    if (got.kind == TokenKind::IntegerLiteral)
        shown = "integer " + got.text;
    error(std::string("expected ") + what + ", got " + shown);
    return false;
}

bool Parser::finishStatement()
{
    if (match(TokenKind::Semicolon))
        return true;
    const Token &tok = peek();
    if (tok.kind == TokenKind::RBrace || tok.kind == TokenKind::Eof || tok.newlineBefore)
        return true;
    error(std::string("expected ';' or line break, got ") + tokenKindToString(tok.kind));
    return false;
}

void Parser::error(const std::string &message)
{
    errorAt(peek().loc, message);
}

void Parser::errorAt(SourceLoc loc, const std::string &message)
{
    if (hasError_)
        return;
    hasError_ = true;
    // The lexer already reported the malformed token.
    if (peek().kind == TokenKind::Error)
        return;
    diag_.report(perc::support::Diagnostic{perc::support::Severity::Error,
                                           message,
                                           loc,
                                           std::string(perc::support::kParseError)});
}

} // namespace perc::frontends::per
