// File: tests/unit/test_per_lexer.cpp
// Purpose: Token kinds, literal decoding and lexical errors of the Per lexer.
// Key invariants: Lexing the same text twice yields the same tokens; every
//                 lexical error is reported once with code P1000 and ends the
//                 token stream with an Error token.
// Ownership/Lifetime: Each test owns its lexer and diagnostic engine.
// Links: src/frontends/per/Lexer.cpp

#include "frontends/per/Lexer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace perc::frontends::per;
using perc::support::DiagnosticEngine;

namespace
{

std::vector<Token> lexAll(const std::string &src, DiagnosticEngine &diag)
{
    Lexer lexer(src, 1, diag);
    return lexer.tokenize();
}

std::vector<TokenKind> kindsOf(const std::vector<Token> &tokens)
{
    std::vector<TokenKind> kinds;
    for (const auto &tok : tokens)
        kinds.push_back(tok.kind);
    return kinds;
}

} // namespace

TEST(PerLexer, KeywordsAndSynonyms)
{
    DiagnosticEngine diag;
    auto tokens = lexAll("package import use fn func var let if else for return pub main", diag);
    std::vector<TokenKind> expected = {TokenKind::KwPackage,
                                       TokenKind::KwImport,
                                       TokenKind::KwImport,
                                       TokenKind::KwFn,
                                       TokenKind::KwFn,
                                       TokenKind::KwVar,
                                       TokenKind::KwVar,
                                       TokenKind::KwIf,
                                       TokenKind::KwElse,
                                       TokenKind::KwFor,
                                       TokenKind::KwReturn,
                                       TokenKind::KwPub,
                                       TokenKind::Identifier,
                                       TokenKind::Eof};
    EXPECT_EQ(kindsOf(tokens), expected);
    EXPECT_FALSE(diag.hasErrors());
}

TEST(PerLexer, OperatorsAndDelimiters)
{
    DiagnosticEngine diag;
    auto tokens = lexAll("+ - * / % == != < <= > >= && || ! & = ; , ( ) { } [ ] : -> .", diag);
    std::vector<TokenKind> expected = {
        TokenKind::Plus,      TokenKind::Minus,        TokenKind::Star,     TokenKind::Slash,
        TokenKind::Percent,   TokenKind::EqualEqual,   TokenKind::NotEqual, TokenKind::Less,
        TokenKind::LessEqual, TokenKind::Greater,      TokenKind::GreaterEqual,
        TokenKind::AmpAmp,    TokenKind::PipePipe,     TokenKind::Bang,     TokenKind::Ampersand,
        TokenKind::Equal,     TokenKind::Semicolon,    TokenKind::Comma,    TokenKind::LParen,
        TokenKind::RParen,    TokenKind::LBrace,       TokenKind::RBrace,   TokenKind::LBracket,
        TokenKind::RBracket,  TokenKind::Colon,        TokenKind::Arrow,    TokenKind::Dot,
        TokenKind::Eof};
    EXPECT_EQ(kindsOf(tokens), expected);
}

TEST(PerLexer, DecodesLiterals)
{
    DiagnosticEngine diag;
    auto tokens = lexAll("9223372036854775807 \"a\\n\\\"b\\\\\\t\"", diag);
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokenKind::IntegerLiteral);
    EXPECT_EQ(tokens[0].intValue, 9223372036854775807LL);
    EXPECT_EQ(tokens[1].kind, TokenKind::StringLiteral);
    EXPECT_EQ(tokens[1].stringValue, "a\n\"b\\\t");
    EXPECT_FALSE(diag.hasErrors());
}

TEST(PerLexer, SkipsCommentsAndTracksPositions)
{
    DiagnosticEngine diag;
    auto tokens = lexAll("// line\n/* block\n comment */ var\n  x", diag);
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokenKind::KwVar);
    EXPECT_EQ(tokens[0].loc.line, 3u);
    EXPECT_EQ(tokens[0].loc.column, 13u);
    EXPECT_TRUE(tokens[0].newlineBefore);
    EXPECT_EQ(tokens[1].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[1].loc.line, 4u);
    EXPECT_EQ(tokens[1].loc.column, 3u);
    EXPECT_TRUE(tokens[1].newlineBefore);
}

TEST(PerLexer, RelexingIsDeterministic)
{
    const std::string src = "fn main() {\n  var a: [i64; 3]\n  a[0] = 5 * (2 + 1)\n"
                            "  stdio.PrintlnStr(\"ok\")\n  return 0\n}\n";
    DiagnosticEngine d1;
    DiagnosticEngine d2;
    auto first = lexAll(src, d1);
    auto second = lexAll(src, d2);
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i)
    {
        EXPECT_EQ(first[i].kind, second[i].kind);
        EXPECT_EQ(first[i].text, second[i].text);
        EXPECT_EQ(first[i].loc.line, second[i].loc.line);
        EXPECT_EQ(first[i].loc.column, second[i].loc.column);
    }
}

struct LexErrorCase
{
    const char *source;
    const char *fragment;
};

class PerLexerErrors : public ::testing::TestWithParam<LexErrorCase>
{
};

TEST_P(PerLexerErrors, ReportsOnceAndStops)
{
    DiagnosticEngine diag;
    auto tokens = lexAll(GetParam().source, diag);
    ASSERT_FALSE(tokens.empty());
    EXPECT_EQ(tokens.back().kind, TokenKind::Error);
    ASSERT_EQ(diag.errorCount(), 1u);
    const auto &d = diag.diagnostics().front();
    EXPECT_EQ(d.code, "P1000");
    EXPECT_NE(d.message.find(GetParam().fragment), std::string::npos) << d.message;
    EXPECT_TRUE(d.loc.hasLine());
}

INSTANTIATE_TEST_SUITE_P(
    Cases,
    PerLexerErrors,
    ::testing::Values(LexErrorCase{"var s = \"open", "unterminated string"},
                      LexErrorCase{"/* never closed", "unterminated block comment"},
                      LexErrorCase{"var x = 1 @ 2", "invalid character '@'"},
                      LexErrorCase{"\"bad \\q\"", "unknown escape"},
                      LexErrorCase{"99999999999999999999", "does not fit in i64"},
                      LexErrorCase{"12abc", "in integer literal"},
                      LexErrorCase{"a | b", "invalid character '|'"},
                      LexErrorCase{"var c = \xC3", "invalid character '\\xc3'"},
                      LexErrorCase{"x\x01", "invalid character '\\x01'"}));
