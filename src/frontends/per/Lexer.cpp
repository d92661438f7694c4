//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.cpp
/// @brief Implementation of the Per lexical analyzer.
///
/// @details Keywords live in a sorted table searched with binary search.
/// `func` and `let` are accepted as spellings of `fn` and `var`.  Integer
/// literals are decimal only and must fit in a signed 64-bit value.
///
//===----------------------------------------------------------------------===//

#include "frontends/per/Lexer.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <string_view>

namespace perc::frontends::per
{

using perc::support::Severity;
using perc::support::SourceLoc;

//===----------------------------------------------------------------------===//
// TokenKind to string conversion
//===----------------------------------------------------------------------===//

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Eof:
            return "end of input";
        case TokenKind::Error:
            return "error";
        case TokenKind::IntegerLiteral:
            return "integer";
        case TokenKind::StringLiteral:
            return "string";
        case TokenKind::Identifier:
            return "identifier";
        case TokenKind::KwPackage:
            return "'package'";
        case TokenKind::KwImport:
            return "'import'";
        case TokenKind::KwFn:
            return "'fn'";
        case TokenKind::KwVar:
            return "'var'";
        case TokenKind::KwIf:
            return "'if'";
        case TokenKind::KwElse:
            return "'else'";
        case TokenKind::KwFor:
            return "'for'";
        case TokenKind::KwReturn:
            return "'return'";
        case TokenKind::KwPub:
            return "'pub'";
        case TokenKind::Plus:
            return "'+'";
        case TokenKind::Minus:
            return "'-'";
        case TokenKind::Star:
            return "'*'";
        case TokenKind::Slash:
            return "'/'";
        case TokenKind::Percent:
            return "'%'";
        case TokenKind::EqualEqual:
            return "'=='";
        case TokenKind::NotEqual:
            return "'!='";
        case TokenKind::Less:
            return "'<'";
        case TokenKind::LessEqual:
            return "'<='";
        case TokenKind::Greater:
            return "'>'";
        case TokenKind::GreaterEqual:
            return "'>='";
        case TokenKind::AmpAmp:
            return "'&&'";
        case TokenKind::PipePipe:
            return "'||'";
        case TokenKind::Bang:
            return "'!'";
        case TokenKind::Ampersand:
            return "'&'";
        case TokenKind::Equal:
            return "'='";
        case TokenKind::Semicolon:
            return "';'";
        case TokenKind::Comma:
            return "','";
        case TokenKind::Colon:
            return "':'";
        case TokenKind::Dot:
            return "'.'";
        case TokenKind::Arrow:
            return "'->'";
        case TokenKind::LParen:
            return "'('";
        case TokenKind::RParen:
            return "')'";
        case TokenKind::LBrace:
            return "'{'";
        case TokenKind::RBrace:
            return "'}'";
        case TokenKind::LBracket:
            return "'['";
        case TokenKind::RBracket:
            return "']'";
    }
    return "unknown";
}

namespace
{

struct KeywordEntry
{
    std::string_view text;
    TokenKind kind;
};

// Sorted by text for binary search.
constexpr std::array<KeywordEntry, 12> kKeywordTable = {{
    {"else", TokenKind::KwElse},
    {"fn", TokenKind::KwFn},
    {"for", TokenKind::KwFor},
    {"func", TokenKind::KwFn},
    {"if", TokenKind::KwIf},
    {"import", TokenKind::KwImport},
    {"let", TokenKind::KwVar},
    {"package", TokenKind::KwPackage},
    {"pub", TokenKind::KwPub},
    {"return", TokenKind::KwReturn},
    {"use", TokenKind::KwImport},
    {"var", TokenKind::KwVar},
}};

bool isIdentStart(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

bool isIdentChar(char c)
{
    return isIdentStart(c) || isDigit(c);
}

} // namespace

Lexer::Lexer(std::string source, uint32_t fileId, perc::support::DiagnosticEngine &diag)
    : source_(std::move(source)), fileId_(fileId), diag_(diag)
{
}

std::optional<TokenKind> Lexer::lookupKeyword(const std::string &name)
{
    auto end = kKeywordTable.end();
    auto it = std::lower_bound(kKeywordTable.begin(),
                               end,
                               std::string_view(name),
                               [](const KeywordEntry &entry, std::string_view key)
                               { return entry.text < key; });
    if (it != end && it->text == name)
        return it->kind;
    return std::nullopt;
}

char Lexer::peekChar() const
{
    return pos_ < source_.size() ? source_[pos_] : '\0';
}

char Lexer::peekChar(size_t offset) const
{
    return pos_ + offset < source_.size() ? source_[pos_ + offset] : '\0';
}

char Lexer::getChar()
{
    char c = source_[pos_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
        sawNewline_ = true;
    }
    else
    {
        ++column_;
    }
    return c;
}

bool Lexer::eof() const
{
    return pos_ >= source_.size();
}

SourceLoc Lexer::currentLoc() const
{
    return SourceLoc{fileId_, line_, column_};
}

Token Lexer::errorToken(SourceLoc loc, const std::string &message)
{
    diag_.report({Severity::Error, message, loc, std::string(perc::support::kLexError)});
    failed_ = true;
    Token tok;
    tok.kind = TokenKind::Error;
    tok.loc = loc;
    return tok;
}

bool Lexer::skipWhitespaceAndComments(SourceLoc &errorLoc)
{
    while (!eof())
    {
        char c = peekChar();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
        {
            getChar();
            continue;
        }
        if (c == '/' && peekChar(1) == '/')
        {
            while (!eof() && peekChar() != '\n')
                getChar();
            continue;
        }
        if (c == '/' && peekChar(1) == '*')
        {
            errorLoc = currentLoc();
            getChar();
            getChar();
            bool closed = false;
            while (!eof())
            {
                if (peekChar() == '*' && peekChar(1) == '/')
                {
                    getChar();
                    getChar();
                    closed = true;
                    break;
                }
                getChar();
            }
            if (!closed)
                return false;
            continue;
        }
        break;
    }
    return true;
}

Token Lexer::lexIdentifierOrKeyword()
{
    Token tok;
    tok.loc = currentLoc();
    while (!eof() && isIdentChar(peekChar()))
        tok.text.push_back(getChar());

    if (auto kw = lookupKeyword(tok.text))
        tok.kind = *kw;
    else
        tok.kind = TokenKind::Identifier;
    return tok;
}

Token Lexer::lexNumber()
{
    Token tok;
    tok.loc = currentLoc();
    tok.kind = TokenKind::IntegerLiteral;

    constexpr uint64_t kMax = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    uint64_t value = 0;
    bool overflow = false;
    while (!eof() && isDigit(peekChar()))
    {
        char c = getChar();
        tok.text.push_back(c);
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (kMax - digit) / 10)
            overflow = true;
        else
            value = value * 10 + digit;
    }

    if (!eof() && isIdentStart(peekChar()))
        return errorToken(tok.loc, "invalid character '" + std::string(1, peekChar()) +
                                       "' in integer literal");
    if (overflow)
        return errorToken(tok.loc, "integer literal '" + tok.text + "' does not fit in i64");

    tok.intValue = static_cast<int64_t>(value);
    return tok;
}

Token Lexer::lexString()
{
    Token tok;
    tok.loc = currentLoc();
    tok.kind = TokenKind::StringLiteral;
    tok.text.push_back(getChar()); // opening quote

    while (!eof())
    {
        char c = peekChar();
        if (c == '"')
        {
            tok.text.push_back(getChar());
            return tok;
        }
        if (c == '\n')
            break;
        if (c == '\\')
        {
            SourceLoc escLoc = currentLoc();
            tok.text.push_back(getChar());
            if (eof())
                break;
            char esc = getChar();
            tok.text.push_back(esc);
            switch (esc)
            {
                case 'n':
                    tok.stringValue.push_back('\n');
                    break;
                case 't':
                    tok.stringValue.push_back('\t');
                    break;
                case 'r':
                    tok.stringValue.push_back('\r');
                    break;
                case '0':
                    tok.stringValue.push_back('\0');
                    break;
                case '\\':
                    tok.stringValue.push_back('\\');
                    break;
                case '"':
                    tok.stringValue.push_back('"');
                    break;
                case '\'':
                    tok.stringValue.push_back('\'');
                    break;
                default:
                    return errorToken(escLoc,
                                      "unknown escape sequence '\\" + std::string(1, esc) + "'");
            }
            continue;
        }
        tok.text.push_back(getChar());
        tok.stringValue.push_back(c);
    }
    return errorToken(tok.loc, "unterminated string literal");
}

Token Lexer::lexToken()
{
    SourceLoc commentLoc{};
    if (!skipWhitespaceAndComments(commentLoc))
        return errorToken(commentLoc, "unterminated block comment");

    if (eof())
    {
        Token tok;
        tok.kind = TokenKind::Eof;
        tok.loc = currentLoc();
        return tok;
    }

    char c = peekChar();
    if (isIdentStart(c))
        return lexIdentifierOrKeyword();
    if (isDigit(c))
        return lexNumber();
    if (c == '"')
        return lexString();

    Token tok;
    tok.loc = currentLoc();
    auto single = [&](TokenKind kind)
    {
        tok.kind = kind;
        tok.text.push_back(getChar());
        return tok;
    };
    auto twoChar = [&](TokenKind kind)
    {
        tok.kind = kind;
        tok.text.push_back(getChar());
        tok.text.push_back(getChar());
        return tok;
    };

    switch (c)
    {
        case '+':
            return single(TokenKind::Plus);
        case '-':
            if (peekChar(1) == '>')
                return twoChar(TokenKind::Arrow);
            return single(TokenKind::Minus);
        case '*':
            return single(TokenKind::Star);
        case '/':
            return single(TokenKind::Slash);
        case '%':
            return single(TokenKind::Percent);
        case '=':
            if (peekChar(1) == '=')
                return twoChar(TokenKind::EqualEqual);
            return single(TokenKind::Equal);
        case '!':
            if (peekChar(1) == '=')
                return twoChar(TokenKind::NotEqual);
            return single(TokenKind::Bang);
        case '<':
            if (peekChar(1) == '=')
                return twoChar(TokenKind::LessEqual);
            return single(TokenKind::Less);
        case '>':
            if (peekChar(1) == '=')
                return twoChar(TokenKind::GreaterEqual);
            return single(TokenKind::Greater);
        case '&':
            if (peekChar(1) == '&')
                return twoChar(TokenKind::AmpAmp);
            return single(TokenKind::Ampersand);
        case '|':
            if (peekChar(1) == '|')
                return twoChar(TokenKind::PipePipe);
            break;
        case ';':
            return single(TokenKind::Semicolon);
        case ',':
            return single(TokenKind::Comma);
        case ':':
            return single(TokenKind::Colon);
        case '.':
            return single(TokenKind::Dot);
        case '(':
            return single(TokenKind::LParen);
        case ')':
            return single(TokenKind::RParen);
        case '{':
            return single(TokenKind::LBrace);
        case '}':
            return single(TokenKind::RBrace);
        case '[':
            return single(TokenKind::LBracket);
        case ']':
            return single(TokenKind::RBracket);
        default:
            break;
    }

    static constexpr char kHexDigits[] = "0123456789abcdef";
    const auto byte = static_cast<unsigned char>(c);
    std::string shown(1, c);
    if (byte < 0x20 || byte >= 0x7f)
        shown = {'\\', 'x', kHexDigits[byte >> 4], kHexDigits[byte & 0xF]};
    return errorToken(tok.loc, "invalid character '" + shown + "'");
}

Token Lexer::next()
{
    if (peeked_)
    {
        Token tok = std::move(*peeked_);
        peeked_.reset();
        return tok;
    }

    if (failed_)
    {
        Token tok;
        tok.kind = TokenKind::Eof;
        tok.loc = currentLoc();
        return tok;
    }

    sawNewline_ = false;
    Token tok = lexToken();
    tok.newlineBefore = sawNewline_;
    return tok;
}

const Token &Lexer::peek()
{
    if (!peeked_)
        peeked_ = next();
    return *peeked_;
}

std::vector<Token> Lexer::tokenize()
{
    std::vector<Token> tokens;
    while (true)
    {
        Token tok = next();
        TokenKind kind = tok.kind;
        tokens.push_back(std::move(tok));
        if (kind == TokenKind::Eof || kind == TokenKind::Error)
            break;
    }
    return tokens;
}

} // namespace perc::frontends::per
