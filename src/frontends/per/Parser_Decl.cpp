//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Decl.cpp
/// @brief Top-level declarations and type syntax.
///
//===----------------------------------------------------------------------===//

#include "frontends/per/Parser.hpp"

namespace perc::frontends::per
{

std::unique_ptr<Program> Parser::parseProgram()
{
    auto program = std::make_unique<Program>();
    program->fileId = peek().loc.file_id;

    Token tok;
    if (match(TokenKind::KwPackage, &tok))
    {
        Token name;
        if (!expect(TokenKind::Identifier, "package name", &name))
            return nullptr;
        program->package = Package{name.text, tok.loc};
        match(TokenKind::Semicolon);
    }

    while (check(TokenKind::KwImport))
    {
        if (!parseImport(*program))
            return nullptr;
    }

    while (!check(TokenKind::Eof))
    {
        if (check(TokenKind::Error))
        {
            error("invalid token");
            return nullptr;
        }
        if (!parseFunction(*program))
            return nullptr;
    }

    if (hasError_)
        return nullptr;
    return program;
}

bool Parser::parseImport(Program &program)
{
    Token kw = advance();
    Token name;
    if (check(TokenKind::StringLiteral))
    {
        name = advance();
        program.imports.push_back(Import{name.stringValue, kw.loc});
    }
    else if (expect(TokenKind::Identifier, "module name", &name))
    {
        program.imports.push_back(Import{name.text, kw.loc});
    }
    else
    {
        return false;
    }
    match(TokenKind::Semicolon);
    return true;
}

bool Parser::parseFunction(Program &program)
{
    FunctionDecl fn;
    fn.loc = peek().loc;
    fn.isPublic = match(TokenKind::KwPub);

    if (!expect(TokenKind::KwFn, "'fn'"))
        return false;

    Token name;
    if (!expect(TokenKind::Identifier, "function name", &name))
        return false;
    fn.name = name.text;

    if (!expect(TokenKind::LParen, "'('"))
        return false;
    if (!check(TokenKind::RParen))
    {
        do
        {
            Token paramName;
            if (!expect(TokenKind::Identifier, "parameter name", &paramName))
                return false;
            if (!expect(TokenKind::Colon, "':'"))
                return false;
            TypeRef type = parseType();
            if (!type)
                return false;
            fn.params.push_back(Param{paramName.text, std::move(type), paramName.loc});
        } while (match(TokenKind::Comma));
    }
    if (!expect(TokenKind::RParen, "')'"))
        return false;

    if (match(TokenKind::Arrow))
    {
        fn.returnType = parseType();
        if (!fn.returnType)
            return false;
    }

    if (!parseBlock(fn.body))
        return false;

    program.functions.push_back(std::move(fn));
    return true;
}

TypeRef Parser::parseType()
{
    if (match(TokenKind::Star))
    {
        TypeRef elem = parseType();
        if (!elem)
            return nullptr;
        return types::pointer(std::move(elem));
    }

    if (match(TokenKind::LBracket))
    {
        TypeRef elem = parseType();
        if (!elem)
            return nullptr;
        if (!expect(TokenKind::Semicolon, "';' in array type"))
            return nullptr;
        Token len;
        if (!expect(TokenKind::IntegerLiteral, "array length literal", &len))
            return nullptr;
        if (len.intValue <= 0)
        {
            errorAt(len.loc, "array length must be positive, got " + len.text);
            return nullptr;
        }
        if (!expect(TokenKind::RBracket, "']'"))
            return nullptr;
        return types::array(std::move(elem), len.intValue);
    }

    Token name;
    if (!expect(TokenKind::Identifier, "type", &name))
        return nullptr;
    if (name.text == "i64" || name.text == "int")
        return types::i64();
    if (name.text == "string")
        return types::string();
    if (name.text == "void")
        return types::voidType();

    errorAt(name.loc, "expected type, got '" + name.text + "'");
    return nullptr;
}

} // namespace perc::frontends::per
