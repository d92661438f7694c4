//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Stmt.cpp
/// @brief Statement parsing for Per.
///
/// @details Statements need no terminator: a line break or closing brace ends
/// them and a trailing `;` is accepted.  The `for` clauses are separated by
/// mandatory semicolons.
///
//===----------------------------------------------------------------------===//

#include "frontends/per/Parser.hpp"

namespace perc::frontends::per
{

namespace
{
StmtPtr makeStmt(SourceLoc loc, auto node)
{
    auto stmt = std::make_unique<Stmt>();
    stmt->loc = loc;
    stmt->node = std::move(node);
    return stmt;
}
} // namespace

bool Parser::parseBlock(Block &block)
{
    if (!expect(TokenKind::LBrace, "'{'"))
        return false;
    while (!check(TokenKind::RBrace))
    {
        if (check(TokenKind::Eof))
        {
            error("expected '}', got end of input");
            return false;
        }
        StmtPtr stmt = parseStatement();
        if (!stmt)
            return false;
        block.stmts.push_back(std::move(stmt));
    }
    advance();
    return true;
}

StmtPtr Parser::parseStatement()
{
    switch (peek().kind)
    {
        case TokenKind::KwVar:
        {
            StmtPtr stmt = parseVarDecl();
            if (!stmt || !finishStatement())
                return nullptr;
            return stmt;
        }
        case TokenKind::KwIf:
        {
            StmtPtr stmt = parseIf();
            match(TokenKind::Semicolon);
            return stmt;
        }
        case TokenKind::KwFor:
        {
            StmtPtr stmt = parseFor();
            match(TokenKind::Semicolon);
            return stmt;
        }
        case TokenKind::KwReturn:
            return parseReturn();
        case TokenKind::LBrace:
        {
            SourceLoc loc = peek().loc;
            Block block;
            if (!parseBlock(block))
                return nullptr;
            match(TokenKind::Semicolon);
            return makeStmt(loc, std::move(block));
        }
        case TokenKind::Semicolon:
            error("expected statement, got ';'");
            return nullptr;
        default:
        {
            StmtPtr stmt = parseSimpleStatement();
            if (!stmt || !finishStatement())
                return nullptr;
            return stmt;
        }
    }
}

StmtPtr Parser::parseVarDecl()
{
    Token kw = advance();
    Token name;
    if (!expect(TokenKind::Identifier, "variable name", &name))
        return nullptr;

    VarDecl decl;
    decl.name = name.text;
    if (match(TokenKind::Colon))
    {
        decl.declaredType = parseType();
        if (!decl.declaredType)
            return nullptr;
    }
    if (match(TokenKind::Equal))
    {
        decl.init = parseExpression();
        if (!decl.init)
            return nullptr;
    }
    if (!decl.declaredType && !decl.init)
    {
        errorAt(name.loc, "variable '" + name.text + "' needs a type or an initializer");
        return nullptr;
    }
    return makeStmt(kw.loc, std::move(decl));
}

StmtPtr Parser::parseIf()
{
    Token kw = advance();
    If node;
    node.cond = parseExpression();
    if (!node.cond)
        return nullptr;
    if (!parseBlock(node.thenBody))
        return nullptr;
    if (match(TokenKind::KwElse))
    {
        if (check(TokenKind::KwIf))
        {
            error("expected '{' after 'else', got 'if' (nest the if inside a block)");
            return nullptr;
        }
        node.elseBody = std::make_unique<Block>();
        if (!parseBlock(*node.elseBody))
            return nullptr;
    }
    return makeStmt(kw.loc, std::move(node));
}

StmtPtr Parser::parseFor()
{
    Token kw = advance();
    For node;

    if (!check(TokenKind::Semicolon))
    {
        node.init = check(TokenKind::KwVar) ? parseVarDecl() : parseSimpleStatement();
        if (!node.init)
            return nullptr;
    }
    if (!expect(TokenKind::Semicolon, "';' after loop initializer"))
        return nullptr;

    if (!check(TokenKind::Semicolon))
    {
        node.cond = parseExpression();
        if (!node.cond)
            return nullptr;
    }
    if (!expect(TokenKind::Semicolon, "';' after loop condition"))
        return nullptr;

    if (!check(TokenKind::LBrace))
    {
        node.step = parseSimpleStatement();
        if (!node.step)
            return nullptr;
    }
    if (!parseBlock(node.body))
        return nullptr;
    return makeStmt(kw.loc, std::move(node));
}

StmtPtr Parser::parseReturn()
{
    Token kw = advance();
    Return node;
    const Token &next = peek();
    bool bare = next.kind == TokenKind::Semicolon || next.kind == TokenKind::RBrace ||
                next.kind == TokenKind::Eof || next.newlineBefore;
    if (!bare)
    {
        node.value = parseExpression();
        if (!node.value)
            return nullptr;
    }
    if (!finishStatement())
        return nullptr;
    return makeStmt(kw.loc, std::move(node));
}

StmtPtr Parser::parseSimpleStatement()
{
    SourceLoc loc = peek().loc;
    ExprPtr expr = parseExpression();
    if (!expr)
        return nullptr;
    if (match(TokenKind::Equal))
    {
        ExprPtr value = parseExpression();
        if (!value)
            return nullptr;
        return makeStmt(loc, Assignment{std::move(expr), std::move(value)});
    }
    return makeStmt(loc, ExprStmt{std::move(expr)});
}

} // namespace perc::frontends::per
