//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Expr.cpp
/// @brief Expression parsing for Per, one function per precedence level.
///
//===----------------------------------------------------------------------===//

#include "frontends/per/Parser.hpp"

namespace perc::frontends::per
{

namespace
{

ExprPtr makeExpr(SourceLoc loc, auto node)
{
    auto expr = std::make_unique<Expr>();
    expr->loc = loc;
    expr->node = std::move(node);
    return expr;
}

ExprPtr makeBinary(BinaryOpKind op, ExprPtr lhs, ExprPtr rhs)
{
    SourceLoc loc = lhs->loc;
    return makeExpr(loc, BinaryOp{op, std::move(lhs), std::move(rhs)});
}

/// A line starting with one of these tokens begins a new statement.
bool startsStatementOnNewLine(const Token &tok)
{
    if (!tok.newlineBefore)
        return false;
    switch (tok.kind)
    {
        case TokenKind::Star:
        case TokenKind::Minus:
        case TokenKind::Ampersand:
        case TokenKind::LParen:
        case TokenKind::LBracket:
            return true;
        default:
            return false;
    }
}

} // namespace

std::optional<BinaryOpKind> Parser::peekBinaryOp()
{
    const Token &tok = peek();
    if (startsStatementOnNewLine(tok))
        return std::nullopt;
    switch (tok.kind)
    {
        case TokenKind::PipePipe:
            return BinaryOpKind::Or;
        case TokenKind::AmpAmp:
            return BinaryOpKind::And;
        case TokenKind::EqualEqual:
            return BinaryOpKind::Eq;
        case TokenKind::NotEqual:
            return BinaryOpKind::Ne;
        case TokenKind::Less:
            return BinaryOpKind::Lt;
        case TokenKind::LessEqual:
            return BinaryOpKind::Le;
        case TokenKind::Greater:
            return BinaryOpKind::Gt;
        case TokenKind::GreaterEqual:
            return BinaryOpKind::Ge;
        case TokenKind::Plus:
            return BinaryOpKind::Add;
        case TokenKind::Minus:
            return BinaryOpKind::Sub;
        case TokenKind::Star:
            return BinaryOpKind::Mul;
        case TokenKind::Slash:
            return BinaryOpKind::Div;
        case TokenKind::Percent:
            return BinaryOpKind::Rem;
        default:
            return std::nullopt;
    }
}

ExprPtr Parser::parseExpression()
{
    return parseOr();
}

ExprPtr Parser::parseOr()
{
    ExprPtr lhs = parseAnd();
    while (lhs && peekBinaryOp() == BinaryOpKind::Or)
    {
        advance();
        ExprPtr rhs = parseAnd();
        if (!rhs)
            return nullptr;
        lhs = makeBinary(BinaryOpKind::Or, std::move(lhs), std::move(rhs));
    }
    return lhs;
}

ExprPtr Parser::parseAnd()
{
    ExprPtr lhs = parseEquality();
    while (lhs && peekBinaryOp() == BinaryOpKind::And)
    {
        advance();
        ExprPtr rhs = parseEquality();
        if (!rhs)
            return nullptr;
        lhs = makeBinary(BinaryOpKind::And, std::move(lhs), std::move(rhs));
    }
    return lhs;
}

ExprPtr Parser::parseEquality()
{
    ExprPtr lhs = parseRelational();
    while (lhs)
    {
        auto op = peekBinaryOp();
        if (op != BinaryOpKind::Eq && op != BinaryOpKind::Ne)
            break;
        advance();
        ExprPtr rhs = parseRelational();
        if (!rhs)
            return nullptr;
        lhs = makeBinary(*op, std::move(lhs), std::move(rhs));
    }
    return lhs;
}

ExprPtr Parser::parseRelational()
{
    ExprPtr lhs = parseAdditive();
    while (lhs)
    {
        auto op = peekBinaryOp();
        if (op != BinaryOpKind::Lt && op != BinaryOpKind::Le && op != BinaryOpKind::Gt &&
            op != BinaryOpKind::Ge)
            break;
        advance();
        ExprPtr rhs = parseAdditive();
        if (!rhs)
            return nullptr;
        lhs = makeBinary(*op, std::move(lhs), std::move(rhs));
    }
    return lhs;
}

ExprPtr Parser::parseAdditive()
{
    ExprPtr lhs = parseMultiplicative();
    while (lhs)
    {
        auto op = peekBinaryOp();
        if (op != BinaryOpKind::Add && op != BinaryOpKind::Sub)
            break;
        advance();
        ExprPtr rhs = parseMultiplicative();
        if (!rhs)
            return nullptr;
        lhs = makeBinary(*op, std::move(lhs), std::move(rhs));
    }
    return lhs;
}

ExprPtr Parser::parseMultiplicative()
{
    ExprPtr lhs = parseUnary();
    while (lhs)
    {
        auto op = peekBinaryOp();
        if (op != BinaryOpKind::Mul && op != BinaryOpKind::Div && op != BinaryOpKind::Rem)
            break;
        advance();
        ExprPtr rhs = parseUnary();
        if (!rhs)
            return nullptr;
        lhs = makeBinary(*op, std::move(lhs), std::move(rhs));
    }
    return lhs;
}

ExprPtr Parser::parseUnary()
{
    SourceLoc loc = peek().loc;
    if (match(TokenKind::Minus))
    {
        ExprPtr operand = parseUnary();
        if (!operand)
            return nullptr;
        return makeExpr(loc, UnaryOp{UnaryOpKind::Neg, std::move(operand)});
    }
    if (match(TokenKind::Bang))
    {
        ExprPtr operand = parseUnary();
        if (!operand)
            return nullptr;
        return makeExpr(loc, UnaryOp{UnaryOpKind::Not, std::move(operand)});
    }
    if (match(TokenKind::Ampersand))
    {
        ExprPtr operand = parseUnary();
        if (!operand)
            return nullptr;
        return makeExpr(loc, AddressOf{std::move(operand)});
    }
    if (match(TokenKind::Star))
    {
        ExprPtr operand = parseUnary();
        if (!operand)
            return nullptr;
        return makeExpr(loc, Deref{std::move(operand)});
    }
    return parsePostfix();
}

ExprPtr Parser::parsePostfix()
{
    ExprPtr expr = parsePrimary();
    while (expr && check(TokenKind::LBracket) && !startsStatementOnNewLine(peek()))
    {
        SourceLoc loc = expr->loc;
        advance();
        ExprPtr index = parseExpression();
        if (!index)
            return nullptr;
        if (!expect(TokenKind::RBracket, "']'"))
            return nullptr;
        expr = makeExpr(loc, ArrayIndex{std::move(expr), std::move(index)});
    }
    return expr;
}

bool Parser::parseCallArgs(std::vector<ExprPtr> &args)
{
    if (!expect(TokenKind::LParen, "'('"))
        return false;
    if (match(TokenKind::RParen))
        return true;
    do
    {
        ExprPtr arg = parseExpression();
        if (!arg)
            return false;
        args.push_back(std::move(arg));
    } while (match(TokenKind::Comma));
    return expect(TokenKind::RParen, "')'");
}

ExprPtr Parser::parsePrimary()
{
    Token tok = peek();
    switch (tok.kind)
    {
        case TokenKind::IntegerLiteral:
            advance();
            return makeExpr(tok.loc, IntLiteral{tok.intValue});

        case TokenKind::StringLiteral:
            advance();
            return makeExpr(tok.loc, StringLiteral{tok.stringValue});

        case TokenKind::LParen:
        {
            advance();
            ExprPtr inner = parseExpression();
            if (!inner)
                return nullptr;
            if (!expect(TokenKind::RParen, "')'"))
                return nullptr;
            return inner;
        }

        case TokenKind::Identifier:
        {
            advance();
            if (match(TokenKind::Dot))
            {
                Token member;
                if (!expect(TokenKind::Identifier, "function name after '.'", &member))
                    return nullptr;
                Call call{tok.text, member.text, {}};
                if (!parseCallArgs(call.args))
                    return nullptr;
                return makeExpr(tok.loc, std::move(call));
            }
            if (check(TokenKind::LParen) && !peek().newlineBefore)
            {
                Call call{"", tok.text, {}};
                if (!parseCallArgs(call.args))
                    return nullptr;
                return makeExpr(tok.loc, std::move(call));
            }
            return makeExpr(tok.loc, Identifier{tok.text});
        }

        default:
            expect(TokenKind::Identifier, "expression");
            return nullptr;
    }
}

} // namespace perc::frontends::per
