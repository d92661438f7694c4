//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.hpp
/// @brief Recursive descent parser for Per source files.
///
/// ## Grammar
///
/// ```
/// program   = [ "package" IDENT ] { import } { function }
/// import    = "import" ( STRING | IDENT )
/// function  = [ "pub" ] "fn" IDENT "(" [ param { "," param } ] ")" [ "->" type ] block
/// type      = "i64" | "int" | "string" | "void" | "*" type | "[" type ";" INT "]"
/// stmt      = var | if | for | return | block | simple
/// for       = "for" [ init ] ";" [ expr ] ";" [ simple ] block
/// simple    = expr [ "=" expr ]
/// ```
///
/// Statements end at a line break, a `}` or an optional `;`.
///
/// ## Operator Precedence (lowest to highest)
///
/// | Level | Operators            |
/// |-------|----------------------|
/// | 1     | `\|\|`               |
/// | 2     | `&&`                 |
/// | 3     | `==` `!=`            |
/// | 4     | `<` `<=` `>` `>=`    |
/// | 5     | `+` `-`              |
/// | 6     | `*` `/` `%`          |
/// | 7     | unary `-` `!` `&` `*`|
/// | 8     | `[index]`, calls     |
///
/// ## Errors
///
/// Parsing stops at the first error.  The error is reported with code P2000
/// as "expected X, got Y"; a lexical error token ends parsing without a
/// second diagnostic.
///
/// @invariant Lexer and DiagnosticEngine outlive the parser.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/per/AST.hpp"
#include "frontends/per/Lexer.hpp"
#include "support/diagnostics.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace perc::frontends::per
{

class Parser
{
  public:
    Parser(Lexer &lexer, perc::support::DiagnosticEngine &diag);

    /// @brief Parse a complete source file.
    /// @return The program, or nullptr after reporting an error.
    std::unique_ptr<Program> parseProgram();

    /// @brief Parse a single expression (used by tests).
    /// @return The expression, or nullptr after reporting an error.
    ExprPtr parseExpression();

    [[nodiscard]] bool hasError() const
    {
        return hasError_;
    }

  private:
    //=========================================================================
    /// @name Token handling
    /// @{
    //=========================================================================

    const Token &peek(size_t offset = 0);
    Token advance();
    bool check(TokenKind kind, size_t offset = 0);
    bool match(TokenKind kind, Token *out = nullptr);
    bool expect(TokenKind kind, const char *what, Token *out = nullptr);

    /// @brief Consume an optional `;` after a simple statement.
    /// @return False when the statement continues on the same line.
    bool finishStatement();

    void error(const std::string &message);
    void errorAt(SourceLoc loc, const std::string &message);

    /// @}
    //=========================================================================
    /// @name Declarations
    /// @{
    //=========================================================================

    bool parseImport(Program &program);
    bool parseFunction(Program &program);
    TypeRef parseType();

    /// @}
    //=========================================================================
    /// @name Statements
    /// @{
    //=========================================================================

    bool parseBlock(Block &block);
    StmtPtr parseStatement();
    StmtPtr parseVarDecl();
    StmtPtr parseIf();
    StmtPtr parseFor();
    StmtPtr parseReturn();
    StmtPtr parseSimpleStatement();

    /// @}
    //=========================================================================
    /// @name Expressions
    /// @{
    //=========================================================================

    ExprPtr parseOr();
    ExprPtr parseAnd();
    ExprPtr parseEquality();
    ExprPtr parseRelational();
    ExprPtr parseAdditive();
    ExprPtr parseMultiplicative();
    ExprPtr parseUnary();
    ExprPtr parsePostfix();
    ExprPtr parsePrimary();
    bool parseCallArgs(std::vector<ExprPtr> &args);

    /// @brief Binary operator at the cursor, if it continues the expression.
    std::optional<BinaryOpKind> peekBinaryOp();

    /// @}

    Lexer &lexer_;
    perc::support::DiagnosticEngine &diag_;
    std::vector<Token> tokens_;
    size_t tokenPos_ = 0;
    bool hasError_ = false;
};

} // namespace perc::frontends::per
