// s2sql/syntax/parser.hpp - Recursive-descent SQL parser
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "s2sql/ast/ast.hpp"
#include "s2sql/ast/ast_context.hpp"
#include "s2sql/basic/diagnostic.hpp"
#include "s2sql/basic/source_manager.hpp"
#include "s2sql/dialect/dialect.hpp"
#include "s2sql/syntax/token.hpp"

namespace s2sql::syntax
{

/**
 * Parses a `;`-separated list of statements.
 *
 * Supported statements are a single-table SELECT and a bare expression.
 * Function calls that the dialect maps onto temporal operations become
 * TemporalExpr nodes. Comment tokens must already be filtered out, and
 * Unknown/Unterminated tokens are assumed to be reported by the caller.
 */
class Parser
{
public:
  Parser(
    AstContext & ast, const SourceFile & source, DiagnosticBag & diags, std::vector<Token> tokens,
    const dialect::Dialect & dialect)
  : ast_(ast), source_(source), diags_(diags), tokens_(std::move(tokens)), dialect_(dialect)
  {
  }

  [[nodiscard]] Script * parse_script();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] bool at_kw(std::string_view kw, size_t lookahead = 0) const;
  [[nodiscard]] SourceRange prev_range() const;

  const Token & advance();
  bool match(TokenKind k);
  bool match_kw(std::string_view kw);
  bool expect(TokenKind k, std::string_view what);
  bool expect_kw(std::string_view kw);

  void error_at(const Token & t, std::string_view msg);
  void synchronize_to_stmt();

  // Small scanners
  [[nodiscard]] static bool is_kw(std::string_view kw, const Token & t);
  [[nodiscard]] static bool is_clause_keyword(const Token & t);
  [[nodiscard]] bool at_name() const;
  [[nodiscard]] std::string_view parse_name(std::string_view what);
  [[nodiscard]] std::string_view parse_alias_opt();

  // Statements
  [[nodiscard]] Stmt * parse_stmt();
  [[nodiscard]] SelectStmt * parse_select();
  void parse_order_by(SelectStmt * sel);
  void parse_limit(SelectStmt * sel);

  // Supporting nodes
  [[nodiscard]] SelectItem * parse_select_item();
  [[nodiscard]] TableRef * parse_table_ref();
  [[nodiscard]] OrderDirection parse_direction_opt();

  // Types
  [[nodiscard]] DataTypeNode * parse_data_type();

  // Expressions
  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_or();
  [[nodiscard]] Expr * parse_and();
  [[nodiscard]] Expr * parse_not();
  [[nodiscard]] Expr * parse_comparison();
  [[nodiscard]] Expr * parse_add();
  [[nodiscard]] Expr * parse_mul();
  [[nodiscard]] Expr * parse_unary();
  [[nodiscard]] Expr * parse_postfix();
  [[nodiscard]] Expr * parse_primary();
  [[nodiscard]] Expr * parse_call(const Token & name_tok);
  [[nodiscard]] Expr * parse_cast_call(const Token & cast_tok);

  [[nodiscard]] Expr * make_missing_expr_at(const Token & t);

  [[nodiscard]] std::string unescape(const Token & t) const;

  AstContext & ast_;
  const SourceFile & source_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  const dialect::Dialect & dialect_;
  size_t idx_ = 0;
};

}  // namespace s2sql::syntax
