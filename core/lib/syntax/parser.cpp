// s2sql/syntax/parser.cpp - Recursive-descent SQL parser implementation
#include "s2sql/syntax/parser.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>

#include "s2sql/dialect/temporal_rewrite.hpp"

namespace s2sql::syntax
{

namespace
{

bool iequals(std::string_view a, std::string_view b)
{
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::toupper(static_cast<unsigned char>(x)) ==
                  std::toupper(static_cast<unsigned char>(y));
         });
}

struct TypeSpelling
{
  std::string_view name;
  DataTypeKind kind;
};

constexpr TypeSpelling k_type_spellings[] = {
  {"TINYINT", DataTypeKind::TinyInt},
  {"SMALLINT", DataTypeKind::SmallInt},
  {"INT", DataTypeKind::Int},
  {"INTEGER", DataTypeKind::Int},
  {"BIGINT", DataTypeKind::BigInt},
  {"DECIMAL", DataTypeKind::Decimal},
  {"NUMERIC", DataTypeKind::Decimal},
  {"FLOAT", DataTypeKind::Float},
  {"DOUBLE", DataTypeKind::Double},
  {"BOOL", DataTypeKind::Boolean},
  {"BOOLEAN", DataTypeKind::Boolean},
  {"CHAR", DataTypeKind::Char},
  {"VARCHAR", DataTypeKind::Varchar},
  {"TEXT", DataTypeKind::Text},
  {"BINARY", DataTypeKind::Binary},
  {"VARBINARY", DataTypeKind::Varbinary},
  {"BLOB", DataTypeKind::Blob},
  {"DATE", DataTypeKind::Date},
  {"TIME", DataTypeKind::Time},
  {"DATETIME", DataTypeKind::DateTime},
  {"TIMESTAMP", DataTypeKind::Timestamp},
  {"YEAR", DataTypeKind::Year},
  {"JSON", DataTypeKind::Json},
  {"GEOGRAPHY", DataTypeKind::Geography},
  {"SIGNED", DataTypeKind::Signed},
  {"UNSIGNED", DataTypeKind::Unsigned},
};

// Words that end a select item or table reference instead of naming an alias.
constexpr std::string_view k_clause_keywords[] = {
  "FROM",  "WHERE", "ORDER", "LIMIT", "OFFSET", "GROUP", "HAVING", "UNION", "AS", "ASC",
  "DESC",  "AND",   "OR",    "NOT",   "IS",     "LIKE",  "ON",     "JOIN",  "INNER", "LEFT",
  "RIGHT", "CROSS", "INTO",  "BY",    "ALL",    "NULL",  "TRUE",   "FALSE",
};

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

bool Parser::at_kw(std::string_view kw, size_t lookahead) const { return is_kw(kw, cur(lookahead)); }

SourceRange Parser::prev_range() const
{
  return idx_ > 0 ? tokens_[idx_ - 1].range : cur().range;
}

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::match_kw(std::string_view kw)
{
  if (at_kw(kw)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what)
{
  if (match(k)) {
    return true;
  }
  error_at(cur(), fmt::format("expected {}", what));
  return false;
}

bool Parser::expect_kw(std::string_view kw)
{
  if (match_kw(kw)) {
    return true;
  }
  error_at(cur(), fmt::format("expected {}", kw));
  return false;
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  // Lexical errors were already reported by the frontend.
  if (t.kind == TokenKind::Unknown || t.kind == TokenKind::Unterminated) {
    return;
  }
  diags_.report_error(t.range, std::string(msg)).with_code(diag_code::k_expected);
}

void Parser::synchronize_to_stmt()
{
  while (!at_eof()) {
    if (at(TokenKind::Semicolon)) {
      return;
    }
    advance();
  }
}

bool Parser::is_kw(std::string_view kw, const Token & t)
{
  return t.kind == TokenKind::Identifier && iequals(t.text, kw);
}

bool Parser::is_clause_keyword(const Token & t)
{
  if (t.kind != TokenKind::Identifier) {
    return false;
  }
  return std::any_of(std::begin(k_clause_keywords), std::end(k_clause_keywords), [&](auto kw) {
    return iequals(kw, t.text);
  });
}

bool Parser::at_name() const
{
  return at(TokenKind::QuotedIdentifier) || (at(TokenKind::Identifier) && !is_clause_keyword(cur()));
}

std::string_view Parser::parse_name(std::string_view what)
{
  const Token & t = cur();
  if (t.kind == TokenKind::Identifier) {
    advance();
    return ast_.intern(t.text);
  }
  if (t.kind == TokenKind::QuotedIdentifier) {
    advance();
    return ast_.intern(unescape(t));
  }
  error_at(t, fmt::format("expected {}", what));
  return {};
}

std::string_view Parser::parse_alias_opt()
{
  if (match_kw("AS")) {
    return parse_name("alias after AS");
  }
  if (at_name()) {
    return parse_name("alias");
  }
  return {};
}

// ============================================================================
// Top level
// ============================================================================

Script * Parser::parse_script()
{
  auto * script = ast_.create<Script>(
    SourceRange(0, static_cast<uint32_t>(source_.content().size())));

  std::vector<Stmt *> statements;

  while (!at_eof()) {
    if (match(TokenKind::Semicolon)) {
      continue;
    }

    const size_t start_idx = idx_;
    statements.push_back(parse_stmt());

    if (!at(TokenKind::Semicolon) && !at_eof()) {
      error_at(cur(), "expected ';' or end of input");
      synchronize_to_stmt();
    }

    // Guarantee progress on malformed input.
    if (idx_ == start_idx) {
      advance();
    }
  }

  script->statements = ast_.copy_to_arena(statements);
  return script;
}

Stmt * Parser::parse_stmt()
{
  if (at_kw("SELECT")) {
    return parse_select();
  }

  Expr * e = parse_expr();
  return ast_.create<ExprStmt>(e, e->get_range());
}

SelectStmt * Parser::parse_select()
{
  const Token select_tok = advance();
  auto * sel = ast_.create<SelectStmt>(select_tok.range);

  sel->distinct = match_kw("DISTINCT");
  if (!sel->distinct) {
    (void)match_kw("ALL");
  }

  std::vector<SelectItem *> items;
  items.push_back(parse_select_item());
  while (match(TokenKind::Comma)) {
    items.push_back(parse_select_item());
  }
  sel->items = ast_.copy_to_arena(items);

  if (match_kw("FROM")) {
    sel->from = parse_table_ref();
  }

  if (match_kw("WHERE")) {
    sel->where = parse_expr();
  }

  if (at_kw("ORDER")) {
    parse_order_by(sel);
  }

  if (at_kw("LIMIT")) {
    parse_limit(sel);
  }

  sel->range_ = join_ranges(select_tok.range, prev_range());
  return sel;
}

void Parser::parse_order_by(SelectStmt * sel)
{
  const Token order_tok = advance();
  if (!expect_kw("BY")) {
    return;
  }

  if (at_kw("ALL") && cur(1).kind != TokenKind::LParen) {
    const Token all_tok = advance();
    if (!dialect_.features().order_by_all) {
      diags_
        .report_error(
          join_ranges(order_tok.range, all_tok.range),
          fmt::format("ORDER BY ALL is not supported by dialect '{}'", dialect_.name()))
        .with_code(diag_code::k_order_by_all);
    }
    sel->order_by_all = true;
    sel->order_all_direction = parse_direction_opt();
    return;
  }

  std::vector<OrderItem *> items;
  do {
    Expr * e = parse_expr();
    const OrderDirection dir = parse_direction_opt();
    items.push_back(ast_.create<OrderItem>(e, dir, join_ranges(e->get_range(), prev_range())));
  } while (match(TokenKind::Comma));
  sel->order_by = ast_.copy_to_arena(items);
}

void Parser::parse_limit(SelectStmt * sel)
{
  advance();  // LIMIT
  Expr * first = parse_expr();
  if (match(TokenKind::Comma)) {
    // MySQL `LIMIT offset, count`
    sel->offset = first;
    sel->limit = parse_expr();
    return;
  }
  sel->limit = first;
  if (match_kw("OFFSET")) {
    sel->offset = parse_expr();
  }
}

// ============================================================================
// Supporting nodes
// ============================================================================

SelectItem * Parser::parse_select_item()
{
  Expr * e = parse_expr();
  const std::string_view alias = parse_alias_opt();
  return ast_.create<SelectItem>(e, alias, join_ranges(e->get_range(), prev_range()));
}

TableRef * Parser::parse_table_ref()
{
  const Token first_tok = cur();
  std::string_view schema;
  std::string_view name = parse_name("table name");
  if (match(TokenKind::Dot)) {
    schema = name;
    name = parse_name("table name after '.'");
  }
  const std::string_view alias = parse_alias_opt();
  return ast_.create<TableRef>(schema, name, alias, join_ranges(first_tok.range, prev_range()));
}

OrderDirection Parser::parse_direction_opt()
{
  if (match_kw("ASC")) return OrderDirection::Asc;
  if (match_kw("DESC")) return OrderDirection::Desc;
  return OrderDirection::Unspecified;
}

// ============================================================================
// Types
// ============================================================================

DataTypeNode * Parser::parse_data_type()
{
  const Token t = cur();
  DataTypeKind kind = DataTypeKind::Other;
  std::string_view name;

  if (t.kind == TokenKind::JsonbType) {
    advance();
    kind = DataTypeKind::Bson;
  } else if (t.kind == TokenKind::GeographyPointType) {
    advance();
    kind = DataTypeKind::GeographyPoint;
  } else if (t.kind == TokenKind::Identifier) {
    advance();
    const auto it = std::find_if(
      std::begin(k_type_spellings), std::end(k_type_spellings),
      [&](const TypeSpelling & s) { return iequals(s.name, t.text); });
    if (it != std::end(k_type_spellings)) {
      kind = it->kind;
    } else {
      name = ast_.intern(t.text);
    }
  } else {
    error_at(t, "expected data type");
    return ast_.create<DataTypeNode>(
      DataTypeKind::Other, std::string_view{}, gsl::span<std::string_view>{}, t.range);
  }

  std::vector<std::string_view> params;
  if (match(TokenKind::LParen)) {
    do {
      const Token & p = cur();
      if (p.kind == TokenKind::Number || p.kind == TokenKind::Identifier) {
        advance();
        params.push_back(ast_.intern(p.text));
      } else {
        error_at(p, "expected type parameter");
        break;
      }
    } while (match(TokenKind::Comma));
    expect(TokenKind::RParen, "')' after type parameters");
  }

  return ast_.create<DataTypeNode>(
    kind, name, ast_.copy_to_arena(params), join_ranges(t.range, prev_range()));
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::parse_expr() { return parse_or(); }

Expr * Parser::parse_or()
{
  Expr * lhs = parse_and();
  while (match_kw("OR") || match(TokenKind::DPipe)) {
    Expr * rhs = parse_and();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::Or, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_and()
{
  Expr * lhs = parse_not();
  while (match_kw("AND")) {
    Expr * rhs = parse_not();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::And, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_not()
{
  if (match_kw("NOT")) {
    const Token op = tokens_[idx_ - 1];
    Expr * e = parse_not();
    return ast_.create<UnaryExpr>(UnaryOp::Not, e, join_ranges(op.range, e->get_range()));
  }
  return parse_comparison();
}

Expr * Parser::parse_comparison()
{
  Expr * lhs = parse_add();

  while (true) {
    if (at_kw("IS")) {
      advance();
      const bool negated = match_kw("NOT");
      expect_kw("NULL");
      lhs = ast_.create<IsNullExpr>(lhs, negated, join_ranges(lhs->get_range(), prev_range()));
      continue;
    }

    if (at_kw("LIKE") || (at_kw("NOT") && at_kw("LIKE", 1))) {
      const bool negated = match_kw("NOT");
      advance();  // LIKE
      Expr * rhs = parse_add();
      Expr * like = ast_.create<BinaryExpr>(
        lhs, BinaryOp::Like, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
      lhs = negated ? ast_.create<UnaryExpr>(UnaryOp::Not, like, like->get_range()) : like;
      continue;
    }

    BinaryOp op = BinaryOp::Eq;
    switch (cur().kind) {
      case TokenKind::Eq:
        op = BinaryOp::Eq;
        break;
      case TokenKind::NullSafeEq:
        op = BinaryOp::NullSafeEq;
        break;
      case TokenKind::Ne:
        op = BinaryOp::Ne;
        break;
      case TokenKind::Lt:
        op = BinaryOp::Lt;
        break;
      case TokenKind::Le:
        op = BinaryOp::Le;
        break;
      case TokenKind::Gt:
        op = BinaryOp::Gt;
        break;
      case TokenKind::Ge:
        op = BinaryOp::Ge;
        break;
      default:
        return lhs;
    }
    advance();
    Expr * rhs = parse_add();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
}

Expr * Parser::parse_add()
{
  Expr * lhs = parse_mul();
  while (match(TokenKind::Plus) || match(TokenKind::Minus)) {
    const Token op_tok = tokens_[idx_ - 1];
    const BinaryOp op = (op_tok.kind == TokenKind::Plus) ? BinaryOp::Add : BinaryOp::Sub;
    Expr * rhs = parse_mul();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_mul()
{
  Expr * lhs = parse_unary();
  while (match(TokenKind::Star) || match(TokenKind::Slash) || match(TokenKind::Percent)) {
    const Token op_tok = tokens_[idx_ - 1];
    BinaryOp op = BinaryOp::Mul;
    if (op_tok.kind == TokenKind::Star) {
      op = BinaryOp::Mul;
    } else if (op_tok.kind == TokenKind::Slash) {
      op = BinaryOp::Div;
    } else {
      op = BinaryOp::Mod;
    }
    Expr * rhs = parse_unary();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_unary()
{
  if (match(TokenKind::Minus)) {
    const Token op = tokens_[idx_ - 1];
    Expr * e = parse_unary();
    return ast_.create<UnaryExpr>(UnaryOp::Neg, e, join_ranges(op.range, e->get_range()));
  }
  if (match(TokenKind::Plus)) {
    return parse_unary();
  }
  return parse_postfix();
}

Expr * Parser::parse_postfix()
{
  Expr * e = parse_primary();

  while (true) {
    // expr :: type, expr :> type, expr !:> type
    if (at(TokenKind::DColon) || at(TokenKind::ColonGt) || at(TokenKind::NColonGt)) {
      const Token op_tok = advance();
      CastStyle style = CastStyle::Function;
      if (op_tok.kind == TokenKind::ColonGt) {
        style = CastStyle::Operator;
      } else if (op_tok.kind == TokenKind::NColonGt) {
        style = CastStyle::TryOperator;
      }
      DataTypeNode * ty = parse_data_type();
      e = ast_.create<CastExpr>(e, ty, style, join_ranges(e->get_range(), ty->get_range()));
      continue;
    }

    // expr ::$ key, expr ::% key
    if (at(TokenKind::DColonDollar) || at(TokenKind::DColonPercent)) {
      const Token op_tok = advance();
      const JsonExtractKind kind = op_tok.kind == TokenKind::DColonDollar
                                     ? JsonExtractKind::String
                                     : JsonExtractKind::Double;
      std::string_view key;
      if (at(TokenKind::String)) {
        key = ast_.intern(unescape(advance()));
      } else {
        key = parse_name("JSON key");
      }
      e = ast_.create<JsonExtractExpr>(e, key, kind, join_ranges(e->get_range(), prev_range()));
      continue;
    }

    return e;
  }
}

Expr * Parser::parse_primary()
{
  const Token t = cur();

  if (match(TokenKind::Number)) {
    return ast_.create<NumberLiteralExpr>(ast_.intern(t.text), t.range);
  }

  if (match(TokenKind::String)) {
    return ast_.create<StringLiteralExpr>(ast_.intern(unescape(t)), t.range);
  }

  if (match(TokenKind::ByteString)) {
    return ast_.create<StringLiteralExpr>(ast_.intern(unescape(t)), true, t.range);
  }

  if (match(TokenKind::Star)) {
    return ast_.create<StarExpr>(t.range);
  }

  if (match(TokenKind::LParen)) {
    Expr * inner = parse_expr();
    const Token rp = cur();
    expect(TokenKind::RParen, "')' after expression");
    return ast_.create<ParenExpr>(inner, join_ranges(t.range, rp.range));
  }

  if (t.kind == TokenKind::Identifier) {
    if (is_kw("TRUE", t) || is_kw("FALSE", t)) {
      advance();
      return ast_.create<BoolLiteralExpr>(is_kw("TRUE", t), t.range);
    }
    if (is_kw("NULL", t)) {
      advance();
      return ast_.create<NullLiteralExpr>(t.range);
    }
    if (is_kw("CAST", t) && cur(1).kind == TokenKind::LParen) {
      advance();
      return parse_cast_call(t);
    }
    if (cur(1).kind == TokenKind::LParen) {
      advance();
      return parse_call(t);
    }
  }

  if (t.kind == TokenKind::Identifier || t.kind == TokenKind::QuotedIdentifier) {
    const std::string_view first = parse_name("column name");
    if (!match(TokenKind::Dot)) {
      return ast_.create<ColumnRefExpr>(first, t.range);
    }
    if (at(TokenKind::Star)) {
      const Token star = advance();
      return ast_.create<StarExpr>(first, join_ranges(t.range, star.range));
    }
    const std::string_view second = parse_name("column name after '.'");
    return ast_.create<ColumnRefExpr>(first, second, join_ranges(t.range, prev_range()));
  }

  if (t.kind == TokenKind::Unknown || t.kind == TokenKind::Unterminated) {
    advance();
    return ast_.create<MissingExpr>(t.range);
  }

  error_at(t, "expected expression");

  // Leave statement and argument terminators for the caller.
  if (t.kind != TokenKind::Semicolon && t.kind != TokenKind::RParen && t.kind != TokenKind::Comma) {
    advance();
  }

  return make_missing_expr_at(t);
}

Expr * Parser::parse_call(const Token & name_tok)
{
  advance();  // (

  std::vector<Expr *> args;
  if (!at(TokenKind::RParen)) {
    args.push_back(parse_expr());
    while (match(TokenKind::Comma)) {
      args.push_back(parse_expr());
    }
  }

  const Token rp = cur();
  expect(TokenKind::RParen, "')' after function arguments");

  const SourceRange range = join_ranges(name_tok.range, rp.range);
  const std::string_view name = ast_.intern(name_tok.text);
  auto span = ast_.copy_to_arena(args);

  if (const auto * rule = dialect_.find_function_rule(name_tok.text)) {
    return dialect::build_temporal(ast_, *rule, name, span, range, diags_);
  }
  return ast_.create<FunctionCallExpr>(name, span, range);
}

Expr * Parser::parse_cast_call(const Token & cast_tok)
{
  advance();  // (
  Expr * e = parse_expr();
  expect_kw("AS");
  DataTypeNode * ty = parse_data_type();
  const Token rp = cur();
  expect(TokenKind::RParen, "')' after CAST");
  return ast_.create<CastExpr>(e, ty, CastStyle::Function, join_ranges(cast_tok.range, rp.range));
}

Expr * Parser::make_missing_expr_at(const Token & t) { return ast_.create<MissingExpr>(t.range); }

// ============================================================================
// Literals
// ============================================================================

std::string Parser::unescape(const Token & t) const
{
  const std::string_view content = source_.content();
  const uint32_t quote_pos = t.kind == TokenKind::ByteString ? t.begin() + 1 : t.begin();
  const char quote = quote_pos < content.size() ? content[quote_pos] : '\'';
  const bool backslash_escapes = t.kind != TokenKind::QuotedIdentifier;

  const std::string_view raw = t.text;
  std::string out;
  out.reserve(raw.size());

  for (size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];

    if (c == quote && i + 1 < raw.size() && raw[i + 1] == quote) {
      out.push_back(quote);
      ++i;
      continue;
    }

    if (c != '\\' || !backslash_escapes || i + 1 >= raw.size()) {
      out.push_back(c);
      continue;
    }

    const char esc = raw[++i];
    switch (esc) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 'b':
        out.push_back('\b');
        break;
      case '0':
        out.push_back('\0');
        break;
      case 'Z':
        out.push_back('\x1a');
        break;
      case '%':
      case '_':
        // Kept escaped for LIKE patterns
        out.push_back('\\');
        out.push_back(esc);
        break;
      default:
        out.push_back(esc);
        break;
    }
  }

  return out;
}

}  // namespace s2sql::syntax
