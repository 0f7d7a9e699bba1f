// s2sql/ast/ast.hpp - AST node class definitions
//
// LLVM/Clang style hierarchy with classof() for RTTI support. Nodes are
// arena-allocated by AstContext and must stay trivially destructible.
//
#pragma once

#include <gsl/span>
#include <string_view>

#include "s2sql/ast/ast_enums.hpp"
#include "s2sql/basic/casting.hpp"
#include "s2sql/basic/source_manager.hpp"
#include "s2sql/time/canonical_format.hpp"

namespace s2sql
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has a NodeKind (for classof) and the byte range it was
 * parsed from. Nodes are non-copyable and owned by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base class that implements classof().
 *
 * @tparam Derived The concrete node class
 * @tparam Base The category class to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class TypeNode : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_type_kind(node->kind); }

protected:
  explicit TypeNode(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// Numeric literal, kept as written.
class NumberLiteralExpr : public NodeBase<NumberLiteralExpr, Expr, NodeKind::NumberLiteral>
{
public:
  std::string_view text;

  explicit NumberLiteralExpr(std::string_view t, SourceRange r = {}) : NodeBase(r), text(t) {}
};

/// String literal; `value` has quotes removed and escapes resolved.
class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;
  bool is_byte_string = false;  ///< e'...'

  explicit StringLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}

  StringLiteralExpr(std::string_view v, bool byte_string, SourceRange r = {})
  : NodeBase(r), value(v), is_byte_string(byte_string)
  {
  }
};

class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class NullLiteralExpr : public NodeBase<NullLiteralExpr, Expr, NodeKind::NullLiteral>
{
public:
  explicit NullLiteralExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// Column reference: name or qualifier.name.
class ColumnRefExpr : public NodeBase<ColumnRefExpr, Expr, NodeKind::ColumnRef>
{
public:
  std::string_view qualifier;  ///< Empty when unqualified
  std::string_view name;

  explicit ColumnRefExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}

  ColumnRefExpr(std::string_view q, std::string_view n, SourceRange r = {})
  : NodeBase(r), qualifier(q), name(n)
  {
  }
};

/// `*` or `qualifier.*`.
class StarExpr : public NodeBase<StarExpr, Expr, NodeKind::Star>
{
public:
  std::string_view qualifier;

  explicit StarExpr(SourceRange r = {}) : NodeBase(r) {}
  explicit StarExpr(std::string_view q, SourceRange r = {}) : NodeBase(r), qualifier(q) {}
};

class ParenExpr : public NodeBase<ParenExpr, Expr, NodeKind::Paren>
{
public:
  Expr * inner;

  explicit ParenExpr(Expr * e, SourceRange r = {}) : NodeBase(r), inner(e) {}
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::UnaryExpr>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

/// `expr IS [NOT] NULL`.
class IsNullExpr : public NodeBase<IsNullExpr, Expr, NodeKind::IsNull>
{
public:
  Expr * operand;
  bool negated;

  IsNullExpr(Expr * e, bool neg, SourceRange r = {}) : NodeBase(r), operand(e), negated(neg) {}
};

/// Function call with no dialect-specific meaning.
class FunctionCallExpr : public NodeBase<FunctionCallExpr, Expr, NodeKind::FunctionCall>
{
public:
  std::string_view name;
  gsl::span<Expr *> args;

  FunctionCallExpr(std::string_view n, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), name(n), args(a)
  {
  }
};

/// Data type reference: INT, VARCHAR(20), TIME(6), BSON, ...
class DataTypeNode : public NodeBase<DataTypeNode, TypeNode, NodeKind::DataType>
{
public:
  DataTypeKind type_kind;
  std::string_view name;  ///< Spelling for DataTypeKind::Other
  gsl::span<std::string_view> params;

  DataTypeNode(DataTypeKind k, std::string_view n, gsl::span<std::string_view> p, SourceRange r = {})
  : NodeBase(r), type_kind(k), name(n), params(p)
  {
  }
};

/// Type conversion: CAST(x AS T), x :> T, x !:> T.
class CastExpr : public NodeBase<CastExpr, Expr, NodeKind::CastExpr>
{
public:
  Expr * expr;
  DataTypeNode * target_type;
  CastStyle style;

  CastExpr(Expr * e, DataTypeNode * t, CastStyle s, SourceRange r = {})
  : NodeBase(r), expr(e), target_type(t), style(s)
  {
  }

  [[nodiscard]] bool is_try() const noexcept { return style == CastStyle::TryOperator; }
};

/// JSON path extraction: x::$key (string) or x::%key (double).
class JsonExtractExpr : public NodeBase<JsonExtractExpr, Expr, NodeKind::JsonExtract>
{
public:
  Expr * expr;
  std::string_view key;
  JsonExtractKind extract_kind;

  JsonExtractExpr(Expr * e, std::string_view k, JsonExtractKind ek, SourceRange r = {})
  : NodeBase(r), expr(e), key(k), extract_kind(ek)
  {
  }
};

/// One decoded element of a literal date/time format.
struct FormatPiece
{
  time::FormatElementKind kind;
  std::string_view text;
};

/**
 * A literal format string decoded into canonical directives.
 *
 * `original` keeps the literal as written; `table` names the directive
 * table it was decoded with.
 */
class TimeFormatExpr : public NodeBase<TimeFormatExpr, Expr, NodeKind::TimeFormat>
{
public:
  gsl::span<FormatPiece> pieces;
  std::string_view original;
  std::string_view table;

  TimeFormatExpr(
    gsl::span<FormatPiece> p, std::string_view orig, std::string_view tbl, SourceRange r = {})
  : NodeBase(r), pieces(p), original(orig), table(tbl)
  {
  }
};

/**
 * Date/time conversion with an optional format argument.
 *
 * `format` is a TimeFormatExpr for literal formats, any other expression
 * for formats only known at run time, or nullptr when omitted.
 */
class TemporalExpr : public NodeBase<TemporalExpr, Expr, NodeKind::Temporal>
{
public:
  TemporalOp op;
  Expr * value;
  Expr * format;
  std::string_view spelled_name;  ///< Function name as written

  TemporalExpr(TemporalOp o, Expr * v, Expr * f, std::string_view name, SourceRange r = {})
  : NodeBase(r), op(o), value(v), format(f), spelled_name(name)
  {
  }
};

/// Missing expression (parser recovery placeholder).
class MissingExpr : public NodeBase<MissingExpr, Expr, NodeKind::MissingExpr>
{
public:
  explicit MissingExpr(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// Select-list entry with optional alias.
class SelectItem : public NodeBase<SelectItem, AstNode, NodeKind::SelectItem>
{
public:
  Expr * expr;
  std::string_view alias;

  SelectItem(Expr * e, std::string_view a, SourceRange r = {}) : NodeBase(r), expr(e), alias(a) {}
};

/// FROM target: [schema.]name [AS alias].
class TableRef : public NodeBase<TableRef, AstNode, NodeKind::TableRef>
{
public:
  std::string_view schema;
  std::string_view name;
  std::string_view alias;

  TableRef(std::string_view s, std::string_view n, std::string_view a, SourceRange r = {})
  : NodeBase(r), schema(s), name(n), alias(a)
  {
  }
};

class OrderItem : public NodeBase<OrderItem, AstNode, NodeKind::OrderItem>
{
public:
  Expr * expr;
  OrderDirection direction;

  OrderItem(Expr * e, OrderDirection d, SourceRange r = {}) : NodeBase(r), expr(e), direction(d) {}
};

// ============================================================================
// Statements
// ============================================================================

class SelectStmt : public NodeBase<SelectStmt, Stmt, NodeKind::SelectStmt>
{
public:
  bool distinct = false;
  gsl::span<SelectItem *> items;
  TableRef * from = nullptr;
  Expr * where = nullptr;
  gsl::span<OrderItem *> order_by;
  bool order_by_all = false;  ///< ORDER BY ALL
  OrderDirection order_all_direction = OrderDirection::Unspecified;
  Expr * limit = nullptr;
  Expr * offset = nullptr;

  explicit SelectStmt(SourceRange r = {}) : NodeBase(r) {}
};

/// Bare expression used as a statement (e.g. `TO_DATE('2020', 'YYYY')`).
class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * expr;

  explicit ExprStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

// ============================================================================
// Top-level
// ============================================================================

class Script : public NodeBase<Script, AstNode, NodeKind::Script>
{
public:
  gsl::span<Stmt *> statements;

  explicit Script(SourceRange r = {}) : NodeBase(r) {}
};

}  // namespace s2sql
