// s2sql/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, operators and the temporal operation set.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace s2sql
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "s2sql/ast/ast_nodes.def"

// === Types ===
#define AST_NODE_TYPE(Class, Kind, Snake) Kind,
#include "s2sql/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "s2sql/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "s2sql/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "s2sql/ast/ast_nodes.def"
};

// ============================================================================
// Operators
// ============================================================================

enum class BinaryOp : uint8_t {
  // Logical
  Or,   ///< OR, ||
  And,  ///< AND
  // Comparison
  Eq,          ///< =
  NullSafeEq,  ///< <=>
  Ne,          ///< <>, !=
  Lt,          ///< <
  Le,          ///< <=
  Gt,          ///< >
  Ge,          ///< >=
  Like,        ///< LIKE
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
};

enum class UnaryOp : uint8_t {
  Not,  ///< NOT
  Neg,  ///< -
};

// ============================================================================
// Temporal conversions
// ============================================================================

/**
 * Date/time string conversions that carry a format argument.
 *
 * Dialects map SQL function names onto these at parse time and back onto
 * function names at generation time.
 */
enum class TemporalOp : uint8_t {
  TsOrDsToDate,  ///< string or timestamp -> DATE (TO_DATE)
  StrToTime,     ///< string -> TIMESTAMP (TO_TIMESTAMP)
  ToChar,        ///< value -> string (TO_CHAR)
  StrToDate,     ///< string -> DATE with explicit format (STR_TO_DATE)
  TimeToStr,     ///< value -> string with explicit format (DATE_FORMAT)
};

inline constexpr TemporalOp k_all_temporal_ops[] = {
  TemporalOp::TsOrDsToDate, TemporalOp::StrToTime, TemporalOp::ToChar, TemporalOp::StrToDate,
  TemporalOp::TimeToStr,
};

/// `::$` extracts a JSON value as string, `::%` as double.
enum class JsonExtractKind : uint8_t {
  String,
  Double,
};

/// How a cast was spelled.
enum class CastStyle : uint8_t {
  Function,  ///< CAST(x AS T), x::T
  Operator,  ///< x :> T
  TryOperator,  ///< x !:> T
};

enum class OrderDirection : uint8_t {
  Unspecified,
  Asc,
  Desc,
};

enum class DataTypeKind : uint8_t {
  TinyInt,
  SmallInt,
  Int,
  BigInt,
  Decimal,
  Float,
  Double,
  Boolean,
  Char,
  Varchar,
  Text,
  Binary,
  Varbinary,
  Blob,
  Date,
  Time,
  DateTime,
  Timestamp,
  Year,
  Json,
  Bson,  ///< SingleStore binary JSON
  Geography,
  GeographyPoint,
  Signed,
  Unsigned,
  Other,  ///< Any other name, rendered as written
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Or:
      return "OR";
    case BinaryOp::And:
      return "AND";
    case BinaryOp::Eq:
      return "=";
    case BinaryOp::NullSafeEq:
      return "<=>";
    case BinaryOp::Ne:
      return "<>";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::Like:
      return "LIKE";
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "NOT";
    case UnaryOp::Neg:
      return "-";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(TemporalOp op) noexcept
{
  switch (op) {
    case TemporalOp::TsOrDsToDate:
      return "TsOrDsToDate";
    case TemporalOp::StrToTime:
      return "StrToTime";
    case TemporalOp::ToChar:
      return "ToChar";
    case TemporalOp::StrToDate:
      return "StrToDate";
    case TemporalOp::TimeToStr:
      return "TimeToStr";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(JsonExtractKind kind) noexcept
{
  switch (kind) {
    case JsonExtractKind::String:
      return "string";
    case JsonExtractKind::Double:
      return "double";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(CastStyle style) noexcept
{
  switch (style) {
    case CastStyle::Function:
      return "function";
    case CastStyle::Operator:
      return "operator";
    case CastStyle::TryOperator:
      return "try_operator";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(OrderDirection dir) noexcept
{
  switch (dir) {
    case OrderDirection::Unspecified:
      return "";
    case OrderDirection::Asc:
      return "ASC";
    case OrderDirection::Desc:
      return "DESC";
  }
  return "";
}

/// Canonical upper-case spelling; empty for DataTypeKind::Other.
[[nodiscard]] constexpr std::string_view to_string(DataTypeKind kind) noexcept
{
  switch (kind) {
    case DataTypeKind::TinyInt:
      return "TINYINT";
    case DataTypeKind::SmallInt:
      return "SMALLINT";
    case DataTypeKind::Int:
      return "INT";
    case DataTypeKind::BigInt:
      return "BIGINT";
    case DataTypeKind::Decimal:
      return "DECIMAL";
    case DataTypeKind::Float:
      return "FLOAT";
    case DataTypeKind::Double:
      return "DOUBLE";
    case DataTypeKind::Boolean:
      return "BOOLEAN";
    case DataTypeKind::Char:
      return "CHAR";
    case DataTypeKind::Varchar:
      return "VARCHAR";
    case DataTypeKind::Text:
      return "TEXT";
    case DataTypeKind::Binary:
      return "BINARY";
    case DataTypeKind::Varbinary:
      return "VARBINARY";
    case DataTypeKind::Blob:
      return "BLOB";
    case DataTypeKind::Date:
      return "DATE";
    case DataTypeKind::Time:
      return "TIME";
    case DataTypeKind::DateTime:
      return "DATETIME";
    case DataTypeKind::Timestamp:
      return "TIMESTAMP";
    case DataTypeKind::Year:
      return "YEAR";
    case DataTypeKind::Json:
      return "JSON";
    case DataTypeKind::Bson:
      return "BSON";
    case DataTypeKind::Geography:
      return "GEOGRAPHY";
    case DataTypeKind::GeographyPoint:
      return "GEOGRAPHYPOINT";
    case DataTypeKind::Signed:
      return "SIGNED";
    case DataTypeKind::Unsigned:
      return "UNSIGNED";
    case DataTypeKind::Other:
      return "";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::NumberLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::MissingExpr;

inline constexpr NodeKind k_first_type_kind = NodeKind::DataType;
inline constexpr NodeKind k_last_type_kind = NodeKind::DataType;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::SelectStmt;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::ExprStmt;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_type_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_type_kind && kind <= detail::k_last_type_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

}  // namespace s2sql
