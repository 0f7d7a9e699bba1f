// s2sql/codegen/sql_generator.cpp - SQL writer
#include "s2sql/codegen/sql_generator.hpp"

#include <fmt/core.h>

#include <cctype>

#include "s2sql/ast/visitor.hpp"
#include "s2sql/dialect/temporal_rewrite.hpp"

namespace s2sql
{

namespace
{

bool is_plain_identifier(std::string_view name)
{
  if (name.empty()) return false;
  const auto first = static_cast<unsigned char>(name.front());
  if (std::isalpha(first) == 0 && first != '_') return false;
  for (const char ch : name) {
    const auto c = static_cast<unsigned char>(ch);
    if (std::isalnum(c) == 0 && c != '_' && c != '$') return false;
  }
  return true;
}

std::string to_upper(std::string_view s)
{
  std::string out(s);
  for (auto & c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

// ============================================================================
// SqlWriter
// ============================================================================

class SqlWriter : public ConstAstVisitor<SqlWriter>
{
public:
  SqlWriter(const SqlGenerator & gen, const dialect::Dialect & dialect, DiagnosticBag & diags)
  : gen_(gen), dialect_(dialect), diags_(diags)
  {
  }

  [[nodiscard]] std::string take() { return std::move(out_); }

  // --- Literals and references ---

  void visit_number_literal_expr(const NumberLiteralExpr * node) { out_ += node->text; }

  void visit_string_literal_expr(const StringLiteralExpr * node)
  {
    if (node->is_byte_string && dialect_.features().byte_strings) {
      out_ += 'e';
    }
    out_ += quote_string_literal(node->value);
  }

  void visit_bool_literal_expr(const BoolLiteralExpr * node)
  {
    out_ += node->value ? "TRUE" : "FALSE";
  }

  void visit_null_literal_expr(const NullLiteralExpr * /*node*/) { out_ += "NULL"; }

  void visit_column_ref_expr(const ColumnRefExpr * node)
  {
    if (!node->qualifier.empty()) {
      out_ += gen_.quote_identifier(node->qualifier);
      out_ += '.';
    }
    out_ += gen_.quote_identifier(node->name);
  }

  void visit_star_expr(const StarExpr * node)
  {
    if (!node->qualifier.empty()) {
      out_ += gen_.quote_identifier(node->qualifier);
      out_ += '.';
    }
    out_ += '*';
  }

  // --- Operators ---

  void visit_paren_expr(const ParenExpr * node)
  {
    out_ += '(';
    visit(node->inner);
    out_ += ')';
  }

  void visit_unary_expr(const UnaryExpr * node)
  {
    if (node->op == UnaryOp::Not) {
      out_ += "NOT ";
    } else {
      out_ += to_string(node->op);
    }
    visit(node->operand);
  }

  void visit_binary_expr(const BinaryExpr * node)
  {
    visit(node->lhs);
    out_ += ' ';
    out_ += to_string(node->op);
    out_ += ' ';
    visit(node->rhs);
  }

  void visit_is_null_expr(const IsNullExpr * node)
  {
    visit(node->operand);
    out_ += node->negated ? " IS NOT NULL" : " IS NULL";
  }

  void visit_function_call_expr(const FunctionCallExpr * node)
  {
    out_ += to_upper(node->name);
    out_ += '(';
    write_list(node->args);
    out_ += ')';
  }

  // --- Types and conversions ---

  void visit_data_type_node(const DataTypeNode * node)
  {
    if (node->type_kind == DataTypeKind::Other) {
      out_ += node->name;
    } else {
      out_ += dialect_.type_name(node->type_kind);
    }
    if (!node->params.empty()) {
      out_ += '(';
      bool first = true;
      for (const auto p : node->params) {
        if (!first) out_ += ", ";
        first = false;
        out_ += p;
      }
      out_ += ')';
    }
  }

  void visit_cast_expr(const CastExpr * node)
  {
    if (node->style != CastStyle::Function && dialect_.features().cast_operators) {
      visit(node->expr);
      out_ += node->is_try() ? " !:> " : " :> ";
      visit(node->target_type);
      return;
    }
    if (node->is_try()) {
      diags_
        .report_warning(
          node->get_range(),
          fmt::format("dialect '{}' has no non-failing cast", dialect_.name()),
          "written as CAST")
        .with_code(diag_code::k_lossy_cast);
    }
    out_ += "CAST(";
    visit(node->expr);
    out_ += " AS ";
    visit(node->target_type);
    out_ += ')';
  }

  void visit_json_extract_expr(const JsonExtractExpr * node)
  {
    const bool as_string = node->extract_kind == JsonExtractKind::String;
    if (dialect_.features().json_extract_operators) {
      visit(node->expr);
      out_ += as_string ? "::$" : "::%";
      out_ += gen_.quote_identifier(node->key);
      return;
    }

    const std::string path = quote_string_literal(fmt::format("$.{}", node->key));
    if (as_string) {
      out_ += "JSON_UNQUOTE(JSON_EXTRACT(";
      visit(node->expr);
      out_ += ", " + path + "))";
    } else {
      out_ += "JSON_EXTRACT(";
      visit(node->expr);
      out_ += ", " + path + ")";
    }
  }

  void visit_time_format_expr(const TimeFormatExpr * node)
  {
    out_ += quote_string_literal(node->original);
  }

  void visit_temporal_expr(const TemporalExpr * node)
  {
    const dialect::WriterRule * writer = dialect_.writer_rule(node->op);
    const bool needs_format =
      writer && writer->format_required && writer->function_without_format.empty();
    if (!node->format && needs_format) {
      const std::string message = fmt::format(
        "{} without a format cannot be written in dialect '{}'", to_upper(node->spelled_name),
        dialect_.name());
      diags_.report_error(node->get_range(), message)
        .with_code(diag_code::k_unsupported_by_writer)
        .with_help(fmt::format("pass a format argument for {}", writer->function));
      write_temporal_fallback(node);
      return;
    }

    auto call = dialect::rewrite_temporal(*node, dialect_);
    if (!call) {
      if (node->format) {
        diags_.report_error(node->format->get_range(), call.error().message())
          .with_code(diag_code::k_format_not_representable)
          .with_secondary_label(node->get_range(), "call left as written");
      } else {
        diags_.report_error(node->get_range(), call.error().message())
          .with_code(diag_code::k_format_not_representable);
      }
      write_temporal_fallback(node);
      return;
    }

    out_ += call->function;
    out_ += '(';
    visit(call->value);
    if (call->format_text) {
      out_ += ", ";
      out_ += quote_string_literal(*call->format_text);
    } else if (call->format_passthrough) {
      out_ += ", ";
      visit(call->format_passthrough);
    }
    out_ += ')';
  }

  void visit_missing_expr(const MissingExpr * /*node*/) { out_ += "NULL"; }

  // --- Statements ---

  void visit_select_item(const SelectItem * node)
  {
    visit(node->expr);
    if (!node->alias.empty()) {
      out_ += " AS ";
      out_ += gen_.quote_identifier(node->alias);
    }
  }

  void visit_table_ref(const TableRef * node)
  {
    if (!node->schema.empty()) {
      out_ += gen_.quote_identifier(node->schema);
      out_ += '.';
    }
    out_ += gen_.quote_identifier(node->name);
    if (!node->alias.empty()) {
      out_ += " AS ";
      out_ += gen_.quote_identifier(node->alias);
    }
  }

  void visit_order_item(const OrderItem * node)
  {
    visit(node->expr);
    write_direction(node->direction);
  }

  void visit_select_stmt(const SelectStmt * node)
  {
    out_ += "SELECT ";
    if (node->distinct) {
      out_ += "DISTINCT ";
    }
    write_list(node->items);

    if (node->from) {
      out_ += " FROM ";
      visit(node->from);
    }
    if (node->where) {
      out_ += " WHERE ";
      visit(node->where);
    }

    if (node->order_by_all) {
      if (!dialect_.features().order_by_all) {
        diags_
          .report_error(
            node->get_range(),
            fmt::format("ORDER BY ALL cannot be written in dialect '{}'", dialect_.name()))
          .with_code(diag_code::k_unsupported_by_writer)
          .with_help("list the ORDER BY columns explicitly");
      }
      out_ += " ORDER BY ALL";
      write_direction(node->order_all_direction);
    } else if (!node->order_by.empty()) {
      out_ += " ORDER BY ";
      write_list(node->order_by);
    }

    if (node->limit) {
      out_ += " LIMIT ";
      visit(node->limit);
    }
    if (node->offset) {
      out_ += " OFFSET ";
      visit(node->offset);
    }
  }

  void visit_expr_stmt(const ExprStmt * node) { visit(node->expr); }

  void visit_script(const Script * node)
  {
    bool first = true;
    for (const auto * stmt : node->statements) {
      if (!first) out_ += ";\n";
      first = false;
      visit(stmt);
    }
  }

private:
  template <typename T>
  void write_list(gsl::span<T *> nodes)
  {
    bool first = true;
    for (const auto * n : nodes) {
      if (!first) out_ += ", ";
      first = false;
      visit(n);
    }
  }

  void write_direction(OrderDirection dir)
  {
    if (dir != OrderDirection::Unspecified) {
      out_ += ' ';
      out_ += to_string(dir);
    }
  }

  // Keeps the call as written when its format cannot be re-spelled.
  void write_temporal_fallback(const TemporalExpr * node)
  {
    out_ += to_upper(node->spelled_name);
    out_ += '(';
    visit(node->value);
    if (node->format) {
      out_ += ", ";
      visit(node->format);
    }
    out_ += ')';
  }

  const SqlGenerator & gen_;
  const dialect::Dialect & dialect_;
  DiagnosticBag & diags_;
  std::string out_;
};

}  // namespace

std::string quote_string_literal(std::string_view value)
{
  std::string out;
  out.reserve(value.size() + 2);
  out += '\'';
  for (size_t i = 0; i < value.size(); ++i) {
    const char c = value[i];
    switch (c) {
      case '\'':
        out += "''";
        break;
      case '\\':
        // `\%` and `\_` stay as written (LIKE escapes)
        if (i + 1 < value.size() && (value[i + 1] == '%' || value[i + 1] == '_')) {
          out += c;
        } else {
          out += "\\\\";
        }
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\0':
        out += "\\0";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\x1a':
        out += "\\Z";
        break;
      default:
        out += c;
        break;
    }
  }
  out += '\'';
  return out;
}

std::string SqlGenerator::quote_identifier(std::string_view name) const
{
  if (!options_.identify && is_plain_identifier(name) && !dialect_.is_reserved(name)) {
    return std::string(name);
  }

  std::string out;
  out.reserve(name.size() + 2);
  out += '`';
  for (const char c : name) {
    if (c == '`') out += '`';
    out += c;
  }
  out += '`';
  return out;
}

std::vector<std::string> SqlGenerator::generate(const Script & script)
{
  std::vector<std::string> out;
  out.reserve(script.statements.size());
  for (const auto * stmt : script.statements) {
    out.push_back(generate(*stmt));
  }
  return out;
}

std::string SqlGenerator::generate(const AstNode & node)
{
  SqlWriter writer(*this, dialect_, diags_);
  writer.visit(&node);
  return writer.take();
}

}  // namespace s2sql
