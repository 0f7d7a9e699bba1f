// s2sql/ast/json_visitor.cpp - JSON serialization implementation
//
#include "s2sql/ast/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "s2sql/ast/ast.hpp"
#include "s2sql/ast/ast_enums.hpp"
#include "s2sql/basic/casting.hpp"
#include "s2sql/basic/source_manager.hpp"

namespace s2sql
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

uint32_t begin_off(SourceRange r) { return r.get_begin().get_offset(); }
uint32_t end_off(SourceRange r) { return r.get_end().get_offset(); }

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", begin_off(r)}, {"end", end_off(r)}};
}

json j_opt_str(std::string_view s)
{
  if (s.empty()) return nullptr;
  return std::string(s);
}

json j_type(const DataTypeNode * t);
json j_expr(const Expr * e);
json j_stmt(const Stmt * s);

// ============================================================================
// Type serialization
// ============================================================================

json j_type(const DataTypeNode * t)
{
  if (!t) return json{{"type", "MissingType"}, {"range", j_range({})}};

  json params = json::array();
  for (const auto p : t->params) {
    params.push_back(std::string(p));
  }
  const std::string_view name =
    t->type_kind == DataTypeKind::Other ? t->name : to_string(t->type_kind);
  return json{
    {"type", "DataType"}, {"range", j_range(t->get_range())}, {"name", std::string(name)},
    {"params", params}};
}

// ============================================================================
// Expression serialization
// ============================================================================

json j_format_pieces(const TimeFormatExpr * f)
{
  json pieces = json::array();
  for (const auto & p : f->pieces) {
    pieces.push_back(json{
      {"kind", p.kind == time::FormatElementKind::Directive ? "directive" : "literal"},
      {"text", std::string(p.text)}});
  }
  return pieces;
}

json j_expr(const Expr * e)
{
  if (!e) return json{{"type", "MissingExpr"}, {"range", j_range({})}};

  if (isa<MissingExpr>(e)) {
    return json{{"type", "MissingExpr"}, {"range", j_range(e->get_range())}};
  }

  if (isa<NumberLiteralExpr>(e)) {
    const auto * lit = cast<NumberLiteralExpr>(e);
    return json{
      {"type", "NumberLiteralExpr"},
      {"range", j_range(lit->get_range())},
      {"value", std::string(lit->text)}};
  }

  if (isa<StringLiteralExpr>(e)) {
    const auto * lit = cast<StringLiteralExpr>(e);
    json j{
      {"type", "StringLiteralExpr"},
      {"range", j_range(lit->get_range())},
      {"value", std::string(lit->value)}};
    if (lit->is_byte_string) {
      j["byteString"] = true;
    }
    return j;
  }

  if (isa<BoolLiteralExpr>(e)) {
    const auto * lit = cast<BoolLiteralExpr>(e);
    return json{
      {"type", "BoolLiteralExpr"}, {"range", j_range(lit->get_range())}, {"value", lit->value}};
  }

  if (isa<NullLiteralExpr>(e)) {
    return json{{"type", "NullLiteralExpr"}, {"range", j_range(e->get_range())}};
  }

  if (isa<ColumnRefExpr>(e)) {
    const auto * c = cast<ColumnRefExpr>(e);
    return json{
      {"type", "ColumnRefExpr"},
      {"range", j_range(c->get_range())},
      {"qualifier", j_opt_str(c->qualifier)},
      {"name", std::string(c->name)}};
  }

  if (isa<StarExpr>(e)) {
    const auto * s = cast<StarExpr>(e);
    return json{
      {"type", "StarExpr"}, {"range", j_range(s->get_range())}, {"qualifier", j_opt_str(s->qualifier)}};
  }

  if (isa<ParenExpr>(e)) {
    const auto * p = cast<ParenExpr>(e);
    return json{{"type", "ParenExpr"}, {"range", j_range(p->get_range())}, {"inner", j_expr(p->inner)}};
  }

  if (isa<UnaryExpr>(e)) {
    const auto * u = cast<UnaryExpr>(e);
    return json{
      {"type", "UnaryExpr"},
      {"range", j_range(u->get_range())},
      {"op", std::string(to_string(u->op))},
      {"operand", j_expr(u->operand)}};
  }

  if (isa<BinaryExpr>(e)) {
    const auto * b = cast<BinaryExpr>(e);
    return json{
      {"type", "BinaryExpr"},
      {"range", j_range(b->get_range())},
      {"op", std::string(to_string(b->op))},
      {"lhs", j_expr(b->lhs)},
      {"rhs", j_expr(b->rhs)}};
  }

  if (isa<IsNullExpr>(e)) {
    const auto * n = cast<IsNullExpr>(e);
    return json{
      {"type", "IsNullExpr"},
      {"range", j_range(n->get_range())},
      {"negated", n->negated},
      {"operand", j_expr(n->operand)}};
  }

  if (isa<FunctionCallExpr>(e)) {
    const auto * call = cast<FunctionCallExpr>(e);
    json args = json::array();
    for (const auto * a : call->args) {
      args.push_back(j_expr(a));
    }
    return json{
      {"type", "FunctionCallExpr"},
      {"range", j_range(call->get_range())},
      {"name", std::string(call->name)},
      {"args", args}};
  }

  if (isa<CastExpr>(e)) {
    const auto * c = cast<CastExpr>(e);
    return json{
      {"type", "CastExpr"},
      {"range", j_range(c->get_range())},
      {"style", std::string(to_string(c->style))},
      {"expr", j_expr(c->expr)},
      {"targetType", j_type(c->target_type)}};
  }

  if (isa<JsonExtractExpr>(e)) {
    const auto * j = cast<JsonExtractExpr>(e);
    return json{
      {"type", "JsonExtractExpr"},
      {"range", j_range(j->get_range())},
      {"as", std::string(to_string(j->extract_kind))},
      {"key", std::string(j->key)},
      {"expr", j_expr(j->expr)}};
  }

  if (isa<TimeFormatExpr>(e)) {
    const auto * f = cast<TimeFormatExpr>(e);
    return json{
      {"type", "TimeFormatExpr"},
      {"range", j_range(f->get_range())},
      {"original", std::string(f->original)},
      {"table", std::string(f->table)},
      {"pieces", j_format_pieces(f)}};
  }

  if (isa<TemporalExpr>(e)) {
    const auto * t = cast<TemporalExpr>(e);
    return json{
      {"type", "TemporalExpr"},
      {"range", j_range(t->get_range())},
      {"op", std::string(to_string(t->op))},
      {"function", std::string(t->spelled_name)},
      {"value", j_expr(t->value)},
      {"format", t->format ? j_expr(t->format) : json(nullptr)}};
  }

  return json{{"type", "UnknownExpr"}, {"range", j_range(e->get_range())}};
}

// ============================================================================
// Supporting node serialization
// ============================================================================

json j_select_item(const SelectItem * item)
{
  return json{
    {"type", "SelectItem"},
    {"range", j_range(item->get_range())},
    {"expr", j_expr(item->expr)},
    {"alias", j_opt_str(item->alias)}};
}

json j_table_ref(const TableRef * t)
{
  return json{
    {"type", "TableRef"},
    {"range", j_range(t->get_range())},
    {"schema", j_opt_str(t->schema)},
    {"name", std::string(t->name)},
    {"alias", j_opt_str(t->alias)}};
}

json j_order_item(const OrderItem * o)
{
  return json{
    {"type", "OrderItem"},
    {"range", j_range(o->get_range())},
    {"expr", j_expr(o->expr)},
    {"direction", j_opt_str(to_string(o->direction))}};
}

// ============================================================================
// Statement serialization
// ============================================================================

json j_stmt(const Stmt * s)
{
  if (!s) return json{{"type", "MissingStmt"}, {"range", j_range({})}};

  if (isa<ExprStmt>(s)) {
    const auto * es = cast<ExprStmt>(s);
    return json{{"type", "ExprStmt"}, {"range", j_range(es->get_range())}, {"expr", j_expr(es->expr)}};
  }

  if (isa<SelectStmt>(s)) {
    const auto * sel = cast<SelectStmt>(s);
    json items = json::array();
    for (const auto * item : sel->items) items.push_back(j_select_item(item));
    json order = json::array();
    for (const auto * o : sel->order_by) order.push_back(j_order_item(o));

    json j{
      {"type", "SelectStmt"},
      {"range", j_range(sel->get_range())},
      {"distinct", sel->distinct},
      {"items", items},
      {"from", sel->from ? j_table_ref(sel->from) : json(nullptr)},
      {"where", sel->where ? j_expr(sel->where) : json(nullptr)},
      {"orderBy", order},
      {"limit", sel->limit ? j_expr(sel->limit) : json(nullptr)},
      {"offset", sel->offset ? j_expr(sel->offset) : json(nullptr)}};
    if (sel->order_by_all) {
      j["orderByAll"] = json{{"direction", j_opt_str(to_string(sel->order_all_direction))}};
    }
    return j;
  }

  return json{{"type", "UnknownStmt"}, {"range", j_range(s->get_range())}};
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const AstNode * node)
{
  if (!node) return nlohmann::json{{"type", "null"}, {"range", j_range({})}};

  if (isa<Script>(node)) {
    return to_json(cast<Script>(node));
  }
  if (isa<Stmt>(node)) {
    return j_stmt(cast<Stmt>(node));
  }
  if (isa<Expr>(node)) {
    return j_expr(cast<Expr>(node));
  }
  if (isa<DataTypeNode>(node)) {
    return j_type(cast<DataTypeNode>(node));
  }
  if (isa<SelectItem>(node)) {
    return j_select_item(cast<SelectItem>(node));
  }
  if (isa<TableRef>(node)) {
    return j_table_ref(cast<TableRef>(node));
  }
  if (isa<OrderItem>(node)) {
    return j_order_item(cast<OrderItem>(node));
  }

  return nlohmann::json{{"type", "UnknownNode"}, {"range", j_range(node->get_range())}};
}

nlohmann::json to_json(const Script * script)
{
  if (!script)
    return nlohmann::json{
      {"type", "Script"}, {"range", j_range({})}, {"statements", nlohmann::json::array()}};

  nlohmann::json statements = nlohmann::json::array();
  for (const auto * s : script->statements) statements.push_back(j_stmt(s));

  return nlohmann::json{
    {"type", "Script"}, {"range", j_range(script->get_range())}, {"statements", statements}};
}

}  // namespace s2sql
