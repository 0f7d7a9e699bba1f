// s2sql/dialect/temporal_rewrite.cpp - Temporal function dispatch
#include "s2sql/dialect/temporal_rewrite.hpp"

#include <fmt/core.h>

#include <vector>

#include "s2sql/basic/casting.hpp"

namespace s2sql::dialect
{

TimeFormatExpr * make_time_format(
  AstContext & ast, const StringLiteralExpr & literal, const time::DirectiveTable & table)
{
  const auto decoded = time::decode(literal.value, table);

  std::vector<FormatPiece> pieces;
  pieces.reserve(decoded.size());
  for (const auto & element : decoded) {
    pieces.push_back(FormatPiece{element.kind, ast.intern(element.text)});
  }

  return ast.create<TimeFormatExpr>(
    ast.copy_to_arena(pieces), literal.value, ast.intern(table.name()), literal.get_range());
}

Expr * build_temporal(
  AstContext & ast, const FunctionRule & rule, std::string_view spelled_name,
  gsl::span<Expr *> args, SourceRange range, DiagnosticBag & diags)
{
  if (args.size() < rule.min_args || args.size() > rule.max_args) {
    const std::string expected =
      rule.min_args == rule.max_args ? fmt::format("{}", rule.min_args)
                                     : fmt::format("{} to {}", rule.min_args, rule.max_args);
    diags
      .report_error(
        range, fmt::format("{} takes {} arguments, got {}", rule.name, expected, args.size()))
      .with_code(diag_code::k_temporal_arity);
    return ast.create<FunctionCallExpr>(spelled_name, args, range);
  }

  Expr * value = args[0];
  if (rule.coerce_time_of_day) {
    std::vector<std::string_view> params{ast.intern("6")};
    auto * time_type = ast.create<DataTypeNode>(
      DataTypeKind::Time, ast.intern("TIME"), ast.copy_to_arena(params), value->get_range());
    value = ast.create<CastExpr>(value, time_type, CastStyle::Function, value->get_range());
  }

  Expr * format = nullptr;
  if (args.size() > 1) {
    format = args[1];
    if (const auto * literal = dyn_cast<StringLiteralExpr>(format)) {
      format = make_time_format(ast, *literal, *rule.format_table);
    }
  }

  return ast.create<TemporalExpr>(rule.op, value, format, spelled_name, range);
}

time::CanonicalFormat canonical_of(const TimeFormatExpr & format)
{
  time::CanonicalFormat out;
  out.reserve(format.pieces.size());
  for (const auto & piece : format.pieces) {
    out.push_back(time::FormatElement{piece.kind, std::string(piece.text)});
  }
  return out;
}

Result<TemporalCall, time::EncodeError> rewrite_temporal(
  const TemporalExpr & expr, const Dialect & dialect)
{
  const WriterRule * rule = dialect.writer_rule(expr.op);
  if (!rule) {
    throw time::DialectDefinitionError(
      fmt::format("dialect '{}': no writer rule for {}", dialect.name(), to_string(expr.op)));
  }

  TemporalCall call;
  call.function = rule->function;
  call.value = expr.value;

  if (!expr.format) {
    if (rule->format_required && !rule->function_without_format.empty()) {
      call.function = rule->function_without_format;
    }
    return call;
  }

  if (const auto * literal = dyn_cast<TimeFormatExpr>(expr.format)) {
    auto encoded = time::encode(canonical_of(*literal), *rule->format_table);
    if (!encoded) {
      return std::move(encoded.error());
    }
    call.format_text = std::move(*encoded);
    return call;
  }

  call.format_passthrough = expr.format;
  return call;
}

}  // namespace s2sql::dialect
