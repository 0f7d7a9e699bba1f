// s2sql/dialect/temporal_rewrite.hpp - Temporal function dispatch
//
// Parse side: a call matched by a FunctionRule becomes a TemporalExpr whose
// literal format is decoded into canonical directives.
// Generate side: a TemporalExpr is re-spelled through the writing dialect's
// rule for its operation, re-encoding a decoded format in that rule's table.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "s2sql/ast/ast.hpp"
#include "s2sql/ast/ast_context.hpp"
#include "s2sql/basic/diagnostic.hpp"
#include "s2sql/basic/result.hpp"
#include "s2sql/dialect/dialect.hpp"
#include "s2sql/time/format_transcoder.hpp"

namespace s2sql::dialect
{

// ============================================================================
// Parse side
// ============================================================================

/// Decode a string literal format with `table` into a TimeFormatExpr.
[[nodiscard]] TimeFormatExpr * make_time_format(
  AstContext & ast, const StringLiteralExpr & literal, const time::DirectiveTable & table);

/**
 * Build the expression for a call to `rule.name`.
 *
 * Reports E0202 and falls back to a plain FunctionCallExpr when the
 * argument count is outside the rule's bounds.
 */
[[nodiscard]] Expr * build_temporal(
  AstContext & ast, const FunctionRule & rule, std::string_view spelled_name,
  gsl::span<Expr *> args, SourceRange range, DiagnosticBag & diags);

/// Canonical format stored in a TimeFormatExpr.
[[nodiscard]] time::CanonicalFormat canonical_of(const TimeFormatExpr & format);

// ============================================================================
// Generate side
// ============================================================================

/**
 * A temporal call spelled for a particular dialect.
 *
 * Exactly one of `format_text` / `format_passthrough` is set when the call
 * has a format argument; neither is set when it has none.
 */
struct TemporalCall
{
  std::string_view function;
  const Expr * value = nullptr;
  std::optional<std::string> format_text;     ///< Re-encoded literal format
  const Expr * format_passthrough = nullptr;  ///< Run-time format, emitted as is
};

/**
 * Spell `expr` in `dialect`.
 *
 * @return the call, or the first canonical directive the writer's table
 *         cannot encode
 * @throws time::DialectDefinitionError if the dialect has no writer rule
 *         for the operation (validate_dialect() rules this out)
 */
[[nodiscard]] Result<TemporalCall, time::EncodeError> rewrite_temporal(
  const TemporalExpr & expr, const Dialect & dialect);

}  // namespace s2sql::dialect
