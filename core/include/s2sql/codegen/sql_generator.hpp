// s2sql/codegen/sql_generator.hpp - Render the AST as SQL text
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "s2sql/ast/ast.hpp"
#include "s2sql/basic/diagnostic.hpp"
#include "s2sql/dialect/dialect.hpp"

namespace s2sql
{

struct GeneratorOptions
{
  /// Quote every identifier, not only reserved or irregular ones
  bool identify = false;
};

/**
 * Writes statements in a target dialect.
 *
 * Problems that still allow output (a format directive the target cannot
 * spell, a clause the target does not support) are reported to the
 * diagnostic bag and the closest rendering is emitted.
 */
class SqlGenerator
{
public:
  SqlGenerator(
    const dialect::Dialect & dialect, DiagnosticBag & diags, GeneratorOptions options = {})
  : dialect_(dialect), diags_(diags), options_(options)
  {
  }

  /// One string per statement, without trailing `;`.
  [[nodiscard]] std::vector<std::string> generate(const Script & script);

  [[nodiscard]] std::string generate(const AstNode & node);

  /// Backtick-quote `name` if the dialect or the options require it.
  [[nodiscard]] std::string quote_identifier(std::string_view name) const;

private:
  const dialect::Dialect & dialect_;
  DiagnosticBag & diags_;
  GeneratorOptions options_;
};

/// `'...'` with `'` doubled and control characters escaped.
[[nodiscard]] std::string quote_string_literal(std::string_view value);

}  // namespace s2sql
