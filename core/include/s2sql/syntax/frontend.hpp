// s2sql/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <vector>

#include "s2sql/ast/ast.hpp"
#include "s2sql/ast/ast_context.hpp"
#include "s2sql/basic/diagnostic.hpp"
#include "s2sql/basic/source_manager.hpp"
#include "s2sql/dialect/dialect.hpp"
#include "s2sql/syntax/token.hpp"

namespace s2sql
{

/**
 * Tokenize `source` with the dialect's tokenizer settings.
 *
 * Reports E0101 for characters no rule accepts and E0102 for unterminated
 * strings, quoted identifiers and block comments. Comment tokens are kept.
 */
[[nodiscard]] std::vector<syntax::Token> tokenize_source(
  const SourceFile & source, const dialect::Dialect & dialect, DiagnosticBag & diags);

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
[[nodiscard]] Script * parse_source(
  const SourceFile & source, const dialect::Dialect & dialect, AstContext & ast,
  DiagnosticBag & diags);

}  // namespace s2sql
