// s2sql/syntax/frontend.cpp - High-level parse pipeline
#include "s2sql/syntax/frontend.hpp"

#include <algorithm>
#include <string>

#include "s2sql/syntax/lexer.hpp"
#include "s2sql/syntax/parser.hpp"

namespace s2sql
{

std::vector<syntax::Token> tokenize_source(
  const SourceFile & source, const dialect::Dialect & dialect, DiagnosticBag & diags)
{
  syntax::Lexer lexer(source.content(), dialect.tokenizer_config());
  auto tokens = lexer.lex_all();

  for (const auto & t : tokens) {
    if (t.kind == syntax::TokenKind::Unknown) {
      diags.report_error(t.range, "unexpected character '" + std::string(t.text) + "'")
        .with_code(diag_code::k_unexpected_char);
    } else if (t.kind == syntax::TokenKind::Unterminated) {
      const char opener = t.text.empty() ? '\0' : t.text.front();
      std::string what = "string literal";
      if (opener == '`') {
        what = "quoted identifier";
      } else if (opener == '/') {
        what = "block comment";
      }
      diags.report_error(t.range, "unterminated " + what)
        .with_code(diag_code::k_unterminated);
    }
  }

  return tokens;
}

Script * parse_source(
  const SourceFile & source, const dialect::Dialect & dialect, AstContext & ast,
  DiagnosticBag & diags)
{
  auto tokens = tokenize_source(source, dialect, diags);
  tokens.erase(
    std::remove_if(tokens.begin(), tokens.end(), [](const auto & t) { return t.is_comment(); }),
    tokens.end());

  syntax::Parser parser(ast, source, diags, std::move(tokens), dialect);
  return parser.parse_script();
}

}  // namespace s2sql
