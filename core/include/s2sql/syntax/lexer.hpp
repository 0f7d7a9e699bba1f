// s2sql/syntax/lexer.hpp - SQL tokenizer
//
// Operators are matched by longest match against a per-dialect trie, so a
// dialect adds `:>` or `::$` without touching the lexer.
//
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "s2sql/syntax/token.hpp"
#include "s2sql/time/trie.hpp"

namespace s2sql::syntax
{

/**
 * Dialect-specific tokenizer settings.
 */
struct TokenizerConfig
{
  /// Operator and punctuation spellings (longest match wins)
  time::Trie<TokenKind> operators;

  /// Prefixes that open a byte string, including the quote (e.g. "e'")
  std::vector<std::string> byte_string_prefixes;

  /// Upper-case words that lex as dedicated token kinds instead of identifiers
  std::map<std::string, TokenKind, std::less<>> keywords;

  /// `#` starts a line comment
  bool hash_comments = true;
};

/// Operators every MySQL-family dialect understands.
[[nodiscard]] TokenizerConfig base_tokenizer_config();

class Lexer
{
public:
  Lexer(std::string_view src, const TokenizerConfig & config) : src_(src), config_(config) {}

  /// Every token including comments, terminated by Eof.
  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_whitespace();
  bool lex_comment(Token & out);

  [[nodiscard]] Token lex_identifier_or_keyword();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_quoted(char quote, TokenKind kind, uint32_t start);
  [[nodiscard]] Token lex_operator();

  [[nodiscard]] static SourceRange make_range(uint32_t start, uint32_t end) noexcept
  {
    return {start, end};
  }

  std::string_view src_;
  const TokenizerConfig & config_;
  size_t pos_ = 0;
};

}  // namespace s2sql::syntax
