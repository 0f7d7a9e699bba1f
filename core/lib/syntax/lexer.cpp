// s2sql/syntax/lexer.cpp - SQL tokenizer implementation
//
#include "s2sql/syntax/lexer.hpp"

#include <cctype>
#include <string>

namespace s2sql::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_' || c == '$'; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

std::string to_upper(std::string_view s)
{
  std::string out(s);
  for (auto & c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

}  // namespace

TokenizerConfig base_tokenizer_config()
{
  TokenizerConfig config;
  auto & ops = config.operators;
  ops.insert("(", TokenKind::LParen);
  ops.insert(")", TokenKind::RParen);
  ops.insert(",", TokenKind::Comma);
  ops.insert(".", TokenKind::Dot);
  ops.insert(";", TokenKind::Semicolon);
  ops.insert(":", TokenKind::Colon);
  ops.insert("+", TokenKind::Plus);
  ops.insert("-", TokenKind::Minus);
  ops.insert("*", TokenKind::Star);
  ops.insert("/", TokenKind::Slash);
  ops.insert("%", TokenKind::Percent);
  ops.insert("=", TokenKind::Eq);
  ops.insert("<", TokenKind::Lt);
  ops.insert(">", TokenKind::Gt);
  ops.insert("<=", TokenKind::Le);
  ops.insert(">=", TokenKind::Ge);
  ops.insert("<>", TokenKind::Ne);
  ops.insert("!=", TokenKind::Ne);
  ops.insert("<=>", TokenKind::NullSafeEq);
  ops.insert("::", TokenKind::DColon);
  ops.insert("||", TokenKind::DPipe);
  return config;
}

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::skip_whitespace()
{
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
      advance(1);
      continue;
    }
    break;
  }
}

bool Lexer::lex_comment(Token & out)
{
  const auto start = static_cast<uint32_t>(pos_);

  if (starts_with("--") || (config_.hash_comments && peek() == '#')) {
    while (!eof() && peek() != '\n') {
      advance(1);
    }
    out.kind = TokenKind::LineComment;
    out.range = make_range(start, static_cast<uint32_t>(pos_));
    out.text = src_.substr(start, pos_ - start);
    return true;
  }

  if (starts_with("/*")) {
    advance(2);
    bool closed = false;
    while (!eof()) {
      if (starts_with("*/")) {
        advance(2);
        closed = true;
        break;
      }
      advance(1);
    }
    out.kind = closed ? TokenKind::BlockComment : TokenKind::Unterminated;
    out.range = make_range(start, static_cast<uint32_t>(pos_));
    out.text = src_.substr(start, pos_ - start);
    return true;
  }

  return false;
}

Token Lexer::lex_identifier_or_keyword()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  const auto end = static_cast<uint32_t>(pos_);

  Token t;
  t.kind = TokenKind::Identifier;
  t.range = make_range(start, end);
  t.text = src_.substr(start, end - start);

  if (!config_.keywords.empty()) {
    const auto it = config_.keywords.find(to_upper(t.text));
    if (it != config_.keywords.end()) {
      t.kind = it->second;
    }
  }
  return t;
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);

  while (!eof() && is_digit(peek())) {
    advance(1);
  }

  // Fractional part (also covers `.5`)
  if (!eof() && peek() == '.' && is_digit(peek(1))) {
    advance(1);
    while (!eof() && is_digit(peek())) {
      advance(1);
    }
  }

  // Exponent, only when digits follow
  if (!eof() && (peek() == 'e' || peek() == 'E')) {
    const size_t sign = (peek(1) == '+' || peek(1) == '-') ? 1 : 0;
    if (is_digit(peek(1 + sign))) {
      advance(1 + sign);
      while (!eof() && is_digit(peek())) {
        advance(1);
      }
    }
  }

  // `1abc` is an identifier in MySQL; keep digits-then-letters together
  if (!eof() && is_ident_start(static_cast<unsigned char>(peek()))) {
    while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
    const auto end = static_cast<uint32_t>(pos_);
    Token t;
    t.kind = TokenKind::Identifier;
    t.range = make_range(start, end);
    t.text = src_.substr(start, end - start);
    return t;
  }

  const auto end = static_cast<uint32_t>(pos_);
  Token t;
  t.kind = TokenKind::Number;
  t.range = make_range(start, end);
  t.text = src_.substr(start, end - start);
  return t;
}

// The opening delimiter (and any prefix) has already been consumed; `start`
// is where the token began.
Token Lexer::lex_quoted(char quote, TokenKind kind, uint32_t start)
{
  const auto payload_start = static_cast<uint32_t>(pos_);
  const bool backslash_escapes = quote != '`';

  while (!eof()) {
    const char c = peek();
    if (c == quote) {
      // Doubled delimiter stands for itself
      if (peek(1) == quote) {
        advance(2);
        continue;
      }
      const auto payload_end = static_cast<uint32_t>(pos_);
      advance(1);
      Token t;
      t.kind = kind;
      t.range = make_range(start, static_cast<uint32_t>(pos_));
      t.text = src_.substr(payload_start, payload_end - payload_start);
      return t;
    }
    if (c == '\\' && backslash_escapes) {
      advance(pos_ + 1 < src_.size() ? 2 : 1);
      continue;
    }
    advance(1);
  }

  Token t;
  t.kind = TokenKind::Unterminated;
  t.range = make_range(start, static_cast<uint32_t>(pos_));
  t.text = src_.substr(start, pos_ - start);
  return t;
}

Token Lexer::lex_operator()
{
  const auto start = static_cast<uint32_t>(pos_);
  Token t;
  t.kind = TokenKind::Unknown;

  const auto match = config_.operators.longest_match(src_.substr(pos_));
  if (match) {
    t.kind = *match->value;
    advance(match->length);
  } else {
    advance(1);
  }

  const auto end = static_cast<uint32_t>(pos_);
  t.range = make_range(start, end);
  t.text = src_.substr(start, end - start);
  return t;
}

Token Lexer::next_token()
{
  skip_whitespace();

  if (eof()) {
    Token t;
    t.kind = TokenKind::Eof;
    t.range = make_range(static_cast<uint32_t>(pos_), static_cast<uint32_t>(pos_));
    t.text = {};
    return t;
  }

  Token comment;
  if (lex_comment(comment)) {
    return comment;
  }

  const auto start = static_cast<uint32_t>(pos_);

  for (const auto & prefix : config_.byte_string_prefixes) {
    if (starts_with(prefix)) {
      advance(prefix.size());
      return lex_quoted(prefix.back(), TokenKind::ByteString, start);
    }
  }

  const char c = peek();

  if (c == '\'' || c == '"') {
    advance(1);
    return lex_quoted(c, TokenKind::String, start);
  }

  if (c == '`') {
    advance(1);
    return lex_quoted('`', TokenKind::QuotedIdentifier, start);
  }

  if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
    return lex_number();
  }

  if (is_ident_start(static_cast<unsigned char>(c))) {
    return lex_identifier_or_keyword();
  }

  return lex_operator();
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  out.reserve(src_.size() / 3 + 1);

  while (true) {
    Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }

  return out;
}

}  // namespace s2sql::syntax
