// s2sql/syntax/token.hpp - SQL token kinds
#pragma once

#include <cstdint>
#include <string_view>

#include "s2sql/basic/source_manager.hpp"

namespace s2sql::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,      // character no rule accepts
  Unterminated, // string, quoted identifier or block comment missing its closer

  // Comments (dropped before parsing, kept for `s2sql tokenize`)
  LineComment,   // -- ... or # ...
  BlockComment,  // /* ... */

  Identifier,
  QuotedIdentifier,  // `name`; token.text is the interior
  Number,
  String,      // '...' or "..."; token.text is the interior
  ByteString,  // e'...'; token.text is the interior

  // Dialect type keywords
  JsonbType,           // BSON
  GeographyPointType,  // GEOGRAPHYPOINT

  // Punctuation / operators
  LParen,
  RParen,
  Comma,
  Dot,
  Semicolon,
  Colon,

  Plus,
  Minus,
  Star,
  Slash,
  Percent,

  Eq,
  Ne,  // <> and !=
  NullSafeEq,
  Lt,
  Le,
  Gt,
  Ge,

  DColon,  // ::
  DPipe,   // ||

  ColonGt,        // :>
  NColonGt,       // !:>
  DColonDollar,   // ::$
  DColonPercent,  // ::%
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range in the original source (including quotes)
  std::string_view text;  // slice view (for strings and quoted identifiers: interior)

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().get_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().get_offset(); }

  [[nodiscard]] bool is_comment() const noexcept
  {
    return kind == TokenKind::LineComment || kind == TokenKind::BlockComment;
  }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::Unterminated:
      return "<unterminated>";
    case TokenKind::LineComment:
      return "<line_comment>";
    case TokenKind::BlockComment:
      return "<block_comment>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::QuotedIdentifier:
      return "quoted identifier";
    case TokenKind::Number:
      return "number";
    case TokenKind::String:
      return "string";
    case TokenKind::ByteString:
      return "byte string";
    case TokenKind::JsonbType:
      return "BSON";
    case TokenKind::GeographyPointType:
      return "GEOGRAPHYPOINT";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Dot:
      return ".";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Colon:
      return ":";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::Slash:
      return "/";
    case TokenKind::Percent:
      return "%";
    case TokenKind::Eq:
      return "=";
    case TokenKind::Ne:
      return "<>";
    case TokenKind::NullSafeEq:
      return "<=>";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
    case TokenKind::DColon:
      return "::";
    case TokenKind::DPipe:
      return "||";
    case TokenKind::ColonGt:
      return ":>";
    case TokenKind::NColonGt:
      return "!:>";
    case TokenKind::DColonDollar:
      return "::$";
    case TokenKind::DColonPercent:
      return "::%";
  }
  return "<invalid>";
}

}  // namespace s2sql::syntax
