// s2sql/time/format_transcoder.cpp - Longest-match decoder and encoder
#include "s2sql/time/format_transcoder.hpp"

#include <fmt/core.h>

namespace s2sql::time
{

std::string EncodeError::message() const
{
  return fmt::format("format directive '{}' has no equivalent in dialect '{}'", directive, table);
}

CanonicalFormat decode(std::string_view format, const DirectiveTable & source)
{
  return decode(format, source.trie());
}

CanonicalFormat decode(std::string_view format, const DirectiveTrie & trie)
{
  CanonicalFormat out;
  size_t pos = 0;

  while (pos < format.size()) {
    const auto match = trie.longest_match(format.substr(pos));
    if (match) {
      append_directive(out, *match->value);
      pos += match->length;
    } else {
      append_literal(out, format.substr(pos, 1));
      ++pos;
    }
  }

  return out;
}

Result<std::string, EncodeError> encode(
  const CanonicalFormat & format, const DirectiveTable & target)
{
  std::string out;
  for (const auto & element : format) {
    if (!element.is_directive()) {
      out += element.text;
      continue;
    }
    const auto token = target.lookup_forward(element.text);
    if (!token) {
      return EncodeError{element.text, target.name()};
    }
    out += *token;
  }
  return out;
}

Result<std::string, EncodeError> transcode(
  std::string_view format, const DirectiveTable & source, const DirectiveTable & target)
{
  return encode(decode(format, source), target);
}

}  // namespace s2sql::time
