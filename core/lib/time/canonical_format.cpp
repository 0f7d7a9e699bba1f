// s2sql/time/canonical_format.cpp
#include "s2sql/time/canonical_format.hpp"

#include <algorithm>

namespace s2sql::time
{

void append_literal(CanonicalFormat & format, std::string_view text)
{
  if (text.empty()) {
    return;
  }
  if (!format.empty() && format.back().kind == FormatElementKind::Literal) {
    format.back().text.append(text);
    return;
  }
  format.push_back(FormatElement{FormatElementKind::Literal, std::string(text)});
}

void append_directive(CanonicalFormat & format, std::string_view directive)
{
  format.push_back(FormatElement{FormatElementKind::Directive, std::string(directive)});
}

std::string to_string(const CanonicalFormat & format)
{
  std::string out;
  for (const auto & element : format) {
    out += element.text;
  }
  return out;
}

std::vector<std::string> directives_of(const CanonicalFormat & format)
{
  std::vector<std::string> out;
  for (const auto & element : format) {
    if (element.is_directive() && std::find(out.begin(), out.end(), element.text) == out.end()) {
      out.push_back(element.text);
    }
  }
  return out;
}

}  // namespace s2sql::time
