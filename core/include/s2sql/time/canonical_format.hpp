// s2sql/time/canonical_format.hpp - Dialect-neutral date/time format
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace s2sql::time
{

enum class FormatElementKind : uint8_t {
  Directive,  ///< Canonical directive such as "%Y"
  Literal,    ///< Verbatim characters such as "-" or ", "
};

struct FormatElement
{
  FormatElementKind kind = FormatElementKind::Literal;
  std::string text;

  [[nodiscard]] bool is_directive() const noexcept { return kind == FormatElementKind::Directive; }

  bool operator==(const FormatElement &) const = default;
};

/// Ordered directives and literal fragments. Adjacent literals are coalesced.
using CanonicalFormat = std::vector<FormatElement>;

/// Append a literal, merging into a trailing literal element.
void append_literal(CanonicalFormat & format, std::string_view text);

void append_directive(CanonicalFormat & format, std::string_view directive);

/// Concatenation of the element texts (canonical directives as `%X` codes).
[[nodiscard]] std::string to_string(const CanonicalFormat & format);

/// Distinct directives in order of first appearance.
[[nodiscard]] std::vector<std::string> directives_of(const CanonicalFormat & format);

}  // namespace s2sql::time
