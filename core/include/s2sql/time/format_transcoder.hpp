// s2sql/time/format_transcoder.hpp - Decode/encode date/time format strings
//
//   decode("YYYY-MM-DD", singlestore)  -> [%Y, "-", %m, "-", %d]
//   encode([%Y, "-", %m, "-", %d], mysql) -> "%Y-%m-%d"
//
#pragma once

#include <string>
#include <string_view>

#include "s2sql/basic/result.hpp"
#include "s2sql/time/canonical_format.hpp"
#include "s2sql/time/directive_table.hpp"

namespace s2sql::time
{

/// A canonical directive the target table has no token for.
struct EncodeError
{
  std::string directive;  ///< e.g. "%u"
  std::string table;      ///< Target table name

  [[nodiscard]] std::string message() const;
};

/**
 * Decode a format string with greedy longest-match over the table's tokens.
 *
 * Characters that start no token become literal fragments. Never fails.
 */
[[nodiscard]] CanonicalFormat decode(std::string_view format, const DirectiveTable & source);

/// Decode against an explicit trie (e.g. one built outside a table).
[[nodiscard]] CanonicalFormat decode(std::string_view format, const DirectiveTrie & trie);

/// Render a canonical format in the target table's vocabulary.
[[nodiscard]] Result<std::string, EncodeError> encode(
  const CanonicalFormat & format, const DirectiveTable & target);

/// decode() with `source`, then encode() with `target`.
[[nodiscard]] Result<std::string, EncodeError> transcode(
  std::string_view format, const DirectiveTable & source, const DirectiveTable & target);

}  // namespace s2sql::time
