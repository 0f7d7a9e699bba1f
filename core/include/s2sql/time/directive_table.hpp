// s2sql/time/directive_table.hpp - Dialect format tokens <-> canonical directives
//
// A DirectiveTable maps the format tokens of one SQL dialect (`YYYY`, `HH24`,
// `%i`, ...) to canonical strftime-style directives (`%Y`, `%H`, `%M`, ...).
// Tables are built once at dialect-definition time and never mutated.
//
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <gsl/span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "s2sql/time/trie.hpp"

namespace s2sql::time
{

/**
 * Raised when a dialect definition is internally inconsistent.
 *
 * Construction-time only; never raised while decoding or encoding.
 */
class DialectDefinitionError : public std::logic_error
{
public:
  using std::logic_error::logic_error;
};

struct DirectiveEntry
{
  std::string token;      ///< Dialect token, e.g. "HH24"
  std::string canonical;  ///< Canonical directive, e.g. "%H"
};

/// Trie keyed by dialect token, valued by canonical directive.
using DirectiveTrie = Trie<std::string>;

class DirectiveTable
{
public:
  /**
   * Build a table from entries in registration order.
   *
   * @throws DialectDefinitionError if a token is empty, a canonical directive
   *         is empty, or a token is registered to two different directives.
   *         Re-registering a token to the same directive is ignored.
   */
  DirectiveTable(std::string name, std::vector<DirectiveEntry> entries);

  DirectiveTable(const DirectiveTable &) = delete;
  DirectiveTable & operator=(const DirectiveTable &) = delete;

  [[nodiscard]] const std::string & name() const noexcept { return name_; }

  [[nodiscard]] const std::vector<DirectiveEntry> & entries() const noexcept { return entries_; }

  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

  /// Dialect token for a canonical directive (the last one registered wins).
  [[nodiscard]] std::optional<std::string_view> lookup_forward(std::string_view canonical) const;

  /// Canonical directive for a dialect token.
  [[nodiscard]] std::optional<std::string_view> lookup_reverse(std::string_view token) const;

  [[nodiscard]] bool covers(std::string_view canonical) const
  {
    return forward_.find(canonical) != forward_.end();
  }

  /// Distinct canonical directives in first-registration order.
  [[nodiscard]] const std::vector<std::string> & canonical_directives() const noexcept
  {
    return canonical_order_;
  }

  /// Reverse-lookup trie, built on first use (thread-safe) and cached.
  [[nodiscard]] const DirectiveTrie & trie() const;

private:
  std::string name_;
  std::vector<DirectiveEntry> entries_;
  std::map<std::string, std::string, std::less<>> reverse_;  // token -> canonical
  std::map<std::string, std::string, std::less<>> forward_;  // canonical -> token
  std::vector<std::string> canonical_order_;

  mutable std::once_flag trie_once_;
  mutable std::unique_ptr<DirectiveTrie> trie_;
};

/// Build a fresh trie from a table's tokens (what `DirectiveTable::trie()` caches).
[[nodiscard]] DirectiveTrie build_directive_trie(const DirectiveTable & table);

/// Canonical directives in `required` that `target` cannot encode, in input order.
[[nodiscard]] std::vector<std::string> missing_directives(
  gsl::span<const std::string> required, const DirectiveTable & target);

}  // namespace s2sql::time
