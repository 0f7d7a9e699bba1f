// s2sql/time/directive_table.cpp - DirectiveTable implementation
#include "s2sql/time/directive_table.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <utility>

namespace s2sql::time
{

DirectiveTable::DirectiveTable(std::string name, std::vector<DirectiveEntry> entries)
: name_(std::move(name))
{
  entries_.reserve(entries.size());

  for (auto & entry : entries) {
    if (entry.token.empty()) {
      throw DialectDefinitionError(fmt::format("directive table '{}': empty token", name_));
    }
    if (entry.canonical.empty()) {
      throw DialectDefinitionError(fmt::format(
        "directive table '{}': token '{}' has no canonical directive", name_, entry.token));
    }

    if (auto it = reverse_.find(entry.token); it != reverse_.end()) {
      if (it->second != entry.canonical) {
        throw DialectDefinitionError(fmt::format(
          "directive table '{}': token '{}' maps to both '{}' and '{}'", name_, entry.token,
          it->second, entry.canonical));
      }
      continue;
    }

    reverse_.emplace(entry.token, entry.canonical);
    if (!forward_.contains(entry.canonical)) {
      canonical_order_.push_back(entry.canonical);
    }
    forward_.insert_or_assign(entry.canonical, entry.token);
    entries_.push_back(std::move(entry));
  }
}

std::optional<std::string_view> DirectiveTable::lookup_forward(std::string_view canonical) const
{
  auto it = forward_.find(canonical);
  if (it == forward_.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

std::optional<std::string_view> DirectiveTable::lookup_reverse(std::string_view token) const
{
  auto it = reverse_.find(token);
  if (it == reverse_.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

const DirectiveTrie & DirectiveTable::trie() const
{
  std::call_once(
    trie_once_, [this] { trie_ = std::make_unique<DirectiveTrie>(build_directive_trie(*this)); });
  return *trie_;
}

DirectiveTrie build_directive_trie(const DirectiveTable & table)
{
  DirectiveTrie trie;
  for (const auto & entry : table.entries()) {
    trie.insert(entry.token, entry.canonical);
  }
  return trie;
}

std::vector<std::string> missing_directives(
  gsl::span<const std::string> required, const DirectiveTable & target)
{
  std::vector<std::string> missing;
  for (const auto & directive : required) {
    if (!target.covers(directive) &&
        std::find(missing.begin(), missing.end(), directive) == missing.end()) {
      missing.push_back(directive);
    }
  }
  return missing;
}

}  // namespace s2sql::time
