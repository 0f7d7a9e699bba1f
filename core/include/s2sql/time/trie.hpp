// s2sql/time/trie.hpp - Byte-keyed prefix tree with longest-match lookup
//
// Backs both the format-directive decoder and the tokenizer's operator
// recognition.
//
#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace s2sql::time
{

/// Result of looking up a complete key.
enum class TrieResult : uint8_t {
  Failed,  ///< No key starts with the input
  Prefix,  ///< Input is a proper prefix of at least one key
  Exists,  ///< Input is a complete key
};

/**
 * Prefix tree over byte strings, each complete key carrying a Value.
 *
 * Nodes live in a flat arena indexed by position; the root is node 0.
 * Child edges are kept sorted by byte.
 */
template <typename Value>
class Trie
{
public:
  struct Match
  {
    size_t length = 0;  ///< Bytes of the input consumed by the key
    const Value * value = nullptr;
  };

  Trie() { nodes_.emplace_back(); }

  /// Insert or overwrite `key`. Empty keys are rejected.
  void insert(std::string_view key, Value value)
  {
    if (key.empty()) {
      throw std::invalid_argument("trie keys must not be empty");
    }

    uint32_t node = 0;
    for (const char c : key) {
      node = child_or_create(node, static_cast<unsigned char>(c));
    }
    if (!nodes_[node].value) {
      ++size_;
    }
    nodes_[node].value = std::move(value);
  }

  [[nodiscard]] TrieResult find(std::string_view key) const
  {
    uint32_t node = 0;
    for (const char c : key) {
      const auto next = child(node, static_cast<unsigned char>(c));
      if (!next) {
        return TrieResult::Failed;
      }
      node = *next;
    }
    if (nodes_[node].value) {
      return TrieResult::Exists;
    }
    return nodes_[node].kids.empty() ? TrieResult::Failed : TrieResult::Prefix;
  }

  /**
   * Longest key that is a prefix of `input`.
   *
   * Walks as far as the tree allows and falls back to the deepest node that
   * marks a complete key. Returns nullopt when no key matches.
   */
  [[nodiscard]] std::optional<Match> longest_match(std::string_view input) const
  {
    std::optional<Match> best;
    uint32_t node = 0;
    for (size_t i = 0; i < input.size(); ++i) {
      const auto next = child(node, static_cast<unsigned char>(input[i]));
      if (!next) {
        break;
      }
      node = *next;
      if (nodes_[node].value) {
        best = Match{i + 1, &*nodes_[node].value};
      }
    }
    return best;
  }

  [[nodiscard]] const Value * get(std::string_view key) const
  {
    uint32_t node = 0;
    for (const char c : key) {
      const auto next = child(node, static_cast<unsigned char>(c));
      if (!next) {
        return nullptr;
      }
      node = *next;
    }
    return nodes_[node].value ? &*nodes_[node].value : nullptr;
  }

  [[nodiscard]] size_t size() const noexcept { return size_; }
  [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

private:
  struct Node
  {
    std::vector<std::pair<unsigned char, uint32_t>> kids;  // sorted by byte
    std::optional<Value> value;
  };

  [[nodiscard]] std::optional<uint32_t> child(uint32_t node, unsigned char c) const
  {
    const auto & kids = nodes_[node].kids;
    auto it = std::lower_bound(
      kids.begin(), kids.end(), c,
      [](const std::pair<unsigned char, uint32_t> & edge, unsigned char b) { return edge.first < b; });
    if (it == kids.end() || it->first != c) {
      return std::nullopt;
    }
    return it->second;
  }

  uint32_t child_or_create(uint32_t node, unsigned char c)
  {
    if (const auto existing = child(node, c)) {
      return *existing;
    }

    const auto created = static_cast<uint32_t>(nodes_.size());
    nodes_.emplace_back();

    auto & kids = nodes_[node].kids;
    auto it = std::lower_bound(
      kids.begin(), kids.end(), c,
      [](const std::pair<unsigned char, uint32_t> & edge, unsigned char b) { return edge.first < b; });
    kids.insert(it, {c, created});
    return created;
  }

  std::vector<Node> nodes_;
  size_t size_ = 0;
};

}  // namespace s2sql::time
