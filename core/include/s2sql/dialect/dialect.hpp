// s2sql/dialect/dialect.hpp - SQL dialect description
//
// A Dialect is plain data: tokenizer settings, the function rules the parser
// consults, the per-operation rules the generator writes with, and a few
// feature flags. Dialects are built once by the registry and never mutated
// afterwards.
//
#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "s2sql/ast/ast_enums.hpp"
#include "s2sql/syntax/lexer.hpp"
#include "s2sql/time/directive_table.hpp"

namespace s2sql::dialect
{

// ============================================================================
// Rules
// ============================================================================

/**
 * Parse-time mapping of a SQL function onto a temporal operation.
 */
struct FunctionRule
{
  /// Upper-case function name
  std::string name;

  TemporalOp op = TemporalOp::TsOrDsToDate;

  /// Table used to decode a literal format argument
  const time::DirectiveTable * format_table = nullptr;

  /// Argument count bounds (value, then optional format)
  size_t min_args = 1;
  size_t max_args = 2;

  /// Wrap the value in CAST(value AS TIME(6))
  bool coerce_time_of_day = false;
};

/**
 * Generate-time spelling of a temporal operation.
 */
struct WriterRule
{
  std::string function;
  const time::DirectiveTable * format_table = nullptr;

  /// `function` cannot be called without a format argument
  bool format_required = false;

  /// Spelling for a call without a format when `format_required` is set;
  /// empty if the dialect has none
  std::string function_without_format;
};

struct DialectFeatures
{
  bool order_by_all = false;            ///< ORDER BY ALL
  bool cast_operators = false;          ///< x :> T, x !:> T
  bool json_extract_operators = false;  ///< x::$key, x::%key
  bool byte_strings = false;            ///< e'...'
};

using ReservedWordPredicate = bool (*)(std::string_view);

// ============================================================================
// Dialect
// ============================================================================

class Dialect
{
public:
  Dialect(std::string name, const time::DirectiveTable & time_table);

  Dialect(const Dialect &) = delete;
  Dialect & operator=(const Dialect &) = delete;
  Dialect(Dialect &&) = default;
  Dialect & operator=(Dialect &&) = delete;

  [[nodiscard]] const std::string & name() const noexcept { return name_; }

  /// The dialect's own format vocabulary (TIME_MAPPING).
  [[nodiscard]] const time::DirectiveTable & time_table() const noexcept { return *time_table_; }

  [[nodiscard]] const syntax::TokenizerConfig & tokenizer_config() const noexcept
  {
    return tokenizer_;
  }
  [[nodiscard]] syntax::TokenizerConfig & tokenizer_config() noexcept { return tokenizer_; }

  [[nodiscard]] const DialectFeatures & features() const noexcept { return features_; }
  [[nodiscard]] DialectFeatures & features() noexcept { return features_; }

  // --- Function rules ---

  /// Registers a rule; a rule with the same name replaces the earlier one.
  void add_function_rule(FunctionRule rule);

  /// Case-insensitive lookup by SQL function name.
  [[nodiscard]] const FunctionRule * find_function_rule(std::string_view name) const;

  [[nodiscard]] const std::vector<FunctionRule> & function_rules() const noexcept
  {
    return function_rules_;
  }

  // --- Writer rules ---

  void set_writer_rule(TemporalOp op, WriterRule rule);

  /// nullptr when the dialect cannot write `op`.
  [[nodiscard]] const WriterRule * writer_rule(TemporalOp op) const;

  // --- Lexical ---

  void set_reserved_words(ReservedWordPredicate predicate) noexcept { reserved_ = predicate; }

  /// True if `word` must be quoted to be used as an identifier.
  [[nodiscard]] bool is_reserved(std::string_view word) const
  {
    return reserved_ != nullptr && reserved_(word);
  }

  // --- Types ---

  /// Render `kind` under a different name (e.g. BSON as JSON).
  void set_type_name(DataTypeKind kind, std::string spelling);

  [[nodiscard]] std::string_view type_name(DataTypeKind kind) const;

private:
  std::string name_;
  const time::DirectiveTable * time_table_;
  syntax::TokenizerConfig tokenizer_;
  DialectFeatures features_;
  std::vector<FunctionRule> function_rules_;
  std::array<std::optional<WriterRule>, std::size(k_all_temporal_ops)> writer_rules_;
  ReservedWordPredicate reserved_ = nullptr;
  std::map<DataTypeKind, std::string> type_names_;
};

/**
 * Check that a dialect is internally consistent.
 *
 * Every temporal operation needs a writer rule, and for every function rule
 * the writer's table must cover all canonical directives the rule's table
 * can decode to.
 *
 * @throws time::DialectDefinitionError describing the first problem found
 */
void validate_dialect(const Dialect & dialect);

}  // namespace s2sql::dialect
