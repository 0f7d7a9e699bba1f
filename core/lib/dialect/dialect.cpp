// s2sql/dialect/dialect.cpp - Dialect implementation and validation
#include "s2sql/dialect/dialect.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace s2sql::dialect
{

namespace
{

bool iequals(std::string_view a, std::string_view b)
{
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::toupper(static_cast<unsigned char>(x)) ==
                  std::toupper(static_cast<unsigned char>(y));
         });
}

std::string to_upper(std::string_view s)
{
  std::string out(s);
  for (auto & c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

size_t op_index(TemporalOp op) { return static_cast<size_t>(op); }

}  // namespace

Dialect::Dialect(std::string name, const time::DirectiveTable & time_table)
: name_(std::move(name)), time_table_(&time_table), tokenizer_(syntax::base_tokenizer_config())
{
}

void Dialect::add_function_rule(FunctionRule rule)
{
  rule.name = to_upper(rule.name);
  auto it = std::find_if(function_rules_.begin(), function_rules_.end(), [&](const auto & r) {
    return r.name == rule.name;
  });
  if (it != function_rules_.end()) {
    *it = std::move(rule);
    return;
  }
  function_rules_.push_back(std::move(rule));
}

const FunctionRule * Dialect::find_function_rule(std::string_view name) const
{
  for (const auto & rule : function_rules_) {
    if (iequals(rule.name, name)) {
      return &rule;
    }
  }
  return nullptr;
}

void Dialect::set_writer_rule(TemporalOp op, WriterRule rule)
{
  writer_rules_[op_index(op)] = std::move(rule);
}

const WriterRule * Dialect::writer_rule(TemporalOp op) const
{
  const auto & slot = writer_rules_[op_index(op)];
  return slot ? &*slot : nullptr;
}

void Dialect::set_type_name(DataTypeKind kind, std::string spelling)
{
  type_names_.insert_or_assign(kind, std::move(spelling));
}

std::string_view Dialect::type_name(DataTypeKind kind) const
{
  if (auto it = type_names_.find(kind); it != type_names_.end()) {
    return it->second;
  }
  return to_string(kind);
}

// ============================================================================
// Validation
// ============================================================================

void validate_dialect(const Dialect & dialect)
{
  for (const TemporalOp op : k_all_temporal_ops) {
    const WriterRule * writer = dialect.writer_rule(op);
    if (!writer) {
      throw time::DialectDefinitionError(
        fmt::format("dialect '{}': no writer rule for {}", dialect.name(), to_string(op)));
    }
    if (writer->function.empty() || !writer->format_table) {
      throw time::DialectDefinitionError(fmt::format(
        "dialect '{}': incomplete writer rule for {}", dialect.name(), to_string(op)));
    }
  }

  for (const auto & rule : dialect.function_rules()) {
    if (!rule.format_table) {
      throw time::DialectDefinitionError(
        fmt::format("dialect '{}': function {} has no format table", dialect.name(), rule.name));
    }
    if (rule.min_args == 0 || rule.min_args > rule.max_args) {
      throw time::DialectDefinitionError(fmt::format(
        "dialect '{}': function {} has invalid argument bounds", dialect.name(), rule.name));
    }

    const WriterRule * writer = dialect.writer_rule(rule.op);
    const auto missing =
      time::missing_directives(rule.format_table->canonical_directives(), *writer->format_table);
    if (!missing.empty()) {
      throw time::DialectDefinitionError(fmt::format(
        "dialect '{}': {} decodes '{}' which the {} writer ('{}' table) cannot encode",
        dialect.name(), rule.name, missing.front(), writer->function,
        writer->format_table->name()));
    }
  }
}

}  // namespace s2sql::dialect
