// s2sql/dialect/dialect_registry.hpp - Process-wide dialect lookup
#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "s2sql/dialect/dialect.hpp"

namespace s2sql::dialect
{

/**
 * Owns the built-in dialects.
 *
 * The first call to instance() builds and validates every dialect; a
 * definition error propagates from that call as time::DialectDefinitionError.
 * After construction the registry is read-only and safe to share.
 */
class DialectRegistry
{
public:
  [[nodiscard]] static const DialectRegistry & instance();

  DialectRegistry(const DialectRegistry &) = delete;
  DialectRegistry & operator=(const DialectRegistry &) = delete;

  /// Case-insensitive lookup; nullptr for unknown names.
  [[nodiscard]] const Dialect * find(std::string_view name) const;

  /// Registered names in registration order.
  [[nodiscard]] std::vector<std::string_view> names() const;

private:
  DialectRegistry();

  void add(Dialect dialect);

  std::vector<std::unique_ptr<Dialect>> dialects_;
};

}  // namespace s2sql::dialect
