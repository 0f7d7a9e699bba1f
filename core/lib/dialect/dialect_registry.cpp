// s2sql/dialect/dialect_registry.cpp - Built-in dialect registration
#include "s2sql/dialect/dialect_registry.hpp"

#include <algorithm>
#include <cctype>

#include "s2sql/dialect/mysql.hpp"
#include "s2sql/dialect/singlestore.hpp"

namespace s2sql::dialect
{

const DialectRegistry & DialectRegistry::instance()
{
  static const DialectRegistry registry;
  return registry;
}

DialectRegistry::DialectRegistry()
{
  add(make_mysql_dialect());
  add(make_singlestore_dialect());
}

void DialectRegistry::add(Dialect dialect)
{
  validate_dialect(dialect);
  dialects_.push_back(std::make_unique<Dialect>(std::move(dialect)));
}

const Dialect * DialectRegistry::find(std::string_view name) const
{
  const auto it = std::find_if(dialects_.begin(), dialects_.end(), [&](const auto & d) {
    return d->name().size() == name.size() &&
           std::equal(name.begin(), name.end(), d->name().begin(), [](char a, char b) {
             return std::tolower(static_cast<unsigned char>(a)) ==
                    std::tolower(static_cast<unsigned char>(b));
           });
  });
  return it != dialects_.end() ? it->get() : nullptr;
}

std::vector<std::string_view> DialectRegistry::names() const
{
  std::vector<std::string_view> out;
  out.reserve(dialects_.size());
  for (const auto & d : dialects_) {
    out.emplace_back(d->name());
  }
  return out;
}

}  // namespace s2sql::dialect
