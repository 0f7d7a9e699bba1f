// s2sql/test_support/parse_helpers.hpp - helpers for unit/integration tests
//
// A single-source parse pipeline for tests. Ownership stays explicit
// (SourceFile + AstContext) behind a small wrapper.
//
#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "s2sql/ast/ast_context.hpp"
#include "s2sql/ast/visitor.hpp"
#include "s2sql/basic/diagnostic.hpp"
#include "s2sql/basic/source_manager.hpp"
#include "s2sql/dialect/dialect_registry.hpp"
#include "s2sql/syntax/frontend.hpp"

namespace s2sql::test_support
{

struct TestParseUnit
{
  std::unique_ptr<SourceFile> source;
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  const dialect::Dialect * dialect = nullptr;
  Script * script = nullptr;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return source->get_slice(r);
  }

  [[nodiscard]] Stmt * stmt(size_t i) const { return script->statements[i]; }
};

[[nodiscard]] inline const dialect::Dialect & get_dialect(std::string_view name)
{
  const auto * d = dialect::DialectRegistry::instance().find(name);
  if (!d) {
    throw std::invalid_argument("unknown dialect: " + std::string(name));
  }
  return *d;
}

[[nodiscard]] inline TestParseUnit parse(
  std::string src, std::string_view dialect_name = "singlestore")
{
  TestParseUnit out;
  out.source = std::make_unique<SourceFile>("<test>.sql", std::move(src));
  out.ast = std::make_unique<AstContext>();
  out.dialect = &get_dialect(dialect_name);
  out.script = parse_source(*out.source, *out.dialect, *out.ast, out.diags);
  return out;
}

namespace detail
{

template <typename T>
class FirstOfKind : public ConstRecursiveAstVisitor<FirstOfKind<T>>
{
  using Base = ConstRecursiveAstVisitor<FirstOfKind<T>>;

public:
  const T * found = nullptr;

  bool visit(const AstNode * node)
  {
    if (!node) return true;
    if (const auto * t = dyn_cast<T>(node)) {
      found = t;
      return false;
    }
    return Base::visit(node);
  }
};

}  // namespace detail

/// Pre-order search for the first node of type T under `root`.
template <typename T>
[[nodiscard]] const T * find_first(const AstNode * root)
{
  detail::FirstOfKind<T> finder;
  (void)finder.visit(root);
  return finder.found;
}

}  // namespace s2sql::test_support
