// s2sql/driver/transpiler.cpp - Transpile driver implementation
#include "s2sql/driver/transpiler.hpp"

#include <fmt/core.h>

#include "s2sql/ast/ast_context.hpp"
#include "s2sql/ast/json_visitor.hpp"
#include "s2sql/codegen/sql_generator.hpp"
#include "s2sql/dialect/dialect_registry.hpp"
#include "s2sql/syntax/frontend.hpp"
#include "s2sql/time/format_transcoder.hpp"

namespace s2sql
{

namespace
{

const dialect::Dialect * resolve_dialect(std::string_view name, DiagnosticBag & diags)
{
  const auto & registry = dialect::DialectRegistry::instance();
  const auto * d = registry.find(name);
  if (!d) {
    std::string known;
    for (const auto n : registry.names()) {
      if (!known.empty()) known += ", ";
      known += n;
    }
    diags.report_error({}, fmt::format("unknown dialect '{}'", name))
      .with_code(diag_code::k_unknown_dialect)
      .with_help(fmt::format("known dialects: {}", known));
  }
  return d;
}

template <typename Result>
void init_result(Result & r, std::string sql, const std::filesystem::path & path)
{
  r.source = std::make_unique<SourceFile>(path, std::move(sql));
}

}  // namespace

TranspileResult Transpiler::transpile(
  std::string sql, const TranspileOptions & options, const std::filesystem::path & path)
{
  TranspileResult result;
  init_result(result, std::move(sql), path);

  const auto * reader = resolve_dialect(options.read, result.diagnostics);
  const auto * writer = resolve_dialect(options.write, result.diagnostics);
  if (!reader || !writer) {
    return result;
  }

  AstContext ast;
  const Script * script = parse_source(*result.source, *reader, ast, result.diagnostics);
  if (result.diagnostics.has_errors()) {
    return result;
  }

  SqlGenerator generator(*writer, result.diagnostics, GeneratorOptions{options.identify});
  result.statements = generator.generate(*script);
  result.success = !result.diagnostics.has_errors();
  return result;
}

TokenizeResult Transpiler::tokenize(
  std::string sql, std::string_view dialect, const std::filesystem::path & path)
{
  TokenizeResult result;
  init_result(result, std::move(sql), path);

  const auto * d = resolve_dialect(dialect, result.diagnostics);
  if (!d) {
    return result;
  }

  result.tokens = tokenize_source(*result.source, *d, result.diagnostics);
  result.success = !result.diagnostics.has_errors();
  return result;
}

DumpResult Transpiler::dump(
  std::string sql, std::string_view dialect, const std::filesystem::path & path)
{
  DumpResult result;
  init_result(result, std::move(sql), path);

  const auto * d = resolve_dialect(dialect, result.diagnostics);
  if (!d) {
    return result;
  }

  AstContext ast;
  const Script * script = parse_source(*result.source, *d, ast, result.diagnostics);
  result.ast = to_json(script);
  result.success = !result.diagnostics.has_errors();
  return result;
}

FormatTimeResult Transpiler::format_time(
  std::string format, std::string_view read, std::string_view write)
{
  FormatTimeResult result;
  init_result(result, std::move(format), "<format>");

  const auto * reader = resolve_dialect(read, result.diagnostics);
  const auto * writer = resolve_dialect(write, result.diagnostics);
  if (!reader || !writer) {
    return result;
  }

  const auto canonical = time::decode(result.source->content(), reader->time_table());
  result.canonical = time::to_string(canonical);

  auto encoded = time::encode(canonical, writer->time_table());
  if (!encoded) {
    result.diagnostics
      .report_error(
        SourceRange(0, static_cast<uint32_t>(result.source->content().size())),
        encoded.error().message())
      .with_code(diag_code::k_format_not_representable);
    return result;
  }

  result.format = std::move(*encoded);
  result.success = true;
  return result;
}

}  // namespace s2sql
