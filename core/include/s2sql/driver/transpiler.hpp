// s2sql/driver/transpiler.hpp - Transpile driver
//
// Single entry point for the tokenize -> parse -> generate pipeline.
// Used by the CLI and the integration tests.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "s2sql/basic/diagnostic.hpp"
#include "s2sql/basic/source_manager.hpp"
#include "s2sql/syntax/token.hpp"

namespace s2sql
{

// ============================================================================
// Options
// ============================================================================

struct TranspileOptions
{
  /// Dialect the input is written in
  std::string read = "singlestore";

  /// Dialect to generate
  std::string write = "singlestore";

  /// Quote every identifier in the output
  bool identify = false;
};

// ============================================================================
// Results
// ============================================================================

/**
 * Common part of every driver result.
 *
 * `source` is heap-allocated so token views stay valid when the result moves.
 */
struct DriverResult
{
  /// Whether the pipeline ran without errors
  bool success = false;

  std::unique_ptr<SourceFile> source;

  DiagnosticBag diagnostics;
};

struct TranspileResult : DriverResult
{
  /// Generated SQL, one entry per input statement
  std::vector<std::string> statements;
};

struct TokenizeResult : DriverResult
{
  /// All tokens including comments; views into `source`
  std::vector<syntax::Token> tokens;
};

struct DumpResult : DriverResult
{
  nlohmann::json ast;
};

struct FormatTimeResult : DriverResult
{
  /// The format in the writing dialect's vocabulary
  std::string format;

  /// Canonical directives, joined (e.g. "%Y-%m-%d")
  std::string canonical;
};

// ============================================================================
// Transpiler
// ============================================================================

/**
 * Pipeline driver.
 *
 * Unknown dialect names are reported as E0401. Generation is skipped when
 * parsing produced errors.
 */
class Transpiler
{
public:
  [[nodiscard]] static TranspileResult transpile(
    std::string sql, const TranspileOptions & options,
    const std::filesystem::path & path = "<input>");

  [[nodiscard]] static TokenizeResult tokenize(
    std::string sql, std::string_view dialect, const std::filesystem::path & path = "<input>");

  [[nodiscard]] static DumpResult dump(
    std::string sql, std::string_view dialect, const std::filesystem::path & path = "<input>");

  /// Re-spell a date/time format from `read`'s vocabulary into `write`'s.
  [[nodiscard]] static FormatTimeResult format_time(
    std::string format, std::string_view read, std::string_view write);
};

}  // namespace s2sql
