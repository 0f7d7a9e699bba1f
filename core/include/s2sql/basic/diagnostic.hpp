// s2sql/basic/diagnostic.hpp - Diagnostic types for tokenizing/parsing/generation
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "s2sql/basic/source_manager.hpp"

namespace s2sql
{

// ============================================================================
// Diagnostic codes
// ============================================================================

namespace diag_code
{
inline constexpr std::string_view k_unexpected_char = "E0101";
inline constexpr std::string_view k_unterminated = "E0102";
inline constexpr std::string_view k_expected = "E0201";
inline constexpr std::string_view k_temporal_arity = "E0202";
inline constexpr std::string_view k_order_by_all = "E0203";
inline constexpr std::string_view k_format_not_representable = "E0301";
inline constexpr std::string_view k_unsupported_by_writer = "E0302";
inline constexpr std::string_view k_lossy_cast = "W0303";
inline constexpr std::string_view k_unknown_dialect = "E0401";
}  // namespace diag_code

// ============================================================================
// Diagnostic
// ============================================================================

enum class Severity : uint8_t {
  Error,    ///< The statement cannot be transpiled
  Warning,  ///< Transpiled, but the output does not mean quite the same thing
};

enum class LabelStyle : uint8_t {
  Primary,    ///< The offending text
  Secondary,  ///< Surrounding call or clause
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

/**
 * One problem found while tokenizing, parsing or writing SQL.
 *
 * `labels.front()` is always the primary label; DiagnosticBag::report puts
 * it there.
 */
struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g. "E0301"
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] bool is_error() const noexcept { return severity == Severity::Error; }

  [[nodiscard]] SourceRange primary_range() const noexcept
  {
    return labels.empty() ? SourceRange{} : labels.front().range;
  }
};

class DiagnosticBag;

/**
 * Fills in a diagnostic and commits it to its bag when destroyed.
 *
 *   diags.report_error(range, "...").with_code(diag_code::k_expected);
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string_view code);
  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);
  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool committed_ = false;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

/// Diagnostics of one transpile run, in the order they were reported.
class DiagnosticBag
{
public:
  DiagnosticBuilder report(
    Severity severity, SourceRange range, std::string message, std::string label_message = "");

  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "")
  {
    return report(Severity::Error, range, std::move(message), std::move(label_message));
  }

  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "")
  {
    return report(Severity::Warning, range, std::move(message), std::move(label_message));
  }

  void add(Diagnostic diag) { diagnostics_.push_back(std::move(diag)); }

  [[nodiscard]] const std::vector<Diagnostic> & all() const noexcept { return diagnostics_; }
  [[nodiscard]] bool empty() const noexcept { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return diagnostics_.size(); }

  [[nodiscard]] size_t error_count() const;
  [[nodiscard]] size_t warning_count() const { return size() - error_count(); }
  [[nodiscard]] bool has_errors() const { return error_count() != 0; }
  [[nodiscard]] bool has_code(std::string_view code) const;

  [[nodiscard]] auto begin() const noexcept { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const noexcept { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace s2sql
