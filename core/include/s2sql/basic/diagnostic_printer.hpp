// s2sql/basic/diagnostic_printer.hpp
//
// Prints diagnostics with the offending SQL line and a position marker.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "s2sql/basic/diagnostic.hpp"
#include "s2sql/basic/source_manager.hpp"

namespace s2sql
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0301]: format directive '%u' has no equivalent in dialect 'mysql'
 *     --> query.sql:1:20
 *      |
 *    1 | SELECT TO_CHAR(d, 'D') FROM t
 *      |                   ^^^ cannot be written for mysql
 *      |
 *      = help: write the query for a dialect that supports the directive
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceFile & source);

  /// Print all diagnostics ordered by their primary location.
  void print_all(const DiagnosticBag & diags, const SourceFile & source);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceFile & source);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace s2sql
