#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "s2sql/basic/diagnostic.hpp"
#include "s2sql/basic/diagnostic_printer.hpp"
#include "s2sql/basic/source_manager.hpp"

namespace s2sql
{

TEST(DiagnosticPrinter, PlainOutputHasCodeLocationAndHelp)
{
  const SourceFile source("query.sql", "SELECT TO_CHAR(d, 'D')");
  DiagnosticBag diags;
  diags.report_error(SourceRange(18, 21), "format directive '%u' has no equivalent")
    .with_code(diag_code::k_format_not_representable)
    .with_help("use a different format");

  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  printer.print_all(diags, source);

  const std::string out = os.str();
  EXPECT_NE(out.find("error[E0301]: format directive '%u' has no equivalent"), std::string::npos);
  EXPECT_NE(out.find("query.sql:1:19"), std::string::npos);
  EXPECT_NE(out.find("SELECT TO_CHAR(d, 'D')"), std::string::npos);
  EXPECT_NE(out.find("^^^"), std::string::npos);
  EXPECT_NE(out.find("= help: use a different format"), std::string::npos);
  EXPECT_EQ(out.find("\033["), std::string::npos);
}

TEST(DiagnosticPrinter, SecondaryLabelIsDashed)
{
  const SourceFile source("q.sql", "SELECT TO_CHAR(d, 'D')");
  DiagnosticBag diags;
  diags.report_warning(SourceRange(18, 21), "odd format", "here")
    .with_secondary_label(SourceRange(7, 22), "in this call");

  std::ostringstream os;
  DiagnosticPrinter(os, false).print_all(diags, source);

  const std::string out = os.str();
  EXPECT_NE(out.find("warning: odd format"), std::string::npos);
  EXPECT_NE(out.find("^^^ here"), std::string::npos);
  EXPECT_NE(out.find("--------------- in this call"), std::string::npos);
}

TEST(DiagnosticPrinter, SortsBySourcePosition)
{
  const SourceFile source("q.sql", "SELECT a ? b ? c");
  DiagnosticBag diags;
  diags.report_error(SourceRange(13, 14), "second");
  diags.report_error(SourceRange(9, 10), "first");

  std::ostringstream os;
  DiagnosticPrinter(os, false).print_all(diags, source);

  const std::string out = os.str();
  const auto first = out.find("error: first");
  const auto second = out.find("error: second");
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  EXPECT_LT(first, second);
}

TEST(DiagnosticBag, CountsErrorsAndCodes)
{
  DiagnosticBag diags;
  EXPECT_FALSE(diags.has_errors());

  diags.report_warning(SourceRange(0, 1), "just a warning");
  EXPECT_FALSE(diags.has_errors());

  diags.report_error(SourceRange(0, 1), "bad").with_code(diag_code::k_unknown_dialect);
  EXPECT_TRUE(diags.has_errors());
  EXPECT_TRUE(diags.has_code("E0401"));
  EXPECT_FALSE(diags.has_code("E0101"));
  EXPECT_EQ(diags.error_count(), 1U);
  EXPECT_EQ(diags.warning_count(), 1U);
  EXPECT_EQ(diags.size(), 2U);
}

TEST(DiagnosticBag, PrimaryLabelComesFirst)
{
  DiagnosticBag diags;
  diags.report(Severity::Warning, SourceRange(4, 9), "lossy", "here")
    .with_secondary_label(SourceRange(0, 12), "in this cast")
    .with_code(diag_code::k_lossy_cast);

  ASSERT_EQ(diags.size(), 1U);
  const Diagnostic & d = diags.all()[0];
  EXPECT_FALSE(d.is_error());
  EXPECT_EQ(d.code, "W0303");
  ASSERT_EQ(d.labels.size(), 2U);
  EXPECT_EQ(d.labels[0].style, LabelStyle::Primary);
  EXPECT_EQ(d.primary_range(), SourceRange(4, 9));
}

}  // namespace s2sql
