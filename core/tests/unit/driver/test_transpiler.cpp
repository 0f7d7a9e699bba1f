// test_transpiler.cpp - End-to-end pipeline tests through the driver
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "s2sql/driver/transpiler.hpp"

using s2sql::TranspileOptions;
using s2sql::Transpiler;

namespace
{

TranspileOptions read_write(std::string read, std::string write)
{
  TranspileOptions o;
  o.read = std::move(read);
  o.write = std::move(write);
  return o;
}

}  // namespace

// ============================================================================
// transpile
// ============================================================================

TEST(DriverTranspile, SingleStoreToMySql)
{
  const auto result = Transpiler::transpile(
    "SELECT TO_DATE(x, 'YYYY-MM-DD HH24:MI:SS'), y :> INT FROM t;\n"
    "SELECT j::$a FROM t",
    read_write("singlestore", "mysql"));

  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
  EXPECT_EQ(
    result.statements,
    (std::vector<std::string>{
      "SELECT STR_TO_DATE(x, '%Y-%m-%d %H:%i:%s'), CAST(y AS INT) FROM t",
      "SELECT JSON_UNQUOTE(JSON_EXTRACT(j, '$.a')) FROM t"}));
}

TEST(DriverTranspile, MySqlToSingleStore)
{
  const auto result = Transpiler::transpile(
    "SELECT STR_TO_DATE(s, '%d.%m.%Y'), CAST(b AS JSON) FROM t", read_write("mysql", "singlestore"));

  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.statements.size(), 1U);
  EXPECT_EQ(result.statements[0], "SELECT STR_TO_DATE(s, '%d.%m.%Y'), CAST(b AS JSON) FROM t");
}

TEST(DriverTranspile, IdentifyOption)
{
  TranspileOptions o;
  o.identify = true;
  const auto result = Transpiler::transpile("SELECT a FROM t", o);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.statements[0], "SELECT `a` FROM `t`");
}

TEST(DriverTranspile, UnknownDialect)
{
  const auto result = Transpiler::transpile("SELECT 1", read_write("oracle", "mysql"));

  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.size(), 1U);
  const auto & d = result.diagnostics.all()[0];
  EXPECT_EQ(d.code, "E0401");
  EXPECT_EQ(d.message, "unknown dialect 'oracle'");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "known dialects: mysql, singlestore");
  EXPECT_TRUE(result.statements.empty());
}

TEST(DriverTranspile, ParseErrorsSkipGeneration)
{
  const auto result = Transpiler::transpile("SELECT (1", TranspileOptions{});

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code("E0201"));
  EXPECT_TRUE(result.statements.empty());
}

TEST(DriverTranspile, GenerationErrorsFail)
{
  const auto result =
    Transpiler::transpile("SELECT TO_CHAR(d, 'D')", read_write("singlestore", "mysql"));

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code("E0301"));
  ASSERT_EQ(result.statements.size(), 1U);
}

TEST(DriverTranspile, ResultKeepsSourceAcrossMoves)
{
  auto result = Transpiler::transpile("SELECT 1", TranspileOptions{}, "query.sql");
  const auto moved = std::move(result);

  ASSERT_NE(moved.source, nullptr);
  EXPECT_EQ(moved.source->path().string(), "query.sql");
  EXPECT_EQ(moved.source->content(), "SELECT 1");
}

// ============================================================================
// tokenize / dump
// ============================================================================

TEST(DriverTokenize, KeepsCommentsAndReportsLexErrors)
{
  const auto result = Transpiler::tokenize("SELECT 1 -- note\n ?", "singlestore");

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code("E0101"));
  ASSERT_EQ(result.tokens.size(), 5U);
  EXPECT_EQ(result.tokens[2].kind, s2sql::syntax::TokenKind::LineComment);
  EXPECT_EQ(result.tokens[2].text, "-- note");
  EXPECT_EQ(result.tokens[3].kind, s2sql::syntax::TokenKind::Unknown);
}

TEST(DriverDump, ProducesScriptJson)
{
  const auto result = Transpiler::dump("SELECT TO_DATE(x, 'YYYY')", "singlestore");

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.ast["type"], "Script");
  EXPECT_EQ(result.ast["statements"][0]["items"][0]["expr"]["type"], "TemporalExpr");
}

// ============================================================================
// format_time
// ============================================================================

TEST(DriverFormatTime, ConvertsBetweenVocabularies)
{
  {
    const auto result = Transpiler::format_time("YYYY-MM-DD HH24:MI", "singlestore", "mysql");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.format, "%Y-%m-%d %H:%i");
    EXPECT_EQ(result.canonical, "%Y-%m-%d %H:%M");
  }
  {
    const auto result = Transpiler::format_time("%d/%m/%y %h", "mysql", "singlestore");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.format, "DD/MM/YY HH12");
  }
}

TEST(DriverFormatTime, ReportsUnrepresentableDirective)
{
  const auto result = Transpiler::format_time("D", "singlestore", "mysql");

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code("E0301"));
  EXPECT_EQ(result.canonical, "%u");
}
