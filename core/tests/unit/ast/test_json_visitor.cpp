// test_json_visitor.cpp - Unit tests for AST JSON serialization
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "s2sql/ast/ast.hpp"
#include "s2sql/ast/json_visitor.hpp"
#include "s2sql/test_support/parse_helpers.hpp"

using nlohmann::json;

namespace s2sql
{

class JsonVisitorTest : public ::testing::Test
{
protected:
  static json parse_and_serialize(const std::string & source)
  {
    auto unit = test_support::parse(source);
    EXPECT_NE(unit.script, nullptr);
    return to_json(unit.script);
  }
};

TEST_F(JsonVisitorTest, EmptyScript)
{
  auto j = parse_and_serialize("");
  EXPECT_EQ(j["type"], "Script");
  EXPECT_TRUE(j["statements"].is_array());
  EXPECT_EQ(j["statements"].size(), 0);
}

TEST_F(JsonVisitorTest, SelectStatement)
{
  auto j = parse_and_serialize("SELECT a AS x FROM db.t WHERE a > 1 ORDER BY a DESC LIMIT 3");

  ASSERT_EQ(j["statements"].size(), 1);
  auto sel = j["statements"][0];
  EXPECT_EQ(sel["type"], "SelectStmt");
  EXPECT_EQ(sel["distinct"], false);

  ASSERT_EQ(sel["items"].size(), 1);
  EXPECT_EQ(sel["items"][0]["alias"], "x");
  EXPECT_EQ(sel["items"][0]["expr"]["type"], "ColumnRefExpr");
  EXPECT_TRUE(sel["items"][0]["expr"]["qualifier"].is_null());

  EXPECT_EQ(sel["from"]["schema"], "db");
  EXPECT_EQ(sel["from"]["name"], "t");
  EXPECT_EQ(sel["where"]["op"], ">");
  EXPECT_EQ(sel["orderBy"][0]["direction"], "DESC");
  EXPECT_EQ(sel["limit"]["value"], "3");
  EXPECT_TRUE(sel["offset"].is_null());
  EXPECT_FALSE(sel.contains("orderByAll"));
}

TEST_F(JsonVisitorTest, TemporalExpression)
{
  auto j = parse_and_serialize("TO_CHAR(d, 'YYYY-MM')");

  auto stmt = j["statements"][0];
  EXPECT_EQ(stmt["type"], "ExprStmt");

  auto t = stmt["expr"];
  EXPECT_EQ(t["type"], "TemporalExpr");
  EXPECT_EQ(t["op"], "ToChar");
  EXPECT_EQ(t["function"], "TO_CHAR");
  EXPECT_EQ(t["value"]["name"], "d");

  auto f = t["format"];
  EXPECT_EQ(f["type"], "TimeFormatExpr");
  EXPECT_EQ(f["original"], "YYYY-MM");
  EXPECT_EQ(f["table"], "singlestore");
  ASSERT_EQ(f["pieces"].size(), 3);
  EXPECT_EQ(f["pieces"][0]["kind"], "directive");
  EXPECT_EQ(f["pieces"][0]["text"], "%Y");
  EXPECT_EQ(f["pieces"][1]["kind"], "literal");
}

TEST_F(JsonVisitorTest, CastAndJsonExtract)
{
  auto j = parse_and_serialize("SELECT x !:> DECIMAL(10, 2), y::%score");

  auto items = j["statements"][0]["items"];
  auto c = items[0]["expr"];
  EXPECT_EQ(c["type"], "CastExpr");
  EXPECT_EQ(c["style"], "try_operator");
  EXPECT_EQ(c["targetType"]["name"], "DECIMAL");
  EXPECT_EQ(c["targetType"]["params"], json::array({"10", "2"}));

  auto e = items[1]["expr"];
  EXPECT_EQ(e["type"], "JsonExtractExpr");
  EXPECT_EQ(e["as"], "double");
  EXPECT_EQ(e["key"], "score");
}

TEST_F(JsonVisitorTest, RangesAreByteOffsets)
{
  auto j = parse_and_serialize("SELECT abc");

  auto col = j["statements"][0]["items"][0]["expr"];
  EXPECT_EQ(col["range"]["start"], 7);
  EXPECT_EQ(col["range"]["end"], 10);
}

TEST_F(JsonVisitorTest, OrderByAllAndByteString)
{
  auto j = parse_and_serialize("SELECT e'x' FROM t ORDER BY ALL");

  auto sel = j["statements"][0];
  EXPECT_EQ(sel["items"][0]["expr"]["byteString"], true);
  ASSERT_TRUE(sel.contains("orderByAll"));
  EXPECT_TRUE(sel["orderByAll"]["direction"].is_null());
}

}  // namespace s2sql
