#include <gtest/gtest.h>

#include "s2sql/dialect/temporal_rewrite.hpp"
#include "s2sql/test_support/parse_helpers.hpp"

using s2sql::test_support::find_first;
using s2sql::test_support::get_dialect;
using s2sql::test_support::parse;

TEST(TemporalRewrite, LiteralFormatIsReencoded)
{
  auto unit = parse("SELECT TO_DATE(x, 'YYYY-MM-DD')");
  ASSERT_TRUE(unit.diags.empty());
  const auto * t = find_first<s2sql::TemporalExpr>(unit.script);
  ASSERT_NE(t, nullptr);

  const auto call = s2sql::dialect::rewrite_temporal(*t, get_dialect("mysql"));
  ASSERT_TRUE(call.has_value());
  EXPECT_EQ(call->function, "STR_TO_DATE");
  EXPECT_EQ(call->value, t->value);
  ASSERT_TRUE(call->format_text.has_value());
  EXPECT_EQ(*call->format_text, "%Y-%m-%d");
  EXPECT_EQ(call->format_passthrough, nullptr);
}

TEST(TemporalRewrite, CanonicalFormOfDecodedLiteral)
{
  auto unit = parse("SELECT TO_CHAR(d, 'HH24 h')");
  const auto * f = find_first<s2sql::TimeFormatExpr>(unit.script);
  ASSERT_NE(f, nullptr);

  EXPECT_EQ(s2sql::time::to_string(s2sql::dialect::canonical_of(*f)), "%H h");
}

TEST(TemporalRewrite, RuntimeFormatIsPassedThrough)
{
  auto unit = parse("SELECT TO_CHAR(d, fmt)");
  const auto * t = find_first<s2sql::TemporalExpr>(unit.script);
  ASSERT_NE(t, nullptr);

  const auto call = s2sql::dialect::rewrite_temporal(*t, get_dialect("mysql"));
  ASSERT_TRUE(call.has_value());
  EXPECT_EQ(call->function, "DATE_FORMAT");
  EXPECT_FALSE(call->format_text.has_value());
  EXPECT_EQ(call->format_passthrough, t->format);
}

TEST(TemporalRewrite, UnknownDirectiveIsAnError)
{
  auto unit = parse("SELECT TO_CHAR(d, 'YYYY D')");
  const auto * t = find_first<s2sql::TemporalExpr>(unit.script);
  ASSERT_NE(t, nullptr);

  const auto call = s2sql::dialect::rewrite_temporal(*t, get_dialect("mysql"));
  ASSERT_FALSE(call.has_value());
  EXPECT_EQ(call.error().directive, "%u");
  EXPECT_EQ(call.error().table, "mysql");
}

TEST(TemporalRewrite, FormatlessCallUsesShortSpelling)
{
  auto unit = parse("SELECT TO_DATE(x)");
  const auto * t = find_first<s2sql::TemporalExpr>(unit.script);
  ASSERT_NE(t, nullptr);

  const auto call = s2sql::dialect::rewrite_temporal(*t, get_dialect("mysql"));
  ASSERT_TRUE(call.has_value());
  EXPECT_EQ(call->function, "DATE");
  EXPECT_FALSE(call->format_text.has_value());
  EXPECT_EQ(call->format_passthrough, nullptr);

  const auto same = s2sql::dialect::rewrite_temporal(*t, get_dialect("singlestore"));
  ASSERT_TRUE(same.has_value());
  EXPECT_EQ(same->function, "TO_DATE");
}
