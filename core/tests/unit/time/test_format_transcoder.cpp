// test_format_transcoder.cpp - Unit tests for decode / encode / transcode
//
#include <gtest/gtest.h>

#include <string>

#include "s2sql/time/canonical_format.hpp"
#include "s2sql/time/format_transcoder.hpp"
#include "s2sql/time/time_mappings.hpp"

namespace s2sql::time
{

namespace
{

FormatElement dir(const char * text) { return {FormatElementKind::Directive, text}; }
FormatElement lit(const char * text) { return {FormatElementKind::Literal, text}; }

}  // namespace

TEST(TimeTranscoder, DecodePreservesLiterals)
{
  const DirectiveTable table("t", {{"YYYY", "%Y"}, {"MM", "%m"}, {"DD", "%d"}});

  const auto decoded = decode("YYYY-MM-DD", table);
  EXPECT_EQ(decoded, (CanonicalFormat{dir("%Y"), lit("-"), dir("%m"), lit("-"), dir("%d")}));

  const auto encoded = encode(decoded, table);
  ASSERT_TRUE(encoded.has_value());
  EXPECT_EQ(*encoded, "YYYY-MM-DD");
}

TEST(TimeTranscoder, LongestMatchWinsOverShorterToken)
{
  const DirectiveTable table("t", {{"HH", "%I"}, {"HH24", "%H"}});

  const auto decoded = decode("HH24", table);
  ASSERT_EQ(decoded.size(), 1u);
  EXPECT_EQ(decoded[0], dir("%H"));
}

TEST(TimeTranscoder, PartialLongTokenFallsBackToShortOne)
{
  const auto & table = singlestore_time_table();

  // "MONT" is not a token: MON, then literal "T".
  EXPECT_EQ(decode("MONT", table), (CanonicalFormat{dir("%b"), lit("T")}));
  EXPECT_EQ(decode("MONTH", table), (CanonicalFormat{dir("%B")}));
}

TEST(TimeTranscoder, AdjacentLiteralCharactersCoalesce)
{
  const auto & table = singlestore_time_table();

  EXPECT_EQ(
    decode("HH24 o'clock", table),
    (CanonicalFormat{dir("%H"), lit(" o'clock")}));
  EXPECT_EQ(decode("", table), CanonicalFormat{});
  EXPECT_EQ(decode("::", table), (CanonicalFormat{lit("::")}));
}

TEST(TimeTranscoder, DecodeIsTotalOverArbitraryBytes)
{
  const auto & table = singlestore_time_table();
  const std::string junk = "\x01\xff%q YYYYY";

  const auto decoded = decode(junk, table);
  EXPECT_EQ(to_string(decoded), "\x01\xff%q %YY");
}

TEST(TimeTranscoder, RoundTripOnPreferredTokens)
{
  const auto & table = singlestore_time_table();

  for (const auto & directive : table.canonical_directives()) {
    const auto token = table.lookup_forward(directive);
    ASSERT_TRUE(token.has_value());
    const auto round = encode(decode(*token, table), table);
    ASSERT_TRUE(round.has_value()) << directive;
    EXPECT_EQ(*round, *token);
  }
}

TEST(TimeTranscoder, AliasTokensEncodeToPreferredSpelling)
{
  const auto & table = singlestore_time_table();

  const auto hh = encode(decode("HH:MI", table), table);
  ASSERT_TRUE(hh.has_value());
  EXPECT_EQ(*hh, "HH12:MI");

  const auto rr = encode(decode("DD-MON-RR", table), table);
  ASSERT_TRUE(rr.has_value());
  EXPECT_EQ(*rr, "DD-MON-YY");
}

TEST(TimeTranscoder, CrossDialectToMySql)
{
  const auto & s2 = singlestore_time_table();
  const auto & mysql = mysql_time_table();

  auto out = transcode("YYYY-MM-DD", s2, mysql);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, "%Y-%m-%d");

  out = transcode("YYYY-MM-DD HH24:MI:SS.FF6", s2, mysql);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, "%Y-%m-%d %H:%i:%s.%f");

  out = transcode("DY, DD MONTH YYYY HH12", s2, mysql);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, "%a, %d %M %Y %h");
}

TEST(TimeTranscoder, MySqlToSingleStore)
{
  const auto out = transcode("%d/%m/%Y %H:%i", mysql_time_table(), singlestore_time_table());
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, "DD/MM/YYYY HH24:MI");
}

TEST(TimeTranscoder, UncoveredDirectiveIsEncodeError)
{
  const auto out = transcode("D YYYY", singlestore_time_table(), mysql_time_table());
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error().directive, "%u");
  EXPECT_EQ(out.error().table, "mysql");
  EXPECT_EQ(out.error().message(), "format directive '%u' has no equivalent in dialect 'mysql'");
}

TEST(TimeTranscoder, FreshTriesDecodeIdentically)
{
  const auto & table = singlestore_time_table();
  const auto first = build_directive_trie(table);
  const auto second = build_directive_trie(table);

  const std::string input = "YYYY-MM-DD HH24:MI:SS";
  EXPECT_EQ(decode(input, first), decode(input, second));
  EXPECT_EQ(decode(input, first), decode(input, table));
}

TEST(TimeCanonicalFormat, DirectivesOfListsDistinctInOrder)
{
  const CanonicalFormat format{dir("%Y"), lit("-"), dir("%m"), lit("-"), dir("%Y")};
  EXPECT_EQ(directives_of(format), (std::vector<std::string>{"%Y", "%m"}));
  EXPECT_EQ(to_string(format), "%Y-%m-%Y");
}

}  // namespace s2sql::time
