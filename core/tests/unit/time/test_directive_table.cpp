// test_directive_table.cpp - Unit tests for DirectiveTable and built-in tables
//
#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "s2sql/time/directive_table.hpp"
#include "s2sql/time/time_mappings.hpp"

using s2sql::time::DialectDefinitionError;
using s2sql::time::DirectiveTable;

TEST(TimeDirectiveTable, LooksUpBothDirections)
{
  const DirectiveTable table("t", {{"YYYY", "%Y"}, {"MM", "%m"}, {"DD", "%d"}});

  EXPECT_EQ(table.name(), "t");
  EXPECT_EQ(table.size(), 3u);
  EXPECT_EQ(table.lookup_forward("%m"), "MM");
  EXPECT_EQ(table.lookup_reverse("DD"), "%d");
  EXPECT_FALSE(table.lookup_forward("%H").has_value());
  EXPECT_FALSE(table.lookup_reverse("dd").has_value());  // tokens are case-sensitive
}

TEST(TimeDirectiveTable, ForwardLookupUsesLastRegisteredToken)
{
  const DirectiveTable table("t", {{"RR", "%y"}, {"YY", "%y"}});

  EXPECT_EQ(table.lookup_forward("%y"), "YY");
  EXPECT_EQ(table.lookup_reverse("RR"), "%y");
  EXPECT_EQ(table.canonical_directives(), std::vector<std::string>{"%y"});
}

TEST(TimeDirectiveTable, ConflictingDuplicateTokenIsFatal)
{
  EXPECT_THROW(
    DirectiveTable("bad", {{"MM", "%m"}, {"MM", "%M"}}), DialectDefinitionError);
}

TEST(TimeDirectiveTable, IdenticalDuplicateIsIgnored)
{
  const DirectiveTable table("t", {{"MM", "%m"}, {"MM", "%m"}});
  EXPECT_EQ(table.size(), 1u);
}

TEST(TimeDirectiveTable, EmptyTokenIsFatal)
{
  EXPECT_THROW(DirectiveTable("bad", {{"", "%Y"}}), DialectDefinitionError);
  EXPECT_THROW(DirectiveTable("bad", {{"YYYY", ""}}), DialectDefinitionError);
}

TEST(TimeDirectiveTable, MissingDirectivesReportsUncovered)
{
  const DirectiveTable target("target", {{"%Y", "%Y"}, {"%m", "%m"}});
  const std::vector<std::string> required{"%Y", "%u", "%m", "%u", "%f"};

  const auto missing = s2sql::time::missing_directives(required, target);
  EXPECT_EQ(missing, (std::vector<std::string>{"%u", "%f"}));
}

TEST(TimeDirectiveTable, TrieIsBuiltOnceAcrossThreads)
{
  const DirectiveTable table("t", {{"HH", "%I"}, {"HH24", "%H"}});

  std::vector<const s2sql::time::DirectiveTrie *> seen(8, nullptr);
  std::vector<std::thread> workers;
  for (size_t i = 0; i < seen.size(); ++i) {
    workers.emplace_back([&, i] { seen[i] = &table.trie(); });
  }
  for (auto & w : workers) {
    w.join();
  }

  for (const auto * t : seen) {
    EXPECT_EQ(t, seen.front());
  }
  EXPECT_EQ(seen.front()->size(), 2u);
}

TEST(TimeMappings, SingleStoreTableMatchesDialectTokens)
{
  const auto & table = s2sql::time::singlestore_time_table();

  EXPECT_EQ(table.name(), "singlestore");
  EXPECT_EQ(table.size(), 15u);
  EXPECT_EQ(table.lookup_reverse("D"), "%u");
  EXPECT_EQ(table.lookup_reverse("HH24"), "%H");
  EXPECT_EQ(table.lookup_reverse("MI"), "%M");
  EXPECT_EQ(table.lookup_reverse("MONTH"), "%B");
  EXPECT_EQ(table.lookup_reverse("FF6"), "%f");
  EXPECT_EQ(table.lookup_forward("%I"), "HH12");
  EXPECT_EQ(table.lookup_forward("%y"), "YY");
}

TEST(TimeMappings, MySqlTableRenamesSpecifiers)
{
  const auto & table = s2sql::time::mysql_time_table();

  EXPECT_EQ(table.lookup_reverse("%i"), "%M");
  EXPECT_EQ(table.lookup_reverse("%M"), "%B");
  EXPECT_EQ(table.lookup_reverse("%e"), "%-d");
  EXPECT_EQ(table.lookup_forward("%M"), "%i");
  EXPECT_EQ(table.lookup_forward("%I"), "%h");
  EXPECT_EQ(table.lookup_forward("%S"), "%s");
  EXPECT_FALSE(table.covers("%u"));
}
