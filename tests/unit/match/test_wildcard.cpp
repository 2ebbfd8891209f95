// test_wildcard.cpp - Type and module name patterns
//
#include <gtest/gtest.h>

#include "typescan/match/wildcard.hpp"

using namespace typescan;

TEST(MatchWildcard, AnchoredAtBothEnds)
{
  EXPECT_TRUE(wildcard_match("App.Service", "App.Service"));
  EXPECT_FALSE(wildcard_match("App.Service", "App.ServiceImpl"));
  EXPECT_FALSE(wildcard_match("Service", "App.Service"));

  EXPECT_TRUE(wildcard_match("*Service", "App.Service"));
  EXPECT_TRUE(wildcard_match("App.*", "App.Service"));
  EXPECT_FALSE(wildcard_match("App.*", "Lib.App.Service"));
}

TEST(MatchWildcard, StarMatchesAnySequence)
{
  EXPECT_TRUE(wildcard_match("*", ""));
  EXPECT_TRUE(wildcard_match("*", "anything"));
  EXPECT_TRUE(wildcard_match("*Smth*", "GeneratorTests.SmthX"));
  EXPECT_TRUE(wildcard_match("A*B*C", "AxxBxxBxxC"));
  EXPECT_FALSE(wildcard_match("A*B*C", "AxxBxxCxx"));
  EXPECT_TRUE(wildcard_match("**", "x"));
  EXPECT_FALSE(wildcard_match("", "x"));
  EXPECT_TRUE(wildcard_match("", ""));
}

TEST(MatchWildcard, RegexCharactersAreLiteral)
{
  EXPECT_TRUE(wildcard_match("App.Repo<T>", "App.Repo<T>"));
  EXPECT_FALSE(wildcard_match("App.Repo", "AppxRepo"));
  EXPECT_TRUE(wildcard_match("a+b?(c)", "a+b?(c)"));
  EXPECT_FALSE(wildcard_match("a+b", "aab"));
}

TEST(MatchWildcard, CaseSensitive)
{
  EXPECT_FALSE(wildcard_match("*service", "App.Service"));
}

TEST(MatchWildcard, CommaSeparatedAlternatives)
{
  const WildcardPattern pattern("*First*,*Second*");
  ASSERT_EQ(pattern.alternatives().size(), 2U);
  EXPECT_TRUE(pattern.matches("App.MyFirstService"));
  EXPECT_TRUE(pattern.matches("App.MySecondService"));
  EXPECT_FALSE(pattern.matches("App.ServiceWithNonMatchingName"));
  EXPECT_EQ(pattern.source(), "*First*,*Second*");

  // Alternatives are not trimmed
  const WildcardPattern spaced("*First, *Second");
  EXPECT_FALSE(spaced.matches("App.Second"));
  EXPECT_TRUE(spaced.matches(" App.Second"));
}

TEST(MatchWildcard, NullPatternIsNoFilter)
{
  EXPECT_FALSE(compile_wildcard(std::nullopt).has_value());

  auto compiled = compile_wildcard(std::string("Lib.*"));
  ASSERT_TRUE(compiled.has_value());
  EXPECT_TRUE(compiled->matches("Lib.Contracts"));
}
