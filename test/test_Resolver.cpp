#include "envtpl/Constants.hpp"
#include "envtpl/Renderer.hpp"
#include "envtpl/Resolver.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace envtpl::test {

class ResolverTest : public ::testing::Test {
protected:
  VariableStore store_;

  [[nodiscard]] Resolver strict(bool expand = false) const {
    return Resolver(store_, {.expand_vars_ = expand, .fail_on_missing_ = true});
  }

  [[nodiscard]] Resolver lenient(bool expand = false) const {
    return Resolver(store_, {.expand_vars_ = expand, .fail_on_missing_ = false});
  }
};

TEST_F(ResolverTest, PlainValue) {
  store_.set("GREETING", "hello");
  auto result = strict().resolve("GREETING");
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, "hello");
}

TEST_F(ResolverTest, LookupUsesUppercasedName) {
  store_.set("GREETING", "hello");
  auto result = strict().resolve("greeting");
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, "hello");
}

TEST_F(ResolverTest, LowercaseEntriesAreNotReachable) {
  store_.set("lower", "x");
  auto result = lenient().resolve("lower");
  ASSERT_TRUE(result);
  EXPECT_FALSE(result->has_value());
}

TEST_F(ResolverTest, LastAssignmentWins) {
  ASSERT_TRUE(store_.assign("A=1"));
  ASSERT_TRUE(store_.assign("A=2"));
  auto result = strict().resolve("A");
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, "2");
}

TEST_F(ResolverTest, MissingStrictFails) {
  auto result = strict().resolve("nope");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind(), Error::Kind::MissingVariable);
  EXPECT_NE(result.error().message().find("nope"), std::string::npos);
}

TEST_F(ResolverTest, MissingLenientIsSentinel) {
  auto result = lenient().resolve("NOPE");
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, std::nullopt);
}

TEST_F(ResolverTest, ChainFollowedWhenExpanding) {
  store_.set("A", "$B");
  store_.set("B", "$C");
  store_.set("C", "final");
  auto result = strict(true).resolve("A");
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, "final");
}

TEST_F(ResolverTest, ChainNamesAreUppercased) {
  store_.set("A", "$b");
  store_.set("B", "found");
  auto result = strict(true).resolve("a");
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, "found");
}

TEST_F(ResolverTest, MarkerIsLiteralWithoutExpansion) {
  store_.set("A", "$B");
  store_.set("B", "$C");
  store_.set("C", "final");
  auto result = strict(false).resolve("A");
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, "$B");
}

TEST_F(ResolverTest, LoneMarkerIsLiteral) {
  store_.set("DOLLAR", "$");
  auto result = strict(true).resolve("DOLLAR");
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, "$");
}

TEST_F(ResolverTest, MarkerOnlyCountsAtStart) {
  store_.set("PRICE", "5$B");
  store_.set("B", "never");
  auto result = strict(true).resolve("PRICE");
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, "5$B");
}

TEST_F(ResolverTest, BrokenChainStrict) {
  store_.set("A", "$B");
  auto result = strict(true).resolve("A");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind(), Error::Kind::MissingVariable);
  EXPECT_NE(result.error().message().find("B"), std::string::npos);
  EXPECT_NE(result.error().message().find("via A"), std::string::npos);
}

TEST_F(ResolverTest, BrokenChainLenient) {
  store_.set("A", "$B");
  auto result = lenient(true).resolve("A");
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, std::nullopt);
}

TEST_F(ResolverTest, SelfReferenceIsCyclic) {
  store_.set("A", "$A");
  auto result = strict(true).resolve("A");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind(), Error::Kind::CyclicReference);
  EXPECT_NE(result.error().message().find("A -> A"), std::string::npos);
}

TEST_F(ResolverTest, TwoNodeCycle) {
  store_.set("A", "$B");
  store_.set("B", "$A");
  auto result = lenient(true).resolve("A");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind(), Error::Kind::CyclicReference);
  EXPECT_NE(result.error().message().find("A -> B -> A"), std::string::npos);
}

TEST_F(ResolverTest, CycleIgnoredWithoutExpansion) {
  store_.set("A", "$A");
  auto result = strict(false).resolve("A");
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, "$A");
}

TEST_F(ResolverTest, OverlongChainIsRejected) {
  auto const links = MAX_INDIRECTION_DEPTH + 1;
  for (std::size_t i = 0; i < links; ++i) {
    store_.set("V" + std::to_string(i), "$V" + std::to_string(i + 1));
  }
  store_.set("V" + std::to_string(links), "end");

  auto result = strict(true).resolve("V0");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind(), Error::Kind::CyclicReference);
}

TEST_F(ResolverTest, ChainAtDepthLimitResolves) {
  auto const links = MAX_INDIRECTION_DEPTH - 1;
  for (std::size_t i = 0; i < links; ++i) {
    store_.set("V" + std::to_string(i), "$V" + std::to_string(i + 1));
  }
  store_.set("V" + std::to_string(links), "end");

  auto result = strict(true).resolve("V0");
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, "end");
}

TEST_F(ResolverTest, ResolveAllKeysByOriginalName) {
  store_.set("HOST", "db");
  std::vector<std::string> tokens{"host", "HOST", "MISSING"};
  auto                     result = lenient().resolveAll(tokens);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->at("host"), "db");
  EXPECT_EQ(result->at("HOST"), "db");
  EXPECT_EQ(result->at("MISSING"), std::nullopt);
}

TEST_F(ResolverTest, ResolveAllFailsFast) {
  store_.set("HOST", "db");
  std::vector<std::string> tokens{"HOST", "MISSING"};
  auto                     result = strict().resolveAll(tokens);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind(), Error::Kind::MissingVariable);
}

TEST_F(ResolverTest, RendererSubstitutesResolvedValues) {
  store_.set("USER", "ada");
  store_.set("HOME_DIR", "$HOME_BASE");
  store_.set("HOME_BASE", "/home/ada");
  auto const resolver = strict(true);
  Renderer   renderer(resolver);

  auto result = renderer.render("user=${ user } home=${HOME_DIR}\n");
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, "user=ada home=/home/ada\n");
}

TEST_F(ResolverTest, RendererPreservesUnresolvedWhenLenient) {
  auto const resolver = lenient();
  Renderer   renderer(resolver);

  auto result = renderer.render("keep ${ THIS } as is");
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, "keep ${ THIS } as is");
}

TEST_F(ResolverTest, RendererFailsOnMissingWhenStrict) {
  store_.set("A", "1");
  auto const resolver = strict();
  Renderer   renderer(resolver);

  auto result = renderer.render("${A} ${B}");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind(), Error::Kind::MissingVariable);
}

TEST_F(ResolverTest, RendererLeavesPlainTextAlone) {
  auto const resolver = strict();
  Renderer   renderer(resolver);

  auto result = renderer.render("nothing to do $HERE");
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, "nothing to do $HERE");
}

} // namespace envtpl::test
