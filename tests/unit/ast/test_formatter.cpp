// test_formatter.cpp - Canonical text rendering and structural equality
//
#include <gtest/gtest.h>

#include <string>

#include "modelspec/ast/ast_equal.hpp"
#include "modelspec/ast/formatter.hpp"
#include "modelspec/test_support/parse_helpers.hpp"

namespace modelspec
{

namespace
{

std::string reformat(const std::string & text)
{
  auto parsed = test_support::expect_parse(text);
  if (!parsed) {
    return {};
  }
  return format_model(parsed->model());
}

}  // namespace

TEST(AstFormatter, CanonicalInputIsUnchanged)
{
  const char * inputs[] = {
    "y ~ x1 + x2",
    "y ~ x1 * x2",
    "y | male ~ x",
    "y | diabetes = 0 ~ x",
    "y ~ factor(x) as z",
    "[tte=t, event=e] ~ x + y",
    "g(rs1) | g(rs2) = 1 ~ SNPs + ln(a) + log10(b) as lb + pow(c, 2)",
    "y ~ age * g(rs1) * factor(sex) as gxe",
  };
  for (const char * text : inputs) {
    EXPECT_EQ(reformat(text), text);
  }
}

TEST(AstFormatter, WhitespaceIsNormalized)
{
  EXPECT_EQ(reformat("y|a=1,b~x+factor(z)as f"), "y | a = 1, b ~ x + factor(z) as f");
  EXPECT_EQ(reformat("[ k = p ]  ~  pow( x ,3 )"), "[k=p] ~ pow(x, 3)");
  EXPECT_EQ(reformat("y\n~\ta*b"), "y ~ a * b");
}

TEST(AstFormatter, NodeWithoutAlias)
{
  auto parsed = test_support::expect_parse("y ~ a * b as ab + factor(c) as fc + g(rs1)");
  ASSERT_TRUE(parsed);
  const Model & m = parsed->model();

  EXPECT_EQ(format_node(m.predictors[0]), "a * b as ab");
  EXPECT_EQ(format_node(m.predictors[0], false), "a * b");
  EXPECT_EQ(format_node(m.predictors[1], false), "factor(c)");
  EXPECT_EQ(format_node(m.predictors[2]), "g(rs1)");
  EXPECT_EQ(format_node(m.outcome), "y");
}

TEST(AstEqual, IgnoresRangesButNotContent)
{
  auto a = test_support::expect_parse("y | s = 1 ~ pow(x, 2) as x2");
  auto b = test_support::expect_parse("y|s=1~pow(x,2)as x2");
  auto c = test_support::expect_parse("y | s = 2 ~ pow(x, 2) as x2");
  auto d = test_support::expect_parse("y | s = 1 ~ pow(x, 3) as x2");
  auto e = test_support::expect_parse("y | s ~ pow(x, 2) as x2");
  ASSERT_TRUE(a && b && c && d && e);

  EXPECT_TRUE(structurally_equal(a->model(), b->model()));
  EXPECT_FALSE(structurally_equal(a->model(), c->model()));
  EXPECT_FALSE(structurally_equal(a->model(), d->model()));
  EXPECT_FALSE(structurally_equal(a->model(), e->model()));
}

TEST(AstEqual, KindsAndOrderMatter)
{
  auto ln = test_support::expect_parse("y ~ ln(x)");
  auto log10 = test_support::expect_parse("y ~ log10(x)");
  auto ab = test_support::expect_parse("y ~ a + b");
  auto ba = test_support::expect_parse("y ~ b + a");
  auto gx = test_support::expect_parse("g(x) ~ a + b");
  ASSERT_TRUE(ln && log10 && ab && ba && gx);

  EXPECT_FALSE(structurally_equal(ln->model(), log10->model()));
  EXPECT_FALSE(structurally_equal(ab->model(), ba->model()));
  EXPECT_FALSE(structurally_equal(ab->model(), gx->model()));
  EXPECT_TRUE(structurally_equal(nullptr, nullptr));
  EXPECT_FALSE(structurally_equal(&ab->model(), nullptr));
}

}  // namespace modelspec
