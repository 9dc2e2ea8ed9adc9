#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "modelspec/ast/ast.hpp"
#include "modelspec/basic/casting.hpp"
#include "modelspec/syntax/dialect.hpp"
#include "modelspec/test_support/parse_helpers.hpp"

namespace modelspec
{

using syntax::Dialect;
using syntax::GrammarFeatures;
using test_support::expect_failure;
using test_support::expect_parse;
using test_support::legacy_options;

TEST(SyntaxDialects, FeatureFlags)
{
  constexpr auto standard = GrammarFeatures::for_dialect(Dialect::Standard);
  EXPECT_TRUE(standard.labelled_outcomes);
  EXPECT_TRUE(standard.snps_token);
  EXPECT_TRUE(standard.pow_terms);
  EXPECT_TRUE(standard.log_terms);
  EXPECT_TRUE(standard.factor_interactions);

  constexpr auto legacy = GrammarFeatures::for_dialect(Dialect::Legacy);
  EXPECT_FALSE(legacy.labelled_outcomes);
  EXPECT_FALSE(legacy.snps_token);
  EXPECT_FALSE(legacy.pow_terms);
  EXPECT_FALSE(legacy.log_terms);
  EXPECT_FALSE(legacy.factor_interactions);
}

TEST(SyntaxDialects, NamesRoundTrip)
{
  EXPECT_EQ(syntax::to_string(Dialect::Standard), "standard");
  EXPECT_EQ(syntax::to_string(Dialect::Legacy), "legacy");
  EXPECT_EQ(syntax::dialect_from_string("legacy"), Dialect::Legacy);
  EXPECT_EQ(syntax::dialect_from_string("standard"), Dialect::Standard);
  EXPECT_FALSE(syntax::dialect_from_string("Legacy").has_value());
}

TEST(SyntaxDialects, LegacyAcceptsTheCommonSubset)
{
  auto parsed =
    expect_parse("y | sex, diabetes = 0 ~ age + g(rs1) + factor(c) as fc + a * g(rs2)", legacy_options());
  ASSERT_TRUE(parsed);

  const Model & m = parsed->model();
  EXPECT_EQ(m.conditions.size(), 2u);
  ASSERT_EQ(m.predictors.size(), 4u);
  EXPECT_TRUE(isa<PlainTerm>(m.predictors[0]));
  EXPECT_TRUE(isa<GenotypeTerm>(m.predictors[1]));
  EXPECT_TRUE(isa<FactorTerm>(m.predictors[2]));
  EXPECT_TRUE(isa<InteractionTerm>(m.predictors[3]));
}

TEST(SyntaxDialects, LegacyRejectsLabelledOutcomes)
{
  const auto err = expect_failure("[tte=t, event=e] ~ x", legacy_options());
  ASSERT_TRUE(err);
  ASSERT_TRUE(err->is_syntax());
  EXPECT_EQ(err->syntax().rule, "outcome");
  EXPECT_EQ(err->syntax().found, "[");
  EXPECT_EQ(err->syntax().expected, (std::vector<std::string>{"g(", "name"}));
}

TEST(SyntaxDialects, LegacyRejectsTransforms)
{
  for (const char * text : {"y ~ ln(x)", "y ~ log10(x)", "y ~ pow(x, 2)"}) {
    const auto err = expect_failure(text, legacy_options());
    ASSERT_TRUE(err) << text;
    ASSERT_TRUE(err->is_syntax()) << text;
    EXPECT_EQ(err->syntax().rule, "expression") << text;
    EXPECT_EQ(err->syntax().expected, (std::vector<std::string>{"g(", "factor(", "name"}))
      << text;
  }
}

TEST(SyntaxDialects, LegacyReadsSnpsAsAPhenotype)
{
  auto parsed = expect_parse("y ~ SNPs", legacy_options());
  ASSERT_TRUE(parsed);
  const auto * plain = dyn_cast<PlainTerm>(parsed->model().predictors[0]);
  ASSERT_NE(plain, nullptr);
  EXPECT_EQ(plain->phenotype->name, "SNPs");

  auto standard = expect_parse("y ~ SNPs");
  ASSERT_TRUE(standard);
  EXPECT_TRUE(isa<SnpsTerm>(standard->model().predictors[0]));
}

TEST(SyntaxDialects, LegacyHasNoFactorInteractions)
{
  // `factor(c)` is a complete term; the `*` that follows is left over.
  auto err = expect_failure("y ~ factor(c) * x", legacy_options());
  ASSERT_TRUE(err);
  ASSERT_TRUE(err->is_syntax());
  EXPECT_TRUE(err->syntax().trailing);
  EXPECT_EQ(err->syntax().found, "*");

  err = expect_failure("y ~ x * factor(c)", legacy_options());
  ASSERT_TRUE(err);
  ASSERT_TRUE(err->is_syntax());
  EXPECT_EQ(err->syntax().rule, "interaction");
  EXPECT_EQ(err->syntax().found, "factor(");
  EXPECT_EQ(err->syntax().expected, (std::vector<std::string>{"g(", "name"}));
}

}  // namespace modelspec
