// test_model_queries.cpp - Unit tests for GWAS detection, references and labels
//
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "modelspec/analysis/model_queries.hpp"
#include "modelspec/test_support/parse_helpers.hpp"

namespace modelspec
{

using Strings = std::vector<std::string>;

class ModelQueriesTest : public ::testing::Test
{
protected:
  const Model & parse_model(const std::string & text, const ParseOptions & opts = {})
  {
    parsed_ = test_support::expect_parse(text, opts);
    if (!parsed_) {
      throw std::runtime_error("parse failed: " + text);
    }
    return parsed_->model();
  }

  std::unique_ptr<ParsedModel> parsed_;
};

TEST_F(ModelQueriesTest, GwasDetection)
{
  EXPECT_TRUE(is_gwas(parse_model("y ~ SNPs + age")));
  EXPECT_FALSE(is_gwas(parse_model("y ~ g(rs1) + age")));
  EXPECT_FALSE(is_gwas(parse_model("y ~ SNPs", test_support::legacy_options())));
}

TEST_F(ModelQueriesTest, ReferencedVariantsInSourceOrder)
{
  const Model & m = parse_model("g(rs3) | g(rs1) = 0 ~ g(rs2) + age * g(rs1) + g(rs9)");
  EXPECT_EQ(referenced_variants(m), (Strings{"rs3", "rs1", "rs2", "rs9"}));
}

TEST_F(ModelQueriesTest, ReferencedPhenotypes)
{
  const Model & m =
    parse_model("[tte=t, event=e] | sex ~ age + factor(sex) as s + ln(bmi) + pow(age, 2) + a * b");
  EXPECT_EQ(referenced_phenotypes(m), (Strings{"t", "e", "sex", "age", "bmi", "a", "b"}));
  EXPECT_TRUE(referenced_variants(m).empty());
}

TEST_F(ModelQueriesTest, TermLabels)
{
  const Model & m = parse_model(
    "y ~ x + g(rs1) + SNPs + factor(c) + factor(d) as fd + a * g(rs2) + ln(w) as lw + pow(v, 2)");
  ASSERT_EQ(m.predictors.size(), 8u);

  EXPECT_EQ(term_label(*m.predictors[0]), "x");
  EXPECT_EQ(term_label(*m.predictors[1]), "g(rs1)");
  EXPECT_EQ(term_label(*m.predictors[2]), "SNPs");
  EXPECT_EQ(term_label(*m.predictors[3]), "factor(c)");
  EXPECT_EQ(term_label(*m.predictors[4]), "fd");
  EXPECT_EQ(term_label(*m.predictors[5]), "a * g(rs2)");
  EXPECT_EQ(term_label(*m.predictors[6]), "lw");
  EXPECT_EQ(term_label(*m.predictors[7]), "pow(v, 2)");
}

TEST_F(ModelQueriesTest, TranslationsMapLabelsToTerms)
{
  const Model & m = parse_model("y ~ age + factor(sex) as s + age * g(rs1) as gxa");

  const std::vector<Translation> expected = {
    {"age", "age"},
    {"s", "factor(sex)"},
    {"gxa", "age * g(rs1)"},
  };
  EXPECT_EQ(translations(m), expected);
}

}  // namespace modelspec
