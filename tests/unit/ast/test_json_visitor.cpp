// test_json_visitor.cpp - Unit tests for AST JSON serialization
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "modelspec/ast/ast.hpp"
#include "modelspec/ast/json_visitor.hpp"
#include "modelspec/test_support/parse_helpers.hpp"

using nlohmann::json;

namespace modelspec
{

class JsonVisitorTest : public ::testing::Test
{
protected:
  static json parse_and_serialize(const std::string & source)
  {
    auto parsed = test_support::expect_parse(source);
    if (!parsed) {
      return nullptr;
    }
    return to_json(parsed->model());
  }
};

TEST_F(JsonVisitorTest, SimpleModel)
{
  auto j = parse_and_serialize("y ~ x1 + x2");
  ASSERT_TRUE(j.is_object());

  EXPECT_EQ(j["type"], "Model");
  EXPECT_EQ(j["range"]["start"], 0);
  EXPECT_EQ(j["range"]["end"], 11);

  EXPECT_EQ(j["outcome"]["type"], "SingleOutcome");
  EXPECT_EQ(j["outcome"]["subject"]["type"], "PhenotypeRef");
  EXPECT_EQ(j["outcome"]["subject"]["name"], "y");

  EXPECT_TRUE(j["conditions"].is_array());
  EXPECT_TRUE(j["conditions"].empty());

  ASSERT_EQ(j["predictors"].size(), 2);
  EXPECT_EQ(j["predictors"][0]["type"], "PlainTerm");
  EXPECT_EQ(j["predictors"][0]["phenotype"]["name"], "x1");
  EXPECT_EQ(j["predictors"][1]["range"]["start"], 9);
}

TEST_F(JsonVisitorTest, Conditions)
{
  auto j = parse_and_serialize("y | male, g(rs7) = 1 ~ x");
  ASSERT_TRUE(j.is_object());

  const auto & conds = j["conditions"];
  ASSERT_EQ(conds.size(), 2);
  EXPECT_EQ(conds[0]["type"], "Condition");
  EXPECT_EQ(conds[0]["subject"]["name"], "male");
  EXPECT_TRUE(conds[0]["level"].is_null());

  EXPECT_EQ(conds[1]["subject"]["type"], "GenotypeRef");
  EXPECT_EQ(conds[1]["subject"]["variant"], "rs7");
  EXPECT_EQ(conds[1]["level"], 1);
}

TEST_F(JsonVisitorTest, LabelledOutcomeGroup)
{
  auto j = parse_and_serialize("[tte=t, event=e] ~ x");
  ASSERT_TRUE(j.is_object());

  const auto & outcome = j["outcome"];
  EXPECT_EQ(outcome["type"], "LabelledOutcomeGroup");
  ASSERT_EQ(outcome["slots"].size(), 2);
  EXPECT_EQ(outcome["slots"][0]["type"], "LabelledOutcome");
  EXPECT_EQ(outcome["slots"][0]["key"], "tte");
  EXPECT_EQ(outcome["slots"][0]["phenotype"]["name"], "t");
  EXPECT_EQ(outcome["slots"][1]["key"], "event");
}

TEST_F(JsonVisitorTest, AliasedTerms)
{
  auto j = parse_and_serialize("y ~ factor(x) as z + ln(a) + pow(b, 3) as b3 + c * g(rs1) as cg");
  ASSERT_TRUE(j.is_object());

  const auto & preds = j["predictors"];
  ASSERT_EQ(preds.size(), 4);

  EXPECT_EQ(preds[0]["type"], "FactorTerm");
  EXPECT_EQ(preds[0]["phenotype"]["name"], "x");
  EXPECT_EQ(preds[0]["alias"], "z");

  EXPECT_EQ(preds[1]["type"], "LogTerm");
  EXPECT_EQ(preds[1]["base"], "ln");
  EXPECT_TRUE(preds[1]["alias"].is_null());

  EXPECT_EQ(preds[2]["type"], "PowTerm");
  EXPECT_EQ(preds[2]["power"], 3);
  EXPECT_EQ(preds[2]["alias"], "b3");

  EXPECT_EQ(preds[3]["type"], "InteractionTerm");
  ASSERT_EQ(preds[3]["members"].size(), 2);
  EXPECT_EQ(preds[3]["members"][0]["type"], "PhenotypeRef");
  EXPECT_EQ(preds[3]["members"][1]["type"], "GenotypeRef");
  EXPECT_EQ(preds[3]["alias"], "cg");
}

TEST_F(JsonVisitorTest, SnpsAndGenotypeTerms)
{
  auto j = parse_and_serialize("y ~ SNPs + g(rs2)");
  ASSERT_TRUE(j.is_object());

  EXPECT_EQ(j["predictors"][0]["type"], "SnpsTerm");
  EXPECT_TRUE(j["predictors"][0].contains("range"));
  EXPECT_EQ(j["predictors"][1]["type"], "GenotypeTerm");
  EXPECT_EQ(j["predictors"][1]["genotype"]["variant"], "rs2");
}

TEST_F(JsonVisitorTest, NullNode)
{
  EXPECT_TRUE(to_json(static_cast<const AstNode *>(nullptr)).is_null());
}

}  // namespace modelspec
