// tests/unit/sema/test_model_checker.cpp - Unit tests for structural validation
//
#include <gtest/gtest.h>

#include <optional>
#include <vector>

#include "modelspec/ast/ast.hpp"
#include "modelspec/ast/ast_context.hpp"
#include "modelspec/basic/diagnostic.hpp"
#include "modelspec/basic/parse_error.hpp"
#include "modelspec/sema/model_checker.hpp"
#include "modelspec/test_support/parse_helpers.hpp"

namespace modelspec
{

using test_support::expect_failure;
using test_support::expect_parse;

// ============================================================================
// Outcome keys
// ============================================================================

TEST(SemaModelChecker, DuplicateOutcomeKey)
{
  const auto err = expect_failure("[a=t, a=e] ~ x");
  ASSERT_TRUE(err);
  ASSERT_TRUE(err->is_semantic());

  const SemanticError & s = err->semantic();
  EXPECT_EQ(s.kind, SemanticErrorKind::DuplicateOutcomeKey);
  EXPECT_EQ(err->code(), error_code::k_duplicate_outcome_key);
  EXPECT_EQ(s.detail, "duplicate outcome key `a`");
  EXPECT_EQ(s.range, SourceRange(6, 7));
  ASSERT_TRUE(s.related.has_value());
  EXPECT_EQ(*s.related, SourceRange(1, 2));
}

TEST(SemaModelChecker, SamePhenotypeUnderDifferentKeysIsAllowed)
{
  EXPECT_TRUE(expect_parse("[a=t, b=t] ~ x"));
}

TEST(SemaModelChecker, OutcomeKeysAreCheckedBeforeAliases)
{
  const auto err = expect_failure("[k=t, k=e] ~ factor(x) as z + ln(y) as z");
  ASSERT_TRUE(err);
  ASSERT_TRUE(err->is_semantic());
  EXPECT_EQ(err->semantic().kind, SemanticErrorKind::DuplicateOutcomeKey);
}

// ============================================================================
// Aliases
// ============================================================================

TEST(SemaModelChecker, DuplicateAlias)
{
  const auto err = expect_failure("y ~ factor(a) as z + ln(b) as z");
  ASSERT_TRUE(err);
  ASSERT_TRUE(err->is_semantic());

  const SemanticError & s = err->semantic();
  EXPECT_EQ(s.kind, SemanticErrorKind::DuplicateAlias);
  EXPECT_EQ(err->code(), error_code::k_duplicate_alias);
  EXPECT_EQ(s.detail, "alias `z` is already used in this model");
  // The second term is reported, the first is related.
  EXPECT_EQ(s.range, SourceRange(21, 31));
  ASSERT_TRUE(s.related.has_value());
  EXPECT_EQ(*s.related, SourceRange(4, 18));
}

TEST(SemaModelChecker, AliasMayNotShadowEarlierPlainTerm)
{
  const auto err = expect_failure("y ~ x + pow(w, 2) as x");
  ASSERT_TRUE(err);
  ASSERT_TRUE(err->is_semantic());
  EXPECT_EQ(err->semantic().kind, SemanticErrorKind::DuplicateAlias);
  EXPECT_EQ(*err->semantic().related, SourceRange(4, 5));
}

TEST(SemaModelChecker, InteractionAliasCountsToo)
{
  const auto err = expect_failure("y ~ a * b as ab + factor(c) as ab");
  ASSERT_TRUE(err);
  ASSERT_TRUE(err->is_semantic());
  EXPECT_EQ(err->semantic().kind, SemanticErrorKind::DuplicateAlias);
}

TEST(SemaModelChecker, FactorMemberAliasCountsToo)
{
  const auto err = expect_failure("y ~ a * factor(b) as f + ln(c) as f");
  ASSERT_TRUE(err);
  ASSERT_TRUE(err->is_semantic());
  EXPECT_EQ(err->semantic().kind, SemanticErrorKind::DuplicateAlias);
  EXPECT_EQ(err->semantic().detail, "alias `f` is already used in this model");
  // Related range is the factor member, not the whole interaction.
  ASSERT_TRUE(err->semantic().related.has_value());
  EXPECT_EQ(err->semantic().related->get_begin(), SourceLocation(8));
}

TEST(SemaModelChecker, FactorMemberAliasClashesWithInteractionAlias)
{
  const auto err = expect_failure("y ~ a * factor(b) as f * c as f");
  ASSERT_TRUE(err);
  ASSERT_TRUE(err->is_semantic());
  EXPECT_EQ(err->semantic().kind, SemanticErrorKind::DuplicateAlias);
}

TEST(SemaModelChecker, PlainTermMayRepeatEarlierAlias)
{
  // Only aliases are checked against names declared before them.
  EXPECT_TRUE(expect_parse("y ~ factor(a) as x + x"));
}

TEST(SemaModelChecker, OutcomeKeyBeforeLaterLiteralOverflow)
{
  const auto err = expect_failure("[a=t, a=e] | c = 99999999999999999999 ~ x");
  ASSERT_TRUE(err);
  ASSERT_TRUE(err->is_semantic());
  EXPECT_EQ(err->semantic().kind, SemanticErrorKind::DuplicateOutcomeKey);
  EXPECT_EQ(err->code(), error_code::k_duplicate_outcome_key);
}

TEST(SemaModelChecker, LiteralOverflowBeforeLaterAlias)
{
  const auto err = expect_failure("y | c = 99999999999999999999 ~ x + ln(w) as x");
  ASSERT_TRUE(err);
  ASSERT_TRUE(err->is_semantic());
  EXPECT_EQ(err->semantic().kind, SemanticErrorKind::IntegerOutOfRange);
  EXPECT_EQ(err->range(), SourceRange(8, 28));
}

TEST(SemaModelChecker, DistinctAliasesAreValid)
{
  EXPECT_TRUE(expect_parse("y ~ factor(a) as fa + ln(b) as lb + pow(c, 2) as c2 + a * b as ab"));
  // An alias equal to a transformed phenotype is not a collision.
  EXPECT_TRUE(expect_parse("y ~ factor(a) as a"));
}

// ============================================================================
// Interaction size
// ============================================================================

class SemaModelCheckerBuiltTree : public ::testing::Test
{
protected:
  /// `y ~ <interaction of members>` built without the parser.
  Model * make_model(const std::vector<AstNode *> & members)
  {
    auto * y = ctx_.create<PhenotypeRef>(ctx_.intern("y"), SourceRange(0, 1));
    auto * model = ctx_.create<Model>(SourceRange(0, 10));
    model->outcome = ctx_.create<SingleOutcome>(y, y->get_range());

    auto * inter = ctx_.create<InteractionTerm>(SourceRange(4, 10));
    inter->members = ctx_.to_span(members);
    model->predictors = ctx_.to_span(std::vector<Term *>{inter});
    return model;
  }

  PhenotypeRef * phenotype(const char * name)
  {
    return ctx_.create<PhenotypeRef>(ctx_.intern(name), SourceRange(4, 5));
  }

  AstContext ctx_;
};

TEST_F(SemaModelCheckerBuiltTree, SingleMemberInteraction)
{
  const Model * model = make_model({phenotype("a")});

  DiagnosticBag diags;
  ModelChecker checker(&diags);
  const auto err = checker.check(*model);

  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, SemanticErrorKind::InteractionTooSmall);
  EXPECT_EQ(err->range, SourceRange(4, 10));
  EXPECT_TRUE(checker.has_errors());

  ASSERT_EQ(diags.size(), 1u);
  EXPECT_EQ(diags.all()[0].code, "E0202");
}

TEST_F(SemaModelCheckerBuiltTree, TwoMembersPass)
{
  const Model * model = make_model({phenotype("a"), phenotype("b")});

  DiagnosticBag diags;
  ModelChecker checker(&diags);
  EXPECT_FALSE(checker.check(*model).has_value());
  EXPECT_FALSE(checker.has_errors());
  EXPECT_TRUE(diags.empty());
}

TEST_F(SemaModelCheckerBuiltTree, WorksWithoutABag)
{
  const Model * model = make_model({});
  ModelChecker checker;
  const auto err = checker.check(*model);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->detail, "interaction has 0 member(s), at least 2 are required");
}

}  // namespace modelspec
