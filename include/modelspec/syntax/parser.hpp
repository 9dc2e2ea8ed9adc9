#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "modelspec/ast/ast.hpp"
#include "modelspec/ast/ast_context.hpp"
#include "modelspec/basic/parse_error.hpp"
#include "modelspec/syntax/dialect.hpp"
#include "modelspec/syntax/recognizer.hpp"
#include "modelspec/syntax/token.hpp"

namespace modelspec::syntax
{

enum class ParseStatus : uint8_t {
  Matched,
  NoMatch,  // nothing consumed; the caller may try another alternative
  Failed,   // committed failure; the error is already recorded
};

/**
 * Tri-state result of one grammar rule.
 */
template <typename T>
class Parsed
{
public:
  static Parsed matched(T * value) { return Parsed(ParseStatus::Matched, value); }
  static Parsed no_match() { return Parsed(ParseStatus::NoMatch, nullptr); }
  static Parsed failed() { return Parsed(ParseStatus::Failed, nullptr); }

  /// Re-type an unmatched result of a sub-rule.
  template <typename U>
  static Parsed forward(const Parsed<U> & other)
  {
    return Parsed(other.status(), nullptr);
  }

  [[nodiscard]] ParseStatus status() const noexcept { return status_; }
  [[nodiscard]] bool is_matched() const noexcept { return status_ == ParseStatus::Matched; }
  [[nodiscard]] bool is_no_match() const noexcept { return status_ == ParseStatus::NoMatch; }
  [[nodiscard]] bool is_failed() const noexcept { return status_ == ParseStatus::Failed; }

  [[nodiscard]] T * get() const noexcept { return value_; }

private:
  Parsed(ParseStatus s, T * v) : status_(s), value_(v) {}

  ParseStatus status_;
  T * value_;
};

/**
 * Recursive-descent builder for one model specification.
 *
 * Alternatives are tried in grammar order. A rule that fails before its
 * cut returns NoMatch with the cursor restored; past the cut it records a
 * ParseError and returns Failed, which every caller propagates unchanged.
 * Nodes are only created once all sub-results of a rule have matched.
 */
class Parser
{
public:
  Parser(AstContext & ast, std::vector<Token> tokens, GrammarFeatures features = {})
  : ast_(ast), tokens_(std::move(tokens)), features_(features), recognizer_(tokens_, features_)
  {
  }

  Parser(const Parser &) = delete;
  Parser & operator=(const Parser &) = delete;

  /// Parse the whole token stream. Returns nullptr when error() is set.
  [[nodiscard]] Model * parse_model();

  [[nodiscard]] const std::optional<ParseError> & error() const noexcept { return error_; }

  /// Out-of-range integer literals, in source order. They do not stop the
  /// parse; the node keeps 0 in place of the value.
  [[nodiscard]] const std::vector<SemanticError> & literal_errors() const noexcept
  {
    return literalErrors_;
  }

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_word(std::string_view w) const;
  const Token & advance();

  /// Consume `k` if present; otherwise note it as expected here.
  bool match(TokenKind k);
  bool match_word(std::string_view w);

  void note_expected(std::string_view spelling);
  void note_expected(TokenKind k) { note_expected(to_string(k)); }

  /// Record a committed SyntaxError at the furthest failure point.
  void fail(std::string_view rule);
  void fail_trailing();
  void defer(SemanticError e);

  // Outcome
  [[nodiscard]] Parsed<Outcome> parse_outcome();
  [[nodiscard]] Parsed<LabelledOutcomeGroup> parse_labelled_group();
  [[nodiscard]] Parsed<LabelledOutcome> parse_labelled_outcome();

  // Leaves
  [[nodiscard]] Parsed<Leaf> parse_phenotype_or_variant();
  [[nodiscard]] Parsed<GenotypeRef> parse_genotype();
  [[nodiscard]] Parsed<PhenotypeRef> parse_phenotype();
  [[nodiscard]] Parsed<const Token> parse_name();
  [[nodiscard]] std::optional<int64_t> parse_integer(std::string_view rule);

  // Conditions
  [[nodiscard]] ParseStatus parse_conditions(std::vector<Condition *> & out);
  [[nodiscard]] Parsed<Condition> parse_condition();

  // Predictors
  [[nodiscard]] ParseStatus parse_predictors(std::vector<Term *> & out);
  [[nodiscard]] Parsed<Term> parse_expression();
  [[nodiscard]] Parsed<Term> parse_snps();
  [[nodiscard]] Parsed<Term> parse_interaction();
  [[nodiscard]] Parsed<AstNode> parse_interaction_member();
  [[nodiscard]] Parsed<Term> parse_genotype_term();
  [[nodiscard]] Parsed<Term> parse_factor();
  [[nodiscard]] Parsed<Term> parse_log(TokenKind opener, LogBase base);
  [[nodiscard]] Parsed<Term> parse_pow();
  [[nodiscard]] Parsed<Term> parse_plain();

  /// Optional `as name`. False only for `as` without a name.
  [[nodiscard]] bool parse_alias(std::optional<std::string_view> & out);

  /// Required phenotype argument of a call form.
  [[nodiscard]] Parsed<PhenotypeRef> parse_argument(std::string_view rule);

  /// Required token past a cut; records the failure under `rule`.
  [[nodiscard]] bool expect(TokenKind k, std::string_view rule);

  [[nodiscard]] SourceRange range_from(size_t start_idx) const;

  AstContext & ast_;
  std::vector<Token> tokens_;
  GrammarFeatures features_;
  Recognizer recognizer_;
  size_t idx_ = 0;

  size_t furthest_ = 0;
  std::vector<std::string> expected_;
  std::optional<ParseError> error_;
  std::vector<SemanticError> literalErrors_;
};

}  // namespace modelspec::syntax
