#include "modelspec/syntax/parser.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <system_error>

namespace modelspec::syntax
{

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_word(std::string_view w) const { return cur().is_word(w); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at(TokenKind::Eof)) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  note_expected(k);
  return false;
}

bool Parser::match_word(std::string_view w)
{
  if (at_word(w)) {
    advance();
    return true;
  }
  note_expected(w);
  return false;
}

bool Parser::expect(TokenKind k, std::string_view rule)
{
  if (match(k)) {
    return true;
  }
  fail(rule);
  return false;
}

void Parser::note_expected(std::string_view spelling)
{
  if (idx_ < furthest_) {
    return;
  }
  if (idx_ > furthest_) {
    furthest_ = idx_;
    expected_.clear();
  }
  if (std::find(expected_.begin(), expected_.end(), spelling) == expected_.end()) {
    expected_.emplace_back(spelling);
  }
}

void Parser::fail(std::string_view rule)
{
  if (error_) {
    return;
  }
  if (idx_ > furthest_) {
    furthest_ = idx_;
    expected_.clear();
  }

  const Token & t = tokens_[std::min(furthest_, tokens_.size() - 1)];
  SyntaxError e;
  e.rule = std::string(rule);
  e.offset = t.begin();
  e.range = t.range;
  e.expected = expected_;
  e.found = (t.kind == TokenKind::Eof) ? std::string(to_string(TokenKind::Eof)) : std::string(t.text);
  error_ = ParseError(std::move(e));
}

void Parser::fail_trailing()
{
  if (error_) {
    return;
  }
  const Token & t = cur();
  SyntaxError e;
  e.rule = "model";
  e.offset = t.begin();
  e.range = t.range;
  if (furthest_ == idx_) {
    e.expected = expected_;
  }
  e.found = std::string(t.text);
  e.trailing = true;
  error_ = ParseError(std::move(e));
}

void Parser::defer(SemanticError e) { literalErrors_.push_back(std::move(e)); }

SourceRange Parser::range_from(size_t start_idx) const
{
  if (idx_ == 0 || start_idx >= idx_) {
    return tokens_[std::min(start_idx, tokens_.size() - 1)].range;
  }
  return join_ranges(tokens_[start_idx].range, tokens_[idx_ - 1].range);
}

// ============================================================================
// Model
// ============================================================================

Model * Parser::parse_model()
{
  auto outcome = parse_outcome();
  if (outcome.is_no_match()) {
    fail("outcome");
  }
  if (!outcome.is_matched()) {
    return nullptr;
  }

  std::vector<Condition *> conditions;
  if (match(TokenKind::Pipe)) {
    if (parse_conditions(conditions) != ParseStatus::Matched) {
      return nullptr;
    }
  }

  if (!expect(TokenKind::Tilde, "model")) {
    return nullptr;
  }

  std::vector<Term *> predictors;
  if (parse_predictors(predictors) != ParseStatus::Matched) {
    return nullptr;
  }

  if (!at(TokenKind::Eof)) {
    note_expected(TokenKind::Eof);
    fail_trailing();
    return nullptr;
  }

  auto * model = ast_.create<Model>(range_from(0));
  model->outcome = outcome.get();
  model->conditions = ast_.to_span(conditions);
  model->predictors = ast_.to_span(predictors);
  return model;
}

// ============================================================================
// Outcome
// ============================================================================

Parsed<Outcome> Parser::parse_outcome()
{
  if (features_.labelled_outcomes) {
    auto group = parse_labelled_group();
    if (group.is_matched()) return Parsed<Outcome>::matched(group.get());
    if (group.is_failed()) return Parsed<Outcome>::failed();
  }

  auto subject = parse_phenotype_or_variant();
  if (!subject.is_matched()) {
    return Parsed<Outcome>::forward(subject);
  }
  return Parsed<Outcome>::matched(
    ast_.create<SingleOutcome>(subject.get(), subject.get()->get_range()));
}

Parsed<LabelledOutcomeGroup> Parser::parse_labelled_group()
{
  const size_t start = idx_;
  if (!match(TokenKind::LBracket)) {
    return Parsed<LabelledOutcomeGroup>::no_match();
  }

  // cut: from here on the outcome is a labelled group
  std::vector<LabelledOutcome *> slots;
  while (true) {
    auto slot = parse_labelled_outcome();
    if (slot.is_no_match()) {
      fail("labelled_outcome_group");
      return Parsed<LabelledOutcomeGroup>::failed();
    }
    if (slot.is_failed()) {
      return Parsed<LabelledOutcomeGroup>::failed();
    }
    slots.push_back(slot.get());
    if (!match(TokenKind::Comma)) {
      break;
    }
  }

  if (!expect(TokenKind::RBracket, "labelled_outcome_group")) {
    return Parsed<LabelledOutcomeGroup>::failed();
  }

  auto * group = ast_.create<LabelledOutcomeGroup>(range_from(start));
  group->slots = ast_.to_span(slots);
  return Parsed<LabelledOutcomeGroup>::matched(group);
}

Parsed<LabelledOutcome> Parser::parse_labelled_outcome()
{
  const size_t start = idx_;
  auto key = parse_name();
  if (!key.is_matched()) {
    return Parsed<LabelledOutcome>::forward(key);
  }
  if (!match(TokenKind::Eq)) {
    idx_ = start;
    return Parsed<LabelledOutcome>::no_match();
  }

  auto phenotype = parse_phenotype();
  if (phenotype.is_no_match()) {
    fail("labelled_outcome");
  }
  if (!phenotype.is_matched()) {
    return Parsed<LabelledOutcome>::failed();
  }

  return Parsed<LabelledOutcome>::matched(ast_.create<LabelledOutcome>(
    ast_.intern(key.get()->text), key.get()->range, phenotype.get(), range_from(start)));
}

// ============================================================================
// Leaves
// ============================================================================

Parsed<Leaf> Parser::parse_phenotype_or_variant()
{
  auto genotype = parse_genotype();
  if (genotype.is_matched()) return Parsed<Leaf>::matched(genotype.get());
  if (genotype.is_failed()) return Parsed<Leaf>::failed();

  auto phenotype = parse_phenotype();
  if (phenotype.is_matched()) return Parsed<Leaf>::matched(phenotype.get());
  return Parsed<Leaf>::forward(phenotype);
}

Parsed<GenotypeRef> Parser::parse_genotype()
{
  const size_t start = idx_;
  if (!match(TokenKind::GenotypeOpen)) {
    return Parsed<GenotypeRef>::no_match();
  }

  // cut
  auto variant = parse_name();
  if (!variant.is_matched()) {
    fail("genotype");
    return Parsed<GenotypeRef>::failed();
  }
  if (!expect(TokenKind::RParen, "genotype")) {
    return Parsed<GenotypeRef>::failed();
  }

  return Parsed<GenotypeRef>::matched(
    ast_.create<GenotypeRef>(ast_.intern(variant.get()->text), range_from(start)));
}

Parsed<PhenotypeRef> Parser::parse_phenotype()
{
  auto name = parse_name();
  if (!name.is_matched()) {
    return Parsed<PhenotypeRef>::forward(name);
  }
  return Parsed<PhenotypeRef>::matched(
    ast_.create<PhenotypeRef>(ast_.intern(name.get()->text), name.get()->range));
}

Parsed<const Token> Parser::parse_name()
{
  if (cur().is_name()) {
    return Parsed<const Token>::matched(&advance());
  }
  note_expected("name");
  return Parsed<const Token>::no_match();
}

std::optional<int64_t> Parser::parse_integer(std::string_view rule)
{
  if (!at(TokenKind::IntLiteral)) {
    note_expected(TokenKind::IntLiteral);
    fail(rule);
    return std::nullopt;
  }

  const Token & t = advance();
  int64_t value = 0;
  const auto [ptr, ec] = std::from_chars(t.text.data(), t.text.data() + t.text.size(), value);
  if (ec == std::errc::result_out_of_range) {
    SemanticError e;
    e.kind = SemanticErrorKind::IntegerOutOfRange;
    e.detail = "integer `" + std::string(t.text) + "` is out of range";
    e.range = t.range;
    // Parsing continues; ModelChecker orders this against the other checks.
    defer(std::move(e));
    return int64_t{0};
  }
  if (ec != std::errc() || ptr != t.text.data() + t.text.size()) {
    fail(rule);
    return std::nullopt;
  }
  return value;
}

// ============================================================================
// Conditions
// ============================================================================

ParseStatus Parser::parse_conditions(std::vector<Condition *> & out)
{
  // Entered past the `|` cut: an empty or malformed list is an error.
  while (true) {
    auto condition = parse_condition();
    if (condition.is_no_match()) {
      fail("condition");
      return ParseStatus::Failed;
    }
    if (condition.is_failed()) {
      return ParseStatus::Failed;
    }
    out.push_back(condition.get());
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  return ParseStatus::Matched;
}

Parsed<Condition> Parser::parse_condition()
{
  const size_t start = idx_;
  auto subject = parse_phenotype_or_variant();
  if (!subject.is_matched()) {
    return Parsed<Condition>::forward(subject);
  }

  std::optional<int64_t> level;
  if (match(TokenKind::Eq)) {
    level = parse_integer("condition");
    if (!level) {
      return Parsed<Condition>::failed();
    }
  }

  return Parsed<Condition>::matched(
    ast_.create<Condition>(subject.get(), level, range_from(start)));
}

// ============================================================================
// Predictors
// ============================================================================

ParseStatus Parser::parse_predictors(std::vector<Term *> & out)
{
  while (true) {
    auto term = parse_expression();
    if (term.is_no_match()) {
      fail("expression");
      return ParseStatus::Failed;
    }
    if (term.is_failed()) {
      return ParseStatus::Failed;
    }
    out.push_back(term.get());
    if (!match(TokenKind::Plus)) {
      break;
    }
  }
  return ParseStatus::Matched;
}

Parsed<Term> Parser::parse_expression()
{
  if (features_.snps_token) {
    auto snps = parse_snps();
    if (!snps.is_no_match()) return snps;
  }

  // Must precede the single-leaf alternatives, which would otherwise claim
  // the first member of an interaction.
  if (auto t = parse_interaction(); !t.is_no_match()) return t;
  if (auto t = parse_genotype_term(); !t.is_no_match()) return t;
  if (auto t = parse_factor(); !t.is_no_match()) return t;

  if (features_.log_terms) {
    if (auto t = parse_log(TokenKind::LnOpen, LogBase::Ln); !t.is_no_match()) return t;
    if (auto t = parse_log(TokenKind::Log10Open, LogBase::Log10); !t.is_no_match()) return t;
  }
  if (features_.pow_terms) {
    if (auto t = parse_pow(); !t.is_no_match()) return t;
  }

  return parse_plain();
}

Parsed<Term> Parser::parse_snps()
{
  const size_t start = idx_;
  if (!match_word("SNPs")) {
    return Parsed<Term>::no_match();
  }
  return Parsed<Term>::matched(ast_.create<SnpsTerm>(range_from(start)));
}

Parsed<Term> Parser::parse_interaction()
{
  // Decided by the pure recognizer; no node is built unless it succeeds.
  if (!recognizer_.interaction_ahead(idx_)) {
    return Parsed<Term>::no_match();
  }

  const size_t start = idx_;
  std::vector<AstNode *> members;

  auto first = parse_interaction_member();
  if (!first.is_matched()) {
    return Parsed<Term>::forward(first);
  }
  members.push_back(first.get());

  while (match(TokenKind::Star)) {
    // cut
    auto member = parse_interaction_member();
    if (member.is_no_match()) {
      fail("interaction");
      return Parsed<Term>::failed();
    }
    if (member.is_failed()) {
      return Parsed<Term>::failed();
    }
    members.push_back(member.get());
  }

  // An `as` right after a factor member was taken by that member.
  std::optional<std::string_view> alias;
  if (!parse_alias(alias)) {
    return Parsed<Term>::failed();
  }

  auto * term = ast_.create<InteractionTerm>(range_from(start));
  term->members = ast_.to_span(members);
  term->alias = alias;
  return Parsed<Term>::matched(term);
}

Parsed<AstNode> Parser::parse_interaction_member()
{
  auto genotype = parse_genotype();
  if (genotype.is_matched()) return Parsed<AstNode>::matched(genotype.get());
  if (genotype.is_failed()) return Parsed<AstNode>::failed();

  // A factor member keeps its own `as name`, so `a * factor(b) as f * c`
  // is one interaction of three members.
  if (features_.factor_interactions) {
    auto factor = parse_factor();
    if (factor.is_matched()) return Parsed<AstNode>::matched(factor.get());
    if (factor.is_failed()) return Parsed<AstNode>::failed();
  }

  auto phenotype = parse_phenotype();
  if (phenotype.is_matched()) return Parsed<AstNode>::matched(phenotype.get());
  return Parsed<AstNode>::forward(phenotype);
}

Parsed<Term> Parser::parse_genotype_term()
{
  auto genotype = parse_genotype();
  if (!genotype.is_matched()) {
    return Parsed<Term>::forward(genotype);
  }
  return Parsed<Term>::matched(
    ast_.create<GenotypeTerm>(genotype.get(), genotype.get()->get_range()));
}

Parsed<Term> Parser::parse_factor()
{
  const size_t start = idx_;
  if (!match(TokenKind::FactorOpen)) {
    return Parsed<Term>::no_match();
  }

  auto phenotype = parse_argument("factor");
  if (!phenotype.is_matched() || !expect(TokenKind::RParen, "factor")) {
    return Parsed<Term>::failed();
  }

  std::optional<std::string_view> alias;
  if (!parse_alias(alias)) {
    return Parsed<Term>::failed();
  }

  return Parsed<Term>::matched(
    ast_.create<FactorTerm>(phenotype.get(), alias, range_from(start)));
}

Parsed<Term> Parser::parse_log(TokenKind opener, LogBase base)
{
  const size_t start = idx_;
  if (!match(opener)) {
    return Parsed<Term>::no_match();
  }

  const std::string_view rule = to_string(base);
  auto phenotype = parse_argument(rule);
  if (!phenotype.is_matched() || !expect(TokenKind::RParen, rule)) {
    return Parsed<Term>::failed();
  }

  std::optional<std::string_view> alias;
  if (!parse_alias(alias)) {
    return Parsed<Term>::failed();
  }

  return Parsed<Term>::matched(
    ast_.create<LogTerm>(base, phenotype.get(), alias, range_from(start)));
}

Parsed<Term> Parser::parse_pow()
{
  const size_t start = idx_;
  if (!match(TokenKind::PowOpen)) {
    return Parsed<Term>::no_match();
  }

  auto phenotype = parse_argument("pow");
  if (!phenotype.is_matched() || !expect(TokenKind::Comma, "pow")) {
    return Parsed<Term>::failed();
  }
  const auto power = parse_integer("pow");
  if (!power || !expect(TokenKind::RParen, "pow")) {
    return Parsed<Term>::failed();
  }

  std::optional<std::string_view> alias;
  if (!parse_alias(alias)) {
    return Parsed<Term>::failed();
  }

  return Parsed<Term>::matched(
    ast_.create<PowTerm>(phenotype.get(), *power, alias, range_from(start)));
}

Parsed<Term> Parser::parse_plain()
{
  auto phenotype = parse_phenotype();
  if (!phenotype.is_matched()) {
    return Parsed<Term>::forward(phenotype);
  }
  return Parsed<Term>::matched(
    ast_.create<PlainTerm>(phenotype.get(), phenotype.get()->get_range()));
}

bool Parser::parse_alias(std::optional<std::string_view> & out)
{
  if (!match_word("as")) {
    return true;
  }
  // cut
  auto name = parse_name();
  if (!name.is_matched()) {
    fail("alias");
    return false;
  }
  out = ast_.intern(name.get()->text);
  return true;
}

Parsed<PhenotypeRef> Parser::parse_argument(std::string_view rule)
{
  auto phenotype = parse_phenotype();
  if (phenotype.is_no_match()) {
    fail(rule);
    return Parsed<PhenotypeRef>::failed();
  }
  return phenotype;
}

}  // namespace modelspec::syntax
