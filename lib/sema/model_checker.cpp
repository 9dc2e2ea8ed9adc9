#include "modelspec/sema/model_checker.hpp"

#include <string>
#include <unordered_map>

namespace modelspec
{

namespace
{

std::optional<SemanticError> declare_alias(
  std::unordered_map<std::string_view, SourceRange> & declared, std::string_view alias,
  SourceRange range)
{
  auto [it, inserted] = declared.emplace(alias, range);
  if (inserted) {
    return std::nullopt;
  }
  SemanticError e;
  e.kind = SemanticErrorKind::DuplicateAlias;
  e.detail = "alias `" + std::string(alias) + "` is already used in this model";
  e.range = range;
  e.related = it->second;
  return e;
}

}  // namespace

std::optional<SemanticError> ModelChecker::check(
  const Model & model, const std::vector<SemanticError> & literal_errors)
{
  std::optional<SemanticError> error;
  if (model.outcome != nullptr) {
    error = check_outcome(*model.outcome);
  }
  // Conditions carry no structural rule beyond the grammar.
  if (!error) {
    error = check_predictors(model);
  }

  // Whichever violation starts first in the text is reported.
  if (!literal_errors.empty()) {
    const SemanticError & literal = literal_errors.front();
    if (!error || literal.range.get_begin() < error->range.get_begin()) {
      error = literal;
    }
  }

  if (error) {
    report(*error);
  }
  return error;
}

std::optional<SemanticError> ModelChecker::check_outcome(const Outcome & outcome) const
{
  const auto * group = dyn_cast<LabelledOutcomeGroup>(&outcome);
  if (group == nullptr) {
    return std::nullopt;
  }

  std::unordered_map<std::string_view, SourceRange> seen;
  for (const auto * slot : group->slots) {
    auto [it, inserted] = seen.emplace(slot->key, slot->keyRange);
    if (!inserted) {
      SemanticError e;
      e.kind = SemanticErrorKind::DuplicateOutcomeKey;
      e.detail = "duplicate outcome key `" + std::string(slot->key) + "`";
      e.range = slot->keyRange;
      e.related = it->second;
      return e;
    }
  }
  return std::nullopt;
}

std::optional<SemanticError> ModelChecker::check_predictors(const Model & model) const
{
  // Plain phenotype names and aliases, first occurrence wins.
  std::unordered_map<std::string_view, SourceRange> declared;

  for (const auto * term : model.predictors) {
    if (const auto * inter = dyn_cast<InteractionTerm>(term)) {
      if (inter->members.size() < 2) {
        SemanticError e;
        e.kind = SemanticErrorKind::InteractionTooSmall;
        e.detail = "interaction has " + std::to_string(inter->members.size()) +
                   " member(s), at least 2 are required";
        e.range = inter->get_range();
        return e;
      }
    }

    if (const auto * plain = dyn_cast<PlainTerm>(term)) {
      // Only aliases are checked against earlier names, so a plain term may
      // repeat an alias declared before it (`factor(a) as x + x`).
      declared.emplace(plain->phenotype->name, plain->get_range());
      continue;
    }

    // Factor members of an interaction declare their aliases first.
    if (const auto * inter = dyn_cast<InteractionTerm>(term)) {
      for (const auto * member : inter->members) {
        const auto * factor = dyn_cast<FactorTerm>(member);
        if (factor == nullptr || !factor->alias) {
          continue;
        }
        if (auto e = declare_alias(declared, *factor->alias, factor->get_range())) {
          return e;
        }
      }
    }

    if (const auto alias = get_alias(term)) {
      if (auto e = declare_alias(declared, *alias, term->get_range())) {
        return e;
      }
    }
  }
  return std::nullopt;
}

void ModelChecker::report(const SemanticError & error)
{
  hasErrors_ = true;
  if (diags_ != nullptr) {
    diags_->add(to_diagnostic(ParseError(error)));
  }
}

}  // namespace modelspec
