// modelspec/sema/model_checker.hpp - Structural validation of a parsed Model
//
// Runs once after a successful parse and stops at the first violation, in
// left-to-right depth-first order: outcome keys, then conditions, then
// predictors. Out-of-range literals found by the parser take part in the
// same ordering.
//
#pragma once

#include <optional>
#include <vector>

#include "modelspec/ast/ast.hpp"
#include "modelspec/basic/diagnostic.hpp"
#include "modelspec/basic/parse_error.hpp"

namespace modelspec
{

/**
 * Checks the rules the grammar cannot express:
 *  - labelled outcome keys are unique
 *  - interactions have at least two members
 *  - an alias does not reuse a plain predictor name or an earlier alias
 */
class ModelChecker
{
public:
  explicit ModelChecker(DiagnosticBag * diags = nullptr) : diags_(diags) {}

  /// First violation found, or std::nullopt for a valid model.
  /// `literal_errors` are the parser's out-of-range literals, in source order.
  [[nodiscard]] std::optional<SemanticError> check(
    const Model & model, const std::vector<SemanticError> & literal_errors = {});

  [[nodiscard]] bool has_errors() const noexcept { return hasErrors_; }

private:
  [[nodiscard]] std::optional<SemanticError> check_outcome(const Outcome & outcome) const;
  [[nodiscard]] std::optional<SemanticError> check_predictors(const Model & model) const;

  void report(const SemanticError & error);

  DiagnosticBag * diags_ = nullptr;
  bool hasErrors_ = false;
};

}  // namespace modelspec
