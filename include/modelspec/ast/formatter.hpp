// modelspec/ast/formatter.hpp - Canonical text rendering of a Model
#pragma once

#include <string>

#include "modelspec/ast/ast.hpp"

namespace modelspec
{

/**
 * Render a model in canonical form, e.g. `y | c = 1 ~ a + factor(b) as f`.
 *
 * Single spaces around `|`, `~`, `+`, `*`, `=` and after commas. Parsing
 * the result yields a structurally equal model.
 */
[[nodiscard]] std::string format_model(const Model & model);

/// Canonical text of one node (term, outcome, condition or leaf).
[[nodiscard]] std::string format_node(const AstNode * node, bool with_aliases = true);

}  // namespace modelspec
