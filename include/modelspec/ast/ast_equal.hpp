#pragma once

#include "modelspec/ast/ast.hpp"

namespace modelspec
{

/**
 * Deep comparison of two subtrees: node kinds, names, levels, powers,
 * aliases and child order must agree. Source ranges are ignored, so the
 * same model parsed from differently spaced text compares equal.
 */
[[nodiscard]] bool structurally_equal(const AstNode * a, const AstNode * b);

[[nodiscard]] inline bool structurally_equal(const Model & a, const Model & b)
{
  return structurally_equal(&a, &b);
}

}  // namespace modelspec
