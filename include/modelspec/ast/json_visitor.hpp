// modelspec/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Downstream tools consume parsed models as nlohmann::json documents. Every
// node becomes an object with a "type" (the node class name), a "range"
// (byte offsets) and its payload fields.
//
#pragma once

#include <nlohmann/json.hpp>

#include "modelspec/ast/ast.hpp"

namespace modelspec
{

/**
 * Serialize any AST node (and its subtree) to JSON.
 *
 * @param node The node to serialize; nullptr yields JSON null
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/**
 * Serialize a whole model.
 */
[[nodiscard]] nlohmann::json to_json(const Model & model);

}  // namespace modelspec
