// modelspec/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds (generated from ast_nodes.def) and the small enums carried by
// individual nodes.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace modelspec
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category so category checks are range comparisons.
 */
enum class NodeKind : uint8_t {
// === Leaves ===
#define AST_NODE_LEAF(Class, Kind, Snake) Kind,
#include "modelspec/ast/ast_nodes.def"

// === Outcomes ===
#define AST_NODE_OUTCOME(Class, Kind, Snake) Kind,
#include "modelspec/ast/ast_nodes.def"

// === Predictor terms ===
#define AST_NODE_TERM(Class, Kind, Snake) Kind,
#include "modelspec/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "modelspec/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "modelspec/ast/ast_nodes.def"
};

[[nodiscard]] constexpr bool is_leaf_kind(NodeKind k) noexcept
{
  return k >= NodeKind::PhenotypeRef && k <= NodeKind::GenotypeRef;
}

[[nodiscard]] constexpr bool is_outcome_kind(NodeKind k) noexcept
{
  return k >= NodeKind::SingleOutcome && k <= NodeKind::LabelledOutcomeGroup;
}

[[nodiscard]] constexpr bool is_term_kind(NodeKind k) noexcept
{
  return k >= NodeKind::SnpsTerm && k <= NodeKind::PlainTerm;
}

/// Class name of a node kind, as used by the dumper and the JSON output.
[[nodiscard]] constexpr std::string_view to_string(NodeKind k) noexcept
{
  switch (k) {
#define AST_NODE_LEAF(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_OUTCOME(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Class;
#define AST_NODE_TERM(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Class;
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Class;
#include "modelspec/ast/ast_nodes.def"
  }
  return "Unknown";
}

// ============================================================================
// LogBase - logarithm used by a LogTerm
// ============================================================================

enum class LogBase : uint8_t {
  Ln,     ///< ln(x)
  Log10,  ///< log10(x)
};

[[nodiscard]] constexpr std::string_view to_string(LogBase b) noexcept
{
  switch (b) {
    case LogBase::Ln:
      return "ln";
    case LogBase::Log10:
      return "log10";
  }
  return "ln";
}

}  // namespace modelspec
