// modelspec/ast/ast.hpp - AST node class definitions for model specifications
//
// Node classes follow the LLVM/Clang style: every node carries a NodeKind and
// classof() enables isa<>/cast<>/dyn_cast<>. Nodes are allocated in an
// AstContext arena and are never mutated once the parser has built them.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string_view>

#include "modelspec/ast/ast_enums.hpp"
#include "modelspec/basic/casting.hpp"
#include "modelspec/basic/source_manager.hpp"

namespace modelspec
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has a NodeKind for RTTI and the SourceRange of the text it
 * was built from. Nodes are non-copyable and owned by an AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base class that implements classof() for a concrete node.
 *
 * @tparam Derived The concrete node class
 * @tparam Base The category base class
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

/**
 * A phenotype or a genetic variant reference: the only things that may
 * appear as a condition subject or as an interaction member.
 */
class Leaf : public AstNode
{
public:
  /// Phenotype name or variant id
  std::string_view name;

  static bool classof(const AstNode * node) { return is_leaf_kind(node->kind); }

protected:
  explicit Leaf(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Base class for the dependent-variable side of a model.
class Outcome : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_outcome_kind(node->kind); }

protected:
  explicit Outcome(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Base class for one additive term of the predictor list.
class Term : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_term_kind(node->kind); }

protected:
  explicit Term(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Leaves
// ============================================================================

/// An observed variable, e.g. `bmi`.
class PhenotypeRef : public NodeBase<PhenotypeRef, Leaf, NodeKind::PhenotypeRef>
{
public:
  explicit PhenotypeRef(std::string_view n, SourceRange r = {}) : NodeBase(r) { name = n; }
};

/// A genetic variant covariate, `g(rs12345)`. `name` is the variant id.
class GenotypeRef : public NodeBase<GenotypeRef, Leaf, NodeKind::GenotypeRef>
{
public:
  explicit GenotypeRef(std::string_view variant, SourceRange r = {}) : NodeBase(r)
  {
    name = variant;
  }

  [[nodiscard]] std::string_view variant() const noexcept { return name; }
};

// ============================================================================
// Outcomes
// ============================================================================

/// A single outcome: `y ~ ...` or `g(rs1) ~ ...`.
class SingleOutcome : public NodeBase<SingleOutcome, Outcome, NodeKind::SingleOutcome>
{
public:
  Leaf * subject;

  explicit SingleOutcome(Leaf * s, SourceRange r = {}) : NodeBase(r), subject(s) {}
};

/// One tagged slot of a multi-outcome model, e.g. `tte=t`.
class LabelledOutcome : public NodeBase<LabelledOutcome, AstNode, NodeKind::LabelledOutcome>
{
public:
  std::string_view key;
  SourceRange keyRange;
  PhenotypeRef * phenotype;

  LabelledOutcome(std::string_view k, SourceRange kr, PhenotypeRef * p, SourceRange r = {})
  : NodeBase(r), key(k), keyRange(kr), phenotype(p)
  {
  }
};

/// `[tte=t, event=e]` - the outcome of survival and competing-risk models.
class LabelledOutcomeGroup
: public NodeBase<LabelledOutcomeGroup, Outcome, NodeKind::LabelledOutcomeGroup>
{
public:
  gsl::span<LabelledOutcome *> slots;

  explicit LabelledOutcomeGroup(SourceRange r = {}) : NodeBase(r) {}

  /// Phenotype bound to `key`, or nullptr.
  [[nodiscard]] const PhenotypeRef * find(std::string_view key) const noexcept
  {
    for (const auto * slot : slots) {
      if (slot->key == key) return slot->phenotype;
    }
    return nullptr;
  }
};

// ============================================================================
// Conditions
// ============================================================================

/**
 * Stratification or subgroup constraint.
 *
 * Without a level the analysis is stratified by the distinct values of
 * `subject`; with a level the sample is restricted to `subject == level`.
 */
class Condition : public NodeBase<Condition, AstNode, NodeKind::Condition>
{
public:
  Leaf * subject;
  std::optional<int64_t> level;

  Condition(Leaf * s, std::optional<int64_t> lvl, SourceRange r = {})
  : NodeBase(r), subject(s), level(lvl)
  {
  }
};

// ============================================================================
// Predictor terms
// ============================================================================

/// The `SNPs` placeholder: the model is fitted once per variant (GWAS).
class SnpsTerm : public NodeBase<SnpsTerm, Term, NodeKind::SnpsTerm>
{
public:
  explicit SnpsTerm(SourceRange r = {}) : NodeBase(r) {}
};

/// `factor(x)` with an optional `as name`.
class FactorTerm : public NodeBase<FactorTerm, Term, NodeKind::FactorTerm>
{
public:
  PhenotypeRef * phenotype;
  std::optional<std::string_view> alias;

  FactorTerm(PhenotypeRef * p, std::optional<std::string_view> a, SourceRange r = {})
  : NodeBase(r), phenotype(p), alias(a)
  {
  }
};

/**
 * `a * g(rs1) * factor(c)` with an optional `as name`.
 *
 * Each member is a PhenotypeRef, a GenotypeRef or a FactorTerm; a factor
 * member may carry its own alias (`a * factor(b) as f * c`).
 * The parser always produces at least two members; ModelChecker rejects
 * hand-built trees with fewer.
 */
class InteractionTerm : public NodeBase<InteractionTerm, Term, NodeKind::InteractionTerm>
{
public:
  gsl::span<AstNode *> members;
  std::optional<std::string_view> alias;

  explicit InteractionTerm(SourceRange r = {}) : NodeBase(r) {}
};

/// A variant used directly as a covariate, `g(rs1)`.
class GenotypeTerm : public NodeBase<GenotypeTerm, Term, NodeKind::GenotypeTerm>
{
public:
  GenotypeRef * genotype;

  explicit GenotypeTerm(GenotypeRef * g, SourceRange r = {}) : NodeBase(r), genotype(g) {}
};

/// `ln(x)` / `log10(x)` with an optional `as name`.
class LogTerm : public NodeBase<LogTerm, Term, NodeKind::LogTerm>
{
public:
  LogBase base;
  PhenotypeRef * phenotype;
  std::optional<std::string_view> alias;

  LogTerm(LogBase b, PhenotypeRef * p, std::optional<std::string_view> a, SourceRange r = {})
  : NodeBase(r), base(b), phenotype(p), alias(a)
  {
  }
};

/// `pow(x, 2)` with an optional `as name`.
class PowTerm : public NodeBase<PowTerm, Term, NodeKind::PowTerm>
{
public:
  PhenotypeRef * phenotype;
  int64_t power;
  std::optional<std::string_view> alias;

  PowTerm(PhenotypeRef * p, int64_t pw, std::optional<std::string_view> a, SourceRange r = {})
  : NodeBase(r), phenotype(p), power(pw), alias(a)
  {
  }
};

/// A bare phenotype covariate.
class PlainTerm : public NodeBase<PlainTerm, Term, NodeKind::PlainTerm>
{
public:
  PhenotypeRef * phenotype;

  explicit PlainTerm(PhenotypeRef * p, SourceRange r = {}) : NodeBase(r), phenotype(p) {}
};

/// Alias of an aliasable term; std::nullopt for terms that never carry one.
[[nodiscard]] inline std::optional<std::string_view> get_alias(const Term * term) noexcept
{
  if (const auto * f = dyn_cast<FactorTerm>(term)) return f->alias;
  if (const auto * i = dyn_cast<InteractionTerm>(term)) return i->alias;
  if (const auto * l = dyn_cast<LogTerm>(term)) return l->alias;
  if (const auto * p = dyn_cast<PowTerm>(term)) return p->alias;
  return std::nullopt;
}

// ============================================================================
// Root
// ============================================================================

/**
 * Root of a parsed specification: `outcome [| conditions] ~ predictors`.
 *
 * `conditions` is empty when the specification has no `|` clause (the
 * grammar never produces an empty clause). `predictors` is never empty.
 */
class Model : public NodeBase<Model, AstNode, NodeKind::Model>
{
public:
  Outcome * outcome = nullptr;
  gsl::span<Condition *> conditions;
  gsl::span<Term *> predictors;

  explicit Model(SourceRange r = {}) : NodeBase(r) {}

  [[nodiscard]] bool has_conditions() const noexcept { return !conditions.empty(); }
};

}  // namespace modelspec
