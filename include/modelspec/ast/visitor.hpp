// modelspec/ast/visitor.hpp - Static (CRTP) visitors over the AST
//
// visit() switches on NodeKind and calls the derived class's
// `visit_<snake_name>`. Hooks the derived class leaves out fall back to
// the node's category (`visit_leaf`, `visit_outcome`, `visit_term`) and
// from there to `visit_node`.
//
#pragma once

#include <type_traits>

#include "modelspec/ast/ast.hpp"
#include "modelspec/ast/ast_enums.hpp"
#include "modelspec/basic/casting.hpp"

namespace modelspec
{

/**
 * @tparam Derived   the visitor itself
 * @tparam Result    what every hook returns; a null node yields Result{}
 * @tparam NodePtrT  `AstNode *`, or `const AstNode *` for read-only walks
 *
 * @code
 *   struct TermCounter : ConstAstVisitor<TermCounter> {
 *     void visit_term(const Term *) { ++count; }
 *     int count = 0;
 *   };
 * @endcode
 */
template <typename Derived, typename Result = void, typename NodePtrT = AstNode *>
class AstVisitor
{
protected:
  /// Pointer to T with the constness of NodePtrT.
  template <typename T>
  using Ptr = detail::CastResult<T, std::remove_pointer_t<NodePtrT>> *;

  Derived & self() { return static_cast<Derived &>(*this); }

public:
  Result visit(NodePtrT node)
  {
    if (node == nullptr) return Result();

#define MODELSPEC_DISPATCH(Class, Kind, Snake) \
  case NodeKind::Kind:                         \
    return self().visit_##Snake(cast<Class>(node));
#define AST_NODE_LEAF MODELSPEC_DISPATCH
#define AST_NODE_OUTCOME MODELSPEC_DISPATCH
#define AST_NODE_TERM MODELSPEC_DISPATCH
#define AST_NODE_SUPPORT MODELSPEC_DISPATCH
#define AST_NODE_TOP MODELSPEC_DISPATCH
    switch (node->kind) {
#include "modelspec/ast/ast_nodes.def"
    }
#undef MODELSPEC_DISPATCH
    return Result();
  }

#define MODELSPEC_FALLBACK(Class, Snake, Hook) \
  Result visit_##Snake(Ptr<Class> node) { return self().Hook(node); }
#define AST_NODE_LEAF(Class, Kind, Snake) MODELSPEC_FALLBACK(Class, Snake, visit_leaf)
#define AST_NODE_OUTCOME(Class, Kind, Snake) MODELSPEC_FALLBACK(Class, Snake, visit_outcome)
#define AST_NODE_TERM(Class, Kind, Snake) MODELSPEC_FALLBACK(Class, Snake, visit_term)
#define AST_NODE_SUPPORT(Class, Kind, Snake) MODELSPEC_FALLBACK(Class, Snake, visit_node)
#define AST_NODE_TOP(Class, Kind, Snake) MODELSPEC_FALLBACK(Class, Snake, visit_node)
#include "modelspec/ast/ast_nodes.def"
#undef MODELSPEC_FALLBACK

  Result visit_leaf(Ptr<Leaf> node) { return self().visit_node(node); }
  Result visit_outcome(Ptr<Outcome> node) { return self().visit_node(node); }
  Result visit_term(Ptr<Term> node) { return self().visit_node(node); }

  Result visit_node(NodePtrT /*node*/) { return Result(); }
};

template <typename Derived, typename Result = void>
using ConstAstVisitor = AstVisitor<Derived, Result, const AstNode *>;

/**
 * Walks the whole tree in source order: outcome, conditions, predictors.
 *
 * A derived hook that does not call back into this class prunes the
 * subtree below it. Any hook returning false ends the walk.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

protected:
  template <typename T>
  using Ptr = typename Base::template Ptr<T>;
  using Base::self;

  template <typename Range>
  bool visit_each(const Range & nodes)
  {
    for (auto * n : nodes) {
      if (!self().visit(n)) return false;
    }
    return true;
  }

public:
  bool visit_model(Ptr<Model> node)
  {
    return self().visit(node->outcome) && visit_each(node->conditions) &&
           visit_each(node->predictors);
  }

  bool visit_single_outcome(Ptr<SingleOutcome> node) { return self().visit(node->subject); }
  bool visit_labelled_outcome_group(Ptr<LabelledOutcomeGroup> node)
  {
    return visit_each(node->slots);
  }
  bool visit_labelled_outcome(Ptr<LabelledOutcome> node) { return self().visit(node->phenotype); }
  bool visit_condition(Ptr<Condition> node) { return self().visit(node->subject); }

  bool visit_interaction_term(Ptr<InteractionTerm> node) { return visit_each(node->members); }
  bool visit_genotype_term(Ptr<GenotypeTerm> node) { return self().visit(node->genotype); }
  bool visit_factor_term(Ptr<FactorTerm> node) { return self().visit(node->phenotype); }
  bool visit_log_term(Ptr<LogTerm> node) { return self().visit(node->phenotype); }
  bool visit_pow_term(Ptr<PowTerm> node) { return self().visit(node->phenotype); }
  bool visit_plain_term(Ptr<PlainTerm> node) { return self().visit(node->phenotype); }

  bool visit_node(NodePtrT /*node*/) { return true; }
};

}  // namespace modelspec
