#include "modelspec/ast/ast_equal.hpp"

#include "modelspec/basic/casting.hpp"

namespace modelspec
{
namespace
{

template <typename T>
bool spans_equal(gsl::span<T *> a, gsl::span<T *> b)
{
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (!structurally_equal(a[i], b[i])) return false;
  }
  return true;
}

}  // namespace

bool structurally_equal(const AstNode * a, const AstNode * b)
{
  if (a == nullptr || b == nullptr) return a == b;
  if (a->get_kind() != b->get_kind()) return false;

  switch (a->get_kind()) {
    case NodeKind::PhenotypeRef:
    case NodeKind::GenotypeRef:
      return cast<Leaf>(a)->name == cast<Leaf>(b)->name;

    case NodeKind::SingleOutcome:
      return structurally_equal(cast<SingleOutcome>(a)->subject, cast<SingleOutcome>(b)->subject);

    case NodeKind::LabelledOutcomeGroup:
      return spans_equal(cast<LabelledOutcomeGroup>(a)->slots, cast<LabelledOutcomeGroup>(b)->slots);

    case NodeKind::LabelledOutcome: {
      const auto * x = cast<LabelledOutcome>(a);
      const auto * y = cast<LabelledOutcome>(b);
      return x->key == y->key && structurally_equal(x->phenotype, y->phenotype);
    }

    case NodeKind::Condition: {
      const auto * x = cast<Condition>(a);
      const auto * y = cast<Condition>(b);
      return x->level == y->level && structurally_equal(x->subject, y->subject);
    }

    case NodeKind::SnpsTerm:
      return true;

    case NodeKind::InteractionTerm: {
      const auto * x = cast<InteractionTerm>(a);
      const auto * y = cast<InteractionTerm>(b);
      return x->alias == y->alias && spans_equal(x->members, y->members);
    }

    case NodeKind::GenotypeTerm:
      return structurally_equal(cast<GenotypeTerm>(a)->genotype, cast<GenotypeTerm>(b)->genotype);

    case NodeKind::FactorTerm: {
      const auto * x = cast<FactorTerm>(a);
      const auto * y = cast<FactorTerm>(b);
      return x->alias == y->alias && structurally_equal(x->phenotype, y->phenotype);
    }

    case NodeKind::LogTerm: {
      const auto * x = cast<LogTerm>(a);
      const auto * y = cast<LogTerm>(b);
      return x->base == y->base && x->alias == y->alias &&
             structurally_equal(x->phenotype, y->phenotype);
    }

    case NodeKind::PowTerm: {
      const auto * x = cast<PowTerm>(a);
      const auto * y = cast<PowTerm>(b);
      return x->power == y->power && x->alias == y->alias &&
             structurally_equal(x->phenotype, y->phenotype);
    }

    case NodeKind::PlainTerm:
      return structurally_equal(cast<PlainTerm>(a)->phenotype, cast<PlainTerm>(b)->phenotype);

    case NodeKind::Model: {
      const auto * x = cast<Model>(a);
      const auto * y = cast<Model>(b);
      return structurally_equal(x->outcome, y->outcome) &&
             spans_equal(x->conditions, y->conditions) &&
             spans_equal(x->predictors, y->predictors);
    }
  }
  return false;
}

}  // namespace modelspec
