// modelspec/ast/ast_dumper.hpp - Indented tree rendering for `msc dump`
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "modelspec/ast/ast.hpp"
#include "modelspec/ast/visitor.hpp"

namespace modelspec
{

/**
 * Writes one line per node, children below their parent:
 *
 * @code
 *   Model
 *   |-SingleOutcome
 *   | `-PhenotypeRef name='y'
 *   |-Condition level='0'
 *   | `-PhenotypeRef name='diabetes'
 *   `-FactorTerm alias='z'
 *     `-PhenotypeRef name='x'
 * @endcode
 *
 * A Model is printed as the unmarked root; any other node dumped on its own
 * starts with a "`-" marker.
 */
class AstDumper : public ConstAstVisitor<AstDumper>
{
public:
  explicit AstDumper(std::ostream & os) : os_(os) {}

  void dump(const AstNode * node) { visit(node); }

  void visit_model(const Model * node);
  void visit_phenotype_ref(const PhenotypeRef * node);
  void visit_genotype_ref(const GenotypeRef * node);
  void visit_single_outcome(const SingleOutcome * node);
  void visit_labelled_outcome_group(const LabelledOutcomeGroup * node);
  void visit_labelled_outcome(const LabelledOutcome * node);
  void visit_condition(const Condition * node);
  void visit_snps_term(const SnpsTerm * node);
  void visit_interaction_term(const InteractionTerm * node);
  void visit_genotype_term(const GenotypeTerm * node);
  void visit_factor_term(const FactorTerm * node);
  void visit_log_term(const LogTerm * node);
  void visit_pow_term(const PowTerm * node);
  void visit_plain_term(const PlainTerm * node);

private:
  void line(std::string_view text, const std::vector<const AstNode *> & children = {});
  void nest(const std::vector<const AstNode *> & children, std::string_view step);

  std::ostream & os_;
  std::string indent_;
  bool last_ = true;
};

void dump(const AstNode * node, std::ostream & os);
[[nodiscard]] std::string dump_to_string(const AstNode * node);

}  // namespace modelspec
