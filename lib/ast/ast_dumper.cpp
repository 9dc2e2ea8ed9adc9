#include "modelspec/ast/ast_dumper.hpp"

#include <fmt/format.h>

#include <optional>
#include <ostream>
#include <sstream>

#include "modelspec/ast/ast_enums.hpp"

namespace modelspec
{

namespace
{

std::string alias_suffix(const std::optional<std::string_view> & alias)
{
  return alias ? fmt::format(" alias='{}'", *alias) : std::string();
}

template <typename Span>
std::vector<const AstNode *> nodes_of(const Span & span)
{
  return std::vector<const AstNode *>(span.begin(), span.end());
}

}  // namespace

void AstDumper::line(std::string_view text, const std::vector<const AstNode *> & children)
{
  os_ << indent_ << (last_ ? "`-" : "|-") << text << '\n';
  nest(children, last_ ? "  " : "| ");
}

void AstDumper::nest(const std::vector<const AstNode *> & children, std::string_view step)
{
  const std::string outer = indent_;
  indent_ += step;
  for (size_t i = 0; i < children.size(); ++i) {
    last_ = i + 1 == children.size();
    visit(children[i]);
  }
  indent_ = outer;
}

void AstDumper::visit_model(const Model * node)
{
  os_ << "Model\n";
  std::vector<const AstNode *> children{node->outcome};
  children.insert(children.end(), node->conditions.begin(), node->conditions.end());
  children.insert(children.end(), node->predictors.begin(), node->predictors.end());
  nest(children, "");
}

void AstDumper::visit_phenotype_ref(const PhenotypeRef * node)
{
  line(fmt::format("PhenotypeRef name='{}'", node->name));
}

void AstDumper::visit_genotype_ref(const GenotypeRef * node)
{
  line(fmt::format("GenotypeRef variant='{}'", node->variant()));
}

void AstDumper::visit_single_outcome(const SingleOutcome * node)
{
  line("SingleOutcome", {node->subject});
}

void AstDumper::visit_labelled_outcome_group(const LabelledOutcomeGroup * node)
{
  line("LabelledOutcomeGroup", nodes_of(node->slots));
}

void AstDumper::visit_labelled_outcome(const LabelledOutcome * node)
{
  line(fmt::format("LabelledOutcome key='{}'", node->key), {node->phenotype});
}

void AstDumper::visit_condition(const Condition * node)
{
  const std::string level = node->level ? fmt::format(" level='{}'", *node->level) : std::string();
  line("Condition" + level, {node->subject});
}

void AstDumper::visit_snps_term(const SnpsTerm * /*node*/) { line("SnpsTerm"); }

void AstDumper::visit_interaction_term(const InteractionTerm * node)
{
  line("InteractionTerm" + alias_suffix(node->alias), nodes_of(node->members));
}

void AstDumper::visit_genotype_term(const GenotypeTerm * node)
{
  line("GenotypeTerm", {node->genotype});
}

void AstDumper::visit_factor_term(const FactorTerm * node)
{
  line("FactorTerm" + alias_suffix(node->alias), {node->phenotype});
}

void AstDumper::visit_log_term(const LogTerm * node)
{
  line(fmt::format("LogTerm {}{}", to_string(node->base), alias_suffix(node->alias)), {node->phenotype});
}

void AstDumper::visit_pow_term(const PowTerm * node)
{
  line(
    fmt::format("PowTerm power='{}'{}", node->power, alias_suffix(node->alias)), {node->phenotype});
}

void AstDumper::visit_plain_term(const PlainTerm * node) { line("PlainTerm", {node->phenotype}); }

void dump(const AstNode * node, std::ostream & os) { AstDumper(os).dump(node); }

std::string dump_to_string(const AstNode * node)
{
  std::ostringstream os;
  dump(node, os);
  return os.str();
}

}  // namespace modelspec
