#include "modelspec/ast/formatter.hpp"

#include <fmt/core.h>

#include <optional>
#include <string_view>

#include "modelspec/ast/visitor.hpp"

namespace modelspec
{
namespace
{

class Formatter : public ConstAstVisitor<Formatter, std::string>
{
public:
  explicit Formatter(bool with_aliases = true) : withAliases_(with_aliases) {}

  template <typename T>
  std::string join(gsl::span<T *> nodes, std::string_view sep)
  {
    std::string out;
    for (size_t i = 0; i < nodes.size(); ++i) {
      if (i > 0) out += sep;
      out += visit(nodes[i]);
    }
    return out;
  }

  std::string visit_model(const Model * node)
  {
    std::string out = visit(node->outcome);
    if (node->has_conditions()) {
      out += fmt::format(" | {}", join(node->conditions, ", "));
    }
    out += fmt::format(" ~ {}", join(node->predictors, " + "));
    return out;
  }

  std::string visit_phenotype_ref(const PhenotypeRef * node) { return std::string(node->name); }
  std::string visit_genotype_ref(const GenotypeRef * node)
  {
    return fmt::format("g({})", node->variant());
  }

  std::string visit_single_outcome(const SingleOutcome * node) { return visit(node->subject); }
  std::string visit_labelled_outcome_group(const LabelledOutcomeGroup * node)
  {
    return fmt::format("[{}]", join(node->slots, ", "));
  }
  std::string visit_labelled_outcome(const LabelledOutcome * node)
  {
    return fmt::format("{}={}", node->key, node->phenotype->name);
  }

  std::string visit_condition(const Condition * node)
  {
    if (node->level) {
      return fmt::format("{} = {}", visit(node->subject), *node->level);
    }
    return visit(node->subject);
  }

  std::string visit_snps_term(const SnpsTerm * /*node*/) { return "SNPs"; }
  std::string visit_interaction_term(const InteractionTerm * node)
  {
    return with_alias(join(node->members, " * "), node->alias);
  }
  std::string visit_genotype_term(const GenotypeTerm * node) { return visit(node->genotype); }
  std::string visit_factor_term(const FactorTerm * node)
  {
    return with_alias(fmt::format("factor({})", node->phenotype->name), node->alias);
  }
  std::string visit_log_term(const LogTerm * node)
  {
    return with_alias(
      fmt::format("{}({})", to_string(node->base), node->phenotype->name), node->alias);
  }
  std::string visit_pow_term(const PowTerm * node)
  {
    return with_alias(
      fmt::format("pow({}, {})", node->phenotype->name, node->power), node->alias);
  }
  std::string visit_plain_term(const PlainTerm * node) { return std::string(node->phenotype->name); }

private:
  std::string with_alias(std::string text, const std::optional<std::string_view> & alias) const
  {
    if (withAliases_ && alias) {
      text += fmt::format(" as {}", *alias);
    }
    return text;
  }

  bool withAliases_;
};

}  // namespace

std::string format_model(const Model & model)
{
  Formatter f;
  return f.visit(&model);
}

std::string format_node(const AstNode * node, bool with_aliases)
{
  Formatter f(with_aliases);
  return f.visit(node);
}

}  // namespace modelspec
