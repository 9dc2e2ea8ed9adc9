#include "modelspec/analysis/model_queries.hpp"

#include <algorithm>
#include <string_view>

#include "modelspec/ast/formatter.hpp"
#include "modelspec/ast/visitor.hpp"

namespace modelspec
{
namespace
{

void append_unique(std::vector<std::string> & out, std::string_view name)
{
  if (std::find(out.begin(), out.end(), name) == out.end()) {
    out.emplace_back(name);
  }
}

class LeafCollector : public RecursiveAstVisitor<LeafCollector, const AstNode *>
{
public:
  bool visit_phenotype_ref(const PhenotypeRef * node)
  {
    append_unique(phenotypes, node->name);
    return true;
  }

  bool visit_genotype_ref(const GenotypeRef * node)
  {
    append_unique(variants, node->variant());
    return true;
  }

  std::vector<std::string> phenotypes;
  std::vector<std::string> variants;
};

}  // namespace

bool is_gwas(const Model & model)
{
  return std::any_of(model.predictors.begin(), model.predictors.end(), [](const Term * t) {
    return isa<SnpsTerm>(t);
  });
}

std::vector<std::string> referenced_variants(const Model & model)
{
  LeafCollector c;
  c.visit(&model);
  return std::move(c.variants);
}

std::vector<std::string> referenced_phenotypes(const Model & model)
{
  LeafCollector c;
  c.visit(&model);
  return std::move(c.phenotypes);
}

std::string term_label(const Term & term)
{
  if (const auto alias = get_alias(&term)) {
    return std::string(*alias);
  }
  return format_node(&term);
}

std::vector<Translation> translations(const Model & model)
{
  std::vector<Translation> out;
  out.reserve(model.predictors.size());
  for (const auto * term : model.predictors) {
    out.emplace_back(term_label(*term), format_node(term, false));
  }
  return out;
}

}  // namespace modelspec
