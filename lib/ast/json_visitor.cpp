// modelspec/ast/json_visitor.cpp - JSON serialization implementation
//
#include "modelspec/ast/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "modelspec/ast/ast.hpp"
#include "modelspec/ast/ast_enums.hpp"
#include "modelspec/ast/visitor.hpp"
#include "modelspec/basic/source_manager.hpp"

namespace modelspec
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

uint32_t begin_off(SourceRange r) { return r.get_begin().get_offset(); }
uint32_t end_off(SourceRange r) { return r.get_end().get_offset(); }

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", begin_off(r)}, {"end", end_off(r)}};
}

json j_alias(const std::optional<std::string_view> & alias)
{
  if (!alias) return nullptr;
  return std::string(*alias);
}

json j_header(const AstNode * node)
{
  return json{{"type", std::string(to_string(node->get_kind()))}, {"range", j_range(node->get_range())}};
}

// ============================================================================
// Serializer
// ============================================================================

class JsonSerializer : public ConstAstVisitor<JsonSerializer, json>
{
public:
  template <typename T>
  json list(gsl::span<T *> nodes)
  {
    json arr = json::array();
    for (const auto * n : nodes) {
      arr.push_back(visit(n));
    }
    return arr;
  }

  json visit_node(const AstNode * node) { return j_header(node); }

  json visit_model(const Model * node)
  {
    json j = j_header(node);
    j["outcome"] = visit(node->outcome);
    j["conditions"] = list(node->conditions);
    j["predictors"] = list(node->predictors);
    return j;
  }

  json visit_phenotype_ref(const PhenotypeRef * node)
  {
    json j = j_header(node);
    j["name"] = std::string(node->name);
    return j;
  }

  json visit_genotype_ref(const GenotypeRef * node)
  {
    json j = j_header(node);
    j["variant"] = std::string(node->variant());
    return j;
  }

  json visit_single_outcome(const SingleOutcome * node)
  {
    json j = j_header(node);
    j["subject"] = visit(node->subject);
    return j;
  }

  json visit_labelled_outcome_group(const LabelledOutcomeGroup * node)
  {
    json j = j_header(node);
    j["slots"] = list(node->slots);
    return j;
  }

  json visit_labelled_outcome(const LabelledOutcome * node)
  {
    json j = j_header(node);
    j["key"] = std::string(node->key);
    j["phenotype"] = visit(node->phenotype);
    return j;
  }

  json visit_condition(const Condition * node)
  {
    json j = j_header(node);
    j["subject"] = visit(node->subject);
    j["level"] = node->level ? json(*node->level) : json(nullptr);
    return j;
  }

  json visit_interaction_term(const InteractionTerm * node)
  {
    json j = j_header(node);
    j["members"] = list(node->members);
    j["alias"] = j_alias(node->alias);
    return j;
  }

  json visit_genotype_term(const GenotypeTerm * node)
  {
    json j = j_header(node);
    j["genotype"] = visit(node->genotype);
    return j;
  }

  json visit_factor_term(const FactorTerm * node)
  {
    json j = j_header(node);
    j["phenotype"] = visit(node->phenotype);
    j["alias"] = j_alias(node->alias);
    return j;
  }

  json visit_log_term(const LogTerm * node)
  {
    json j = j_header(node);
    j["base"] = std::string(to_string(node->base));
    j["phenotype"] = visit(node->phenotype);
    j["alias"] = j_alias(node->alias);
    return j;
  }

  json visit_pow_term(const PowTerm * node)
  {
    json j = j_header(node);
    j["phenotype"] = visit(node->phenotype);
    j["power"] = node->power;
    j["alias"] = j_alias(node->alias);
    return j;
  }

  json visit_plain_term(const PlainTerm * node)
  {
    json j = j_header(node);
    j["phenotype"] = visit(node->phenotype);
    return j;
  }
};

}  // namespace

nlohmann::json to_json(const AstNode * node)
{
  if (!node) return nullptr;
  JsonSerializer serializer;
  return serializer.visit(node);
}

nlohmann::json to_json(const Model & model) { return to_json(static_cast<const AstNode *>(&model)); }

}  // namespace modelspec
