// modelspec/analysis/model_queries.hpp - Read-only questions asked of a Model
//
// The statistical engine uses these to decide how to run an analysis and
// how to label its result columns.
//
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "modelspec/ast/ast.hpp"

namespace modelspec
{

/// True when the predictors contain `SNPs`, i.e. one fit per variant.
[[nodiscard]] bool is_gwas(const Model & model);

/// Variant ids referenced anywhere, in source order, without duplicates.
[[nodiscard]] std::vector<std::string> referenced_variants(const Model & model);

/// Phenotype names referenced anywhere, in source order, without duplicates.
[[nodiscard]] std::vector<std::string> referenced_phenotypes(const Model & model);

/**
 * Result column key of a predictor: its alias when it has one, otherwise
 * its canonical text (`x`, `g(rs1)`, `a * b`, `SNPs`).
 */
[[nodiscard]] std::string term_label(const Term & term);

/// (column key, canonical text without alias) for every predictor, in order.
using Translation = std::pair<std::string, std::string>;

[[nodiscard]] std::vector<Translation> translations(const Model & model);

}  // namespace modelspec
