// modelspec/syntax/dialect.hpp - Grammar dialects as feature flags
//
// The legacy grammar is a strict subset of the standard one, so a single
// parser serves both; the flags switch off the productions legacy input
// may not use.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace modelspec::syntax
{

enum class Dialect : uint8_t {
  Standard,
  Legacy,
};

struct GrammarFeatures
{
  /// `[key=phen, ...]` outcomes
  bool labelled_outcomes = true;
  /// The `SNPs` placeholder term
  bool snps_token = true;
  /// `pow(x, n)`
  bool pow_terms = true;
  /// `ln(x)` and `log10(x)`
  bool log_terms = true;
  /// `factor(x)` as interaction head or member
  bool factor_interactions = true;

  [[nodiscard]] static constexpr GrammarFeatures for_dialect(Dialect d) noexcept
  {
    GrammarFeatures f;
    if (d == Dialect::Legacy) {
      f.labelled_outcomes = false;
      f.snps_token = false;
      f.pow_terms = false;
      f.log_terms = false;
      f.factor_interactions = false;
    }
    return f;
  }
};

[[nodiscard]] constexpr std::string_view to_string(Dialect d) noexcept
{
  return d == Dialect::Legacy ? "legacy" : "standard";
}

[[nodiscard]] constexpr std::optional<Dialect> dialect_from_string(std::string_view s) noexcept
{
  if (s == "standard") return Dialect::Standard;
  if (s == "legacy") return Dialect::Legacy;
  return std::nullopt;
}

}  // namespace modelspec::syntax
