#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "modelspec/syntax/dialect.hpp"
#include "modelspec/syntax/token.hpp"

namespace modelspec::syntax
{

/**
 * Pure matching layer over a token vector.
 *
 * Each function takes a token index and returns the index just past a
 * match, or std::nullopt. Nothing is allocated, built or reported, so the
 * parser may call these speculatively at any point.
 */
class Recognizer
{
public:
  Recognizer(const std::vector<Token> & tokens, GrammarFeatures features)
  : tokens_(tokens), features_(features)
  {
  }

  /// `name`
  [[nodiscard]] std::optional<size_t> name(size_t i) const;

  /// `g(` name `)`
  [[nodiscard]] std::optional<size_t> genotype(size_t i) const;

  /// `factor(` name `)`, without alias
  [[nodiscard]] std::optional<size_t> factor_head(size_t i) const;

  /// One interaction member: genotype, factor head (when enabled) or name.
  [[nodiscard]] std::optional<size_t> interaction_member(size_t i) const;

  /// The interaction lookahead: `(genotype | factor head | name) "*"`.
  [[nodiscard]] bool interaction_ahead(size_t i) const;

private:
  [[nodiscard]] const Token & at(size_t i) const
  {
    return i < tokens_.size() ? tokens_[i] : tokens_.back();
  }

  [[nodiscard]] std::optional<size_t> token(size_t i, TokenKind k) const
  {
    if (at(i).kind == k) return i + 1;
    return std::nullopt;
  }

  [[nodiscard]] std::optional<size_t> call(size_t i, TokenKind opener) const;

  const std::vector<Token> & tokens_;
  GrammarFeatures features_;
};

}  // namespace modelspec::syntax
