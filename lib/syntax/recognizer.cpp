#include "modelspec/syntax/recognizer.hpp"

namespace modelspec::syntax
{

std::optional<size_t> Recognizer::name(size_t i) const
{
  if (at(i).is_name()) return i + 1;
  return std::nullopt;
}

std::optional<size_t> Recognizer::call(size_t i, TokenKind opener) const
{
  auto next = token(i, opener);
  if (!next) return std::nullopt;
  next = name(*next);
  if (!next) return std::nullopt;
  return token(*next, TokenKind::RParen);
}

std::optional<size_t> Recognizer::genotype(size_t i) const
{
  return call(i, TokenKind::GenotypeOpen);
}

std::optional<size_t> Recognizer::factor_head(size_t i) const
{
  return call(i, TokenKind::FactorOpen);
}

std::optional<size_t> Recognizer::interaction_member(size_t i) const
{
  if (auto g = genotype(i)) return g;
  if (features_.factor_interactions) {
    if (auto f = factor_head(i)) return f;
  }
  return name(i);
}

bool Recognizer::interaction_ahead(size_t i) const
{
  const auto head = interaction_member(i);
  return head.has_value() && token(*head, TokenKind::Star).has_value();
}

}  // namespace modelspec::syntax
