#pragma once

#include <cstdint>
#include <string_view>

#include "modelspec/basic/source_manager.hpp"

namespace modelspec::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  Identifier,  // [A-Za-z0-9_:]+ with at least one non-digit
  IntLiteral,  // [0-9]+

  // Call openers; only formed when the word is immediately followed by '('
  GenotypeOpen,  // g(
  FactorOpen,    // factor(
  PowOpen,       // pow(
  LnOpen,        // ln(
  Log10Open,     // log10(

  // Punctuation
  LParen,
  RParen,
  LBracket,
  RBracket,
  Comma,
  Eq,
  Pipe,
  Tilde,
  Plus,
  Star,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range in the specification text
  std::string_view text;  // slice view of the token text

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().get_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().get_offset(); }

  /// Identifiers and integers both satisfy the `name` rule.
  [[nodiscard]] bool is_name() const noexcept
  {
    return kind == TokenKind::Identifier || kind == TokenKind::IntLiteral;
  }

  [[nodiscard]] bool is_word(std::string_view w) const noexcept
  {
    return kind == TokenKind::Identifier && text == w;
  }
};

/// Spelling used in "expected ..." lists.
[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::Identifier:
      return "name";
    case TokenKind::IntLiteral:
      return "integer";
    case TokenKind::GenotypeOpen:
      return "g(";
    case TokenKind::FactorOpen:
      return "factor(";
    case TokenKind::PowOpen:
      return "pow(";
    case TokenKind::LnOpen:
      return "ln(";
    case TokenKind::Log10Open:
      return "log10(";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Eq:
      return "=";
    case TokenKind::Pipe:
      return "|";
    case TokenKind::Tilde:
      return "~";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Star:
      return "*";
  }
  return "";
}

}  // namespace modelspec::syntax
