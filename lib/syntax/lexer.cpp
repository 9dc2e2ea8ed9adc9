#include "modelspec/syntax/lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace modelspec::syntax
{
namespace
{

bool is_word_char(char c)
{
  const auto u = static_cast<unsigned char>(c);
  return std::isalnum(u) != 0 || c == '_' || c == ':';
}

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

bool is_integer(std::string_view word)
{
  return std::all_of(
    word.begin(), word.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

constexpr std::array<std::pair<std::string_view, TokenKind>, 5> k_call_openers = {{
  {"g", TokenKind::GenotypeOpen},
  {"factor", TokenKind::FactorOpen},
  {"pow", TokenKind::PowOpen},
  {"ln", TokenKind::LnOpen},
  {"log10", TokenKind::Log10Open},
}};

constexpr std::array<std::pair<char, TokenKind>, 10> k_punctuation = {{
  {'(', TokenKind::LParen},
  {')', TokenKind::RParen},
  {'[', TokenKind::LBracket},
  {']', TokenKind::RBracket},
  {',', TokenKind::Comma},
  {'=', TokenKind::Eq},
  {'|', TokenKind::Pipe},
  {'~', TokenKind::Tilde},
  {'+', TokenKind::Plus},
  {'*', TokenKind::Star},
}};

}  // namespace

Token Lexer::emit(TokenKind kind, uint32_t start) const noexcept
{
  return {kind, SourceRange(start, cursor_), text_.substr(start, cursor_ - start)};
}

Token Lexer::scan_word(uint32_t start)
{
  while (is_word_char(current())) ++cursor_;
  const std::string_view word = text_.substr(start, cursor_ - start);

  // `factor(` is one token, `factor (` is a name followed by '('.
  if (current() == '(') {
    const auto opener = std::find_if(
      k_call_openers.begin(), k_call_openers.end(), [&](const auto & o) { return o.first == word; });
    if (opener != k_call_openers.end()) {
      ++cursor_;
      return emit(opener->second, start);
    }
  }
  return emit(is_integer(word) ? TokenKind::IntLiteral : TokenKind::Identifier, start);
}

Token Lexer::scan()
{
  while (is_space(current())) ++cursor_;

  const uint32_t start = cursor_;
  if (at_end()) return emit(TokenKind::Eof, start);
  if (is_word_char(current())) return scan_word(start);

  const char c = current();
  ++cursor_;
  for (const auto & [ch, kind] : k_punctuation) {
    if (ch == c) return emit(kind, start);
  }
  return emit(TokenKind::Unknown, start);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> tokens;
  do {
    tokens.push_back(scan());
  } while (tokens.back().kind != TokenKind::Eof);
  return tokens;
}

}  // namespace modelspec::syntax
