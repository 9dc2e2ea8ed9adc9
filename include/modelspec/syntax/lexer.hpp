// modelspec/syntax/lexer.hpp - Tokenizer for model specifications
//
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "modelspec/syntax/token.hpp"

namespace modelspec::syntax
{

/**
 * Splits a model specification into tokens. Whitespace is skipped; any
 * character outside the grammar becomes a one-byte Unknown token, which no
 * parser rule accepts. The lexer is the same for every dialect.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view text) : text_(text) {}

  /// Full token stream, always terminated by a single Eof token.
  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token scan();
  [[nodiscard]] Token scan_word(uint32_t start);
  [[nodiscard]] Token emit(TokenKind kind, uint32_t start) const noexcept;

  [[nodiscard]] bool at_end() const noexcept { return cursor_ >= text_.size(); }
  /// Character under the cursor, '\0' past the end.
  [[nodiscard]] char current() const noexcept { return at_end() ? '\0' : text_[cursor_]; }

  std::string_view text_;
  uint32_t cursor_ = 0;
};

}  // namespace modelspec::syntax
