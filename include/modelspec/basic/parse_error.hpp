// modelspec/basic/parse_error.hpp - Structured errors returned by parse()
//
// A parse call fails with exactly one ParseError: either a SyntaxError
// (the text does not match the grammar) or a SemanticError (it matches but
// violates a structural rule). Both convert to a Diagnostic for printing.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "modelspec/basic/diagnostic.hpp"
#include "modelspec/basic/source_manager.hpp"

namespace modelspec
{

namespace error_code
{
inline constexpr std::string_view k_unexpected_token = "E0101";
inline constexpr std::string_view k_trailing_input = "E0102";
inline constexpr std::string_view k_duplicate_outcome_key = "E0201";
inline constexpr std::string_view k_interaction_too_small = "E0202";
inline constexpr std::string_view k_duplicate_alias = "E0203";
inline constexpr std::string_view k_integer_out_of_range = "E0204";
}  // namespace error_code

/**
 * Input that does not conform to the grammar.
 */
struct SyntaxError
{
  /// Grammar rule that failed, e.g. "factor" or "model"
  std::string rule;
  /// Byte offset of the offending token
  uint32_t offset = 0;
  /// Range of the offending token (empty at end of input)
  SourceRange range;
  /// Token spellings that would have been accepted, in grammar order
  std::vector<std::string> expected;
  /// Spelling of the token that was found ("<eof>" at end of input)
  std::string found;
  /// Set when the remaining input was well formed but not consumed
  bool trailing = false;

  [[nodiscard]] std::string message() const;
};

enum class SemanticErrorKind : uint8_t {
  DuplicateOutcomeKey,
  InteractionTooSmall,
  DuplicateAlias,
  IntegerOutOfRange,
};

[[nodiscard]] std::string_view to_string(SemanticErrorKind k) noexcept;

/**
 * Grammatically valid input that is structurally invalid.
 */
struct SemanticError
{
  SemanticErrorKind kind = SemanticErrorKind::DuplicateOutcomeKey;
  std::string detail;
  SourceRange range;
  /// First occurrence, for duplicate-name errors
  std::optional<SourceRange> related;

  [[nodiscard]] std::string message() const { return detail; }
};

/**
 * Tagged union of the two failure kinds.
 */
class ParseError
{
public:
  ParseError(SyntaxError e) : error_(std::move(e)) {}      // NOLINT(google-explicit-constructor)
  ParseError(SemanticError e) : error_(std::move(e)) {}    // NOLINT(google-explicit-constructor)

  [[nodiscard]] bool is_syntax() const noexcept
  {
    return std::holds_alternative<SyntaxError>(error_);
  }
  [[nodiscard]] bool is_semantic() const noexcept
  {
    return std::holds_alternative<SemanticError>(error_);
  }

  [[nodiscard]] const SyntaxError & syntax() const { return std::get<SyntaxError>(error_); }
  [[nodiscard]] const SemanticError & semantic() const { return std::get<SemanticError>(error_); }

  [[nodiscard]] const std::variant<SyntaxError, SemanticError> & get() const noexcept
  {
    return error_;
  }

  [[nodiscard]] std::string message() const;
  [[nodiscard]] SourceRange range() const noexcept;
  [[nodiscard]] std::string_view code() const noexcept;

private:
  std::variant<SyntaxError, SemanticError> error_;
};

/// Render a ParseError as a Diagnostic with code, labels and help text.
[[nodiscard]] Diagnostic to_diagnostic(const ParseError & error);

}  // namespace modelspec
