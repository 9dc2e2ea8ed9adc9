// modelspec/basic/parse_error.cpp - Messages and diagnostics for parse errors
#include "modelspec/basic/parse_error.hpp"

#include <fmt/core.h>

#include <string>

namespace modelspec
{

namespace
{

std::string quote_list(const std::vector<std::string> & items)
{
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out += (i + 1 == items.size()) ? " or " : ", ";
    }
    out += "`" + items[i] + "`";
  }
  return out;
}

// Expected entries that name a class of tokens rather than a spelling.
bool is_insertable(std::string_view expected) noexcept
{
  return expected != "name" && expected != "integer" && expected != "<eof>";
}

std::string_view help_for(SemanticErrorKind k) noexcept
{
  switch (k) {
    case SemanticErrorKind::DuplicateOutcomeKey:
      return "each key of a labelled outcome group may be used only once";
    case SemanticErrorKind::InteractionTooSmall:
      return "an interaction needs at least two members joined by `*`";
    case SemanticErrorKind::DuplicateAlias:
      return "choose a different alias for this term";
    case SemanticErrorKind::IntegerOutOfRange:
      return "use a value that fits in a signed 64-bit integer";
  }
  return "";
}

}  // namespace

std::string SyntaxError::message() const
{
  if (trailing) {
    return fmt::format("unexpected `{}` after the end of the model", found);
  }
  if (expected.empty()) {
    return fmt::format("unexpected `{}` in {}", found, rule);
  }
  return fmt::format("expected {}, found `{}`", quote_list(expected), found);
}

std::string_view to_string(SemanticErrorKind k) noexcept
{
  switch (k) {
    case SemanticErrorKind::DuplicateOutcomeKey:
      return "duplicate_outcome_key";
    case SemanticErrorKind::InteractionTooSmall:
      return "interaction_too_small";
    case SemanticErrorKind::DuplicateAlias:
      return "duplicate_alias";
    case SemanticErrorKind::IntegerOutOfRange:
      return "integer_out_of_range";
  }
  return "unknown";
}

std::string ParseError::message() const
{
  return std::visit([](const auto & e) { return e.message(); }, error_);
}

SourceRange ParseError::range() const noexcept
{
  return std::visit([](const auto & e) { return e.range; }, error_);
}

std::string_view ParseError::code() const noexcept
{
  if (const auto * s = std::get_if<SyntaxError>(&error_)) {
    return s->trailing ? error_code::k_trailing_input : error_code::k_unexpected_token;
  }
  switch (std::get<SemanticError>(error_).kind) {
    case SemanticErrorKind::DuplicateOutcomeKey:
      return error_code::k_duplicate_outcome_key;
    case SemanticErrorKind::InteractionTooSmall:
      return error_code::k_interaction_too_small;
    case SemanticErrorKind::DuplicateAlias:
      return error_code::k_duplicate_alias;
    case SemanticErrorKind::IntegerOutOfRange:
      return error_code::k_integer_out_of_range;
  }
  return error_code::k_unexpected_token;
}

Diagnostic to_diagnostic(const ParseError & error)
{
  if (error.is_syntax()) {
    const SyntaxError & s = error.syntax();
    Diagnostic d = Diagnostic::error(
      error.code(), error.message(), s.range, s.trailing ? "not part of the model" : "");
    if (
      !s.trailing && s.expected.size() == 1 && s.found == "<eof>" &&
      is_insertable(s.expected.front())) {
      d.with_fixit(s.range, s.expected.front());
    }
    if (!s.rule.empty()) {
      d.with_help("while parsing `" + s.rule + "`");
    }
    return d;
  }

  const SemanticError & s = error.semantic();
  Diagnostic d = Diagnostic::error(error.code(), error.message(), s.range);
  if (s.related) {
    d.with_secondary(*s.related, "first used here");
  }
  d.with_help(std::string(help_for(s.kind)));
  return d;
}

}  // namespace modelspec
