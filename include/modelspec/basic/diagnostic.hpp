// modelspec/basic/diagnostic.hpp - Printable reports of parse and check failures
//
// A Diagnostic is the presentation form of an error: a code, a headline,
// labelled source ranges and optional help. Diagnostics are built fluently
// and collected in a DiagnosticBag until the driver prints them.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "modelspec/basic/source_manager.hpp"

namespace modelspec
{

enum class Severity : uint8_t {
  Error,
  Warning,
  Note,
};

[[nodiscard]] std::string_view to_string(Severity s) noexcept;

enum class LabelStyle : uint8_t {
  Primary,    // the offending text
  Secondary,  // related text, e.g. the first declaration of a duplicate
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

/// Text to insert at `range` that would make the input valid.
struct FixIt
{
  SourceRange range;
  std::string replacement_text;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g. "E0201"
  std::string message;

  std::vector<Label> labels;
  std::vector<FixIt> fixits;
  std::optional<std::string> help_message;

  /// Start an error with its primary range already labelled.
  [[nodiscard]] static Diagnostic error(
    std::string_view code, std::string message, SourceRange range, std::string label = {});

  Diagnostic & with_secondary(SourceRange range, std::string message);
  Diagnostic & with_fixit(SourceRange range, std::string replacement);
  Diagnostic & with_help(std::string help);

  /// First primary label, falling back to the first label of any style.
  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

/**
 * Ordered collection of diagnostics.
 *
 * parse() stops at the first failure, so a bag filled by one call holds at
 * most one error; drivers that check several specifications share a bag.
 */
class DiagnosticBag
{
public:
  void add(Diagnostic diag) { diagnostics_.push_back(std::move(diag)); }

  [[nodiscard]] const std::vector<Diagnostic> & all() const noexcept { return diagnostics_; }
  [[nodiscard]] bool empty() const noexcept { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return diagnostics_.size(); }
  [[nodiscard]] bool has_errors() const noexcept;

  /// Diagnostics ordered by the start of their primary range.
  [[nodiscard]] std::vector<Diagnostic> sorted_by_location() const;

  [[nodiscard]] auto begin() const noexcept { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const noexcept { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace modelspec
