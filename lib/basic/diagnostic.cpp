#include "modelspec/basic/diagnostic.hpp"

#include <algorithm>
#include <utility>

namespace modelspec
{

std::string_view to_string(Severity s) noexcept
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Note:
      return "note";
  }
  return "error";
}

Diagnostic Diagnostic::error(
  std::string_view code, std::string message, SourceRange range, std::string label)
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.code = std::string(code);
  d.message = std::move(message);
  d.labels.push_back(Label{range, std::move(label), LabelStyle::Primary});
  return d;
}

Diagnostic & Diagnostic::with_secondary(SourceRange range, std::string message)
{
  labels.push_back(Label{range, std::move(message), LabelStyle::Secondary});
  return *this;
}

Diagnostic & Diagnostic::with_fixit(SourceRange range, std::string replacement)
{
  fixits.push_back(FixIt{range, std::move(replacement)});
  return *this;
}

Diagnostic & Diagnostic::with_help(std::string help)
{
  help_message = std::move(help);
  return *this;
}

const Label * Diagnostic::primary_label() const noexcept
{
  const auto it = std::find_if(labels.begin(), labels.end(), [](const Label & l) {
    return l.style == LabelStyle::Primary;
  });
  if (it != labels.end()) {
    return &*it;
  }
  return labels.empty() ? nullptr : &labels.front();
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * l = primary_label();
  return l != nullptr ? l->range : SourceRange{};
}

bool DiagnosticBag::has_errors() const noexcept
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

std::vector<Diagnostic> DiagnosticBag::sorted_by_location() const
{
  std::vector<Diagnostic> sorted = diagnostics_;
  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic & a, const Diagnostic & b) {
    return a.primary_range().get_begin() < b.primary_range().get_begin();
  });
  return sorted;
}

}  // namespace modelspec
