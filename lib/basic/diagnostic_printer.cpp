// modelspec/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// fmt does the layout, rang the terminal colors.
//
#include "modelspec/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <map>
#include <ostream>
#include <rang.hpp>
#include <string>

namespace modelspec
{

namespace
{

// Width of the line-number column, " 1234 ".
constexpr std::string_view k_gutter = "      ";

rang::fg severity_color(Severity s)
{
  switch (s) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
    case Severity::Note:
      return rang::fg::cyan;
  }
  return rang::fg::red;
}

std::string expand_tabs(std::string_view line)
{
  std::string out(line);
  for (char & c : out) {
    if (c == '\t') c = ' ';
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), useColor_(use_color)
{
  if (useColor_) {
    // Force: the target may be a file or pipe the caller chose to color.
    rang::setControlMode(rang::control::Force);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceManager & source)
{
  print_header(diag);

  const FullSourceRange where = source.get_full_range(diag.primary_range());
  if (useColor_) os_ << rang::fg::cyan << rang::style::bold;
  os_ << "  -->";
  if (useColor_) os_ << rang::style::reset << rang::fg::reset;
  if (where.is_valid()) {
    fmt::print(os_, " {}:{}:{}\n", source.get_name(), where.start_line, where.start_column);
  } else {
    fmt::print(os_, " {}\n", source.get_name());
  }

  print_gutter();
  print_snippet(diag.labels, source);

  for (const auto & fixit : diag.fixits) {
    print_gutter();
    print_footer("fix", fmt::format("insert '{}'", fixit.replacement_text));
  }
  if (diag.help_message) {
    print_gutter();
    print_footer("help", *diag.help_message);
  }
  os_ << "\n";
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceManager & source)
{
  for (const auto & d : diags.sorted_by_location()) {
    print(d, source);
  }
}

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  if (useColor_) os_ << rang::style::bold << severity_color(diag.severity);
  os_ << to_string(diag.severity);
  if (!diag.code.empty()) {
    fmt::print(os_, "[{}]", diag.code);
  }
  if (useColor_) os_ << rang::fg::reset;
  fmt::print(os_, ": {}", diag.message);
  if (useColor_) os_ << rang::style::reset;
  os_ << "\n";
}

void DiagnosticPrinter::print_snippet(const std::vector<Label> & labels, const SourceManager & source)
{
  std::map<uint32_t, std::vector<Marker>> by_line;
  std::vector<const Label *> detached;

  for (const auto & label : labels) {
    const FullSourceRange fr = source.get_full_range(label.range);
    if (!fr.is_valid()) {
      if (!label.message.empty()) detached.push_back(&label);
      continue;
    }
    // Multi-line ranges are marked on their first line only.
    const uint32_t width = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                             ? fr.end_column - fr.start_column
                             : 1;
    by_line[fr.start_line].push_back(Marker{fr.start_column, width, &label});
  }

  for (const auto & [line, markers] : by_line) {
    print_line(line, source.get_line(line - 1), markers);
  }

  for (const auto * label : detached) {
    print_gutter();
    print_footer("note", label->message);
  }
}

void DiagnosticPrinter::print_line(
  uint32_t line_number, std::string_view text, const std::vector<Marker> & markers)
{
  if (useColor_) os_ << rang::fg::cyan;
  fmt::print(os_, " {:>4} ", line_number);
  if (useColor_) os_ << rang::fg::reset;
  fmt::print(os_, "| {}\n", expand_tabs(text));

  for (const auto & m : markers) {
    const bool primary = m.label->style == LabelStyle::Primary;
    os_ << k_gutter << "| " << std::string(m.column - 1, ' ');
    if (useColor_) {
      if (primary) {
        os_ << rang::fg::red << rang::style::bold;
      } else {
        os_ << rang::fg::cyan;
      }
    }
    os_ << std::string(m.width, primary ? '^' : '-');
    if (!m.label->message.empty()) {
      os_ << ' ' << m.label->message;
    }
    if (useColor_) os_ << rang::style::reset << rang::fg::reset;
    os_ << "\n";
  }
}

void DiagnosticPrinter::print_footer(std::string_view kind, std::string_view text)
{
  if (useColor_) os_ << rang::fg::cyan << rang::style::bold;
  os_ << "   = ";
  if (useColor_) os_ << rang::style::reset << rang::fg::reset;
  fmt::print(os_, "{}: {}\n", kind, text);
}

void DiagnosticPrinter::print_gutter(std::string_view text)
{
  os_ << k_gutter << "|";
  if (!text.empty()) {
    os_ << ' ' << text;
  }
  os_ << "\n";
}

}  // namespace modelspec
