// modelspec/basic/diagnostic_printer.hpp - Terminal rendering of diagnostics
//
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string_view>
#include <vector>

#include "modelspec/basic/diagnostic.hpp"
#include "modelspec/basic/source_manager.hpp"

namespace modelspec
{

/**
 * Prints diagnostics in Rust style. Each source line is shown once, with
 * one marker row per label on it:
 *
 *   error[E0203]: alias `f` is already used in this model
 *     --> <spec>:1:21
 *      |
 *    1 | y ~ factor(a) as f + ln(b) as f
 *      |                      ^^^^^^^^^^
 *      |     -------------- first used here
 *      |
 *      = help: choose a different alias for this term
 */
class DiagnosticPrinter
{
public:
  DiagnosticPrinter(std::ostream & os, bool use_color);

  void print(const Diagnostic & diag, const SourceManager & source);

  /// Print every diagnostic of the bag, ordered by primary location.
  void print_all(const DiagnosticBag & diags, const SourceManager & source);

private:
  struct Marker
  {
    uint32_t column;  // 1-indexed
    uint32_t width;
    const Label * label;
  };

  void print_header(const Diagnostic & diag);
  void print_snippet(const std::vector<Label> & labels, const SourceManager & source);
  void print_line(uint32_t line_number, std::string_view text, const std::vector<Marker> & markers);
  void print_footer(std::string_view kind, std::string_view text);
  void print_gutter(std::string_view text = {});

  std::ostream & os_;
  bool useColor_;
};

}  // namespace modelspec
