// modelspec/syntax/frontend.cpp - High-level parse pipeline
#include "modelspec/syntax/frontend.hpp"

#include "modelspec/sema/model_checker.hpp"
#include "modelspec/syntax/lexer.hpp"
#include "modelspec/syntax/parser.hpp"

namespace modelspec
{

ParseResult parse(std::string_view text, const ParseOptions & opts)
{
  auto unit = std::make_unique<ParsedModel>(std::string(text), opts.source_name);

  // Tokens view the copy owned by `unit`, not the caller's buffer.
  syntax::Lexer lexer(unit->source().get_source());
  syntax::Parser parser(
    unit->context(), lexer.lex_all(), syntax::GrammarFeatures::for_dialect(opts.dialect));

  Model * model = parser.parse_model();
  if (model == nullptr) {
    return ParseResult::fail(*parser.error());
  }

  ModelChecker checker;
  if (auto error = checker.check(*model, parser.literal_errors())) {
    return ParseResult::fail(std::move(*error));
  }

  unit->set_model(model);
  return ParseResult::ok(std::move(unit));
}

std::unique_ptr<ParsedModel> parse_or_report(
  std::string_view text, const ParseOptions & opts, DiagnosticBag & diags)
{
  ParseResult result = parse(text, opts);
  if (!result.success) {
    diags.add(to_diagnostic(*result.error));
    return nullptr;
  }
  return std::move(result.parsed);
}

}  // namespace modelspec
