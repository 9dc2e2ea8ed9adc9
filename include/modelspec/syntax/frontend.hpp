// modelspec/syntax/frontend.hpp - High-level parse pipeline entry point
//
// text -> Lexer (tokens) -> Parser (AST) -> ModelChecker -> ParseResult
//
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "modelspec/ast/ast.hpp"
#include "modelspec/ast/ast_context.hpp"
#include "modelspec/basic/diagnostic.hpp"
#include "modelspec/basic/parse_error.hpp"
#include "modelspec/basic/source_manager.hpp"
#include "modelspec/syntax/dialect.hpp"

namespace modelspec
{

struct ParseOptions
{
  syntax::Dialect dialect = syntax::Dialect::Standard;

  /// Name shown in diagnostics, e.g. a file path
  std::string source_name = "<spec>";
};

/**
 * A successfully parsed and validated model.
 *
 * Owns the specification text and the arena holding every node, so the
 * Model stays valid for as long as this object lives.
 */
class ParsedModel
{
public:
  explicit ParsedModel(std::string text, std::string name = "<spec>")
  : source_(std::move(text), std::move(name))
  {
  }

  ParsedModel(const ParsedModel &) = delete;
  ParsedModel & operator=(const ParsedModel &) = delete;

  [[nodiscard]] const Model & model() const { return *model_; }
  [[nodiscard]] const SourceManager & source() const noexcept { return source_; }
  [[nodiscard]] AstContext & context() noexcept { return ast_; }

  void set_model(Model * model) noexcept { model_ = model; }

private:
  SourceManager source_;
  AstContext ast_;
  Model * model_ = nullptr;
};

/**
 * Either a ParsedModel or a ParseError, never both.
 */
struct ParseResult
{
  /// Parsed model (only set if success == true)
  std::unique_ptr<ParsedModel> parsed;

  /// Whether parsing and validation succeeded
  bool success = false;

  /// Failure (only set if success == false)
  std::optional<ParseError> error;

  static ParseResult ok(std::unique_ptr<ParsedModel> model)
  {
    ParseResult r;
    r.parsed = std::move(model);
    r.success = true;
    return r;
  }

  static ParseResult fail(ParseError err)
  {
    ParseResult r;
    r.error = std::move(err);
    r.success = false;
    return r;
  }

  [[nodiscard]] const Model & model() const { return parsed->model(); }
};

/**
 * Parse and validate one model specification.
 *
 * Pure and re-entrant: every call owns its tokens and arena.
 */
[[nodiscard]] ParseResult parse(std::string_view text, const ParseOptions & opts = {});

/**
 * Parse, and on failure add the error to `diags` as a Diagnostic.
 *
 * @return The parsed model, or nullptr on failure
 */
[[nodiscard]] std::unique_ptr<ParsedModel> parse_or_report(
  std::string_view text, const ParseOptions & opts, DiagnosticBag & diags);

}  // namespace modelspec
