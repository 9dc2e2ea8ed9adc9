// modelspec/test_support/parse_helpers.hpp - helpers for unit tests
//
// Thin wrappers over parse() that fail the current test with the rendered
// error (or the unexpected success) instead of crashing on a null model.
//
#pragma once

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "modelspec/ast/formatter.hpp"
#include "modelspec/basic/parse_error.hpp"
#include "modelspec/syntax/frontend.hpp"

namespace modelspec::test_support
{

[[nodiscard]] inline ParseOptions legacy_options()
{
  ParseOptions opts;
  opts.dialect = syntax::Dialect::Legacy;
  return opts;
}

/**
 * Parse text that is expected to be valid.
 *
 * @return The parsed model, or nullptr after recording a test failure
 */
[[nodiscard]] inline std::unique_ptr<ParsedModel> expect_parse(
  std::string_view text, const ParseOptions & opts = {})
{
  ParseResult result = parse(text, opts);
  if (!result.success) {
    ADD_FAILURE() << "parse failed for `" << text << "`: [" << result.error->code() << "] "
                  << result.error->message();
    return nullptr;
  }
  return std::move(result.parsed);
}

/**
 * Parse text that is expected to be rejected.
 *
 * @return The error, or std::nullopt after recording a test failure
 */
[[nodiscard]] inline std::optional<ParseError> expect_failure(
  std::string_view text, const ParseOptions & opts = {})
{
  ParseResult result = parse(text, opts);
  if (result.success) {
    ADD_FAILURE() << "expected `" << text << "` to be rejected, got `"
                  << format_model(result.model()) << "`";
    return std::nullopt;
  }
  return std::move(result.error);
}

}  // namespace modelspec::test_support
