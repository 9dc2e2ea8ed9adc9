// modelspec/config/parser_config.hpp - modelspec.yaml settings
//
//   grammar:
//     dialect: standard   # or legacy
//   diagnostics:
//     color: auto         # auto | always | never
//
// Every key is optional. Keys the loader does not know are ignored so that
// newer files still load with older tools.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "modelspec/syntax/dialect.hpp"
#include "modelspec/syntax/frontend.hpp"

namespace modelspec
{

inline constexpr const char * k_parser_config_file_name = "modelspec.yaml";

enum class ColorMode : uint8_t {
  Auto,  // color when stderr is a terminal
  Always,
  Never,
};

[[nodiscard]] std::optional<ColorMode> color_mode_from_string(std::string_view s) noexcept;

struct ParserConfig
{
  struct Grammar
  {
    syntax::Dialect dialect = syntax::Dialect::Standard;
  } grammar;

  struct Diagnostics
  {
    ColorMode color = ColorMode::Auto;
  } diagnostics;

  /// Directory the file was read from; empty for text or defaults.
  std::filesystem::path config_root;

  [[nodiscard]] ParseOptions parse_options() const
  {
    ParseOptions opts;
    opts.dialect = grammar.dialect;
    return opts;
  }
};

/// Either a loaded configuration or the reason it could not be loaded.
struct ConfigLoadResult
{
  ParserConfig config;
  bool success = false;
  std::string error;

  static ConfigLoadResult ok(ParserConfig config) { return {std::move(config), true, {}}; }
  static ConfigLoadResult fail(std::string error) { return {{}, false, std::move(error)}; }
};

[[nodiscard]] ConfigLoadResult load_parser_config(const std::filesystem::path & config_path);
[[nodiscard]] ConfigLoadResult load_parser_config_from_string(std::string_view yaml_text);

/**
 * Look for modelspec.yaml in `start` (or in the directory holding it, when
 * `start` is a file) and then in each parent up to the root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_parser_config(
  const std::filesystem::path & start);

}  // namespace modelspec
