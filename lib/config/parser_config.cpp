#include "modelspec/config/parser_config.hpp"

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <utility>

namespace modelspec
{

namespace
{

using LoadError = std::optional<std::string>;

/// Read `section.key` through `convert` when present. `allowed` lists the
/// accepted spellings for the error message.
template <typename T, typename Convert>
LoadError read_choice(
  const YAML::Node & section, std::string_view section_name, const char * key, Convert convert,
  std::string_view allowed, T & out)
{
  const YAML::Node value_node = section[key];
  if (!value_node) return std::nullopt;

  const auto value = value_node.as<std::string>();
  const std::optional<T> parsed = convert(value);
  if (!parsed) {
    return fmt::format("invalid {}.{}: '{}' (must be {})", section_name, key, value, allowed);
  }
  out = *parsed;
  return std::nullopt;
}

LoadError read_document(const YAML::Node & root, ParserConfig & config)
{
  if (!root || root.IsNull()) return std::nullopt;  // empty file: all defaults
  if (!root.IsMap()) return std::string("configuration root must be a map");

  if (const YAML::Node grammar = root["grammar"]) {
    if (!grammar.IsMap()) return std::string("grammar must be a map");
    if (auto error = read_choice(
          grammar, "grammar", "dialect", syntax::dialect_from_string, "'standard' or 'legacy'",
          config.grammar.dialect)) {
      return error;
    }
  }

  if (const YAML::Node diagnostics = root["diagnostics"]) {
    if (!diagnostics.IsMap()) return std::string("diagnostics must be a map");
    if (auto error = read_choice(
          diagnostics, "diagnostics", "color", color_mode_from_string,
          "'auto', 'always' or 'never'", config.diagnostics.color)) {
      return error;
    }
  }
  return std::nullopt;
}

ConfigLoadResult finish(const YAML::Node & root, ParserConfig config)
{
  try {
    if (auto error = read_document(root, config)) {
      return ConfigLoadResult::fail(std::move(*error));
    }
  } catch (const YAML::Exception & e) {
    // e.g. a sequence where a scalar was expected
    return ConfigLoadResult::fail(fmt::format("invalid configuration value: {}", e.what()));
  }
  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

std::optional<ColorMode> color_mode_from_string(std::string_view s) noexcept
{
  if (s == "auto") return ColorMode::Auto;
  if (s == "always") return ColorMode::Always;
  if (s == "never") return ColorMode::Never;
  return std::nullopt;
}

ConfigLoadResult load_parser_config(const std::filesystem::path & config_path)
{
  if (!std::filesystem::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  ParserConfig config;
  config.config_root = std::filesystem::absolute(config_path).parent_path();
  try {
    return finish(YAML::LoadFile(config_path.string()), std::move(config));
  } catch (const YAML::ParserException & e) {
    return ConfigLoadResult::fail(fmt::format("failed to parse YAML: {}", e.what()));
  } catch (const YAML::BadFile & e) {
    return ConfigLoadResult::fail(fmt::format("failed to read {}: {}", config_path.string(), e.what()));
  }
}

ConfigLoadResult load_parser_config_from_string(std::string_view yaml_text)
{
  try {
    return finish(YAML::Load(std::string(yaml_text)), ParserConfig{});
  } catch (const YAML::ParserException & e) {
    return ConfigLoadResult::fail(fmt::format("failed to parse YAML: {}", e.what()));
  }
}

std::optional<std::filesystem::path> find_parser_config(const std::filesystem::path & start)
{
  namespace fs = std::filesystem;

  fs::path dir = fs::absolute(start);
  if (fs::is_regular_file(dir)) dir = dir.parent_path();

  for (;;) {
    if (fs::path candidate = dir / k_parser_config_file_name; fs::exists(candidate)) {
      return candidate;
    }
    if (dir == dir.parent_path()) return std::nullopt;
    dir = dir.parent_path();
  }
}

}  // namespace modelspec
