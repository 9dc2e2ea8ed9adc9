// msc - model specification compiler command line interface
//
// Usage:
//   msc check  [spec | -f file]   Parse and validate
//   msc dump   [spec | -f file]   Print the AST as a tree
//   msc json   [spec | -f file]   Print the AST as JSON
//   msc format [spec | -f file]   Print the canonical form
//
#include <fmt/core.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "modelspec/analysis/model_queries.hpp"
#include "modelspec/ast/ast_dumper.hpp"
#include "modelspec/ast/formatter.hpp"
#include "modelspec/ast/json_visitor.hpp"
#include "modelspec/basic/diagnostic_printer.hpp"
#include "modelspec/config/parser_config.hpp"
#include "modelspec/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_parse_error = 1;
constexpr int k_exit_usage = 2;

void print_usage(const char * program_name)
{
  std::cerr << "Model specification compiler v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [spec | -f file] [options]\n\n"
            << "Commands:\n"
            << "  check                    Parse and validate a model specification\n"
            << "  dump                     Print the parsed model as a tree\n"
            << "  json                     Print the parsed model as JSON\n"
            << "  format                   Print the canonical form of the model\n\n"
            << "Options:\n"
            << "  -f, --file <path>        Read the specification from a file\n"
            << "  --dialect <name>         Grammar dialect: standard (default) or legacy\n"
            << "  --config <path>          Use this modelspec.yaml instead of searching\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string spec_text;
  std::string input_file;
  std::string config_path;
  std::string dialect;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string usage_error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  auto take_value = [&](int & i, const std::string & flag) -> std::string {
    if (i + 1 < argc) {
      return argv[++i];
    }
    args.usage_error = "missing value for " + flag;
    return {};
  };

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-f" || arg == "--file") {
      args.input_file = take_value(i, arg);
    } else if (arg == "--dialect") {
      args.dialect = take_value(i, arg);
    } else if (arg == "--config") {
      args.config_path = take_value(i, arg);
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.usage_error = "unknown option '" + arg + "'";
    } else {
      // An unquoted specification arrives as several words.
      if (!args.spec_text.empty()) args.spec_text += ' ';
      args.spec_text += arg;
    }
  }

  return args;
}

// ============================================================================
// Configuration
// ============================================================================

std::optional<modelspec::ParserConfig> resolve_config(const CommandArgs & args)
{
  modelspec::ParserConfig config;

  std::optional<fs::path> path;
  if (!args.config_path.empty()) {
    path = fs::path(args.config_path);
  } else {
    path = modelspec::find_parser_config(fs::current_path());
  }

  if (path) {
    auto loaded = modelspec::load_parser_config(*path);
    if (!loaded.success) {
      std::cerr << "error: " << loaded.error << "\n";
      return std::nullopt;
    }
    config = std::move(loaded.config);
    if (args.verbose) {
      fmt::print(stderr, "Using configuration: {}\n", path->string());
    }
  }

  if (!args.dialect.empty()) {
    const auto dialect = modelspec::syntax::dialect_from_string(args.dialect);
    if (!dialect) {
      std::cerr << "error: unknown dialect '" << args.dialect << "'\n";
      return std::nullopt;
    }
    config.grammar.dialect = *dialect;
  }
  if (args.no_color) {
    config.diagnostics.color = modelspec::ColorMode::Never;
  }

  return config;
}

bool use_color(modelspec::ColorMode mode)
{
  switch (mode) {
    case modelspec::ColorMode::Always:
      return true;
    case modelspec::ColorMode::Never:
      return false;
    case modelspec::ColorMode::Auto:
      break;
  }
  return isatty(fileno(stderr)) != 0;
}

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// ============================================================================
// Commands
// ============================================================================

int run(const CommandArgs & args)
{
  const auto config = resolve_config(args);
  if (!config) {
    return k_exit_usage;
  }

  std::string text = args.spec_text;
  modelspec::ParseOptions options = config->parse_options();

  if (!args.input_file.empty()) {
    if (!text.empty()) {
      std::cerr << "error: give either a specification or -f, not both\n";
      return k_exit_usage;
    }
    auto content = read_file(args.input_file);
    if (!content) {
      std::cerr << "error: cannot read file: " << args.input_file << "\n";
      return k_exit_usage;
    }
    text = std::move(*content);
    options.source_name = args.input_file;
  } else if (text.empty()) {
    std::cerr << "error: no model specification given\n";
    return k_exit_usage;
  }

  if (args.verbose) {
    fmt::print(
      stderr, "Parsing {} ({} grammar)\n", options.source_name,
      modelspec::syntax::to_string(options.dialect));
  }

  modelspec::DiagnosticBag diags;
  const auto parsed = modelspec::parse_or_report(text, options, diags);
  if (!parsed) {
    const modelspec::SourceManager source(text, options.source_name);
    modelspec::DiagnosticPrinter printer(std::cerr, use_color(config->diagnostics.color));
    printer.print_all(diags, source);
    return k_exit_parse_error;
  }

  const modelspec::Model & model = parsed->model();

  if (args.verbose) {
    fmt::print(
      stderr, "Parsed {} predictor(s), {} condition(s){}\n", model.predictors.size(),
      model.conditions.size(), modelspec::is_gwas(model) ? ", GWAS" : "");
  }

  if (args.command == "check") {
    return k_exit_ok;
  }
  if (args.command == "dump") {
    modelspec::dump(&model, std::cout);
    return k_exit_ok;
  }
  if (args.command == "json") {
    std::cout << modelspec::to_json(model).dump(2) << "\n";
    return k_exit_ok;
  }
  // format
  std::cout << modelspec::format_model(model) << "\n";
  return k_exit_ok;
}

bool is_known_command(const std::string & command)
{
  return command == "check" || command == "dump" || command == "json" || command == "format";
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!is_known_command(args.command)) {
    std::cerr << "error: unknown command '" << args.command << "'\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  if (!args.usage_error.empty()) {
    std::cerr << "error: " << args.usage_error << "\n";
    return k_exit_usage;
  }

  try {
    return run(args);
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return k_exit_usage;
  }
}
