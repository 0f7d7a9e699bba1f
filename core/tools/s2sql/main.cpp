// s2sql - SingleStore/MySQL SQL transpiler command line interface
//
// Usage:
//   s2sql transpile [file.sql] [-e SQL] [--read D] [--write D] [--identify]
//   s2sql tokenize [file.sql] [-e SQL] [--read D]
//   s2sql dump [file.sql] [-e SQL] [--read D]
//   s2sql format-time <format> [--read D] [--write D]
//   s2sql dialects
//   s2sql init
//
#include <fmt/core.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
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

#include "s2sql/basic/diagnostic_printer.hpp"
#include "s2sql/dialect/dialect_registry.hpp"
#include "s2sql/driver/transpiler.hpp"
#include "s2sql/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "s2sql - SingleStore SQL transpiler v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  transpile [file.sql]     Rewrite SQL from one dialect into another\n"
            << "  tokenize [file.sql]      Print the token stream\n"
            << "  dump [file.sql]          Print the syntax tree as JSON\n"
            << "  format-time <format>     Re-spell a date/time format string\n"
            << "  dialects                 List known dialects\n"
            << "  init                     Write a default s2sql.yaml\n\n"
            << "Options:\n"
            << "  -e, --execute <sql>      Read SQL from the argument instead of a file\n"
            << "  --read <dialect>         Input dialect (default: singlestore)\n"
            << "  --write <dialect>        Output dialect (default: singlestore)\n"
            << "  --identify               Quote every identifier\n"
            << "  --config <path>          Use this s2sql.yaml instead of searching for one\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n\n"
            << "Without a file or -e, SQL is read from standard input.\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::optional<std::string> execute;
  std::optional<std::string> read;
  std::optional<std::string> write;
  std::optional<std::string> config_path;
  bool identify = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
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

  const auto take_value = [&](int & i, const std::string & flag) -> std::optional<std::string> {
    if (i + 1 < argc) {
      return std::string(argv[++i]);
    }
    args.error = "missing value for " + flag;
    return std::nullopt;
  };

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-e" || arg == "--execute") {
      args.execute = take_value(i, arg);
    } else if (arg == "--read") {
      args.read = take_value(i, arg);
    } else if (arg == "--write") {
      args.write = take_value(i, arg);
    } else if (arg == "--config") {
      args.config_path = take_value(i, arg);
    } else if (arg == "--identify") {
      args.identify = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.error = "unexpected argument '" + arg + "'";
    }
  }

  return args;
}

// ============================================================================
// Shared setup
// ============================================================================

struct Environment
{
  s2sql::ProjectConfig config;
  bool use_color = false;
};

/// Load s2sql.yaml (explicit or discovered) and apply command line overrides.
std::optional<Environment> load_environment(const CommandArgs & args)
{
  Environment env;

  std::optional<fs::path> config_path;
  if (args.config_path) {
    config_path = *args.config_path;
  } else {
    config_path = s2sql::find_project_config(fs::current_path());
  }

  if (config_path) {
    const auto result = s2sql::load_project_config(*config_path);
    if (!result.success) {
      std::cerr << "error: " << result.error << "\n";
      return std::nullopt;
    }
    env.config = result.config;
    if (args.verbose) {
      std::cerr << "Using configuration: " << config_path->string() << "\n";
    }
  }

  auto & tr = env.config.transpile;
  if (args.read) tr.read = *args.read;
  if (args.write) tr.write = *args.write;
  if (args.identify) tr.identify = true;

  switch (env.config.output.color) {
    case s2sql::ColorMode::Always:
      env.use_color = true;
      break;
    case s2sql::ColorMode::Never:
      env.use_color = false;
      break;
    case s2sql::ColorMode::Auto:
      env.use_color = isatty(fileno(stderr)) != 0;
      break;
  }
  if (args.no_color) {
    env.use_color = false;
  }

  return env;
}

/// SQL text from -e, the input file, or standard input.
std::optional<std::string> read_input(const CommandArgs & args, fs::path & path)
{
  if (args.execute) {
    path = "<command-line>";
    return *args.execute;
  }

  if (args.input_file.empty()) {
    path = "<stdin>";
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }

  path = args.input_file;
  if (!fs::exists(path)) {
    std::cerr << "error: file not found: " << path.string() << "\n";
    return std::nullopt;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    std::cerr << "error: failed to open file: " << path.string() << "\n";
    return std::nullopt;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

void print_diagnostics(const s2sql::DriverResult & result, bool use_color)
{
  if (result.diagnostics.empty()) {
    return;
  }
  s2sql::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(result.diagnostics, *result.source);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_transpile(const CommandArgs & args, const Environment & env)
{
  fs::path path;
  auto sql = read_input(args, path);
  if (!sql) {
    return 1;
  }

  s2sql::TranspileOptions options;
  options.read = env.config.transpile.read;
  options.write = env.config.transpile.write;
  options.identify = env.config.transpile.identify;

  if (args.verbose) {
    std::cerr << "Transpiling " << path.string() << ": " << options.read << " -> "
              << options.write << "\n";
  }

  const auto result = s2sql::Transpiler::transpile(std::move(*sql), options, path);
  print_diagnostics(result, env.use_color);

  if (!result.success) {
    return 1;
  }

  for (const auto & stmt : result.statements) {
    std::cout << stmt << ";\n";
  }

  if (args.verbose) {
    std::cerr << "Wrote " << result.statements.size() << " statement(s), "
              << result.diagnostics.warning_count() << " warning(s)\n";
  }
  return 0;
}

int cmd_tokenize(const CommandArgs & args, const Environment & env)
{
  fs::path path;
  auto sql = read_input(args, path);
  if (!sql) {
    return 1;
  }

  const auto result =
    s2sql::Transpiler::tokenize(std::move(*sql), env.config.transpile.read, path);
  print_diagnostics(result, env.use_color);

  for (const auto & t : result.tokens) {
    if (t.kind == s2sql::syntax::TokenKind::Eof) {
      break;
    }
    const auto lc = result.source->get_line_column(t.begin());
    fmt::print(
      "{}:{}\t{}\t{}\n", lc.line, lc.column, s2sql::syntax::to_string(t.kind),
      result.source->get_slice(t.range));
  }

  return result.success ? 0 : 1;
}

int cmd_dump(const CommandArgs & args, const Environment & env)
{
  fs::path path;
  auto sql = read_input(args, path);
  if (!sql) {
    return 1;
  }

  const auto result = s2sql::Transpiler::dump(std::move(*sql), env.config.transpile.read, path);
  print_diagnostics(result, env.use_color);

  std::cout << result.ast.dump(2) << "\n";
  return result.success ? 0 : 1;
}

int cmd_format_time(const CommandArgs & args, const Environment & env)
{
  if (args.input_file.empty()) {
    std::cerr << "error: format string required\n";
    std::cerr << "usage: s2sql format-time <format> [--read D] [--write D]\n";
    return 1;
  }

  const auto & tr = env.config.transpile;
  const auto result = s2sql::Transpiler::format_time(args.input_file, tr.read, tr.write);
  print_diagnostics(result, env.use_color);

  if (args.verbose) {
    std::cerr << "Canonical: " << result.canonical << "\n";
  }

  if (!result.success) {
    return 1;
  }
  std::cout << result.format << "\n";
  return 0;
}

int cmd_dialects()
{
  for (const auto name : s2sql::dialect::DialectRegistry::instance().names()) {
    std::cout << name << "\n";
  }
  return 0;
}

int cmd_init()
{
  const fs::path config_path = fs::current_path() / s2sql::k_project_config_file_name;

  if (fs::exists(config_path)) {
    std::cerr << "error: configuration already exists: " << config_path.string() << "\n";
    return 1;
  }

  std::ofstream config(config_path);
  if (!config.is_open()) {
    std::cerr << "error: failed to create " << config_path.string() << "\n";
    return 1;
  }
  config << s2sql::default_project_config_text();
  config.close();

  std::cout << "Created " << config_path.string() << "\n";
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    return 1;
  }

  try {
    if (args.command == "dialects") {
      return cmd_dialects();
    }

    if (args.command == "init") {
      return cmd_init();
    }

    const auto env = load_environment(args);
    if (!env) {
      return 1;
    }

    if (args.command == "transpile") {
      return cmd_transpile(args, *env);
    }

    if (args.command == "tokenize") {
      return cmd_tokenize(args, *env);
    }

    if (args.command == "dump") {
      return cmd_dump(args, *env);
    }

    if (args.command == "format-time") {
      return cmd_format_time(args, *env);
    }
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
