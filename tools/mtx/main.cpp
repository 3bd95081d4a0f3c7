// mtx - matrix_lang command line interface
//
// Usage:
//   mtx run [file.mtx]
//   mtx check [file.mtx]
//   mtx ast <file.mtx>
//   mtx repl
//   mtx init [dir]
//
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

#include "matrix_lang/ast/json_visitor.hpp"
#include "matrix_lang/basic/diagnostic_printer.hpp"
#include "matrix_lang/driver/session.hpp"
#include "matrix_lang/project/project_config.hpp"
#include "matrix_lang/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "matrix_lang v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  run [file.mtx]           Check and evaluate a script (default: project entry)\n"
            << "  check [file.mtx]         Lex, parse and type-check only\n"
            << "  ast <file.mtx>           Print the syntax tree as JSON\n"
            << "  repl                     Interactive session (:type <expr>, :env, :quit)\n"
            << "  init [dir]               Write a default mtx.yaml\n\n"
            << "Options:\n"
            << "  --config <path>          Use this mtx.yaml instead of searching for one\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  --no-jit                 Disable the JIT-eligibility pass\n"
            << "  --jit-debug              Log JIT decisions to stderr\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string config_path;
  bool verbose = false;
  bool no_color = false;
  bool no_jit = false;
  bool jit_debug = false;
  bool show_help = false;
  bool bad_usage = false;
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

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      } else {
        args.bad_usage = true;
      }
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "--no-jit") {
      args.no_jit = true;
    } else if (arg == "--jit-debug") {
      args.jit_debug = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      std::cerr << "error: unexpected argument '" << arg << "'\n";
      args.bad_usage = true;
    }
  }

  return args;
}

// ============================================================================
// Configuration
// ============================================================================

/// Effective settings: mtx.yaml (when present) overridden by flags.
struct Settings
{
  matrix_lang::ProjectConfig config;
  bool has_project = false;
  bool use_color = true;
};

std::optional<Settings> load_settings(const CommandArgs & args)
{
  Settings settings;

  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = matrix_lang::find_project_config(fs::current_path());
  }

  if (config_path) {
    auto result = matrix_lang::load_project_config(*config_path);
    if (!result.success) {
      std::cerr << "error: " << config_path->string() << ": " << result.error << "\n";
      return std::nullopt;
    }
    settings.config = std::move(result.config);
    settings.has_project = true;
    if (args.verbose) {
      std::cerr << "Using configuration: " << config_path->string() << "\n";
    }
  }

  auto & cfg = settings.config;
  if (args.verbose) cfg.options.verbose = true;
  if (args.no_color) cfg.options.color = false;
  if (args.no_jit) cfg.jit.enabled = false;
  if (args.jit_debug) cfg.jit.debug = true;

  // Detect if terminal supports colors (simple check for TTY)
  settings.use_color = cfg.options.color && isatty(fileno(stderr)) != 0;
  return settings;
}

matrix_lang::SessionOptions session_options(const Settings & settings)
{
  matrix_lang::SessionOptions options;
  options.verbose = settings.config.options.verbose;
  options.interpreter.maxCallDepth = settings.config.options.max_call_depth;
  options.interpreter.jitEnabled = settings.config.jit.enabled;
  options.interpreter.jitDebug = settings.config.jit.debug;
  return options;
}

// ============================================================================
// Helpers
// ============================================================================

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream file(path);
  if (!file.is_open()) {
    std::cerr << "error: failed to open file: " << path.string() << "\n";
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

/// Script named on the command line, or the project's entry file.
std::optional<fs::path> resolve_input(const CommandArgs & args, const Settings & settings)
{
  if (!args.input_file.empty()) {
    return fs::absolute(args.input_file);
  }
  if (settings.has_project) {
    return settings.config.project_root / settings.config.project.entry;
  }
  std::cerr << "error: no input file and no " << matrix_lang::k_project_config_file_name
            << " found in current directory or parents\n";
  return std::nullopt;
}

void print_diagnostics(
  const matrix_lang::EvalOutcome & outcome, const Settings & settings)
{
  if (!outcome.source) return;
  for (const auto & diag : outcome.diags) {
    std::cerr << matrix_lang::format_diagnostic(diag, *outcome.source) << "\n";
  }
  if (settings.config.options.verbose) {
    matrix_lang::DiagnosticPrinter printer(std::cerr, settings.use_color);
    printer.print_all(outcome.diags, *outcome.source);
  }
}

// ============================================================================
// Commands
// ============================================================================

int cmd_run(const CommandArgs & args, const Settings & settings)
{
  const auto input = resolve_input(args, settings);
  if (!input) return 1;
  const auto text = read_file(*input);
  if (!text) return 1;

  if (settings.config.options.verbose) {
    std::cerr << "Running: " << input->string() << "\n";
  }

  matrix_lang::Session session(session_options(settings));
  const auto outcome = session.run(*text, *input);
  print_diagnostics(outcome, settings);
  if (!outcome.ok) return 1;

  if (outcome.value && !outcome.value->is_unit()) {
    std::cout << matrix_lang::format_value(*outcome.value) << "\n";
  }
  return 0;
}

int cmd_check(const CommandArgs & args, const Settings & settings)
{
  const auto input = resolve_input(args, settings);
  if (!input) return 1;
  const auto text = read_file(*input);
  if (!text) return 1;

  if (settings.config.options.verbose) {
    std::cerr << "Checking: " << input->string() << "\n";
  }

  matrix_lang::Session session(session_options(settings));
  const auto outcome = session.check(*text, *input);
  print_diagnostics(outcome, settings);
  if (!outcome.ok) return 1;

  std::cout << "OK: " << outcome.type << "\n";
  return 0;
}

int cmd_ast(const CommandArgs & args, const Settings & settings)
{
  const auto input = resolve_input(args, settings);
  if (!input) return 1;
  const auto text = read_file(*input);
  if (!text) return 1;

  auto unit = matrix_lang::parse_source(*input, *text);
  if (!unit->ok()) {
    for (const auto & diag : unit->diags) {
      std::cerr << matrix_lang::format_diagnostic(diag, unit->source) << "\n";
    }
    return 1;
  }

  std::cout << matrix_lang::to_json(unit->program).dump(2) << "\n";
  return 0;
}

int cmd_repl(const Settings & settings)
{
  matrix_lang::Session session(session_options(settings));
  std::cout << "matrix_lang REPL. :type <expr>, :env, :quit\n";

  std::string line;
  while (true) {
    std::cout << "mtx> " << std::flush;
    if (!std::getline(std::cin, line)) break;
    if (line.empty()) continue;

    if (line == ":quit" || line == ":q") break;

    if (line == ":env") {
      for (const auto & [name, type] : session.describe_env()) {
        std::cout << name << " : " << type << "\n";
      }
      continue;
    }

    if (line.rfind(":type ", 0) == 0) {
      const auto outcome = session.type_of(line.substr(6));
      print_diagnostics(outcome, settings);
      if (outcome.ok) std::cout << outcome.type << "\n";
      continue;
    }

    if (line[0] == ':') {
      std::cerr << "error: unknown command '" << line << "'\n";
      continue;
    }

    const auto outcome = session.run(line);
    print_diagnostics(outcome, settings);
    if (outcome.ok && outcome.value && !outcome.value->is_unit()) {
      std::cout << matrix_lang::format_value(*outcome.value) << " : " << outcome.type << "\n";
    }
  }
  return 0;
}

int cmd_init(const CommandArgs & args)
{
  const fs::path project_dir =
    args.input_file.empty() ? fs::current_path() : fs::current_path() / args.input_file;
  const fs::path config_file = project_dir / matrix_lang::k_project_config_file_name;

  if (fs::exists(config_file)) {
    std::cerr << "error: " << config_file.string() << " already exists\n";
    return 1;
  }

  try {
    fs::create_directories(project_dir);

    std::ofstream config(config_file);
    config << matrix_lang::default_project_config(
      fs::absolute(project_dir).filename().string());
    config.close();

    const fs::path main_file = project_dir / "main.mtx";
    if (!fs::exists(main_file)) {
      std::ofstream main(main_file);
      main << "-- main.mtx\n"
           << "let square = (x: Int) => x * x\n"
           << "println(square(7))\n";
      main.close();
    }

    std::cout << "Initialized matrix_lang project in " << project_dir.string() << "\n";
    return 0;
  } catch (const fs::filesystem_error & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }
  if (args.bad_usage) {
    print_usage(argv[0]);
    return 2;
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  const auto settings = load_settings(args);
  if (!settings) {
    return 1;
  }

  if (args.command == "run") {
    return cmd_run(args, *settings);
  }
  if (args.command == "check") {
    return cmd_check(args, *settings);
  }
  if (args.command == "ast") {
    return cmd_ast(args, *settings);
  }
  if (args.command == "repl") {
    return cmd_repl(*settings);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 2;
}
