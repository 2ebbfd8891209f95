// typescan - Type scanning command line interface
//
// Usage:
//   typescan scan [typescan.yaml] [--graph graph.json] [--format text|json] [-o output]
//   typescan check [typescan.yaml] [--graph graph.json]
//   typescan types <graph.json> [--module name]
//
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "typescan/basic/diagnostic_printer.hpp"
#include "typescan/driver/scan_driver.hpp"
#include "typescan/graph/graph_loader.hpp"
#include "typescan/match/type_scanner.hpp"
#include "typescan/project/scan_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "typescan v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  scan [typescan.yaml]     Evaluate every query and print the matches\n"
            << "  check [typescan.yaml]    Load the graph and validate the queries\n"
            << "  types <graph.json>       List declarations in scan order\n\n"
            << "Options:\n"
            << "  --graph <path>           Type graph file (overrides configuration)\n"
            << "  --format <text|json>     Output format (overrides configuration)\n"
            << "  -o, --output <path>      Output file (default: stdout)\n"
            << "  --module <name>          Restrict 'types' to one module\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const typescan::DiagnosticBag & diagnostics)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  typescan::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string graph_path;
  std::string format;
  std::string output_path;
  std::string module_name;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

// Options that consume the following argument
std::string * value_slot(CommandArgs & args, const std::string & flag)
{
  if (flag == "--graph") return &args.graph_path;
  if (flag == "--format") return &args.format;
  if (flag == "-o" || flag == "--output") return &args.output_path;
  if (flag == "--module") return &args.module_name;
  return nullptr;
}

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;
  if (argc < 2 || std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help") {
    args.show_help = true;
    return args;
  }
  args.command = argv[1];

  for (int i = 2; i < argc && args.error.empty(); ++i) {
    const std::string arg = argv[i];
    if (std::string * slot = value_slot(args, arg)) {
      if (i + 1 >= argc) {
        args.error = "option '" + arg + "' requires a value";
      } else {
        *slot = argv[++i];
      }
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option '" + arg + "'";
    } else if (args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.error = "unexpected argument '" + arg + "'";
    }
  }
  return args;
}

// ============================================================================
// Commands
// ============================================================================

std::optional<typescan::ConfigLoadResult> load_config(const CommandArgs & args)
{
  fs::path config_path;
  if (args.input_file.empty()) {
    auto found = typescan::find_scan_config(fs::current_path());
    if (!found) {
      std::cerr << "error: no " << typescan::k_scan_config_file_name
                << " found in current directory or parents\n";
      return std::nullopt;
    }
    config_path = *found;
  } else {
    config_path = fs::absolute(args.input_file);
  }

  auto result = typescan::load_scan_config(config_path);
  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics);
  }
  if (!result.success) {
    return std::nullopt;
  }
  return result;
}

int run_scan(const CommandArgs & args, typescan::ScanMode mode)
{
  typescan::ScanOptions options;
  options.mode = mode;
  options.verbose = args.verbose;

  if (!args.graph_path.empty()) {
    options.graph_path = fs::absolute(args.graph_path);
  }
  if (!args.output_path.empty()) {
    options.output_path = fs::absolute(args.output_path);
  }
  if (!args.format.empty()) {
    if (args.format == "text") {
      options.format = typescan::OutputFormat::Text;
    } else if (args.format == "json") {
      options.format = typescan::OutputFormat::Json;
    } else {
      std::cerr << "error: unknown output format '" << args.format << "' (expected text or json)\n";
      return 1;
    }
  }

  const auto config_result = load_config(args);
  if (!config_result) {
    return 1;
  }
  const typescan::ScanConfig & config = config_result->config;

  if (args.verbose) {
    std::cerr << (mode == typescan::ScanMode::Check ? "Checking project: " : "Scanning project: ")
              << config.project_name << "\n";
  }

  const auto result = typescan::ScanDriver::run(config, options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics);
  }

  if (mode == typescan::ScanMode::Check) {
    if (result.success) {
      std::cout << config.project_name << ": OK\n";
      return 0;
    }
    return 1;
  }

  if (result.written_file) {
    std::cerr << "Generated: " << result.written_file->string() << "\n";
  } else {
    std::cout << result.output;
  }

  return result.success ? 0 : 1;
}

int cmd_types(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: graph file required\n";
    std::cerr << "usage: typescan types <graph.json> [--module name]\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  if (args.verbose) {
    std::cerr << "Loading graph: " << input_path.string() << "\n";
  }

  auto loaded = typescan::load_graph_file(input_path);
  if (!loaded.diagnostics.empty()) {
    print_diagnostics(loaded.diagnostics);
  }
  if (!loaded.success()) {
    return 1;
  }
  const typescan::TypeGraph & graph = *loaded.graph;

  std::vector<const typescan::Module *> modules;
  if (args.module_name.empty()) {
    modules = graph.modules();
  } else if (const auto * module = graph.find_module(args.module_name)) {
    modules.push_back(module);
  } else {
    std::cerr << "error: unknown module '" << args.module_name << "'\n";
    return 1;
  }

  typescan::ModuleTypeCursor cursor(modules);
  while (const typescan::TypeDecl * decl = cursor.next()) {
    std::cout << decl->module->name << ": " << typescan::to_string(decl->accessibility) << " "
              << typescan::to_string(decl->kind) << " " << decl->display_name() << "\n";
  }

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
    return 2;
  }

  if (args.command == "scan") {
    return run_scan(args, typescan::ScanMode::Scan);
  }

  if (args.command == "check") {
    return run_scan(args, typescan::ScanMode::Check);
  }

  if (args.command == "types") {
    return cmd_types(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
