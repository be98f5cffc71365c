// owncheck - Ownership Graph Validator Command Line Interface
//
// Usage:
//   owncheck check [file.yaml | --project] [--format text|json] [--Werror]
//   owncheck graph <file.yaml>
//   owncheck init <project-name>
//
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
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

#include <nlohmann/json.hpp>

#include "owncheck/basic/diagnostic_printer.hpp"
#include "owncheck/driver/checker.hpp"
#include "owncheck/model/decl_loader.hpp"
#include "owncheck/project/project_config.hpp"
#include "owncheck/report/json_report.hpp"
#include "owncheck/sema/decl_table.hpp"
#include "owncheck/sema/ownership_graph.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "owncheck - ownership graph validator v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [file.yaml]        Validate a declaration file or project\n"
            << "  graph <file.yaml>        Print the ownership graph and its SCCs as JSON\n"
            << "  init <project-name>      Initialize a new project\n\n"
            << "Options:\n"
            << "  --project                Check the project from owncheck.yaml\n"
            << "  --format <text|json>     Diagnostic output format (default: text)\n"
            << "  --Werror                 Treat warnings as errors\n"
            << "  --max-depth <n>          Value type chain depth limit\n"
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
  std::string format = "text";
  std::optional<size_t> max_depth;
  bool use_project = false;
  bool warnings_as_errors = false;
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

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--format") {
      if (i + 1 < argc) {
        args.format = argv[++i];
      }
    } else if (arg == "--max-depth") {
      if (i + 1 < argc) {
        const std::string value = argv[++i];
        char * end = nullptr;
        const long depth = std::strtol(value.c_str(), &end, 10);
        if (end == value.c_str() || *end != '\0' || depth < 1) {
          args.error = "invalid --max-depth: '" + value + "'";
        } else {
          args.max_depth = static_cast<size_t>(depth);
        }
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--Werror") {
      args.warnings_as_errors = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  if (args.error.empty() && args.format != "text" && args.format != "json") {
    args.error = "invalid --format: '" + args.format + "' (must be 'text' or 'json')";
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  owncheck::CheckOptions options;
  options.max_value_chain_depth = args.max_depth;
  options.warnings_as_errors = args.warnings_as_errors;
  options.verbose = args.verbose;

  owncheck::CheckResult result;

  if (args.use_project || args.input_file.empty()) {
    // Project mode: find owncheck.yaml
    auto config_path = owncheck::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no owncheck.yaml found in current directory or parents\n";
      return 1;
    }

    const auto config_result = owncheck::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }

    if (args.verbose) {
      std::cerr << "Checking project: " << config_result.config.package.name << "\n";
    }

    result = owncheck::Checker::check_project(config_result.config, options);
  } else {
    // Single file mode
    const fs::path input_path = fs::absolute(args.input_file);

    if (!fs::exists(input_path)) {
      std::cerr << "error: file not found: " << input_path.string() << "\n";
      return 1;
    }

    if (args.verbose) {
      std::cerr << "Checking: " << input_path.string() << "\n";
    }

    result = owncheck::Checker::check_file(input_path, options);
  }

  for (const auto & error : result.input_errors) {
    std::cerr << "error: " << error << "\n";
  }
  if (!result.input_errors.empty()) {
    return 1;
  }

  if (args.format == "json") {
    std::cout << owncheck::to_json(result.diagnostics.all()).dump(2) << "\n";
    return result.success ? 0 : 1;
  }

  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  owncheck::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(result.diagnostics);
  if (!result.diagnostics.empty()) {
    printer.print_summary(result.diagnostics.error_count(), result.diagnostics.warning_count());
  }

  if (result.success) {
    std::cout << (args.input_file.empty() ? "project" : args.input_file) << ": OK\n";
    return 0;
  }

  return 1;
}

int cmd_graph(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input declaration file required\n";
    std::cerr << "usage: owncheck graph <file.yaml>\n";
    return 1;
  }

  const auto loaded = owncheck::load_declarations(fs::absolute(args.input_file));
  if (!loaded.success) {
    std::cerr << "error: " << loaded.error << "\n";
    return 1;
  }

  owncheck::DiagnosticBag diags;
  owncheck::DeclTable table(&diags);
  table.build(loaded.declarations);

  owncheck::OwnershipGraph graph(&diags);
  graph.build(
    table, args.max_depth.value_or(owncheck::k_default_max_value_chain_depth));

  auto j = owncheck::to_json(graph);
  j["diagnostics"] = owncheck::to_json(diags.all())["diagnostics"];
  std::cout << j.dump(2) << "\n";

  if (args.verbose) {
    std::cerr << "Nodes: " << graph.node_count() << ", edges: " << graph.edge_count()
              << ", components: " << graph.scc_count() << "\n";
  }
  return 0;
}

int cmd_init(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: project name required\n";
    std::cerr << "usage: owncheck init <project-name>\n";
    return 1;
  }

  const fs::path project_dir = fs::current_path() / args.input_file;

  if (fs::exists(project_dir)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return 1;
  }

  try {
    fs::create_directories(project_dir / "decls");

    std::ofstream config(project_dir / owncheck::k_project_config_file_name);
    config << "package:\n"
           << "  name: '" << args.input_file << "'\n"
           << "  version: '0.1.0'\n\n"
           << "check:\n"
           << "  inputs:\n"
           << "    - './decls/model.yaml'\n"
           << "  max_value_chain_depth: " << owncheck::k_default_max_value_chain_depth << "\n"
           << "  warnings_as_errors: false\n";
    config.close();

    std::ofstream model(project_dir / "decls" / "model.yaml");
    model << "# @owns(Node) class Tree\n"
          << "# @owns(Node) class Node\n"
          << "declarations:\n"
          << "  - name: Tree\n"
          << "    kind: reference\n"
          << "    owns: [Node]\n"
          << "    members:\n"
          << "      - { name: root, type: Node }\n"
          << "  - name: Node\n"
          << "    kind: reference\n"
          << "    owns: [Node]\n"
          << "    members:\n"
          << "      - { name: next, type: Node }\n";
    model.close();

    std::cout << "Initialized new owncheck project in " << project_dir.string() << "\n";
    std::cout << "\nNext steps:\n"
              << "  cd " << args.input_file << "\n"
              << "  owncheck check\n";

    return 0;
  } catch (const std::exception & e) {
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
    return args.command.empty() ? 1 : 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    return 1;
  }

  try {
    if (args.command == "check") {
      return cmd_check(args);
    }
    if (args.command == "graph") {
      return cmd_graph(args);
    }
    if (args.command == "init") {
      return cmd_init(args);
    }
  } catch (const owncheck::InternalError & e) {
    std::cerr << "internal error: " << e.what() << "\n";
    return 2;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
