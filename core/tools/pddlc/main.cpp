// pddlc - PDDL structure checker and completion tool
//
// Usage:
//   pddlc check [file.pddl | --project]
//   pddlc complete <file.pddl> --offset N [--trigger C]
//   pddlc tree <file.pddl>
//
#include <cstdlib>
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

#include <nlohmann/json.hpp>

#include "pddl/basic/diagnostic_printer.hpp"
#include "pddl/driver/checker.hpp"
#include "pddl/lsp.hpp"
#include "pddl/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "PDDL structure checker v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [file.pddl]        Check bracket balance and section order\n"
            << "  complete <file.pddl>     Print completion items as JSON\n"
            << "  tree <file.pddl>         Print the syntax tree\n\n"
            << "Options:\n"
            << "  --project                Check the files listed in pddl.yaml\n"
            << "  --offset <n>             Byte offset for 'complete'\n"
            << "  --trigger <c>            Trigger character for 'complete'\n"
            << "  --job-scheduling         Offer :job structures and requirement\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_result(const pddl::CheckResult & result)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  pddl::DiagnosticPrinter printer(std::cerr, use_color);

  for (const auto & error : result.io_errors) {
    std::cerr << "error: " << error << "\n";
  }
  for (const auto & file : result.files) {
    printer.print_all(file.diagnostics, file.source);
  }
}

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::optional<uint32_t> offset;
  std::string trigger;
  bool use_project = false;
  bool job_scheduling = false;
  bool verbose = false;
  bool show_help = false;
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

    if (arg == "--offset") {
      if (i + 1 < argc) {
        args.offset = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
      }
    } else if (arg == "--trigger") {
      if (i + 1 < argc) {
        args.trigger = argv[++i];
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--job-scheduling") {
      args.job_scheduling = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  pddl::CheckOptions options;
  options.job_scheduling = args.job_scheduling;
  options.verbose = args.verbose;

  pddl::CheckResult result;

  if (args.use_project || args.input_file.empty()) {
    // Project mode: find pddl.yaml
    auto config_path = pddl::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << pddl::k_project_config_file_name
                << " found in current directory or parents\n";
      return 1;
    }

    const auto config_result = pddl::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }

    if (args.verbose) {
      std::cerr << "Checking project: " << config_result.config.package.name << "\n";
    }

    result = pddl::Checker::check_project(config_result.config, options);
  } else {
    // Single file mode
    const fs::path input_path = fs::absolute(args.input_file);

    if (!fs::exists(input_path)) {
      std::cerr << "error: file not found: " << input_path.string() << "\n";
      return 1;
    }

    result = pddl::Checker::check_file(input_path, options);
  }

  print_result(result);

  if (result.success) {
    std::cout << (args.input_file.empty() ? "project" : args.input_file) << ": OK\n";
    return 0;
  }

  return 1;
}

/// Load the input file (and, for a problem, the domain files beside it) into a workspace.
std::optional<std::string> load_workspace(const CommandArgs & args, pddl::lsp::Workspace & ws)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    return std::nullopt;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  const auto text = read_file(input_path);
  if (!text) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return std::nullopt;
  }

  const std::string uri = "file://" + input_path.string();
  ws.set_document(uri, *text);

  std::error_code ec;
  for (const auto & entry : fs::directory_iterator(input_path.parent_path(), ec)) {
    if (entry.path() == input_path || entry.path().extension() != ".pddl") {
      continue;
    }
    if (const auto sibling = read_file(entry.path())) {
      ws.set_document("file://" + entry.path().string(), *sibling);
    }
  }

  return uri;
}

int cmd_complete(const CommandArgs & args)
{
  if (!args.offset) {
    std::cerr << "error: --offset required\n";
    std::cerr << "usage: pddlc complete <file.pddl> --offset N [--trigger C]\n";
    return 1;
  }

  pddl::lsp::Workspace ws;
  pddl::lsp::CompletionOptions options;
  options.job_scheduling = args.job_scheduling;
  if (!args.job_scheduling && !args.input_file.empty()) {
    if (const auto config_path = pddl::find_project_config(fs::absolute(args.input_file))) {
      const auto config_result = pddl::load_project_config(*config_path);
      if (config_result.success) {
        options.job_scheduling = config_result.config.completion.job_scheduling;
      } else {
        std::cerr << "warning: " << config_result.error << "\n";
      }
    }
  }
  ws.set_options(options);

  const auto uri = load_workspace(args, ws);
  if (!uri) {
    return 1;
  }

  const auto out = nlohmann::json::parse(ws.completion_json(*uri, *args.offset, args.trigger));
  std::cout << out.dump(2) << "\n";
  return 0;
}

int cmd_tree(const CommandArgs & args)
{
  pddl::lsp::Workspace ws;
  const auto uri = load_workspace(args, ws);
  if (!uri) {
    return 1;
  }
  std::cout << ws.tree_dump(*uri);
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  try {
    const CommandArgs args = parse_args(argc, argv);

    if (args.show_help) {
      print_usage(argv[0]);
      return 0;
    }

    if (args.command == "check") {
      return cmd_check(args);
    }

    if (args.command == "complete") {
      return cmd_complete(args);
    }

    if (args.command == "tree") {
      return cmd_tree(args);
    }

    std::cerr << "error: unknown command '" << args.command << "'\n";
    print_usage(argv[0]);
    return 1;
  } catch (const std::exception & e) {
    std::cerr << "pddlc: fatal error: " << e.what() << "\n";
    return 1;
  }
}
