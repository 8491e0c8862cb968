// shimc - shimbridge command line interface
//
// Usage:
//   shimc check <unit.json> [options]
//   shimc emit <unit.json> [-o shim.c] [options]
//
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "shimbridge/basic/diagnostic_printer.hpp"
#include "shimbridge/driver/compiler.hpp"
#include "shimbridge/lsp/diagnostics_client.hpp"
#include "shimbridge/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "shimbridge shim compiler v0.1.0\n\n"
            << "Usage: " << program_name << " <command> <unit.json> [options]\n\n"
            << "Commands:\n"
            << "  check <unit.json>        Elaborate and report shim diagnostics\n"
            << "  emit <unit.json>         Elaborate and write the shim file\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Shim output file (emit)\n"
            << "  --config <path>          Use this shimbridge.yaml\n"
            << "  --tool <command>         Shim language server to launch\n"
            << "  --timeout <ms>           Diagnostics timeout in milliseconds\n"
            << "  --diagnostics            Require shim diagnostics (timeouts are errors)\n"
            << "  --no-diagnostics         Skip shim diagnostics\n"
            << "  -Werror                  Treat shim warnings as errors\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const shimbridge::CompileResult & result)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  shimbridge::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(result.diagnostics, result.host);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::string config_path;
  std::string tool;
  std::string timeout;
  bool require_diagnostics = false;
  bool no_diagnostics = false;
  bool warnings_as_errors = false;
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

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--tool") {
      if (i + 1 < argc) {
        args.tool = argv[++i];
      }
    } else if (arg == "--timeout") {
      if (i + 1 < argc) {
        args.timeout = argv[++i];
      }
    } else if (arg == "--diagnostics") {
      args.require_diagnostics = true;
    } else if (arg == "--no-diagnostics") {
      args.no_diagnostics = true;
    } else if (arg == "-Werror") {
      args.warnings_as_errors = true;
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
// Configuration
// ============================================================================

/// Load shimbridge.yaml (explicit or found next to the input) and apply flags.
bool load_config(
  const CommandArgs & args, const fs::path & input, shimbridge::ProjectConfig & out)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::absolute(args.config_path);
  } else {
    config_path = shimbridge::find_project_config(input.parent_path());
  }

  if (config_path) {
    const auto loaded = shimbridge::load_project_config(*config_path);
    if (!loaded.success) {
      std::cerr << "error: " << loaded.error << "\n";
      return false;
    }
    out = loaded.config;
    if (args.verbose) {
      std::cerr << "Using config: " << config_path->string() << "\n";
    }
  } else {
    out.project_root = input.parent_path();
  }

  if (!args.tool.empty()) {
    out.diagnostics.tool.command = args.tool;
  }
  if (!args.timeout.empty()) {
    char * end = nullptr;
    const unsigned long ms = std::strtoul(args.timeout.c_str(), &end, 10);
    if (end == args.timeout.c_str() || *end != '\0' || ms == 0 || ms > 600000) {
      std::cerr << "error: --timeout expects milliseconds between 1 and 600000\n";
      return false;
    }
    out.diagnostics.timeout_ms = static_cast<uint32_t>(ms);
  }
  if (args.require_diagnostics) {
    out.diagnostics.enabled = true;
  }
  if (args.no_diagnostics) {
    out.diagnostics.enabled = false;
  }
  if (args.warnings_as_errors) {
    out.compiler.warnings_as_errors = true;
  }
  return true;
}

/**
 * Logs each diagnostics round in verbose mode.
 */
class VerboseProvider : public shimbridge::lsp::DiagnosticsProvider
{
public:
  VerboseProvider(shimbridge::lsp::DiagnosticsProvider & inner, std::string tool)
  : inner_(inner), tool_(std::move(tool))
  {
  }

  shimbridge::lsp::CollectResult collect(
    const shimbridge::lsp::CollectRequest & request) override
  {
    std::cerr << "Analysing " << request.text.size() << " bytes of shim code with '" << tool_
              << "'\n";
    auto result = inner_.collect(request);
    switch (result.status) {
      case shimbridge::lsp::CollectResult::Status::Ok:
        std::cerr << "  " << result.diagnostics.size() << " diagnostic(s)\n";
        break;
      case shimbridge::lsp::CollectResult::Status::Timeout:
        std::cerr << "  timed out: " << result.message << "\n";
        break;
      case shimbridge::lsp::CollectResult::Status::ToolError:
        std::cerr << "  tool error: " << result.message << "\n";
        break;
    }
    return result;
  }

private:
  shimbridge::lsp::DiagnosticsProvider & inner_;
  std::string tool_;
};

// ============================================================================
// Commands
// ============================================================================

int cmd_compile(const CommandArgs & args, shimbridge::CompileMode mode)
{
  if (args.input_file.empty()) {
    std::cerr << "error: missing input file\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return 1;
  }

  shimbridge::ProjectConfig config;
  if (!load_config(args, input_path, config)) {
    return 1;
  }

  shimbridge::CompileOptions options;
  options.mode = mode;
  if (!args.output_path.empty()) {
    options.output = fs::absolute(args.output_path);
  }

  shimbridge::lsp::DiagnosticsClient client(config.diagnostics);
  VerboseProvider verbose_client(client, config.diagnostics.tool.command);
  shimbridge::lsp::DiagnosticsProvider * provider = &client;
  if (args.verbose) {
    provider = &verbose_client;
    std::cerr << (mode == shimbridge::CompileMode::Emit ? "Emitting: " : "Checking: ")
              << input_path.string() << "\n";
  }

  const auto result = shimbridge::Compiler::compile_file(input_path, config, options, provider);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result);
  }

  if (args.verbose) {
    std::cerr << "Shim buffer: " << result.shim_commands << " command(s), "
              << result.shim_text.size() << " bytes\n";
  }

  if (!result.success) {
    return 1;
  }

  for (const auto & file : result.generated_files) {
    std::cerr << "Generated: " << file.string() << "\n";
  }
  if (mode == shimbridge::CompileMode::Check) {
    std::cout << args.input_file << ": OK\n";
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

  try {
    if (args.command == "check") {
      return cmd_compile(args, shimbridge::CompileMode::Check);
    }

    if (args.command == "emit") {
      return cmd_compile(args, shimbridge::CompileMode::Emit);
    }
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
