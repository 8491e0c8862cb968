// shimbridge/driver/compiler.hpp - Compiler driver
//
// Single entry point for elaborating a host unit. Used by the CLI and the
// integration tests.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "shimbridge/basic/diagnostic.hpp"
#include "shimbridge/basic/source_manager.hpp"
#include "shimbridge/elab/environment.hpp"
#include "shimbridge/project/project_config.hpp"
#include "shimbridge/syntax/syntax_json.hpp"

namespace shimbridge
{

namespace lsp
{
class DiagnosticsProvider;
}  // namespace lsp

// ============================================================================
// Compile Mode
// ============================================================================

enum class CompileMode {
  Check,  ///< Elaborate and report diagnostics only
  Emit,   ///< Also write the shim file
};

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  CompileMode mode = CompileMode::Check;

  /// Shim output file (overrides project config)
  std::optional<std::filesystem::path> output;
};

// ============================================================================
// Compile Result
// ============================================================================

struct CompileResult
{
  /// Whether elaboration succeeded (no errors)
  bool success = false;

  DiagnosticBag diagnostics;

  /// Host source the diagnostics refer to
  SourceFile host;

  /// Rendered shim text
  std::string shim_text;

  /// Number of commands in the shim buffer (prelude included)
  size_t shim_commands = 0;

  /// Generated files (Emit mode only)
  std::vector<std::filesystem::path> generated_files;
};

// ============================================================================
// Compiler
// ============================================================================

class Compiler
{
public:
  /**
   * Elaborate an already loaded host unit.
   *
   * @param unit Host file and command syntax
   * @param config Project configuration (CLI overrides already applied)
   * @param options Compile options
   * @param provider Shim diagnostics source; nullptr disables diagnostics rounds
   */
  [[nodiscard]] static CompileResult compile_unit(
    const HostUnit & unit, const ProjectConfig & config, const CompileOptions & options,
    lsp::DiagnosticsProvider * provider);

  /**
   * Load a host unit from its JSON interchange file and elaborate it.
   */
  [[nodiscard]] static CompileResult compile_file(
    const std::filesystem::path & file, const ProjectConfig & config,
    const CompileOptions & options, lsp::DiagnosticsProvider * provider);

private:
  /// Write the shim file; reports failures to `diags`.
  static bool write_shim(
    const std::filesystem::path & path, const std::string & text, DiagnosticBag & diags);
};

}  // namespace shimbridge
