// shimbridge/project/project_config.hpp - Project configuration (shimbridge.yaml)
//
// Parses and validates shimbridge.yaml. The same structures carry the
// options consumed during elaboration, so command-line overrides are
// applied directly on a loaded ProjectConfig.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace shimbridge
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * The shim language server to launch.
 */
struct ToolConfig
{
  std::string command = "clangd";
  std::vector<std::string> args;

  /// Compile flags for the virtual document (sent as clangd fallbackFlags)
  std::vector<std::string> flags;
};

/**
 * Diagnostics collection options.
 */
struct DiagnosticsConfig
{
  /// Unset means "implicitly enabled": timeouts are then skipped silently.
  std::optional<bool> enabled;

  /// How long to wait for the tool to report the document idle
  uint32_t timeout_ms = 1000;

  ToolConfig tool;

  /// File name of the virtual shim document; lines starting with it are noise
  std::string virtual_file = "nul";

  std::string language_id = "c";

  /// Value of the file status "state" field that marks analysis completion
  std::string idle_state = "idle";

  [[nodiscard]] bool is_enabled() const noexcept { return enabled.value_or(true); }

  [[nodiscard]] bool explicitly_requested() const noexcept { return enabled.value_or(false); }
};

/**
 * Host compiler options consumed by the core.
 */
struct CompilerConfig
{
  bool warnings_as_errors = false;

  /// Where `shimc emit` writes the shim file
  std::filesystem::path output = "generated/shim.c";
};

/**
 * Runtime entry points used by generated boundary code.
 */
struct BoundaryRuntimeConfig
{
  /// Lines emitted at the top of the shim file
  std::vector<std::string> prelude = {"#include <lean/lean.h>"};

  std::string external_class_type = "lean_external_class";
  std::string object_type = "lean_object";
  std::string borrowed_object_type = "b_lean_obj_arg";
  std::string register_class = "lean_register_external_class";
  std::string alloc_external = "lean_alloc_external";
  std::string get_external_data = "lean_get_external_data";
};

/**
 * Complete project configuration (shimbridge.yaml).
 */
struct ProjectConfig
{
  DiagnosticsConfig diagnostics;
  CompilerConfig compiler;
  BoundaryRuntimeConfig boundary;

  /// Directory containing shimbridge.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a shimbridge.yaml file.
 *
 * @param config_path Path to shimbridge.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text. Relative paths resolve against `project_root`.
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to shimbridge.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "shimbridge.yaml";

}  // namespace shimbridge
