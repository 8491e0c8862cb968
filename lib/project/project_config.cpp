// shimbridge/project/project_config.cpp - Project configuration implementation
//
#include "shimbridge/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace shimbridge
{

namespace
{

bool read_string_list(
  const YAML::Node & node, const char * what, std::vector<std::string> & out, std::string & error)
{
  if (!node.IsSequence()) {
    error = std::string(what) + " must be a list";
    return false;
  }
  out.clear();
  for (const auto & item : node) {
    out.push_back(item.as<std::string>());
  }
  return true;
}

bool parse_diagnostics(const YAML::Node & diag, DiagnosticsConfig & out, std::string & error)
{
  if (!diag.IsMap()) {
    error = "diagnostics must be a map";
    return false;
  }

  if (diag["enabled"]) {
    out.enabled = diag["enabled"].as<bool>();
  }

  if (diag["timeout_ms"]) {
    const auto timeout = diag["timeout_ms"].as<int64_t>();
    if (timeout <= 0 || timeout > INT32_MAX) {
      error = "diagnostics.timeout_ms must be a positive number of milliseconds";
      return false;
    }
    out.timeout_ms = static_cast<uint32_t>(timeout);
  }

  if (diag["tool"]) {
    out.tool.command = diag["tool"].as<std::string>();
    if (out.tool.command.empty()) {
      error = "diagnostics.tool must not be empty";
      return false;
    }
  }
  if (diag["args"] && !read_string_list(diag["args"], "diagnostics.args", out.tool.args, error)) {
    return false;
  }
  if (
    diag["flags"] && !read_string_list(diag["flags"], "diagnostics.flags", out.tool.flags, error)) {
    return false;
  }

  if (diag["virtual_file"]) {
    out.virtual_file = diag["virtual_file"].as<std::string>();
  }
  if (diag["language_id"]) {
    out.language_id = diag["language_id"].as<std::string>();
  }
  if (diag["idle_state"]) {
    out.idle_state = diag["idle_state"].as<std::string>();
  }
  return true;
}

bool parse_boundary(const YAML::Node & b, BoundaryRuntimeConfig & out, std::string & error)
{
  if (!b.IsMap()) {
    error = "boundary must be a map";
    return false;
  }
  if (b["prelude"] && !read_string_list(b["prelude"], "boundary.prelude", out.prelude, error)) {
    return false;
  }

  const std::pair<const char *, std::string *> names[] = {
    {"external_class_type", &out.external_class_type},
    {"object_type", &out.object_type},
    {"borrowed_object_type", &out.borrowed_object_type},
    {"register_class", &out.register_class},
    {"alloc_external", &out.alloc_external},
    {"get_external_data", &out.get_external_data},
  };
  for (const auto & [key, field] : names) {
    if (b[key]) {
      *field = b[key].as<std::string>();
      if (field->empty()) {
        error = std::string("boundary.") + key + " must not be empty";
        return false;
      }
    }
  }
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  std::string error;
  if (root["diagnostics"] && !parse_diagnostics(root["diagnostics"], config.diagnostics, error)) {
    return ConfigLoadResult::fail(error);
  }

  if (root["compiler"]) {
    const auto & comp = root["compiler"];
    if (comp["warnings_as_errors"]) {
      config.compiler.warnings_as_errors = comp["warnings_as_errors"].as<bool>();
    }
    if (comp["output"]) {
      config.compiler.output = comp["output"].as<std::string>();
    }
  }

  if (root["boundary"] && !parse_boundary(root["boundary"], config.boundary, error)) {
    return ConfigLoadResult::fail(error);
  }

  if (config.compiler.output.is_relative()) {
    config.compiler.output = config.project_root / config.compiler.output;
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  try {
    return parse_root(YAML::Load(yaml_text), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  try {
    return parse_root(
      YAML::LoadFile(config_path.string()), fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace shimbridge
