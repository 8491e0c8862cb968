// shimbridge/boundary/boundary_generator.cpp - Opaque host types backed by shim storage
#include "shimbridge/boundary/boundary_generator.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <functional>
#include <set>
#include <utility>

#include "shimbridge/elab/shim_diagnostics.hpp"
#include "shimbridge/syntax/reprint.hpp"

namespace shimbridge
{

namespace
{

bool is_ascii_alnum(uint32_t cp)
{
  return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') || (cp >= '0' && cp <= '9');
}

/// Decode the UTF-8 code point at `i` and advance past it. Invalid bytes decode as themselves.
uint32_t next_code_point(std::string_view s, size_t & i)
{
  const auto c0 = static_cast<unsigned char>(s[i]);
  const auto cont = [&s](size_t k) { return static_cast<unsigned char>(s[k]) & 0x3Fu; };
  if ((c0 & 0xE0) == 0xC0 && i + 1 < s.size()) {
    const uint32_t cp = ((c0 & 0x1Fu) << 6) | cont(i + 1);
    i += 2;
    return cp;
  }
  if ((c0 & 0xF0) == 0xE0 && i + 2 < s.size()) {
    const uint32_t cp = ((c0 & 0x0Fu) << 12) | (cont(i + 1) << 6) | cont(i + 2);
    i += 3;
    return cp;
  }
  if ((c0 & 0xF8) == 0xF0 && i + 3 < s.size()) {
    const uint32_t cp =
      ((c0 & 0x07u) << 18) | (cont(i + 1) << 12) | (cont(i + 2) << 6) | cont(i + 3);
    i += 4;
    return cp;
  }
  i += 1;
  return c0;
}

void mangle_component(std::string_view component, std::string & out)
{
  size_t i = 0;
  while (i < component.size()) {
    const uint32_t cp = next_code_point(component, i);
    if (is_ascii_alnum(cp)) {
      out.push_back(static_cast<char>(cp));
    } else if (cp == '_') {
      out += "__";
    } else if (cp <= 0xFFFF) {
      out += fmt::format("_u{:04x}", cp);
    } else {
      out += fmt::format("_U{:08x}", cp);
    }
  }
}

std::string trim_copy(std::string_view s)
{
  while (!s.empty() && (s.front() == ' ' || s.front() == '\n' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\n' || s.back() == '\t')) {
    s.remove_suffix(1);
  }
  return std::string(s);
}

std::string join(const std::vector<std::string> & items, std::string_view sep)
{
  std::string out;
  for (const auto & item : items) {
    if (!out.empty()) {
      out += sep;
    }
    out += item;
  }
  return out;
}

}  // namespace

// ============================================================================
// Names
// ============================================================================

std::string mangle_name(std::string_view full_name, std::string_view prefix)
{
  std::string out(prefix);
  size_t pos = 0;
  bool first = true;
  while (pos <= full_name.size()) {
    size_t dot = full_name.find('.', pos);
    if (dot == std::string_view::npos) {
      dot = full_name.size();
    }
    if (!first) {
      out.push_back('_');
    }
    mangle_component(full_name.substr(pos, dot - pos), out);
    first = false;
    pos = dot + 1;
  }
  return out;
}

BoundaryNames derive_boundary_names(std::string_view resolved_name)
{
  const std::string mangled = mangle_name(resolved_name);
  return BoundaryNames{"shim_to_" + mangled, "shim_of_" + mangled, "shim_class_" + mangled};
}

BoundaryNames resolve_boundary_names(
  std::string_view resolved_name, const BoundaryConfig & config)
{
  BoundaryNames names = derive_boundary_names(resolved_name);
  if (config.wrap) names.wrap = *config.wrap;
  if (config.unwrap) names.unwrap = *config.unwrap;
  if (config.ext_class) names.ext_class = *config.ext_class;
  return names;
}

// ============================================================================
// Configuration
// ============================================================================

std::optional<BoundaryConfig> evaluate_boundary_config(
  Environment & env, const Syntax & config, const Syntax & target)
{
  BoundaryConfig result;
  bool ok = true;

  const auto report = [&env, &ok](SourceRange range, std::string message) {
    env.report_error(range, std::move(message), diag_code::k_boundary_config);
    ok = false;
  };

  // Target type: reprinted tokens, default "void *".
  if (target.is_node() && target.num_children() > 0) {
    const ReprintResult printed = reprint(target);
    if (!printed.ok()) {
      report(target.range(), "target type cannot be printed as shim code");
    } else {
      std::string text = trim_copy(*printed.text);
      if (!text.empty()) {
        result.target_type = std::move(text);
      }
    }
  } else if (target.is_atom() || target.is_ident()) {
    result.target_type = target.value();
  }

  if (!config.is_node() || config.kind() != k_boundary_config_kind) {
    report(config.range(), "expected a boundary configuration");
    return std::nullopt;
  }

  std::set<std::string, std::less<>> seen;
  for (const auto & field : config.children()) {
    if (!field.is_node() || field.kind() != k_config_field_kind) {
      report(field.range(), "expected 'name := value' in boundary configuration");
      continue;
    }

    const Syntax & key = field.child(0);
    const Syntax & value = field.child(1);
    if (!key.is_ident() || !(value.is_ident() || value.is_atom()) || value.value().empty()) {
      report(field.range(), "boundary configuration fields take a name and a function name");
      continue;
    }

    const std::string & name = key.value();
    if (!seen.insert(name).second) {
      report(key.range(), "duplicate field '" + name + "' in boundary configuration");
      continue;
    }

    if (name == "finalize") {
      result.finalize = value.value();
    } else if (name == "foreach") {
      result.foreach = value.value();
    } else if (name == "wrap") {
      result.wrap = value.value();
    } else if (name == "unwrap") {
      result.unwrap = value.value();
    } else if (name == "ext_class") {
      result.ext_class = value.value();
    } else {
      report(key.range(), "unknown boundary configuration field '" + name + "'");
    }
  }

  if (result.finalize.empty()) {
    report(config.range(), "boundary configuration requires 'finalize'");
  }
  if (result.foreach.empty()) {
    report(config.range(), "boundary configuration requires 'foreach'");
  }

  if (!ok) {
    return std::nullopt;
  }
  return result;
}

// ============================================================================
// Code Generation
// ============================================================================

std::string render_boundary_code(
  const BoundaryNames & names, const BoundaryConfig & config,
  const BoundaryRuntimeConfig & runtime)
{
  // The class is registered at most once per process: the handle is
  // checked for NULL on every wrap.
  return fmt::format(
    "static {ext_type} * {ext} = NULL;\n"
    "static inline {obj} * {wrap}({target} o) {{\n"
    "  if ({ext} == NULL) {ext} = {register_class}({finalize}, {foreach});\n"
    "  return {alloc}({ext}, (void *)o);\n"
    "}}\n"
    "static inline {target} {unwrap}({borrowed} o) {{\n"
    "  return ({target})({get_data}(o));\n"
    "}}\n",
    fmt::arg("ext_type", runtime.external_class_type), fmt::arg("ext", names.ext_class),
    fmt::arg("obj", runtime.object_type), fmt::arg("wrap", names.wrap),
    fmt::arg("target", config.target_type), fmt::arg("register_class", runtime.register_class),
    fmt::arg("finalize", config.finalize), fmt::arg("foreach", config.foreach),
    fmt::arg("alloc", runtime.alloc_external), fmt::arg("unwrap", names.unwrap),
    fmt::arg("borrowed", runtime.borrowed_object_type),
    fmt::arg("get_data", runtime.get_external_data));
}

bool generate_boundary(
  Translator & translator, const Syntax & declared_name, const BoundaryConfig & config,
  SourceRange origin)
{
  Environment & env = translator.env();

  if (!declared_name.is_ident() || declared_name.value().empty()) {
    env.report_error(
      declared_name.range(), "expected a type name", diag_code::k_boundary_config);
    return false;
  }
  const std::string & name = declared_name.value();

  // 1. Host declaration.
  const std::string full_name = env.qualify(name);
  if (!env.declare_opaque(full_name)) {
    env.report_error(
      declared_name.range(), "'" + full_name + "' has already been declared",
      diag_code::k_host_declaration);
    return false;
  }

  // 2. Resolution.
  const std::vector<std::string> candidates = env.resolve_global_name(name);
  if (candidates.empty()) {
    env.report_error(
      declared_name.range(), "unknown type '" + name + "'", diag_code::k_name_resolution);
    return false;
  }
  if (candidates.size() > 1) {
    env.report_error(
         declared_name.range(), "ambiguous type '" + name + "'", diag_code::k_name_resolution)
      .with_help("possible interpretations: " + join(candidates, ", "));
    return false;
  }
  const std::string & resolved = candidates.front();

  // 3-4. Names and shim text.
  const BoundaryNames names = resolve_boundary_names(resolved, config);
  translator.push_command(render_boundary_code(names, config, env.config().boundary), origin);

  // 5. Boundary table.
  env.record_boundary(resolved, BoundaryEntry{names.wrap, names.unwrap, names.ext_class});
  return true;
}

bool elaborate_opaque_type(Translator & translator, const Syntax & node)
{
  Environment & env = translator.env();

  bool params_ok = true;
  for (const auto & param : node.child(1).children()) {
    if (!param.is_ident()) {
      env.report_error(
        param.range(), "type parameters must be identifiers", diag_code::k_boundary_config);
      params_ok = false;
    }
  }

  const auto config = evaluate_boundary_config(env, node.child(3), node.child(2));
  if (!params_ok || !config) {
    return false;
  }

  if (!generate_boundary(translator, node.child(0), *config, node.range())) {
    return false;
  }

  run_diagnostics_round(translator, node.range());
  return true;
}

}  // namespace shimbridge
