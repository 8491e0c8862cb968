// shimbridge/boundary/boundary_generator.hpp - Opaque host types backed by shim storage
//
// For a declared opaque type the generator emits a static external-class
// handle, a wrap function that registers the class on first use and boxes a
// raw pointer, and an unwrap function that returns the boxed pointer.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "shimbridge/elab/translator.hpp"
#include "shimbridge/project/project_config.hpp"
#include "shimbridge/syntax/syntax.hpp"

namespace shimbridge
{

/// Syntax kinds of the opaque type command and its configuration.
inline constexpr std::string_view k_opaque_type_kind = "shim.opaque_type";
inline constexpr std::string_view k_boundary_config_kind = "shim.boundary_config";
inline constexpr std::string_view k_config_field_kind = "shim.field";

/**
 * Per-type configuration.
 *
 * `finalize` and `foreach` are mandatory; unset optional names are derived
 * from the mangled declared name.
 */
struct BoundaryConfig
{
  std::string target_type = "void *";
  std::optional<std::string> wrap;
  std::optional<std::string> unwrap;
  std::optional<std::string> ext_class;
  std::string finalize;
  std::string foreach;
};

struct BoundaryNames
{
  std::string wrap;
  std::string unwrap;
  std::string ext_class;
};

/**
 * Mangle a dotted host name into a C identifier.
 *
 * Components are joined by '_', '_' is doubled and any other character that
 * is not an ASCII letter or digit becomes _uXXXX (_UXXXXXXXX beyond the BMP).
 */
[[nodiscard]] std::string mangle_name(std::string_view full_name, std::string_view prefix = "l_");

/// Default names for `resolved_name`: shim_to_<m>, shim_of_<m>, shim_class_<m>.
[[nodiscard]] BoundaryNames derive_boundary_names(std::string_view resolved_name);

/// Apply the overrides in `config` to the derived names.
[[nodiscard]] BoundaryNames resolve_boundary_names(
  std::string_view resolved_name, const BoundaryConfig & config);

/**
 * Evaluate a configuration expression.
 *
 * `config` is a `shim.boundary_config` node of `shim.field` entries
 * (name ident, value token); `target` holds the target type tokens (may be
 * empty). Problems are reported as E0202 and yield std::nullopt.
 */
[[nodiscard]] std::optional<BoundaryConfig> evaluate_boundary_config(
  Environment & env, const Syntax & config, const Syntax & target);

/// The shim text for one boundary type.
[[nodiscard]] std::string render_boundary_code(
  const BoundaryNames & names, const BoundaryConfig & config,
  const BoundaryRuntimeConfig & runtime);

/**
 * Declare `declared_name` in the host, resolve it and emit its boundary code.
 *
 * Nothing is pushed unless the name resolves to exactly one declaration.
 */
bool generate_boundary(
  Translator & translator, const Syntax & declared_name, const BoundaryConfig & config,
  SourceRange origin);

/// Handler for `shim.opaque_type`: [name, type params, target type, config].
bool elaborate_opaque_type(Translator & translator, const Syntax & node);

}  // namespace shimbridge
