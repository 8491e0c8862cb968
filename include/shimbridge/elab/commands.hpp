// shimbridge/elab/commands.hpp - Built-in shim commands
//
//   shim.section        [cmd, ...]        commands, then one diagnostics round
//   shim.include        [header, ...]     #include lines
//   shim.opaque_type    [name, params, target, config]
//   shim.namespace      [name]
//   shim.end_namespace  [name?]
//   shim.open           [name, ...]
//
#pragma once

#include <string_view>

#include "shimbridge/elab/translator.hpp"

namespace shimbridge
{

inline constexpr std::string_view k_section_kind = "shim.section";
inline constexpr std::string_view k_include_kind = "shim.include";
inline constexpr std::string_view k_namespace_kind = "shim.namespace";
inline constexpr std::string_view k_end_namespace_kind = "shim.end_namespace";
inline constexpr std::string_view k_open_kind = "shim.open";

/**
 * Elaborate each command of a section independently, then run one
 * diagnostics round for the section.
 *
 * A failing command is dropped; the commands around it are kept.
 */
bool elaborate_section(Translator & translator, const Syntax & node);

bool elaborate_include(Translator & translator, const Syntax & node);

bool elaborate_namespace(Translator & translator, const Syntax & node);

bool elaborate_end_namespace(Translator & translator, const Syntax & node);

bool elaborate_open(Translator & translator, const Syntax & node);

/// Register every built-in command with `registry`.
void register_builtin_commands(TranslatorRegistry & registry);

}  // namespace shimbridge
