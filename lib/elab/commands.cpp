// shimbridge/elab/commands.cpp - Built-in shim commands
#include "shimbridge/elab/commands.hpp"

#include <string>

#include "shimbridge/boundary/boundary_generator.hpp"
#include "shimbridge/elab/shim_diagnostics.hpp"

namespace shimbridge
{

bool elaborate_section(Translator & translator, const Syntax & node)
{
  for (const auto & command : node.children()) {
    // Failures are already reported; later commands still run.
    (void)translator.elaborate_command(command);
  }
  run_diagnostics_round(translator, node.range());
  return true;
}

bool elaborate_include(Translator & translator, const Syntax & node)
{
  bool ok = true;
  for (const auto & header : node.children()) {
    if (!(header.is_atom() || header.is_ident()) || header.value().empty()) {
      translator.env().report_error(
        translator.origin_for(header.range()),
        "expected a header name such as <stdio.h> or \"file.h\"",
        diag_code::k_handler_failed);
      ok = false;
      continue;
    }

    std::string line = "#include ";
    const char first = header.value().front();
    if (first == '<' || first == '"') {
      line += header.value();
    } else {
      line += "<" + header.value() + ">";
    }
    translator.push_command(line, header.range());
  }
  return ok;
}

bool elaborate_namespace(Translator & translator, const Syntax & node)
{
  const Syntax & name = node.child(0);
  if (!name.is_ident() || name.value().empty()) {
    translator.env().report_error(
      node.range(), "expected a namespace name", diag_code::k_handler_failed);
    return false;
  }
  translator.env().push_namespace(name.value());
  return true;
}

bool elaborate_end_namespace(Translator & translator, const Syntax & node)
{
  Environment & env = translator.env();
  if (env.namespace_stack().empty()) {
    env.report_error(node.range(), "no namespace to end", diag_code::k_handler_failed);
    return false;
  }

  const Syntax & name = node.child(0);
  if (name.is_ident() && name.value() != env.namespace_stack().back()) {
    env.report_error(
      name.range(),
      "invalid 'end', expected name '" + env.namespace_stack().back() + "'",
      diag_code::k_handler_failed);
    return false;
  }
  return env.pop_namespace();
}

bool elaborate_open(Translator & translator, const Syntax & node)
{
  bool ok = true;
  for (const auto & name : node.children()) {
    if (!name.is_ident() || name.value().empty()) {
      translator.env().report_error(
        name.range(), "expected a namespace name", diag_code::k_handler_failed);
      ok = false;
      continue;
    }
    translator.env().open_namespace(name.value());
  }
  return ok;
}

void register_builtin_commands(TranslatorRegistry & registry)
{
  registry.add(std::string(k_section_kind), elaborate_section);
  registry.add(std::string(k_include_kind), elaborate_include);
  registry.add(std::string(k_opaque_type_kind), elaborate_opaque_type);
  registry.add(std::string(k_namespace_kind), elaborate_namespace);
  registry.add(std::string(k_end_namespace_kind), elaborate_end_namespace);
  registry.add(std::string(k_open_kind), elaborate_open);
}

}  // namespace shimbridge
