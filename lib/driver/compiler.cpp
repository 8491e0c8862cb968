// shimbridge/driver/compiler.cpp - Compiler driver implementation
//
#include "shimbridge/driver/compiler.hpp"

#include <fstream>
#include <system_error>

#include "shimbridge/elab/commands.hpp"
#include "shimbridge/elab/translator.hpp"

namespace shimbridge
{

CompileResult Compiler::compile_unit(
  const HostUnit & unit, const ProjectConfig & config, const CompileOptions & options,
  lsp::DiagnosticsProvider * provider)
{
  CompileResult result;
  result.host = unit.file;

  Environment env(unit.file, config);
  env.set_diagnostics_provider(provider);
  for (const auto & name : unit.imports) {
    env.import_declaration(name);
  }

  TranslatorRegistry registry;
  register_builtin_commands(registry);
  MacroTable macros;
  Translator translator(env, registry, macros);

  // Top-level commands are independent: a failing one does not stop the rest.
  if (unit.syntax.is_null_node()) {
    for (const auto & command : unit.syntax.children()) {
      (void)translator.elaborate_command(command);
    }
  } else {
    (void)translator.elaborate_command(unit.syntax);
  }

  if (!env.namespace_stack().empty()) {
    const auto end = static_cast<uint32_t>(unit.file.content().size());
    env.report_error(
      SourceRange(end, end), "namespace '" + env.current_namespace() + "' is never ended",
      diag_code::k_handler_failed);
  }

  const ShimBuffer & buffer = env.shim_buffer();
  result.shim_text = buffer.source_text();
  result.shim_commands = buffer.commands().size();

  if (options.mode == CompileMode::Emit && !env.diagnostics().has_errors()) {
    const std::filesystem::path output = options.output.value_or(config.compiler.output);
    if (write_shim(output, result.shim_text, env.diagnostics())) {
      result.generated_files.push_back(output);
    }
  }

  result.success = !env.diagnostics().has_errors();
  result.diagnostics.merge(std::move(env.diagnostics()));
  return result;
}

CompileResult Compiler::compile_file(
  const std::filesystem::path & file, const ProjectConfig & config,
  const CompileOptions & options, lsp::DiagnosticsProvider * provider)
{
  namespace fs = std::filesystem;

  if (!fs::exists(file)) {
    CompileResult result;
    result.diagnostics.report_error(SourceRange{}, "file not found: " + file.string());
    return result;
  }

  auto loaded = load_host_unit_file(file);
  if (!loaded.success) {
    CompileResult result;
    result.diagnostics.report_error(SourceRange{}, file.string() + ": " + loaded.error);
    return result;
  }
  return compile_unit(loaded.unit, config, options, provider);
}

bool Compiler::write_shim(
  const std::filesystem::path & path, const std::string & text, DiagnosticBag & diags)
{
  namespace fs = std::filesystem;

  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      diags.report_error(
        SourceRange{}, "cannot create " + path.parent_path().string() + ": " + ec.message());
      return false;
    }
  }

  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    diags.report_error(SourceRange{}, "cannot write " + path.string());
    return false;
  }
  out << text;
  out.close();
  if (!out) {
    diags.report_error(SourceRange{}, "failed while writing " + path.string());
    return false;
  }
  return true;
}

}  // namespace shimbridge
