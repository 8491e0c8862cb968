// tests/support/elab_harness.hpp - Environment + translator wiring and canned shim tools
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "shimbridge/elab/commands.hpp"
#include "shimbridge/elab/environment.hpp"
#include "shimbridge/elab/translator.hpp"
#include "shimbridge/lsp/diagnostics_client.hpp"
#include "shimbridge/project/project_config.hpp"

namespace shimbridge::test
{

/// Configuration without a prelude, so buffers hold only what a test pushes.
inline ProjectConfig bare_config()
{
  ProjectConfig config;
  config.boundary.prelude.clear();
  return config;
}

/**
 * One elaboration context with the built-in commands registered.
 */
struct ElabHarness
{
  Environment env;
  TranslatorRegistry registry;
  MacroTable macros;
  Translator translator;

  explicit ElabHarness(SourceFile host, ProjectConfig config = bare_config())
  : env(std::move(host), std::move(config)), translator(env, registry, macros)
  {
    register_builtin_commands(registry);
  }

  [[nodiscard]] std::string shim_text() { return env.shim_buffer().source_text(); }

  [[nodiscard]] std::vector<std::string> codes() const
  {
    std::vector<std::string> out;
    for (const auto & d : env.diagnostics()) {
      out.push_back(d.code);
    }
    return out;
  }
};

/**
 * Returns a fixed result and records every request it receives.
 */
class CannedProvider : public lsp::DiagnosticsProvider
{
public:
  explicit CannedProvider(lsp::CollectResult result) : result_(std::move(result)) {}

  lsp::CollectResult collect(const lsp::CollectRequest & request) override
  {
    requests.push_back(request);
    return result_;
  }

  void set_result(lsp::CollectResult result) { result_ = std::move(result); }

  std::vector<lsp::CollectRequest> requests;

private:
  lsp::CollectResult result_;
};

/// A tool diagnostic covering `[start_char, end_char)` of `line`.
inline lsp::LspDiagnostic lsp_diag(
  uint32_t line, uint32_t start_char, uint32_t end_char, lsp::ToolSeverity severity,
  std::string message)
{
  lsp::LspDiagnostic d;
  d.start = {line, start_char};
  d.end = {line, end_char};
  d.severity = severity;
  d.message = std::move(message);
  return d;
}

}  // namespace shimbridge::test
