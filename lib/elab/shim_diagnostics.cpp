// shimbridge/elab/shim_diagnostics.cpp - One diagnostics round after a batch
#include "shimbridge/elab/shim_diagnostics.hpp"

#include <chrono>
#include <utility>

#include "shimbridge/diag/diagnostics_remapper.hpp"
#include "shimbridge/lsp/diagnostics_client.hpp"

namespace shimbridge
{

void run_diagnostics_round(Translator & translator, SourceRange batch)
{
  Environment & env = translator.env();
  const DiagnosticsConfig & cfg = env.config().diagnostics;
  lsp::DiagnosticsProvider * provider = env.diagnostics_provider();
  if (!cfg.is_enabled() || provider == nullptr) {
    return;
  }

  const ShimBuffer & buffer = translator.current_buffer();

  lsp::CollectRequest request;
  request.uri = lsp::virtual_document_uri(cfg);
  request.text = buffer.source_text();
  request.language_id = cfg.language_id;
  request.timeout = std::chrono::milliseconds(cfg.timeout_ms);

  const lsp::CollectResult result = provider->collect(request);
  switch (result.status) {
    case lsp::CollectResult::Status::Timeout:
      if (cfg.explicitly_requested()) {
        env.report_error(
             batch,
             "shim diagnostics timed out after " + std::to_string(cfg.timeout_ms) + " ms",
             diag_code::k_shim_timeout)
          .with_help("raise diagnostics.timeout_ms or disable shim diagnostics");
      }
      return;
    case lsp::CollectResult::Status::ToolError:
      env.report_warning(
        batch, "shim diagnostics unavailable: " + result.message, diag_code::k_shim_tool);
      return;
    case lsp::CollectResult::Status::Ok:
      break;
  }

  const SourceFile shim_file(buffer.source_text());
  const auto records = to_records(result.diagnostics, shim_file, result.encoding);
  const SourceLocation host_start =
    batch.is_valid() ? batch.get_begin() : PositionMap::k_sentinel;

  RemapOptions options;
  options.warnings_as_errors = env.config().compiler.warnings_as_errors;
  options.virtual_file = cfg.virtual_file;
  options.file_name = env.host_file().path().string();

  for (auto & diag : report_from(host_start, records, options, buffer.position_map())) {
    env.diagnostics().add(std::move(diag));
  }
}

}  // namespace shimbridge
