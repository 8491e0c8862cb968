// shimbridge/diag/diagnostics_remapper.hpp - Shim diagnostics -> host diagnostics
//
// Tool diagnostics are expressed in shim text coordinates. The remapper
// turns them into byte ranges, drops the ones belonging to earlier batches,
// relocates the rest onto host positions and cleans up the message text.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "shimbridge/basic/diagnostic.hpp"
#include "shimbridge/basic/source_manager.hpp"
#include "shimbridge/lsp/client_session.hpp"
#include "shimbridge/shim/position_map.hpp"

namespace shimbridge
{

/**
 * One issue reported by the shim tool, in shim byte offsets.
 */
struct DiagnosticRecord
{
  uint32_t shim_start = 0;
  uint32_t shim_end = 0;
  lsp::ToolSeverity severity = lsp::ToolSeverity::Unknown;
  std::string message;
};

struct RemapOptions
{
  bool warnings_as_errors = false;

  /// Virtual shim file name; message lines starting with "<name>:" are noise
  std::string virtual_file = "nul";

  /// Host file the produced diagnostics refer to
  std::string file_name;
};

/// Convert tool diagnostics to byte ranges in `shim_text`.
[[nodiscard]] std::vector<DiagnosticRecord> to_records(
  const std::vector<lsp::LspDiagnostic> & diagnostics, const SourceFile & shim_text,
  lsp::PositionEncoding encoding);

/**
 * Clean a tool message.
 *
 * Lines are trimmed; lines starting with "<virtual_file>:" are dropped and a
 * trailing "(fix available)" is removed from each line. The result is trimmed.
 */
[[nodiscard]] std::string clean_message(std::string_view text, std::string_view virtual_file);

/// Map a tool severity to a host severity.
[[nodiscard]] Severity classify_severity(lsp::ToolSeverity severity, bool warnings_as_errors);

/**
 * Produce host diagnostics for the records of one diagnostics round.
 *
 * The batch begins at `positions.host_to_shim(host_start)`. A record ending
 * before that offset belongs to an earlier batch and is discarded; with no
 * span at or after `host_start` the batch produced no text and every record
 * is discarded. Each remaining record yields one diagnostic covering the host
 * range of the span holding its start.
 */
[[nodiscard]] std::vector<Diagnostic> report_from(
  SourceLocation host_start, const std::vector<DiagnosticRecord> & records,
  const RemapOptions & options, const PositionMap & positions);

}  // namespace shimbridge
