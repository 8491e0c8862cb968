// shimbridge/diag/diagnostics_remapper.cpp - Shim diagnostics -> host diagnostics
#include "shimbridge/diag/diagnostics_remapper.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace shimbridge
{

namespace
{

constexpr std::string_view k_fix_available = "(fix available)";

std::string_view trim(std::string_view s)
{
  const auto is_space = [](char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
  };
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

bool ends_with(std::string_view s, std::string_view suffix)
{
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

}  // namespace

std::vector<DiagnosticRecord> to_records(
  const std::vector<lsp::LspDiagnostic> & diagnostics, const SourceFile & shim_text,
  lsp::PositionEncoding encoding)
{
  std::vector<DiagnosticRecord> records;
  records.reserve(diagnostics.size());
  for (const auto & d : diagnostics) {
    DiagnosticRecord r;
    r.shim_start =
      lsp::lsp_position_to_offset(shim_text, d.start.line, d.start.character, encoding);
    r.shim_end = lsp::lsp_position_to_offset(shim_text, d.end.line, d.end.character, encoding);
    r.shim_end = std::max(r.shim_end, r.shim_start);
    r.severity = d.severity;
    r.message = d.message;
    records.push_back(std::move(r));
  }
  return records;
}

std::string clean_message(std::string_view text, std::string_view virtual_file)
{
  const std::string marker = std::string(virtual_file) + ":";

  std::string out;
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t eol = text.find('\n', pos);
    if (eol == std::string_view::npos) {
      eol = text.size();
    }
    std::string_view line = trim(text.substr(pos, eol - pos));
    pos = eol + 1;

    if (!virtual_file.empty() && starts_with(line, marker)) {
      continue;
    }
    if (ends_with(line, k_fix_available)) {
      line = trim(line.substr(0, line.size() - k_fix_available.size()));
    }
    if (!out.empty()) {
      out += '\n';
    }
    out += line;
  }
  return std::string(trim(out));
}

Severity classify_severity(lsp::ToolSeverity severity, bool warnings_as_errors)
{
  switch (severity) {
    case lsp::ToolSeverity::Error:
      return Severity::Error;
    case lsp::ToolSeverity::Warning:
      return warnings_as_errors ? Severity::Error : Severity::Warning;
    default:
      return Severity::Info;
  }
}

std::vector<Diagnostic> report_from(
  SourceLocation host_start, const std::vector<DiagnosticRecord> & records,
  const RemapOptions & options, const PositionMap & positions)
{
  std::vector<Diagnostic> out;
  const std::optional<uint32_t> batch_start = positions.host_to_shim(host_start);
  if (!batch_start) {
    return out;
  }

  for (const auto & record : records) {
    // Kept when any part of the record reaches into the batch.
    const uint32_t last =
      record.shim_end > record.shim_start ? record.shim_end - 1 : record.shim_end;
    if (last < *batch_start) {
      continue;
    }

    Diagnostic diag;
    diag.severity = classify_severity(record.severity, options.warnings_as_errors);
    diag.code = diag_code::k_shim_diagnostic;
    diag.message = clean_message(record.message, options.virtual_file);
    diag.file_name = options.file_name;
    diag.range = positions.shim_range_to_host(record.shim_start);
    out.push_back(std::move(diag));
  }
  return out;
}

}  // namespace shimbridge
