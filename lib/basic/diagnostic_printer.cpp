// shimbridge/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "shimbridge/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <cstdint>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace shimbridge
{

namespace
{

constexpr const char * k_gutter_color = "\033[1;36m";
constexpr const char * k_reset_color = "\033[0m";

/// Non-empty lines of a message; the shim tool reports notes on following lines.
std::vector<std::string_view> message_lines(std::string_view message)
{
  std::vector<std::string_view> lines;
  while (!message.empty()) {
    const size_t nl = message.find('\n');
    const std::string_view line = message.substr(0, nl);
    if (!line.empty()) {
      lines.push_back(line);
    }
    if (nl == std::string_view::npos) {
      break;
    }
    message.remove_prefix(nl + 1);
  }
  return lines;
}

/// Tabs widen to four columns; the marker row must line up with the expansion.
std::string expand_tabs(std::string_view text)
{
  std::string out;
  for (const char c : text) {
    out += (c == '\t') ? std::string(4, ' ') : std::string(1, c);
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceFile & host)
{
  const auto lines = message_lines(diag.message);
  print_headline(diag, lines.empty() ? std::string_view{} : lines.front());

  std::string file = diag.file_name.empty() ? host.file_name() : diag.file_name;
  if (file.empty()) {
    file = "<unknown>";
  }

  if (diag.range.is_valid()) {
    const LineColumn at = host.get_line_column(diag.range.get_begin().offset());
    fmt::print(os_, "{} {}:{}:{}\n", gutter("-->"), file, at.line, at.column);
    fmt::print(os_, "{}\n", gutter("|"));
    print_snippet(diag, host);
  } else {
    fmt::print(os_, "{} {}\n", gutter("-->"), file);
  }

  for (size_t i = 1; i < lines.size(); ++i) {
    print_footer("note", lines[i]);
  }
  if (diag.help_message) {
    print_footer("help", *diag.help_message);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceFile & host)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const auto & d : diags) {
    ordered.push_back(&d);
  }

  // Invalid locations carry UINT32_MAX; rank them ahead of positioned ones.
  const auto key = [](const Diagnostic * d) {
    return d->range.is_valid() ? static_cast<int64_t>(d->range.get_begin().offset()) : -1;
  };
  std::stable_sort(
    ordered.begin(), ordered.end(),
    [&key](const Diagnostic * a, const Diagnostic * b) { return key(a) < key(b); });

  for (const Diagnostic * d : ordered) {
    print(*d, host);
  }
}

// ============================================================================
// Pieces
// ============================================================================

void DiagnosticPrinter::print_headline(const Diagnostic & diag, std::string_view headline)
{
  const std::string label = diag.code.empty()
                              ? std::string(to_string(diag.severity))
                              : fmt::format("{}[{}]", to_string(diag.severity), diag.code);
  if (!use_color_) {
    fmt::print(os_, "{}: {}\n", label, headline);
    return;
  }

  os_ << rang::style::bold;
  switch (diag.severity) {
    case Severity::Error:
      os_ << rang::fg::red;
      break;
    case Severity::Warning:
      os_ << rang::fg::yellow;
      break;
    case Severity::Info:
      os_ << rang::fg::cyan;
      break;
  }
  os_ << label << rang::fg::reset << ": " << headline << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_snippet(const Diagnostic & diag, const SourceFile & host)
{
  const LineColumn begin = host.get_line_column(diag.range.get_begin().offset());
  const LineColumn end = host.get_line_column(diag.range.get_end().offset());
  const std::string_view line = host.get_line(begin.line - 1);
  if (line.empty()) {
    return;
  }

  const uint32_t first = std::min<uint32_t>(begin.column - 1, static_cast<uint32_t>(line.size()));
  const uint32_t last = end.line == begin.line
                          ? std::min<uint32_t>(end.column - 1, static_cast<uint32_t>(line.size()))
                          : static_cast<uint32_t>(line.size());
  const size_t width = std::max<size_t>(1, expand_tabs(line.substr(first, last - first)).size());

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", begin.line);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
    fmt::print(os_, "{}\n", expand_tabs(line));
  } else {
    fmt::print(os_, " {:>4} | {}\n", begin.line, expand_tabs(line));
  }

  fmt::print(
    os_, "{} {}", gutter("|"), std::string(expand_tabs(line.substr(0, first)).size(), ' '));
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold;
  }
  fmt::print(os_, "{}", std::string(width, '^'));
  if (!diag.range_message.empty()) {
    fmt::print(os_, " {}", diag.range_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_footer(std::string_view kind, std::string_view message)
{
  fmt::print(os_, "{}\n", gutter("|"));
  fmt::print(os_, "   {} {}: {}\n", gutter("="), kind, message);
}

std::string DiagnosticPrinter::gutter(std::string_view glyph) const
{
  std::string text(glyph);
  if (glyph == "-->") {
    text = "  -->";
  } else if (glyph == "|") {
    text = "      |";  // under the line-number column
  }
  if (!use_color_) {
    return text;
  }
  return fmt::format("{}{}{}", k_gutter_color, text, k_reset_color);
}

}  // namespace shimbridge
