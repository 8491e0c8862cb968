// shimbridge/basic/diagnostic.cpp - Diagnostic records and the host message sink
#include "shimbridge/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace shimbridge
{

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      break;
  }
  return "info";
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(&bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(std::exchange(other.bag_, nullptr)), diagnostic_(std::move(other.diagnostic_))
{
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (bag_ != nullptr) {
    bag_->add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_file(std::string file_name)
{
  diagnostic_.file_name = std::move(file_name);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(
  Severity severity, SourceRange range, std::string message, std::string range_message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.range = range;
  d.range_message = std::move(range_message);
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_error(
  SourceRange range, std::string message, std::string range_message)
{
  return report(Severity::Error, range, std::move(message), std::move(range_message));
}

DiagnosticBuilder DiagnosticBag::report_warning(
  SourceRange range, std::string message, std::string range_message)
{
  return report(Severity::Warning, range, std::move(message), std::move(range_message));
}

DiagnosticBuilder DiagnosticBag::report_info(
  SourceRange range, std::string message, std::string range_message)
{
  return report(Severity::Info, range, std::move(message), std::move(range_message));
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  std::move(other.diagnostics_.begin(), other.diagnostics_.end(), std::back_inserter(diagnostics_));
  other.diagnostics_.clear();
}

size_t DiagnosticBag::count(Severity severity) const noexcept
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [severity](const Diagnostic & d) { return d.severity == severity; }));
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  std::vector<Diagnostic> result;
  for (const auto & d : diagnostics_) {
    if (d.severity == Severity::Warning) {
      result.push_back(d);
    }
  }
  return result;
}

}  // namespace shimbridge
