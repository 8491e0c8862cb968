// shimbridge/basic/diagnostic.hpp - Host-level diagnostic records
//
// DiagnosticBag is the host message sink: every problem found while
// translating shim code or analysing it with the shim tool ends up here.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "shimbridge/basic/source_manager.hpp"

namespace shimbridge
{

enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

/// Stable diagnostic codes.
namespace diag_code
{
inline constexpr const char * k_unreprintable_node = "E0101";
inline constexpr const char * k_macro_expansion = "E0102";
inline constexpr const char * k_handler_failed = "E0103";
inline constexpr const char * k_name_resolution = "E0201";
inline constexpr const char * k_boundary_config = "E0202";
inline constexpr const char * k_host_declaration = "E0203";
inline constexpr const char * k_shim_timeout = "E0301";
inline constexpr const char * k_shim_tool = "W0302";
inline constexpr const char * k_shim_diagnostic = "S0001";
}  // namespace diag_code

/**
 * One problem attributed to a host range.
 *
 * Diagnostics relayed from the shim tool may carry a multi-line message;
 * the printer shows the first line as the headline and the rest as notes.
 */
struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;       // e.g. "E0101"
  std::string message;
  std::string file_name;  // Host file the range refers to (may be empty)

  SourceRange range;
  std::string range_message;  // Printed under the marked source text
  std::optional<std::string> help_message;

  [[nodiscard]] SourceRange primary_range() const noexcept { return range; }

  /// True for records that were analysed by the shim tool, not the elaborator.
  [[nodiscard]] bool from_shim_tool() const noexcept
  {
    return code == diag_code::k_shim_diagnostic;
  }
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fills in optional fields of a reported diagnostic; the diagnostic is added
 * to the bag when the builder goes out of scope.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_file(std::string file_name);
  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag * bag_;
  Diagnostic diagnostic_;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string range_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string range_message = "");
  DiagnosticBuilder report_info(
    SourceRange range, std::string message, std::string range_message = "");

  void add(Diagnostic diag) { diagnostics_.push_back(std::move(diag)); }

  /// Move every diagnostic of `other` to the end of this bag.
  void merge(DiagnosticBag && other);

  [[nodiscard]] const std::vector<Diagnostic> & all() const noexcept { return diagnostics_; }
  [[nodiscard]] bool empty() const noexcept { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return diagnostics_.size(); }

  [[nodiscard]] size_t count(Severity severity) const noexcept;
  [[nodiscard]] size_t error_count() const noexcept { return count(Severity::Error); }
  [[nodiscard]] bool has_errors() const noexcept { return error_count() != 0; }

  [[nodiscard]] std::vector<Diagnostic> warnings() const;

  [[nodiscard]] auto begin() const noexcept { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const noexcept { return diagnostics_.end(); }

private:
  DiagnosticBuilder report(
    Severity severity, SourceRange range, std::string message, std::string range_message);

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace shimbridge
