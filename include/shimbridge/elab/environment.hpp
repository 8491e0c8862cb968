// shimbridge/elab/environment.hpp - Elaboration state of one host compilation unit
//
// The Environment stands in for the host compiler's environment: it owns the
// extension state the core keeps between elaboration steps (the shim buffer
// and the boundary table), the host declarations the core adds, and the
// message sink.
//
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "shimbridge/basic/diagnostic.hpp"
#include "shimbridge/basic/source_manager.hpp"
#include "shimbridge/project/project_config.hpp"
#include "shimbridge/shim/shim_buffer.hpp"

namespace shimbridge
{

namespace lsp
{
class DiagnosticsProvider;
}  // namespace lsp

/**
 * Functions generated for one boundary type.
 */
struct BoundaryEntry
{
  std::string wrap;
  std::string unwrap;
  std::string ext_class;
};

/**
 * Everything a command may change besides the diagnostics, saved before a
 * command runs so a failing command can be undone.
 */
struct ElaborationState
{
  std::optional<ShimBuffer> shim;
  std::map<std::string, BoundaryEntry, std::less<>> boundaries;
  std::set<std::string, std::less<>> declarations;
  std::vector<std::string> namespaces;
  std::vector<std::string> opened;
};

class Environment
{
public:
  Environment(SourceFile host, ProjectConfig config);

  Environment(const Environment &) = delete;
  Environment & operator=(const Environment &) = delete;

  [[nodiscard]] const SourceFile & host_file() const noexcept { return host_; }

  [[nodiscard]] const ProjectConfig & config() const noexcept { return config_; }

  [[nodiscard]] DiagnosticBag & diagnostics() noexcept { return diags_; }
  [[nodiscard]] const DiagnosticBag & diagnostics() const noexcept { return diags_; }

  /// Start an error diagnostic attributed to the host file.
  DiagnosticBuilder report_error(SourceRange range, std::string message, const char * code);

  /// Start a warning diagnostic attributed to the host file.
  DiagnosticBuilder report_warning(SourceRange range, std::string message, const char * code);

  // ===========================================================================
  // Shim Buffer State
  // ===========================================================================

  /**
   * Current shim buffer. Created on first use, seeded with the configured
   * prelude (recorded against the sentinel host position).
   */
  [[nodiscard]] const ShimBuffer & shim_buffer();

  [[nodiscard]] bool has_shim_buffer() const noexcept { return shim_.has_value(); }

  /// Append one command to the current buffer.
  void push_shim_command(std::string_view text, SourceRange origin);

  // ===========================================================================
  // Rollback
  // ===========================================================================

  [[nodiscard]] ElaborationState save_state() const;

  /// Reinstate a saved state. Diagnostics reported since are kept.
  void restore_state(ElaborationState state);

  // ===========================================================================
  // Boundary Table
  // ===========================================================================

  void record_boundary(const std::string & resolved_name, BoundaryEntry entry);

  [[nodiscard]] const BoundaryEntry * find_boundary(std::string_view resolved_name) const;

  [[nodiscard]] const std::map<std::string, BoundaryEntry, std::less<>> & boundaries() const
  {
    return boundaries_;
  }

  // ===========================================================================
  // Host Declarations
  // ===========================================================================

  /// Make a declaration from another unit visible.
  void import_declaration(std::string full_name);

  /**
   * Add an opaque type declaration.
   *
   * @return false if `full_name` is already declared
   */
  bool declare_opaque(const std::string & full_name);

  [[nodiscard]] bool is_declared(std::string_view full_name) const;

  /// `name` qualified with the current namespace.
  [[nodiscard]] std::string qualify(std::string_view name) const;

  /**
   * Resolve `name` as the host would.
   *
   * The namespace chain is searched from the innermost namespace outward
   * and stops at the first level with a match; every opened namespace adds
   * its own match. More than one distinct result means the name is
   * ambiguous.
   */
  [[nodiscard]] std::vector<std::string> resolve_global_name(std::string_view name) const;

  // ===========================================================================
  // Namespaces
  // ===========================================================================

  void push_namespace(std::string name);

  /// Leave the innermost namespace; false if none is open.
  bool pop_namespace();

  [[nodiscard]] std::string current_namespace() const;

  [[nodiscard]] const std::vector<std::string> & namespace_stack() const noexcept
  {
    return namespaces_;
  }

  void open_namespace(std::string name);

  // ===========================================================================
  // Shim Diagnostics
  // ===========================================================================

  void set_diagnostics_provider(lsp::DiagnosticsProvider * provider) noexcept
  {
    provider_ = provider;
  }

  [[nodiscard]] lsp::DiagnosticsProvider * diagnostics_provider() const noexcept
  {
    return provider_;
  }

private:
  SourceFile host_;
  ProjectConfig config_;
  DiagnosticBag diags_;

  std::optional<ShimBuffer> shim_;
  std::map<std::string, BoundaryEntry, std::less<>> boundaries_;

  std::set<std::string, std::less<>> declarations_;
  std::vector<std::string> namespaces_;
  std::vector<std::string> opened_;

  lsp::DiagnosticsProvider * provider_ = nullptr;
};

}  // namespace shimbridge
