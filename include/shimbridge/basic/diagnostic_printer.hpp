// shimbridge/basic/diagnostic_printer.hpp
//
// Prints host diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "shimbridge/basic/diagnostic.hpp"
#include "shimbridge/basic/source_manager.hpp"

namespace shimbridge
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[S0001]: unused variable 'x'
 *     --> Main.host:5:12
 *      |
 *    5 |   int x = 0;
 *      |   ^^^^^^^^^^
 *      |
 *      = note: second line of a multi-line shim message
 *
 * A range spanning several host lines is marked up to the end of its first line.
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Print a single diagnostic against the host file it refers to.
  void print(const Diagnostic & diag, const SourceFile & host);

  /// Print all diagnostics ordered by position; diagnostics without a range come first.
  void print_all(const DiagnosticBag & diags, const SourceFile & host);

private:
  void print_headline(const Diagnostic & diag, std::string_view headline);
  void print_snippet(const Diagnostic & diag, const SourceFile & host);
  void print_footer(std::string_view kind, std::string_view message);

  /// Gutter of the given glyph ("-->", "|" or "="), coloured when enabled.
  [[nodiscard]] std::string gutter(std::string_view glyph) const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace shimbridge
