// shimbridge/elab/translator.hpp - Host syntax -> shim text dispatch
//
// Every host construct reaching the translator is either handled by a
// registered command handler, expanded as a macro, recursed into (grouping
// nodes) or reprinted verbatim into the shim buffer.
//
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "shimbridge/elab/environment.hpp"
#include "shimbridge/shim/shim_buffer.hpp"
#include "shimbridge/syntax/syntax.hpp"

namespace shimbridge
{

class Translator;

/// Returns false on failure; the handler reports its own diagnostics.
using CommandHandler = std::function<bool(Translator & translator, const Syntax & node)>;

/// Returns the expansion, or std::nullopt if the node does not match the macro.
using MacroExpander = std::function<std::optional<Syntax>(const Syntax & node)>;

// ============================================================================
// Registries
// ============================================================================

class TranslatorRegistry
{
public:
  /// Register (or replace) the handler for `kind`.
  void add(std::string kind, CommandHandler handler);

  [[nodiscard]] const CommandHandler * find(std::string_view kind) const;

  [[nodiscard]] bool contains(std::string_view kind) const { return find(kind) != nullptr; }

  [[nodiscard]] size_t size() const noexcept { return handlers_.size(); }

private:
  std::map<std::string, CommandHandler, std::less<>> handlers_;
};

class MacroTable
{
public:
  /// Nested expansions beyond this depth are reported as runaway macros.
  static constexpr size_t k_max_expansion_depth = 512;

  void add(std::string kind, MacroExpander expander);

  [[nodiscard]] const MacroExpander * find(std::string_view kind) const;

  [[nodiscard]] bool contains(std::string_view kind) const { return find(kind) != nullptr; }

private:
  std::map<std::string, MacroExpander, std::less<>> expanders_;
};

// ============================================================================
// Translator
// ============================================================================

class Translator
{
public:
  Translator(Environment & env, TranslatorRegistry & registry, MacroTable & macros)
  : env_(env), registry_(registry), macros_(macros)
  {
  }

  /**
   * Translate one host construct into shim text.
   *
   * @return false if the construct (or part of it) could not be translated;
   *         the reason is reported to the environment's diagnostics
   */
  bool elaborate(const Syntax & node);

  /**
   * Elaborate one command atomically.
   *
   * The environment's extension state (shim buffer, boundary table, host
   * declarations and namespaces) is saved first and restored if the command
   * fails, so a failing command contributes nothing. Its diagnostics stay.
   */
  bool elaborate_command(const Syntax & node);

  /**
   * Append one rendered command to the shim buffer.
   *
   * An invalid origin (syntax produced by a macro) falls back to the innermost
   * enclosing construct that has a host range.
   */
  void push_command(std::string_view text, SourceRange origin);

  /// `range` if valid, else the host range of the construct being elaborated.
  [[nodiscard]] SourceRange origin_for(SourceRange range) const noexcept;

  /// The buffer commands currently write to.
  [[nodiscard]] const ShimBuffer & current_buffer();

  [[nodiscard]] Environment & env() noexcept { return env_; }
  [[nodiscard]] TranslatorRegistry & registry() noexcept { return registry_; }
  [[nodiscard]] MacroTable & macros() noexcept { return macros_; }

private:
  bool elaborate_at(const Syntax & node, size_t depth);

  /// One expansion step; nullopt after reporting a failure.
  std::optional<Syntax> expand_macro(
    const MacroExpander & expander, const Syntax & node, size_t depth);

  /// Expand every macro node below `node`; nullopt after reporting a failure.
  std::optional<Syntax> expand_all(const Syntax & node, size_t depth);

  Environment & env_;
  TranslatorRegistry & registry_;
  MacroTable & macros_;

  SourceRange origin_;
};

}  // namespace shimbridge
