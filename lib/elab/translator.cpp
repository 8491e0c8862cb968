// shimbridge/elab/translator.cpp - Host syntax -> shim text dispatch
#include "shimbridge/elab/translator.hpp"

#include <utility>
#include <vector>

#include "shimbridge/syntax/reprint.hpp"

namespace shimbridge
{

// ============================================================================
// Registries
// ============================================================================

void TranslatorRegistry::add(std::string kind, CommandHandler handler)
{
  handlers_[std::move(kind)] = std::move(handler);
}

const CommandHandler * TranslatorRegistry::find(std::string_view kind) const
{
  const auto it = handlers_.find(kind);
  return it == handlers_.end() ? nullptr : &it->second;
}

void MacroTable::add(std::string kind, MacroExpander expander)
{
  expanders_[std::move(kind)] = std::move(expander);
}

const MacroExpander * MacroTable::find(std::string_view kind) const
{
  const auto it = expanders_.find(kind);
  return it == expanders_.end() ? nullptr : &it->second;
}

// ============================================================================
// Translator
// ============================================================================

namespace
{

/// Undoes a command's changes unless it is committed.
class StateRollback
{
public:
  explicit StateRollback(Environment & env) : env_(env), saved_(env.save_state()) {}

  StateRollback(const StateRollback &) = delete;
  StateRollback & operator=(const StateRollback &) = delete;

  ~StateRollback()
  {
    if (!committed_) {
      env_.restore_state(std::move(saved_));
    }
  }

  void commit() noexcept { committed_ = true; }

private:
  Environment & env_;
  ElaborationState saved_;
  bool committed_ = false;
};

/// Makes `range` the fallback origin while a construct with a host range is elaborated.
class OriginScope
{
public:
  OriginScope(SourceRange & slot, SourceRange range) : slot_(slot), saved_(slot)
  {
    if (range.is_valid()) {
      slot_ = range;
    }
  }

  OriginScope(const OriginScope &) = delete;
  OriginScope & operator=(const OriginScope &) = delete;

  ~OriginScope() { slot_ = saved_; }

private:
  SourceRange & slot_;
  SourceRange saved_;
};

}  // namespace

bool Translator::elaborate(const Syntax & node) { return elaborate_at(node, 0); }

bool Translator::elaborate_command(const Syntax & node)
{
  StateRollback rollback(env_);
  if (!elaborate(node)) {
    return false;
  }
  rollback.commit();
  return true;
}

SourceRange Translator::origin_for(SourceRange range) const noexcept
{
  return range.is_valid() ? range : origin_;
}

void Translator::push_command(std::string_view text, SourceRange origin)
{
  env_.push_shim_command(text, origin_for(origin));
}

const ShimBuffer & Translator::current_buffer() { return env_.shim_buffer(); }

bool Translator::elaborate_at(const Syntax & node, size_t depth)
{
  // Macro output has no host range; it is attributed to the call site.
  OriginScope origin(origin_, node.range());

  // 1. Grouping nodes: children in order, stopping at the first failure.
  if (node.is_null_node()) {
    for (const auto & child : node.children()) {
      if (!elaborate_at(child, depth)) {
        return false;
      }
    }
    return true;
  }

  // Macros expand before dispatch.
  if (node.is_node()) {
    if (const MacroExpander * expander = macros_.find(node.kind())) {
      auto expanded = expand_macro(*expander, node, depth);
      if (!expanded) {
        return false;
      }
      return elaborate_at(*expanded, depth + 1);
    }
  }

  // 2. Registered handler.
  if (const CommandHandler * handler = registry_.find(node.kind())) {
    const size_t errors_before = env_.diagnostics().error_count();
    if ((*handler)(*this, node)) {
      return true;
    }
    if (env_.diagnostics().error_count() == errors_before) {
      env_.report_error(
        node.range(), "elaboration of '" + std::string(node.kind()) + "' failed",
        diag_code::k_handler_failed);
    }
    return false;
  }

  // 3. Verbatim reprint.
  auto expanded = expand_all(node, depth);
  if (!expanded) {
    return false;
  }
  const auto is_macro = [this](std::string_view kind) { return macros_.contains(kind); };
  const ReprintResult printed = reprint(*expanded, is_macro);
  if (!printed.ok()) {
    const SourceRange where =
      printed.failed_range.is_valid() ? printed.failed_range : origin_for(node.range());
    env_.report_error(
          where, "cannot translate '" + printed.failed_kind + "' to shim code",
          diag_code::k_unreprintable_node)
      .with_help(printed.reason);
    return false;
  }

  push_command(*printed.text, node.range());
  return true;
}

std::optional<Syntax> Translator::expand_macro(
  const MacroExpander & expander, const Syntax & node, size_t depth)
{
  if (depth >= MacroTable::k_max_expansion_depth) {
    env_.report_error(
      origin_for(node.range()),
      "maximum macro expansion depth exceeded while expanding '" + std::string(node.kind()) + "'",
      diag_code::k_macro_expansion);
    return std::nullopt;
  }
  auto expanded = expander(node);
  if (!expanded) {
    env_.report_error(
      origin_for(node.range()),
      "macro '" + std::string(node.kind()) + "' does not apply to this syntax",
      diag_code::k_macro_expansion);
  }
  return expanded;
}

std::optional<Syntax> Translator::expand_all(const Syntax & node, size_t depth)
{
  if (!node.is_node()) {
    return node;
  }

  if (const MacroExpander * expander = macros_.find(node.kind())) {
    auto expanded = expand_macro(*expander, node, depth);
    if (!expanded) {
      return std::nullopt;
    }
    return expand_all(*expanded, depth + 1);
  }

  std::vector<Syntax> children;
  children.reserve(node.num_children());
  for (const auto & child : node.children()) {
    auto expanded = expand_all(child, depth);
    if (!expanded) {
      return std::nullopt;
    }
    children.push_back(std::move(*expanded));
  }
  return Syntax::node(std::string(node.kind()), std::move(children));
}

}  // namespace shimbridge
