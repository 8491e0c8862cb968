// shimbridge/syntax/reprint.hpp - Verbatim reprinting of host syntax
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "shimbridge/syntax/syntax.hpp"

namespace shimbridge
{

/**
 * Outcome of reprinting a syntax tree.
 *
 * On failure `text` is empty and `failed_kind`/`failed_range` name the
 * first construct that could not be printed.
 */
struct ReprintResult
{
  std::optional<std::string> text;
  std::string failed_kind;
  SourceRange failed_range;
  std::string reason;

  [[nodiscard]] bool ok() const noexcept { return text.has_value(); }

  static ReprintResult success(std::string t)
  {
    ReprintResult r;
    r.text = std::move(t);
    return r;
  }

  static ReprintResult fail(std::string_view kind, SourceRange range, std::string reason)
  {
    ReprintResult r;
    r.failed_kind = std::string(kind);
    r.failed_range = range;
    r.reason = std::move(reason);
    return r;
  }
};

/// Predicate telling the printer which node kinds are unexpanded macros.
using MacroKindPredicate = std::function<bool(std::string_view kind)>;

/**
 * Print `stx` back to surface text, using the whitespace recorded around
 * each token.
 *
 * Fails on missing nodes, antiquotations (kinds ending in "antiquot"),
 * tokens with empty text, and nodes for which `is_macro` returns true.
 * Synthetic tokens are separated by a single space.
 */
[[nodiscard]] ReprintResult reprint(
  const Syntax & stx, const MacroKindPredicate & is_macro = nullptr);

}  // namespace shimbridge
