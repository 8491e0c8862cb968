// shimbridge/syntax/syntax.hpp - Host syntax trees as handed over by the host parser
//
// The host parser is an external collaborator. Its output is modelled as a
// small value tree: atoms and identifiers carry their original text plus
// surrounding whitespace (enough to reprint them verbatim), nodes carry a
// kind tag and ordered children.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string>
#include <string_view>
#include <vector>

#include "shimbridge/basic/source_manager.hpp"

namespace shimbridge
{

enum class SyntaxTag : uint8_t {
  Missing,  ///< Parser recovery placeholder
  Atom,     ///< Keyword or punctuation token
  Ident,    ///< Identifier token (possibly dotted)
  Node,     ///< Interior node with a kind tag
};

/// Kind tag of grouping nodes (children are elaborated in sequence).
inline constexpr std::string_view k_null_kind = "null";

/**
 * Where a token came from. Synthetic tokens (created by macro expansion)
 * have no range and no recorded whitespace.
 */
struct SourceInfo
{
  SourceRange range;
  std::string leading;
  std::string trailing;

  [[nodiscard]] bool is_synthetic() const noexcept { return range.is_invalid(); }
};

class Syntax
{
public:
  Syntax() = default;

  static Syntax missing();
  static Syntax atom(std::string value, SourceInfo info = {});
  static Syntax ident(std::string name, SourceInfo info = {});
  static Syntax node(std::string kind, std::vector<Syntax> children);
  static Syntax null_node(std::vector<Syntax> children);

  [[nodiscard]] SyntaxTag tag() const noexcept { return tag_; }

  /// Node kind; atoms, identifiers and missing nodes report "atom", "ident", "missing".
  [[nodiscard]] std::string_view kind() const noexcept;

  [[nodiscard]] bool is_missing() const noexcept { return tag_ == SyntaxTag::Missing; }
  [[nodiscard]] bool is_atom() const noexcept { return tag_ == SyntaxTag::Atom; }
  [[nodiscard]] bool is_ident() const noexcept { return tag_ == SyntaxTag::Ident; }
  [[nodiscard]] bool is_node() const noexcept { return tag_ == SyntaxTag::Node; }
  [[nodiscard]] bool is_null_node() const noexcept
  {
    return tag_ == SyntaxTag::Node && kind_ == k_null_kind;
  }

  /// Token text (atoms) or identifier name.
  [[nodiscard]] const std::string & value() const noexcept { return value_; }

  [[nodiscard]] const SourceInfo & info() const noexcept { return info_; }

  [[nodiscard]] gsl::span<const Syntax> children() const noexcept
  {
    return gsl::span<const Syntax>(children_.data(), children_.size());
  }

  [[nodiscard]] size_t num_children() const noexcept { return children_.size(); }

  /// Child at index, or a shared missing node when out of range.
  [[nodiscard]] const Syntax & child(size_t index) const noexcept;

  /**
   * Host range covered by this syntax: the token range for atoms and
   * identifiers, the union of non-synthetic children for nodes.
   */
  [[nodiscard]] SourceRange range() const noexcept;

  /// Start of range(), invalid if fully synthetic.
  [[nodiscard]] SourceLocation start() const noexcept { return range().get_begin(); }

private:
  SyntaxTag tag_ = SyntaxTag::Missing;
  std::string kind_;
  std::string value_;
  SourceInfo info_;
  std::vector<Syntax> children_;
};

}  // namespace shimbridge
