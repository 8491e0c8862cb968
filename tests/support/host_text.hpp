// tests/support/host_text.hpp - Builds host text and matching syntax tokens for tests
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "shimbridge/basic/source_manager.hpp"
#include "shimbridge/syntax/syntax.hpp"

namespace shimbridge::test
{

/**
 * Appends tokens to a host text, handing back syntax whose ranges and
 * whitespace match what was written.
 */
class HostText
{
public:
  Syntax atom(std::string_view text, std::string trailing = " ")
  {
    return Syntax::atom(std::string(text), append(text, std::move(trailing)));
  }

  Syntax ident(std::string_view name, std::string trailing = " ")
  {
    return Syntax::ident(std::string(name), append(name, std::move(trailing)));
  }

  /// A node of atoms, one per word of `words`.
  Syntax words(std::string kind, const std::vector<std::string> & words, std::string end = "\n")
  {
    std::vector<Syntax> children;
    for (size_t i = 0; i < words.size(); ++i) {
      children.push_back(atom(words[i], i + 1 == words.size() ? end : std::string(" ")));
    }
    return Syntax::node(std::move(kind), std::move(children));
  }

  /// Raw text that belongs to no token.
  void skip(std::string_view filler) { text_ += filler; }

  /// Pad with spaces up to `offset`.
  void pad_to(uint32_t offset)
  {
    if (text_.size() < offset) {
      text_.append(offset - text_.size(), ' ');
    }
  }

  [[nodiscard]] uint32_t offset() const { return static_cast<uint32_t>(text_.size()); }

  [[nodiscard]] const std::string & text() const { return text_; }

  [[nodiscard]] SourceFile file(std::string name = "Main.host") const
  {
    return SourceFile(std::move(name), text_);
  }

private:
  SourceInfo append(std::string_view value, std::string trailing)
  {
    SourceInfo info;
    const auto start = offset();
    text_ += value;
    info.range = SourceRange(start, offset());
    text_ += trailing;
    info.trailing = std::move(trailing);
    return info;
  }

  std::string text_;
};

}  // namespace shimbridge::test
