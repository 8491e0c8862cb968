// shimbridge/syntax/syntax.cpp - Host syntax tree implementation
#include "shimbridge/syntax/syntax.hpp"

#include <algorithm>
#include <utility>

namespace shimbridge
{

Syntax Syntax::missing() { return Syntax{}; }

Syntax Syntax::atom(std::string value, SourceInfo info)
{
  Syntax s;
  s.tag_ = SyntaxTag::Atom;
  s.value_ = std::move(value);
  s.info_ = std::move(info);
  return s;
}

Syntax Syntax::ident(std::string name, SourceInfo info)
{
  Syntax s;
  s.tag_ = SyntaxTag::Ident;
  s.value_ = std::move(name);
  s.info_ = std::move(info);
  return s;
}

Syntax Syntax::node(std::string kind, std::vector<Syntax> children)
{
  Syntax s;
  s.tag_ = SyntaxTag::Node;
  s.kind_ = std::move(kind);
  s.children_ = std::move(children);
  return s;
}

Syntax Syntax::null_node(std::vector<Syntax> children)
{
  return node(std::string(k_null_kind), std::move(children));
}

std::string_view Syntax::kind() const noexcept
{
  switch (tag_) {
    case SyntaxTag::Missing:
      return "missing";
    case SyntaxTag::Atom:
      return "atom";
    case SyntaxTag::Ident:
      return "ident";
    case SyntaxTag::Node:
      return kind_;
  }
  return "missing";
}

const Syntax & Syntax::child(size_t index) const noexcept
{
  static const Syntax k_missing;
  if (index >= children_.size()) {
    return k_missing;
  }
  return children_[index];
}

SourceRange Syntax::range() const noexcept
{
  if (tag_ != SyntaxTag::Node) {
    return info_.range;
  }

  SourceLocation begin;
  SourceLocation end;
  for (const auto & c : children_) {
    const SourceRange r = c.range();
    if (r.is_invalid()) {
      continue;
    }
    if (begin.is_invalid() || r.get_begin() < begin) {
      begin = r.get_begin();
    }
    if (end.is_invalid() || r.get_end() > end) {
      end = r.get_end();
    }
  }
  return {begin, end};
}

}  // namespace shimbridge
