// shimbridge/syntax/reprint.cpp - Verbatim reprinting of host syntax
#include "shimbridge/syntax/reprint.hpp"

namespace shimbridge
{

namespace
{

bool ends_with(std::string_view s, std::string_view suffix)
{
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

class Reprinter
{
public:
  explicit Reprinter(const MacroKindPredicate & is_macro) : is_macro_(is_macro) {}

  bool print(const Syntax & stx)
  {
    switch (stx.tag()) {
      case SyntaxTag::Missing:
        return fail(stx, "syntax is missing");
      case SyntaxTag::Atom:
      case SyntaxTag::Ident:
        return print_token(stx);
      case SyntaxTag::Node:
        return print_node(stx);
    }
    return fail(stx, "unknown syntax tag");
  }

  ReprintResult take_text() { return ReprintResult::success(std::move(out_)); }

  ReprintResult take_failure() { return std::move(failure_).value(); }

private:
  bool print_token(const Syntax & stx)
  {
    if (stx.value().empty()) {
      return fail(stx, "token has no text");
    }

    const SourceInfo & info = stx.info();
    if (info.is_synthetic()) {
      if (!out_.empty() && out_.back() != ' ' && out_.back() != '\n') {
        out_.push_back(' ');
      }
      out_ += stx.value();
      return true;
    }

    out_ += info.leading;
    out_ += stx.value();
    out_ += info.trailing;
    return true;
  }

  bool print_node(const Syntax & stx)
  {
    if (ends_with(stx.kind(), "antiquot")) {
      return fail(stx, "antiquotation has no surface text");
    }
    if (is_macro_ && is_macro_(stx.kind())) {
      return fail(stx, "macro was not expanded");
    }
    for (const auto & c : stx.children()) {
      if (!print(c)) {
        return false;
      }
    }
    return true;
  }

  bool fail(const Syntax & stx, std::string reason)
  {
    failure_ = ReprintResult::fail(stx.kind(), stx.range(), std::move(reason));
    return false;
  }

  const MacroKindPredicate & is_macro_;
  std::string out_;
  std::optional<ReprintResult> failure_;
};

}  // namespace

ReprintResult reprint(const Syntax & stx, const MacroKindPredicate & is_macro)
{
  Reprinter printer(is_macro);
  if (!printer.print(stx)) {
    return printer.take_failure();
  }
  return printer.take_text();
}

}  // namespace shimbridge
