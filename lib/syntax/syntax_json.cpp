// shimbridge/syntax/syntax_json.cpp - JSON interchange for host syntax trees
#include "shimbridge/syntax/syntax_json.hpp"

#include <fstream>
#include <utility>
#include <vector>

namespace shimbridge
{

using json = nlohmann::json;

namespace
{

constexpr size_t k_max_depth = 4096;

std::optional<SourceInfo> info_from_json(const json & j, std::string & error)
{
  SourceInfo info;
  if (j.contains("range")) {
    const auto & r = j["range"];
    const auto is_offset = [](const json & v) {
      return v.is_number_integer() && v.get<int64_t>() >= 0 &&
             v.get<int64_t>() < static_cast<int64_t>(SourceLocation::k_invalid_offset);
    };
    if (!r.is_array() || r.size() != 2 || !is_offset(r[0]) || !is_offset(r[1])) {
      error = "token range must be [start, end] with unsigned offsets";
      return std::nullopt;
    }
    const auto start = r[0].get<uint32_t>();
    const auto end = r[1].get<uint32_t>();
    if (end < start) {
      error = "token range end precedes its start";
      return std::nullopt;
    }
    info.range = SourceRange(start, end);
    info.leading = j.value("leading", "");
    info.trailing = j.value("trailing", "");
  }
  return info;
}

std::optional<Syntax> convert(const json & j, std::string & error, size_t depth)
{
  if (depth > k_max_depth) {
    error = "syntax tree is nested too deeply";
    return std::nullopt;
  }

  if (j.is_null()) {
    return Syntax::missing();
  }
  if (!j.is_object()) {
    error = "syntax element must be an object or null";
    return std::nullopt;
  }
  if (j.value("missing", false)) {
    return Syntax::missing();
  }

  if (j.contains("atom") || j.contains("ident")) {
    const bool is_atom = j.contains("atom");
    const auto & v = is_atom ? j["atom"] : j["ident"];
    if (!v.is_string()) {
      error = "token text must be a string";
      return std::nullopt;
    }
    auto info = info_from_json(j, error);
    if (!info) {
      return std::nullopt;
    }
    return is_atom ? Syntax::atom(v.get<std::string>(), std::move(*info))
                   : Syntax::ident(v.get<std::string>(), std::move(*info));
  }

  if (!j.contains("kind") || !j["kind"].is_string()) {
    error = "syntax node requires a string \"kind\"";
    return std::nullopt;
  }

  std::vector<Syntax> children;
  if (j.contains("args")) {
    const auto & args = j["args"];
    if (!args.is_array()) {
      error = "syntax node \"args\" must be an array";
      return std::nullopt;
    }
    children.reserve(args.size());
    for (const auto & a : args) {
      auto child = convert(a, error, depth + 1);
      if (!child) {
        return std::nullopt;
      }
      children.push_back(std::move(*child));
    }
  }
  return Syntax::node(j["kind"].get<std::string>(), std::move(children));
}

json info_to_json(json j, const SourceInfo & info)
{
  if (!info.is_synthetic()) {
    j["range"] = json::array({info.range.get_begin().offset(), info.range.get_end().offset()});
    j["leading"] = info.leading;
    j["trailing"] = info.trailing;
  }
  return j;
}

}  // namespace

std::optional<Syntax> syntax_from_json(const json & j, std::string & error)
{
  return convert(j, error, 0);
}

json syntax_to_json(const Syntax & stx)
{
  switch (stx.tag()) {
    case SyntaxTag::Missing:
      return json{{"missing", true}};
    case SyntaxTag::Atom:
      return info_to_json(json{{"atom", stx.value()}}, stx.info());
    case SyntaxTag::Ident:
      return info_to_json(json{{"ident", stx.value()}}, stx.info());
    case SyntaxTag::Node: {
      json args = json::array();
      for (const auto & c : stx.children()) {
        args.push_back(syntax_to_json(c));
      }
      return json{{"kind", std::string(stx.kind())}, {"args", std::move(args)}};
    }
  }
  return json{{"missing", true}};
}

SyntaxLoadResult load_host_unit(const json & doc)
{
  if (!doc.is_object()) {
    return SyntaxLoadResult::fail("host unit must be a JSON object");
  }
  if (!doc.contains("source") || !doc["source"].is_string()) {
    return SyntaxLoadResult::fail("host unit requires a string \"source\"");
  }
  if (!doc.contains("syntax")) {
    return SyntaxLoadResult::fail("host unit requires \"syntax\"");
  }

  std::string error;
  auto stx = syntax_from_json(doc["syntax"], error);
  if (!stx) {
    return SyntaxLoadResult::fail("malformed syntax: " + error);
  }

  HostUnit unit;
  if (doc.contains("imports")) {
    const auto & imports = doc["imports"];
    if (!imports.is_array()) {
      return SyntaxLoadResult::fail("\"imports\" must be an array of names");
    }
    for (const auto & name : imports) {
      if (!name.is_string() || name.get_ref<const std::string &>().empty()) {
        return SyntaxLoadResult::fail("\"imports\" must be an array of names");
      }
      unit.imports.push_back(name.get<std::string>());
    }
  }
  unit.file = SourceFile(doc.value("file", "<host>"), doc["source"].get<std::string>());
  unit.syntax = std::move(*stx);
  return SyntaxLoadResult::ok(std::move(unit));
}

SyntaxLoadResult load_host_unit_file(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    return SyntaxLoadResult::fail("cannot open " + path.string());
  }

  json doc;
  try {
    doc = json::parse(in);
  } catch (const json::parse_error & e) {
    return SyntaxLoadResult::fail("failed to parse JSON: " + std::string(e.what()));
  }
  return load_host_unit(doc);
}

}  // namespace shimbridge
