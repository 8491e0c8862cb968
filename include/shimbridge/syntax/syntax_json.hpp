// shimbridge/syntax/syntax_json.hpp - JSON interchange for host syntax trees
//
// The host parser hands its output over as JSON:
//
//   {
//     "file": "Main.host",
//     "source": "...full host text...",
//     "imports": ["Lib.Handle", ...],     (optional)
//     "syntax": <tree>
//   }
//
// "imports" lists host declarations visible before the unit starts.
//
// where <tree> is one of
//
//   {"atom": "def", "range": [10, 13], "leading": "", "trailing": " "}
//   {"ident": "Foo.bar", "range": [14, 21], "leading": "", "trailing": ""}
//   {"kind": "shim.section", "args": [<tree>, ...]}
//   {"missing": true}   or   null
//
// A token without "range" is synthetic.
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "shimbridge/basic/source_manager.hpp"
#include "shimbridge/syntax/syntax.hpp"

namespace shimbridge
{

/**
 * A parsed host compilation unit: the host file and its command syntax.
 */
struct HostUnit
{
  SourceFile file;
  Syntax syntax;
  std::vector<std::string> imports;
};

struct SyntaxLoadResult
{
  HostUnit unit;
  bool success = false;
  std::string error;

  static SyntaxLoadResult ok(HostUnit u)
  {
    SyntaxLoadResult r;
    r.unit = std::move(u);
    r.success = true;
    return r;
  }

  static SyntaxLoadResult fail(std::string msg)
  {
    SyntaxLoadResult r;
    r.error = std::move(msg);
    return r;
  }
};

/**
 * Convert one JSON tree into Syntax.
 *
 * @param j JSON tree
 * @param error Receives a description of the first malformed element
 * @return The syntax, or std::nullopt if `j` is malformed
 */
[[nodiscard]] std::optional<Syntax> syntax_from_json(const nlohmann::json & j, std::string & error);

/// Serialise Syntax back to the interchange format.
[[nodiscard]] nlohmann::json syntax_to_json(const Syntax & stx);

/// Load a host unit from an already parsed JSON document.
[[nodiscard]] SyntaxLoadResult load_host_unit(const nlohmann::json & doc);

/// Load a host unit from a JSON file on disk.
[[nodiscard]] SyntaxLoadResult load_host_unit_file(const std::filesystem::path & path);

}  // namespace shimbridge
