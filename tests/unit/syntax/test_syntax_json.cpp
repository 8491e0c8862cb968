// tests/unit/syntax/test_syntax_json.cpp - Unit tests for the host syntax interchange format
//

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "shimbridge/syntax/reprint.hpp"
#include "shimbridge/syntax/syntax_json.hpp"

using namespace shimbridge;
using json = nlohmann::json;

TEST(SyntaxJson, LoadsTokensAndNodes)
{
  const json j = json::parse(R"({
    "kind": "shim.include",
    "args": [
      {"ident": "stdio.h", "range": [12, 19], "leading": "", "trailing": "\n"},
      null,
      {"atom": "+"}
    ]
  })");

  std::string error;
  const auto stx = syntax_from_json(j, error);
  ASSERT_TRUE(stx.has_value()) << error;
  EXPECT_EQ(stx->kind(), "shim.include");
  ASSERT_EQ(stx->num_children(), 3U);

  const Syntax & header = stx->child(0);
  EXPECT_TRUE(header.is_ident());
  EXPECT_EQ(header.value(), "stdio.h");
  EXPECT_EQ(header.range(), SourceRange(12, 19));
  EXPECT_EQ(header.info().trailing, "\n");

  EXPECT_TRUE(stx->child(1).is_missing());
  EXPECT_TRUE(stx->child(2).info().is_synthetic());
}

TEST(SyntaxJson, RejectsMalformedTrees)
{
  std::string error;
  EXPECT_FALSE(syntax_from_json(json::parse(R"({"args": []})"), error).has_value());
  EXPECT_NE(error.find("kind"), std::string::npos);

  error.clear();
  EXPECT_FALSE(syntax_from_json(json::parse(R"({"atom": 3})"), error).has_value());
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(
    syntax_from_json(json::parse(R"({"atom": "x", "range": [5, 2]})"), error).has_value());
  EXPECT_NE(error.find("precedes"), std::string::npos);

  error.clear();
  EXPECT_FALSE(syntax_from_json(json::parse("[1, 2]"), error).has_value());
}

TEST(SyntaxJson, WriteThenReadPreservesReprint)
{
  const json j = json::parse(R"({
    "kind": "c.decl",
    "args": [
      {"atom": "int", "range": [0, 3], "leading": "", "trailing": " "},
      {"ident": "x", "range": [4, 5], "leading": "", "trailing": ""},
      {"atom": ";", "range": [5, 6], "leading": "", "trailing": "\n"}
    ]
  })");

  std::string error;
  const auto stx = syntax_from_json(j, error);
  ASSERT_TRUE(stx.has_value()) << error;

  const auto again = syntax_from_json(syntax_to_json(*stx), error);
  ASSERT_TRUE(again.has_value()) << error;
  EXPECT_EQ(*reprint(*again).text, "int x;\n");
}

TEST(SyntaxJson, LoadsHostUnitWithImports)
{
  const json doc = json::parse(R"({
    "file": "Main.host",
    "source": "opaque Handle\n",
    "imports": ["Lib.Handle"],
    "syntax": {"kind": "null", "args": []}
  })");

  const auto loaded = load_host_unit(doc);
  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_EQ(loaded.unit.file.file_name(), "Main.host");
  EXPECT_EQ(loaded.unit.file.content(), "opaque Handle\n");
  ASSERT_EQ(loaded.unit.imports.size(), 1U);
  EXPECT_EQ(loaded.unit.imports.front(), "Lib.Handle");
  EXPECT_TRUE(loaded.unit.syntax.is_null_node());
}

TEST(SyntaxJson, HostUnitRequiresSourceAndSyntax)
{
  EXPECT_FALSE(load_host_unit(json::parse(R"({"syntax": null})")).success);
  EXPECT_FALSE(load_host_unit(json::parse(R"({"source": ""})")).success);
  EXPECT_FALSE(
    load_host_unit(json::parse(R"({"source": "", "syntax": null, "imports": [""]})")).success);
  EXPECT_FALSE(load_host_unit(json::parse("42")).success);
}
