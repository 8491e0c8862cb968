// tests/unit/basic/test_source_manager.cpp - Unit tests for SourceFile and diagnostics
//

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "shimbridge/basic/diagnostic.hpp"
#include "shimbridge/basic/diagnostic_printer.hpp"
#include "shimbridge/basic/source_manager.hpp"

using namespace shimbridge;

// ============================================================================
// SourceFile
// ============================================================================

TEST(BasicSourceFile, LineColumnIsOneIndexed)
{
  const SourceFile file("ab\ncd\n\nef");

  EXPECT_EQ(file.line_count(), 4U);
  const auto lc0 = file.get_line_column(0);
  EXPECT_EQ(lc0.line, 1U);
  EXPECT_EQ(lc0.column, 1U);

  const auto lc4 = file.get_line_column(4);
  EXPECT_EQ(lc4.line, 2U);
  EXPECT_EQ(lc4.column, 2U);

  const auto lc7 = file.get_line_column(7);
  EXPECT_EQ(lc7.line, 4U);
  EXPECT_EQ(lc7.column, 1U);
}

TEST(BasicSourceFile, GetLineStripsNewline)
{
  const SourceFile file("first\r\nsecond\nthird");
  EXPECT_EQ(file.get_line(0), "first");
  EXPECT_EQ(file.get_line(1), "second");
  EXPECT_EQ(file.get_line(2), "third");
  EXPECT_TRUE(file.get_line(3).empty());
}

TEST(BasicSourceFile, LineOffsetClampsToEnd)
{
  const SourceFile file("x\ny");
  EXPECT_EQ(file.line_offset(0), 0U);
  EXPECT_EQ(file.line_offset(1), 2U);
  EXPECT_EQ(file.line_offset(7), 3U);
}

TEST(BasicSourceFile, SliceOfInvalidRangeIsEmpty)
{
  const SourceFile file("hello world");
  EXPECT_EQ(file.get_slice(SourceRange(6, 11)), "world");
  EXPECT_TRUE(file.get_slice(SourceRange{}).empty());
}

// ============================================================================
// DiagnosticBag
// ============================================================================

TEST(BasicDiagnosticBag, BuilderAddsOnDestruction)
{
  DiagnosticBag bag;
  bag.report_error(SourceRange(1, 3), "bad thing").with_code("E0101").with_help("try again");
  bag.report_warning(SourceRange(4, 5), "odd thing");

  ASSERT_EQ(bag.size(), 2U);
  EXPECT_TRUE(bag.has_errors());
  EXPECT_EQ(bag.error_count(), 1U);
  EXPECT_EQ(bag.warnings().size(), 1U);

  const Diagnostic & d = bag.all().front();
  EXPECT_EQ(d.code, "E0101");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "try again");
  EXPECT_EQ(d.primary_range(), SourceRange(1, 3));
}

TEST(BasicDiagnosticBag, MergeKeepsOrder)
{
  DiagnosticBag a;
  DiagnosticBag b;
  a.report_info(SourceRange(0, 1), "first");
  b.report_warning(SourceRange(2, 3), "second");

  a.merge(std::move(b));
  ASSERT_EQ(a.size(), 2U);
  EXPECT_EQ(a.all()[0].message, "first");
  EXPECT_EQ(a.all()[1].message, "second");
  EXPECT_FALSE(a.has_errors());
}

// ============================================================================
// DiagnosticPrinter
// ============================================================================

TEST(BasicDiagnosticPrinter, PrintsCodeLocationAndNotes)
{
  const SourceFile host("Main.host", "def a := 1\nshim foo\n");
  DiagnosticBag bag;
  bag.report_warning(SourceRange(11, 19), "unused variable\nsecond line").with_code("S0001");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, host);

  const std::string text = out.str();
  EXPECT_NE(text.find("warning[S0001]: unused variable"), std::string::npos) << text;
  EXPECT_NE(text.find("Main.host:2:1"), std::string::npos) << text;
  EXPECT_NE(text.find("shim foo"), std::string::npos) << text;
  EXPECT_NE(text.find("note: second line"), std::string::npos) << text;
}

TEST(BasicDiagnosticPrinter, MultiLineRangeIsMarkedToEndOfFirstLine)
{
  const SourceFile host("Main.host", "shim {\n  int x;\n}\n");
  DiagnosticBag bag;
  bag.report_error(SourceRange(0, 17), "bad block", "here");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, host);

  const std::string text = out.str();
  EXPECT_NE(text.find("    1 | shim {"), std::string::npos) << text;
  EXPECT_NE(text.find("      | ^^^^^^ here"), std::string::npos) << text;
}

TEST(BasicDiagnosticPrinter, SortsByPrimaryLocation)
{
  const SourceFile host("Main.host", "aaaa\nbbbb\n");
  DiagnosticBag bag;
  bag.report_error(SourceRange(5, 9), "later");
  bag.report_error(SourceRange(0, 4), "earlier");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, host);

  const std::string text = out.str();
  EXPECT_LT(text.find("earlier"), text.find("later"));
}
