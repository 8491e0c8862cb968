// tests/unit/shim/test_shim_buffer.cpp - Unit tests for the shim buffer and position map
//

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>

#include "shimbridge/basic/source_manager.hpp"
#include "shimbridge/shim/position_map.hpp"
#include "shimbridge/shim/shim_buffer.hpp"

using namespace shimbridge;

// ============================================================================
// PositionMap
// ============================================================================

TEST(ShimPositionMap, EmptyMapReturnsSentinel)
{
  const PositionMap map;
  EXPECT_EQ(map.shim_to_host(0), PositionMap::k_sentinel);
  EXPECT_EQ(map.shim_to_host(1000), PositionMap::k_sentinel);
  EXPECT_FALSE(map.host_to_shim(SourceLocation(3)).has_value());
}

TEST(ShimPositionMap, GreatestStartAtOrBeforeOffsetWins)
{
  PositionMap map;
  map.record(5, 10, SourceRange(100, 120));
  map.record(10, 20, SourceRange(200, 210));
  map.record(20, 20, SourceRange(300, 305));

  EXPECT_EQ(map.shim_to_host(4), PositionMap::k_sentinel);
  EXPECT_EQ(map.shim_to_host(5).offset(), 100U);
  EXPECT_EQ(map.shim_to_host(9).offset(), 100U);
  EXPECT_EQ(map.shim_to_host(10).offset(), 200U);
  EXPECT_EQ(map.shim_to_host(19).offset(), 200U);
  // Past the last span the last span still applies.
  EXPECT_EQ(map.shim_to_host(500).offset(), 300U);
}

TEST(ShimPositionMap, ShimToHostIsMonotonicAndRoundTrips)
{
  struct Span
  {
    uint32_t shim_start;
    uint32_t shim_end;
    SourceRange host;
  };
  const Span spans[] = {
    {3, 10, SourceRange(10, 16)},
    {10, 24, SourceRange(25, 38)},
    {24, 24, SourceRange(39, 39)},
    {24, 31, SourceRange(40, 46)},
  };

  PositionMap map;
  for (const auto & s : spans) {
    map.record(s.shim_start, s.shim_end, s.host);
  }

  uint32_t previous = 0;
  for (uint32_t offset = 0; offset < 40; ++offset) {
    const SourceLocation host = map.shim_to_host(offset);
    EXPECT_GE(host.offset(), previous) << "offset " << offset;
    EXPECT_EQ(host == PositionMap::k_sentinel, offset < 3) << "offset " << offset;
    previous = host.offset();
  }

  EXPECT_EQ(map.shim_to_host(3).offset(), 10U);
  EXPECT_EQ(map.shim_to_host(10).offset(), 25U);
  // Equal shim starts resolve to the later span.
  EXPECT_EQ(map.shim_to_host(24).offset(), 40U);
}

TEST(ShimPositionMap, RangeIsAttributedToSpanOfItsStart)
{
  PositionMap map;
  map.record(0, 10, SourceRange(10, 20));
  map.record(10, 30, SourceRange(25, 35));

  EXPECT_EQ(map.shim_range_to_host(12), SourceRange(25, 35));
  // A range starting in the first span but ending in the second stays in the first.
  EXPECT_EQ(map.shim_range_to_host(8), SourceRange(10, 20));
}

TEST(ShimPositionMap, HostToShimFindsFirstSpanAtOrAfter)
{
  PositionMap map;
  map.record(0, 10, SourceRange(10, 20));
  map.record(10, 30, SourceRange(25, 35));

  EXPECT_EQ(map.host_to_shim(SourceLocation(10)), std::optional<uint32_t>(0));
  EXPECT_EQ(map.host_to_shim(SourceLocation(21)), std::optional<uint32_t>(10));
  EXPECT_FALSE(map.host_to_shim(SourceLocation(36)).has_value());
}

TEST(ShimPositionMap, OutOfOrderRecordThrows)
{
  PositionMap map;
  map.record(10, 20, SourceRange(0, 1));
  EXPECT_THROW(map.record(5, 8, SourceRange(2, 3)), OrderingViolation);
  EXPECT_THROW(map.record(30, 25, SourceRange(2, 3)), OrderingViolation);
  EXPECT_EQ(map.size(), 1U);
}

TEST(ShimPositionMap, OverlappingRecordThrows)
{
  PositionMap map;
  map.record(0, 10, SourceRange(0, 4));
  EXPECT_THROW(map.record(5, 12, SourceRange(6, 8)), OrderingViolation);
  EXPECT_NO_THROW(map.record(10, 12, SourceRange(6, 8)));
  EXPECT_EQ(map.size(), 2U);
}

TEST(ShimPositionMap, EqualStartsAreAllowed)
{
  PositionMap map;
  map.record(10, 10, SourceRange(0, 1));
  EXPECT_NO_THROW(map.record(10, 15, SourceRange(4, 6)));
  EXPECT_EQ(map.shim_to_host(10).offset(), 4U);
}

// ============================================================================
// ShimBuffer
// ============================================================================

TEST(ShimBuffer, CommandsAreNewlineTerminated)
{
  ShimBuffer buffer;
  buffer.push_command("int a;", SourceRange(10, 16));
  buffer.push_command("int b;\n", SourceRange(25, 31));

  EXPECT_EQ(buffer.source_text(), "int a;\nint b;\n");
  ASSERT_EQ(buffer.commands().size(), 2U);
  EXPECT_EQ(buffer.commands()[1].shim_start, 7U);
  EXPECT_EQ(buffer.current_end_offset(), 14U);
}

TEST(ShimBuffer, EmptyTextIsNoOp)
{
  ShimBuffer buffer;
  buffer.push_command("", SourceRange(0, 1));
  EXPECT_TRUE(buffer.empty());
  EXPECT_TRUE(buffer.source_text().empty());
  EXPECT_TRUE(buffer.position_map().empty());
}

TEST(ShimBuffer, SpansTrackEachCommand)
{
  ShimBuffer buffer;
  buffer.push_command("a", SourceRange(10, 11));
  buffer.push_command("bb", SourceRange(25, 27));
  buffer.push_command("ccc", SourceRange(40, 43));

  const PositionMap & map = buffer.position_map();
  ASSERT_EQ(map.size(), 3U);
  EXPECT_EQ(map.shim_to_host(0).offset(), 10U);
  EXPECT_EQ(map.shim_to_host(2).offset(), 25U);
  EXPECT_EQ(map.shim_to_host(5).offset(), 40U);
  EXPECT_EQ(map.spans()[2].shim_end, buffer.current_end_offset());
}

TEST(ShimBuffer, InvalidOriginMapsToSentinel)
{
  ShimBuffer buffer;
  buffer.push_command("#include <x.h>", SourceRange{});
  EXPECT_EQ(buffer.position_map().shim_to_host(3), PositionMap::k_sentinel);
  EXPECT_EQ(buffer.commands().front().origin.get_begin(), PositionMap::k_sentinel);
}

TEST(ShimBuffer, CopiesAreIndependent)
{
  ShimBuffer original;
  original.push_command("a", SourceRange(0, 1));

  ShimBuffer staged = original;
  staged.push_command("b", SourceRange(2, 3));

  EXPECT_EQ(original.source_text(), "a\n");
  EXPECT_EQ(staged.source_text(), "a\nb\n");
  EXPECT_EQ(original.position_map().size(), 1U);
}
