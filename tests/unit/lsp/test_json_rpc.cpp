// tests/unit/lsp/test_json_rpc.cpp - Unit tests for framing, positions and sync helpers
//

#include <gtest/gtest.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

#include "shimbridge/lsp/client_session.hpp"
#include "shimbridge/lsp/json_rpc.hpp"
#include "shimbridge/lsp/one_shot.hpp"
#include "shimbridge/lsp/position_encoding.hpp"

using namespace shimbridge;
using namespace shimbridge::lsp;
using json = nlohmann::json;

// ============================================================================
// Test Helper
// ============================================================================

namespace
{

/// A pipe whose ends are closed on destruction.
struct Pipe
{
  int read_fd = -1;
  int write_fd = -1;

  Pipe()
  {
    int fds[2];
    if (::pipe(fds) == 0) {
      read_fd = fds[0];
      write_fd = fds[1];
    }
  }

  ~Pipe()
  {
    close_write();
    if (read_fd >= 0) ::close(read_fd);
  }

  void write_raw(const std::string & s) const
  {
    ASSERT_EQ(::write(write_fd, s.data(), s.size()), static_cast<ssize_t>(s.size()));
  }

  void close_write()
  {
    if (write_fd >= 0) ::close(write_fd);
    write_fd = -1;
  }
};

}  // namespace

// ============================================================================
// Framing
// ============================================================================

TEST(LspFraming, WriteThenReadMessage)
{
  Pipe p;
  ASSERT_GE(p.read_fd, 0);

  const json msg = make_request(7, "initialize", json{{"processId", 1}});
  ASSERT_TRUE(write_framed(p.write_fd, msg));

  FrameReader reader(p.read_fd);
  const auto r = reader.read(1000);
  ASSERT_EQ(r.status, FrameReader::Status::Message) << r.error;
  EXPECT_EQ(r.message["id"], 7);
  EXPECT_EQ(r.message["method"], "initialize");
  EXPECT_EQ(r.message["jsonrpc"], "2.0");
}

TEST(LspFraming, ReassemblesSplitMessagesAndExtraHeaders)
{
  Pipe p;
  const std::string body = R"({"jsonrpc":"2.0","method":"a","params":{}})";
  p.write_raw("Content-Type: application/vscode-jsonrpc\r\nContent-Len");

  FrameReader reader(p.read_fd);
  EXPECT_EQ(reader.read(20).status, FrameReader::Status::Timeout);

  p.write_raw("gth: " + std::to_string(body.size()) + "\r\n\r\n" + body.substr(0, 5));
  EXPECT_EQ(reader.read(20).status, FrameReader::Status::Timeout);

  // Second message arrives in the same chunk as the rest of the first.
  const std::string second = R"({"jsonrpc":"2.0","method":"b"})";
  p.write_raw(
    body.substr(5) + "Content-Length: " + std::to_string(second.size()) + "\r\n\r\n" + second);

  const auto first = reader.read(1000);
  ASSERT_EQ(first.status, FrameReader::Status::Message);
  EXPECT_EQ(first.message["method"], "a");

  const auto next = reader.read(1000);
  ASSERT_EQ(next.status, FrameReader::Status::Message);
  EXPECT_EQ(next.message["method"], "b");
}

TEST(LspFraming, ClosedStream)
{
  Pipe p;
  p.close_write();
  FrameReader reader(p.read_fd);
  EXPECT_EQ(reader.read(1000).status, FrameReader::Status::Closed);
}

TEST(LspFraming, MissingContentLengthIsMalformed)
{
  Pipe p;
  p.write_raw("X-Whatever: 1\r\n\r\n{}");
  FrameReader reader(p.read_fd);
  EXPECT_EQ(reader.read(1000).status, FrameReader::Status::Malformed);
}

TEST(LspFraming, InvalidJsonBodyIsMalformed)
{
  Pipe p;
  p.write_raw("Content-Length: 3\r\n\r\n{]x");
  FrameReader reader(p.read_fd);
  const auto r = reader.read(1000);
  EXPECT_EQ(r.status, FrameReader::Status::Malformed);
  EXPECT_NE(r.error.find("JSON"), std::string::npos);
}

// ============================================================================
// Diagnostic Decoding
// ============================================================================

TEST(LspDiagnosticParse, DecodesRangeSeverityAndMessage)
{
  const json j = json::parse(R"({
    "range": {"start": {"line": 2, "character": 4}, "end": {"line": 2, "character": 9}},
    "severity": 2,
    "message": "unused variable"
  })");
  const auto d = parse_lsp_diagnostic(j);
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->start.line, 2U);
  EXPECT_EQ(d->start.character, 4U);
  EXPECT_EQ(d->end.character, 9U);
  EXPECT_EQ(d->severity, ToolSeverity::Warning);
  EXPECT_EQ(d->message, "unused variable");
}

TEST(LspDiagnosticParse, MissingSeverityIsUnknown)
{
  const json j = json::parse(
    R"({"range": {"start": {"line": 0, "character": 0}, "end": {"line": 0, "character": 1}}})");
  const auto d = parse_lsp_diagnostic(j);
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->severity, ToolSeverity::Unknown);
  EXPECT_TRUE(d->message.empty());
}

TEST(LspDiagnosticParse, RejectsBadRanges)
{
  EXPECT_FALSE(parse_lsp_diagnostic(json::parse(R"({"message": "x"})")).has_value());
  EXPECT_FALSE(parse_lsp_diagnostic(json::parse(
                 R"({"range": {"start": {"line": -1, "character": 0},
                               "end": {"line": 0, "character": 0}}})"))
                 .has_value());
  EXPECT_FALSE(parse_lsp_diagnostic(json::array()).has_value());
}

// ============================================================================
// Position Encoding
// ============================================================================

TEST(LspPositionEncoding, ParseName)
{
  EXPECT_EQ(parse_position_encoding("utf-8"), PositionEncoding::Utf8);
  EXPECT_EQ(parse_position_encoding("utf-16"), PositionEncoding::Utf16);
  EXPECT_EQ(parse_position_encoding("utf-32"), PositionEncoding::Utf16);
}

TEST(LspPositionEncoding, Utf8ColumnsAreBytes)
{
  const SourceFile text("a\n\xC3\xA9x\n");
  EXPECT_EQ(lsp_position_to_offset(text, 1, 2, PositionEncoding::Utf8), 4U);
  EXPECT_EQ(lsp_position_to_offset(text, 1, 2, PositionEncoding::Utf16), 5U);
}

TEST(LspPositionEncoding, SurrogatePairCountsTwice)
{
  const SourceFile text("\xF0\x9F\x98\x80z");
  EXPECT_EQ(lsp_position_to_offset(text, 0, 2, PositionEncoding::Utf16), 4U);
  // Inside the pair clamps to the code point start.
  EXPECT_EQ(lsp_position_to_offset(text, 0, 1, PositionEncoding::Utf16), 0U);
}

// ============================================================================
// OneShot / DeadlineTimer
// ============================================================================

TEST(LspOneShot, FirstResolutionWins)
{
  OneShot<int> cell;
  EXPECT_FALSE(cell.peek().has_value());
  EXPECT_TRUE(cell.resolve(1));
  EXPECT_FALSE(cell.resolve(2));
  EXPECT_EQ(cell.wait(), 1);
  EXPECT_EQ(cell.wait_for(std::chrono::milliseconds(0)), std::optional<int>(1));
}

TEST(LspOneShot, WaitForTimesOut)
{
  OneShot<int> cell;
  EXPECT_FALSE(cell.wait_for(std::chrono::milliseconds(10)).has_value());
}

TEST(LspDeadlineTimer, FiresAfterDelay)
{
  OneShot<bool> fired;
  DeadlineTimer timer(std::chrono::milliseconds(10), [&fired] { fired.resolve(true); });
  EXPECT_EQ(fired.wait_for(std::chrono::milliseconds(2000)), std::optional<bool>(true));
}

TEST(LspDeadlineTimer, DestructionCancels)
{
  std::atomic<bool> fired{false};
  {
    DeadlineTimer timer(std::chrono::milliseconds(10000), [&fired] { fired = true; });
  }
  EXPECT_FALSE(fired.load());
}
