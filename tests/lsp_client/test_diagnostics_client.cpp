// tests/lsp_client/test_diagnostics_client.cpp - Diagnostics rounds against a real subprocess
//
// Runs the client against fake_shim_tool, a minimal language server whose
// behaviour is selected by its first argument.
//

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "shimbridge/lsp/client_session.hpp"
#include "shimbridge/lsp/diagnostics_client.hpp"
#include "shimbridge/project/project_config.hpp"

using namespace shimbridge;
using namespace shimbridge::lsp;
using json = nlohmann::json;

#ifndef SHIMBRIDGE_FAKE_TOOL_PATH
#define SHIMBRIDGE_FAKE_TOOL_PATH "fake_shim_tool"
#endif

namespace
{

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

constexpr const char * k_uri = "file:///nul";
constexpr const char * k_text = "int x = WARN(1);\nint y;\nERR(2);\n";

ToolConfig fake_tool(const std::string & mode)
{
  ToolConfig tool;
  tool.command = SHIMBRIDGE_FAKE_TOOL_PATH;
  tool.args = {mode};
  return tool;
}

DiagnosticsConfig fake_config(const std::string & mode)
{
  DiagnosticsConfig config;
  config.tool = fake_tool(mode);
  return config;
}

CollectRequest request_for(const std::string & text, milliseconds timeout)
{
  CollectRequest request;
  request.uri = k_uri;
  request.text = text;
  request.timeout = timeout;
  return request;
}

std::unique_ptr<ClientSession> start_session(const std::string & mode)
{
  auto started = ClientSession::start(fake_tool(mode), milliseconds(5000));
  EXPECT_NE(started.session, nullptr) << started.error;
  return std::move(started.session);
}

}  // namespace

// ============================================================================
// DiagnosticsClient
// ============================================================================

TEST(LspDiagnosticsClient, CollectsPublishedDiagnostics)
{
  DiagnosticsClient client(fake_config("normal"));
  const CollectResult r = client.collect(request_for(k_text, milliseconds(5000)));

  ASSERT_EQ(r.status, CollectResult::Status::Ok) << r.message;
  EXPECT_EQ(r.encoding, PositionEncoding::Utf8);
  ASSERT_EQ(r.diagnostics.size(), 2U);

  EXPECT_EQ(r.diagnostics[0].severity, ToolSeverity::Warning);
  EXPECT_EQ(r.diagnostics[0].start.line, 0U);
  EXPECT_EQ(r.diagnostics[0].start.character, 8U);
  EXPECT_EQ(r.diagnostics[0].end.character, 12U);
  EXPECT_EQ(r.diagnostics[0].message, "marked warning");

  EXPECT_EQ(r.diagnostics[1].severity, ToolSeverity::Error);
  EXPECT_EQ(r.diagnostics[1].start.line, 2U);
}

TEST(LspDiagnosticsClient, CleanTextHasNoDiagnostics)
{
  DiagnosticsClient client(fake_config("normal"));
  const CollectResult r = client.collect(request_for("int x;\n", milliseconds(5000)));
  ASSERT_TRUE(r.is_ok()) << r.message;
  EXPECT_TRUE(r.diagnostics.empty());
}

TEST(LspDiagnosticsClient, NeverIdleTimesOutOnSchedule)
{
  DiagnosticsClient client(fake_config("never-idle"));

  const auto start = Clock::now();
  const CollectResult r = client.collect(request_for(k_text, milliseconds(300)));
  const auto elapsed = std::chrono::duration_cast<milliseconds>(Clock::now() - start);

  EXPECT_EQ(r.status, CollectResult::Status::Timeout);
  EXPECT_GE(elapsed.count(), 250);
  // Shutdown of the tool is bounded as well.
  EXPECT_LT(elapsed.count(), 3000);
}

TEST(LspDiagnosticsClient, SilentToolTimesOutDuringHandshake)
{
  DiagnosticsClient client(fake_config("silent"));
  const CollectResult r = client.collect(request_for(k_text, milliseconds(200)));
  EXPECT_EQ(r.status, CollectResult::Status::Timeout);
}

TEST(LspDiagnosticsClient, MissingExecutableIsAToolError)
{
  DiagnosticsConfig config;
  config.tool.command = "/nonexistent/shimbridge-no-such-tool";
  DiagnosticsClient client(config);

  const CollectResult r = client.collect(request_for(k_text, milliseconds(1000)));
  EXPECT_EQ(r.status, CollectResult::Status::ToolError);
  EXPECT_FALSE(r.message.empty());
}

TEST(LspDiagnosticsClient, CrashIsAToolError)
{
  DiagnosticsClient client(fake_config("crash"));
  const CollectResult r = client.collect(request_for(k_text, milliseconds(5000)));
  EXPECT_EQ(r.status, CollectResult::Status::ToolError);
}

TEST(LspDiagnosticsClient, GarbageIsAToolError)
{
  DiagnosticsClient client(fake_config("garbage"));
  const CollectResult r = client.collect(request_for(k_text, milliseconds(5000)));
  EXPECT_EQ(r.status, CollectResult::Status::ToolError);
  EXPECT_NE(r.message.find("malformed"), std::string::npos) << r.message;
}

TEST(LspDiagnosticsClient, VirtualDocumentUri)
{
  DiagnosticsConfig config;
  EXPECT_EQ(virtual_document_uri(config), "file:///nul");
  config.virtual_file = "shim_doc";
  EXPECT_EQ(virtual_document_uri(config), "file:///shim_doc");
}

// ============================================================================
// ClientSession Resource Hygiene
// ============================================================================

TEST(LspClientSession, SuccessfulRoundReleasesHandlersAndDocument)
{
  auto session = start_session("normal");
  ASSERT_NE(session, nullptr);
  EXPECT_EQ(session->position_encoding(), PositionEncoding::Utf8);

  const CollectResult r = session->collect(k_uri, k_text, "c", milliseconds(5000), "idle");
  EXPECT_TRUE(r.is_ok()) << r.message;
  EXPECT_EQ(session->handler_count(), 0U);
  EXPECT_EQ(session->open_document_count(), 0U);

  // The session stays usable for another round.
  const CollectResult again =
    session->collect(k_uri, "int z;\n", "c", milliseconds(5000), "idle");
  EXPECT_TRUE(again.is_ok()) << again.message;
  EXPECT_TRUE(again.diagnostics.empty());
  EXPECT_EQ(session->handler_count(), 0U);
}

TEST(LspClientSession, TimedOutRoundReleasesHandlersAndDocument)
{
  auto session = start_session("never-idle");
  ASSERT_NE(session, nullptr);

  const CollectResult r = session->collect(k_uri, k_text, "c", milliseconds(200), "idle");
  EXPECT_EQ(r.status, CollectResult::Status::Timeout);
  EXPECT_EQ(session->handler_count(), 0U);
  EXPECT_EQ(session->open_document_count(), 0U);
  EXPECT_TRUE(session->is_alive());
}

TEST(LspClientSession, UnexpectedIdleStateIsIgnored)
{
  auto session = start_session("normal");
  ASSERT_NE(session, nullptr);

  const CollectResult r =
    session->collect(k_uri, k_text, "c", milliseconds(200), "finished");
  EXPECT_EQ(r.status, CollectResult::Status::Timeout);
  EXPECT_EQ(session->handler_count(), 0U);
}

TEST(LspClientSession, CrashedToolReleasesHandlersAndDocument)
{
  auto session = start_session("crash");
  ASSERT_NE(session, nullptr);

  const CollectResult r = session->collect(k_uri, k_text, "c", milliseconds(5000), "idle");
  EXPECT_EQ(r.status, CollectResult::Status::ToolError);
  EXPECT_EQ(session->handler_count(), 0U);
  EXPECT_EQ(session->open_document_count(), 0U);
  EXPECT_FALSE(session->is_alive());
  EXPECT_FALSE(session->close_reason().empty());

  // A dead session fails fast.
  const auto start = Clock::now();
  const CollectResult later = session->collect(k_uri, k_text, "c", milliseconds(5000), "idle");
  EXPECT_EQ(later.status, CollectResult::Status::ToolError);
  EXPECT_LT(std::chrono::duration_cast<milliseconds>(Clock::now() - start).count(), 1000);
  EXPECT_EQ(session->handler_count(), 0U);
}

TEST(LspClientSession, ShutdownRequestIsAnswered)
{
  auto session = start_session("normal");
  ASSERT_NE(session, nullptr);

  const auto r = session->request("shutdown", nullptr, milliseconds(2000));
  EXPECT_EQ(r.status, ClientSession::RequestResult::Status::Ok) << r.error;
  EXPECT_TRUE(r.result.is_null());
}
