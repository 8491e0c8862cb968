// fake_shim_tool - Minimal language server used by the diagnostics client tests
//
// Usage: fake_shim_tool [normal|never-idle|crash|garbage|silent]
//
//   normal      publish diagnostics for WARN(/ERR( markers, then report idle
//   never-idle  publish diagnostics but never report the document idle
//   crash       exit as soon as a document is opened
//   garbage     answer didOpen with bytes that are not a framed message
//   silent      never answer initialize
//
// Speaks the same framing as the client, through shimbridge's own codec.
//
#include <unistd.h>

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "shimbridge/lsp/json_rpc.hpp"

using json = nlohmann::json;
using shimbridge::lsp::FrameReader;

namespace
{

constexpr int k_poll_ms = 100;

struct Marker
{
  std::string_view text;
  int severity;
  const char * message;
};

const Marker k_markers[] = {
  {"WARN(", 2, "marked warning"},
  {"ERR(", 1, "marked error\nnul:1:1: note: here"},
};

void send(const json & msg) { (void)shimbridge::lsp::write_framed(STDOUT_FILENO, msg); }

void reply(const json & request, json result)
{
  send(json{{"jsonrpc", "2.0"}, {"id", request.at("id")}, {"result", std::move(result)}});
}

/// One diagnostic per marker, covering the marker name without its parenthesis.
json scan_markers(std::string_view text)
{
  json diags = json::array();
  uint32_t line = 0;
  uint32_t column = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    for (const Marker & m : k_markers) {
      if (text.compare(i, m.text.size(), m.text) != 0) {
        continue;
      }
      const auto width = static_cast<uint32_t>(m.text.size() - 1);
      diags.push_back(json{
        {"range",
         {{"start", {{"line", line}, {"character", column}}},
          {"end", {{"line", line}, {"character", column + width}}}}},
        {"severity", m.severity},
        {"message", m.message},
      });
    }
    if (text[i] == '\n') {
      ++line;
      column = 0;
    } else {
      ++column;
    }
  }
  return diags;
}

}  // namespace

int main(int argc, char * argv[])
{
  const std::string mode = argc > 1 ? argv[1] : "normal";
  FrameReader reader(STDIN_FILENO);

  while (true) {
    auto r = reader.read(k_poll_ms);
    if (r.status == FrameReader::Status::Timeout) {
      continue;
    }
    if (r.status != FrameReader::Status::Message) {
      return r.status == FrameReader::Status::Closed ? 0 : 1;
    }

    const json & msg = r.message;
    const std::string method = msg.value("method", "");
    const json params = msg.value("params", json::object());

    if (method == "initialize") {
      if (mode != "silent") {
        reply(msg, json{{"capabilities", {{"positionEncoding", "utf-8"}}}});
      }
    } else if (method == "textDocument/didOpen") {
      if (mode == "crash") {
        return 3;
      }
      if (mode == "garbage") {
        constexpr std::string_view junk = "this is not a language server\r\n\r\n{]";
        if (::write(STDOUT_FILENO, junk.data(), junk.size()) < 0) {
          return 1;
        }
        continue;
      }
      const json doc = params.value("textDocument", json::object());
      const std::string uri = doc.value("uri", "");
      send(shimbridge::lsp::make_notification(
        "textDocument/publishDiagnostics",
        json{{"uri", uri}, {"diagnostics", scan_markers(doc.value("text", ""))}}));
      if (mode != "never-idle") {
        send(shimbridge::lsp::make_notification(
          "textDocument/clangd.fileStatus", json{{"uri", uri}, {"state", "idle"}}));
      }
    } else if (method == "shutdown") {
      reply(msg, nullptr);
    } else if (method == "exit") {
      return 0;
    }
  }
}
