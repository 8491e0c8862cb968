// shimbridge/lsp/diagnostics_client.cpp - Diagnostics rounds against the shim tool
#include "shimbridge/lsp/diagnostics_client.hpp"

#include <algorithm>
#include <utility>

namespace shimbridge::lsp
{

CollectResult DiagnosticsClient::collect(const CollectRequest & request)
{
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + request.timeout;

  auto started = ClientSession::start(config_.tool, request.timeout);
  if (!started.session) {
    if (started.timed_out) {
      return CollectResult::timeout(started.error);
    }
    return CollectResult::tool_error(started.error);
  }

  const auto remaining = std::max(
    std::chrono::milliseconds(0),
    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()));

  return started.session->collect(
    request.uri, request.text, request.language_id, remaining, config_.idle_state);
}

std::string virtual_document_uri(const DiagnosticsConfig & config)
{
  return "file:///" + config.virtual_file;
}

}  // namespace shimbridge::lsp
