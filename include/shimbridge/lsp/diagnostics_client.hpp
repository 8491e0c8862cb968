// shimbridge/lsp/diagnostics_client.hpp - Diagnostics rounds against the shim tool
#pragma once

#include <chrono>
#include <string>
#include <utility>

#include "shimbridge/lsp/client_session.hpp"
#include "shimbridge/project/project_config.hpp"

namespace shimbridge::lsp
{

struct CollectRequest
{
  std::string uri;
  std::string text;
  std::string language_id = "c";
  std::chrono::milliseconds timeout{1000};
};

/**
 * Source of shim diagnostics used by elaboration.
 *
 * The elaborator only depends on this interface; tests substitute canned
 * results for the real tool.
 */
class DiagnosticsProvider
{
public:
  virtual ~DiagnosticsProvider() = default;

  virtual CollectResult collect(const CollectRequest & request) = 0;
};

/**
 * Runs each round in a fresh ClientSession.
 *
 * The initialize handshake counts against the round's timeout, so one round
 * never waits much longer than `request.timeout` in total.
 */
class DiagnosticsClient : public DiagnosticsProvider
{
public:
  explicit DiagnosticsClient(DiagnosticsConfig config) : config_(std::move(config)) {}

  CollectResult collect(const CollectRequest & request) override;

  [[nodiscard]] const DiagnosticsConfig & config() const noexcept { return config_; }

private:
  DiagnosticsConfig config_;
};

/**
 * URI of the virtual shim document, "file:///<virtual_file>".
 *
 * The tool names the document after its last path component in related
 * notes, which is what the remapper strips as noise.
 */
[[nodiscard]] std::string virtual_document_uri(const DiagnosticsConfig & config);

}  // namespace shimbridge::lsp
