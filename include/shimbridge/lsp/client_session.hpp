// shimbridge/lsp/client_session.hpp - One live shim tool process
//
// A ClientSession owns the tool subprocess, a background receiver thread
// that decodes the tool's output, and the set of handlers that receiver
// dispatches notifications to.
//
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "shimbridge/lsp/json_rpc.hpp"
#include "shimbridge/lsp/one_shot.hpp"
#include "shimbridge/lsp/position_encoding.hpp"
#include "shimbridge/lsp/subprocess.hpp"
#include "shimbridge/project/project_config.hpp"

namespace shimbridge::lsp
{

// ============================================================================
// Diagnostics as Reported by the Tool
// ============================================================================

/// LSP DiagnosticSeverity values.
enum class ToolSeverity : uint8_t {
  Unknown = 0,
  Error = 1,
  Warning = 2,
  Information = 3,
  Hint = 4,
};

struct LspPosition
{
  uint32_t line = 0;
  uint32_t character = 0;
};

/// One entry of a textDocument/publishDiagnostics notification.
struct LspDiagnostic
{
  LspPosition start;
  LspPosition end;
  ToolSeverity severity = ToolSeverity::Unknown;
  std::string message;
};

/// Decode one diagnostic object; nullopt if it has no usable range.
[[nodiscard]] std::optional<LspDiagnostic> parse_lsp_diagnostic(const nlohmann::json & j);

/**
 * Outcome of one diagnostics round.
 */
struct CollectResult
{
  enum class Status {
    Ok,
    Timeout,    ///< The tool did not report the document idle in time
    ToolError,  ///< The tool could not be launched, died, or spoke garbage
  };

  Status status = Status::Ok;
  std::vector<LspDiagnostic> diagnostics;
  std::string message;

  /// Unit of LspPosition::character negotiated with the tool
  PositionEncoding encoding = PositionEncoding::Utf16;

  [[nodiscard]] bool is_ok() const noexcept { return status == Status::Ok; }

  static CollectResult ok(std::vector<LspDiagnostic> diags, PositionEncoding enc)
  {
    CollectResult r;
    r.status = Status::Ok;
    r.diagnostics = std::move(diags);
    r.encoding = enc;
    return r;
  }

  static CollectResult timeout(std::string msg)
  {
    CollectResult r;
    r.status = Status::Timeout;
    r.message = std::move(msg);
    return r;
  }

  static CollectResult tool_error(std::string msg)
  {
    CollectResult r;
    r.status = Status::ToolError;
    r.message = std::move(msg);
    return r;
  }
};

// ============================================================================
// ClientSession
// ============================================================================

class ClientSession
{
public:
  using HandlerId = uint64_t;
  using NotificationHandler = std::function<void(const nlohmann::json & params)>;
  using CloseHandler = std::function<void(const std::string & reason)>;

  struct StartResult
  {
    std::unique_ptr<ClientSession> session;
    bool timed_out = false;
    std::string error;
  };

  struct RequestResult
  {
    enum class Status {
      Ok,
      Timeout,
      Failed,
    };

    Status status = Status::Failed;
    nlohmann::json result;
    std::string error;
  };

  /**
   * Launch the tool and perform the initialize/initialized handshake.
   *
   * The handshake waits at most `handshake_timeout` for the initialize response.
   */
  [[nodiscard]] static StartResult start(
    const ToolConfig & tool, std::chrono::milliseconds handshake_timeout);

  ClientSession(const ClientSession &) = delete;
  ClientSession & operator=(const ClientSession &) = delete;

  /// Sends shutdown/exit if the tool is still alive, then stops and reaps it.
  ~ClientSession();

  // Handlers ----------------------------------------------------------------

  /**
   * Register a handler for server notifications named `method`.
   *
   * Handlers run on the receiver thread while the handler table is locked, so
   * they must not register or remove handlers themselves. Removing a handler
   * waits for any invocation of it in progress.
   */
  HandlerId add_notification_handler(std::string method, NotificationHandler handler);

  /// Register a handler called once when the tool's output stream ends or breaks.
  HandlerId add_close_handler(CloseHandler handler);

  void remove_handler(HandlerId id);

  [[nodiscard]] size_t handler_count() const;

  // Messages ----------------------------------------------------------------

  bool notify(const std::string & method, nlohmann::json params);

  RequestResult request(
    const std::string & method, nlohmann::json params, std::chrono::milliseconds timeout);

  // Documents ---------------------------------------------------------------

  bool open_document(const std::string & uri, const std::string & language_id,
                     const std::string & text);

  void close_document(const std::string & uri);

  [[nodiscard]] size_t open_document_count() const;

  // Diagnostics -------------------------------------------------------------

  /**
   * Open `text` as `uri` and wait until the tool reports the document idle.
   *
   * Returns the last published diagnostics for `uri`. Temporary handlers and
   * the opened document are released on every exit path.
   */
  CollectResult collect(const std::string & uri, const std::string & text,
                        const std::string & language_id, std::chrono::milliseconds timeout,
                        const std::string & idle_state);

  // State -------------------------------------------------------------------

  [[nodiscard]] bool is_alive() const noexcept { return alive_.load(); }

  [[nodiscard]] std::string close_reason() const;

  [[nodiscard]] PositionEncoding position_encoding() const noexcept { return encoding_; }

private:
  explicit ClientSession(std::unique_ptr<Subprocess> process);

  bool send(const nlohmann::json & msg);

  void receive_loop();
  void dispatch(const nlohmann::json & msg);
  void handle_close(const std::string & reason);

  struct HandlerEntry
  {
    std::string method;  // empty for close handlers
    NotificationHandler on_notification;
    CloseHandler on_close;
  };

  struct Response
  {
    bool ok = false;
    nlohmann::json result;
    std::string error;
  };

  std::unique_ptr<Subprocess> process_;
  FrameReader reader_;
  std::thread receiver_;
  std::atomic<bool> stop_{false};
  std::atomic<bool> alive_{true};
  PositionEncoding encoding_ = PositionEncoding::Utf16;

  std::mutex write_mutex_;

  mutable std::mutex handlers_mutex_;
  std::map<HandlerId, HandlerEntry> handlers_;
  HandlerId next_handler_id_ = 1;

  std::mutex pending_mutex_;
  std::map<int64_t, std::shared_ptr<OneShot<Response>>> pending_;
  int64_t next_request_id_ = 1;

  mutable std::mutex state_mutex_;
  std::set<std::string> open_documents_;
  std::string close_reason_;
};

// ============================================================================
// Scoped Resources
// ============================================================================

/// Removes a handler when it goes out of scope.
class ScopedHandler
{
public:
  ScopedHandler(ClientSession & session, ClientSession::HandlerId id) : session_(session), id_(id)
  {
  }

  ScopedHandler(const ScopedHandler &) = delete;
  ScopedHandler & operator=(const ScopedHandler &) = delete;

  ~ScopedHandler() { session_.remove_handler(id_); }

private:
  ClientSession & session_;
  ClientSession::HandlerId id_;
};

/// Opens a document on construction and closes it when it goes out of scope.
class ScopedDocument
{
public:
  ScopedDocument(ClientSession & session, std::string uri, const std::string & language_id,
                 const std::string & text)
  : session_(session), uri_(std::move(uri))
  {
    opened_ = session_.open_document(uri_, language_id, text);
  }

  ScopedDocument(const ScopedDocument &) = delete;
  ScopedDocument & operator=(const ScopedDocument &) = delete;

  ~ScopedDocument() { session_.close_document(uri_); }

  [[nodiscard]] bool opened() const noexcept { return opened_; }

private:
  ClientSession & session_;
  std::string uri_;
  bool opened_ = false;
};

}  // namespace shimbridge::lsp
