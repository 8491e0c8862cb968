// shimbridge/lsp/client_session.cpp - Shim tool session and diagnostics round
#include "shimbridge/lsp/client_session.hpp"

#include <unistd.h>

#include <utility>

namespace shimbridge::lsp
{

using json = nlohmann::json;

namespace
{

constexpr int k_receive_poll_ms = 50;
constexpr auto k_shutdown_timeout = std::chrono::milliseconds(500);

constexpr const char * k_publish_diagnostics = "textDocument/publishDiagnostics";
constexpr const char * k_file_status = "textDocument/clangd.fileStatus";

enum class CollectSignal {
  Idle,
  TimedOut,
  ToolFailed,
};

std::optional<LspPosition> parse_position(const json & j)
{
  if (!j.is_object()) {
    return std::nullopt;
  }
  const auto line = j.find("line");
  const auto character = j.find("character");
  if (line == j.end() || character == j.end() || !line->is_number_integer() ||
      !character->is_number_integer() || line->get<int64_t>() < 0 ||
      character->get<int64_t>() < 0) {
    return std::nullopt;
  }
  return LspPosition{line->get<uint32_t>(), character->get<uint32_t>()};
}

bool is_string_field(const json & j, const char * key, const std::string & expected)
{
  const auto it = j.find(key);
  return it != j.end() && it->is_string() && it->get_ref<const std::string &>() == expected;
}

}  // namespace

std::optional<LspDiagnostic> parse_lsp_diagnostic(const json & j)
{
  if (!j.is_object() || !j.contains("range")) {
    return std::nullopt;
  }
  const json & range = j["range"];
  if (!range.is_object() || !range.contains("start") || !range.contains("end")) {
    return std::nullopt;
  }
  const auto start = parse_position(range["start"]);
  const auto end = parse_position(range["end"]);
  if (!start || !end) {
    return std::nullopt;
  }

  LspDiagnostic d;
  d.start = *start;
  d.end = *end;

  const auto sev = j.find("severity");
  if (sev != j.end() && sev->is_number_integer()) {
    const int64_t v = sev->get<int64_t>();
    if (v >= 1 && v <= 4) {
      d.severity = static_cast<ToolSeverity>(v);
    }
  }

  const auto msg = j.find("message");
  if (msg != j.end() && msg->is_string()) {
    d.message = msg->get<std::string>();
  }
  return d;
}

// ============================================================================
// Lifecycle
// ============================================================================

ClientSession::ClientSession(std::unique_ptr<Subprocess> process)
: process_(std::move(process)), reader_(process_->stdout_fd())
{
  receiver_ = std::thread([this] { receive_loop(); });
}

ClientSession::StartResult ClientSession::start(
  const ToolConfig & tool, std::chrono::milliseconds handshake_timeout)
{
  StartResult result;

  std::vector<std::string> argv;
  argv.push_back(tool.command);
  argv.insert(argv.end(), tool.args.begin(), tool.args.end());

  auto spawned = Subprocess::spawn(argv);
  if (!spawned.process) {
    result.error = std::move(spawned.error);
    return result;
  }

  std::unique_ptr<ClientSession> session(new ClientSession(std::move(spawned.process)));

  json params;
  params["processId"] = static_cast<int64_t>(::getpid());
  params["rootUri"] = nullptr;
  params["capabilities"] = {
    {"general", {{"positionEncodings", json::array({"utf-8", "utf-16"})}}},
    {"textDocument", {{"publishDiagnostics", {{"relatedInformation", false}}}}},
  };
  params["initializationOptions"] = {
    {"clangdFileStatus", true},
    {"fallbackFlags", tool.flags},
  };

  const auto init = session->request("initialize", std::move(params), handshake_timeout);
  if (init.status == RequestResult::Status::Timeout) {
    result.timed_out = true;
    result.error = "'" + tool.command + "' did not answer initialize in time";
    return result;
  }
  if (init.status != RequestResult::Status::Ok) {
    result.error = "initialize failed: " + init.error;
    return result;
  }

  if (init.result.is_object()) {
    const auto caps = init.result.find("capabilities");
    if (caps != init.result.end() && caps->is_object()) {
      const auto enc = caps->find("positionEncoding");
      if (enc != caps->end() && enc->is_string()) {
        session->encoding_ = parse_position_encoding(enc->get<std::string>());
      }
    }
  }

  if (!session->notify("initialized", json::object())) {
    result.error = "tool closed its input after initialize";
    return result;
  }

  result.session = std::move(session);
  return result;
}

ClientSession::~ClientSession()
{
  if (is_alive()) {
    const auto r = request("shutdown", nullptr, k_shutdown_timeout);
    if (r.status == RequestResult::Status::Ok) {
      (void)notify("exit", nullptr);
    }
  }

  stop_ = true;
  if (receiver_.joinable()) {
    receiver_.join();
  }
  process_->terminate(k_shutdown_timeout);
}

// ============================================================================
// Handlers
// ============================================================================

ClientSession::HandlerId ClientSession::add_notification_handler(
  std::string method, NotificationHandler handler)
{
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  const HandlerId id = next_handler_id_++;
  handlers_[id] = HandlerEntry{std::move(method), std::move(handler), nullptr};
  return id;
}

ClientSession::HandlerId ClientSession::add_close_handler(CloseHandler handler)
{
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  const HandlerId id = next_handler_id_++;
  handlers_[id] = HandlerEntry{std::string(), nullptr, std::move(handler)};
  return id;
}

void ClientSession::remove_handler(HandlerId id)
{
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_.erase(id);
}

size_t ClientSession::handler_count() const
{
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  return handlers_.size();
}

// ============================================================================
// Messages
// ============================================================================

bool ClientSession::send(const json & msg)
{
  std::lock_guard<std::mutex> lock(write_mutex_);
  const int fd = process_->stdin_fd();
  if (fd < 0) {
    return false;
  }
  return write_framed(fd, msg);
}

bool ClientSession::notify(const std::string & method, json params)
{
  return send(make_notification(method, std::move(params)));
}

ClientSession::RequestResult ClientSession::request(
  const std::string & method, json params, std::chrono::milliseconds timeout)
{
  RequestResult result;

  auto cell = std::make_shared<OneShot<Response>>();
  int64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (!alive_) {
      result.error = close_reason();
      return result;
    }
    id = next_request_id_++;
    pending_[id] = cell;
  }

  auto forget = [this, id] {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.erase(id);
  };

  if (!send(make_request(id, method, std::move(params)))) {
    forget();
    result.error = "cannot write '" + method + "' to the tool";
    return result;
  }

  const auto response = cell->wait_for(timeout);
  forget();

  if (!response) {
    result.status = RequestResult::Status::Timeout;
    result.error = "'" + method + "' timed out";
    return result;
  }
  if (!response->ok) {
    result.error = response->error;
    return result;
  }
  result.status = RequestResult::Status::Ok;
  result.result = response->result;
  return result;
}

// ============================================================================
// Documents
// ============================================================================

bool ClientSession::open_document(
  const std::string & uri, const std::string & language_id, const std::string & text)
{
  json params;
  params["textDocument"] = {
    {"uri", uri},
    {"languageId", language_id},
    {"version", 1},
    {"text", text},
  };
  if (!notify("textDocument/didOpen", std::move(params))) {
    return false;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  open_documents_.insert(uri);
  return true;
}

void ClientSession::close_document(const std::string & uri)
{
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (open_documents_.erase(uri) == 0) {
      return;
    }
  }
  // A dead tool has nothing left to close.
  (void)notify("textDocument/didClose", {{"textDocument", {{"uri", uri}}}});
}

size_t ClientSession::open_document_count() const
{
  std::lock_guard<std::mutex> lock(state_mutex_);
  return open_documents_.size();
}

std::string ClientSession::close_reason() const
{
  std::lock_guard<std::mutex> lock(state_mutex_);
  return close_reason_;
}

// ============================================================================
// Diagnostics Round
// ============================================================================

CollectResult ClientSession::collect(
  const std::string & uri, const std::string & text, const std::string & language_id,
  std::chrono::milliseconds timeout, const std::string & idle_state)
{
  // Declaration order matters: the timer and handlers reference these and are
  // destroyed first.
  OneShot<CollectSignal> done;
  std::mutex slot_mutex;
  std::vector<LspDiagnostic> slot;
  std::string tool_failure;

  ScopedHandler on_close(*this, add_close_handler([&](const std::string & reason) {
    {
      std::lock_guard<std::mutex> lock(slot_mutex);
      tool_failure = reason;
    }
    done.resolve(CollectSignal::ToolFailed);
  }));

  ScopedHandler on_publish(
    *this, add_notification_handler(k_publish_diagnostics, [&](const json & params) {
      if (!params.is_object() || !is_string_field(params, "uri", uri)) {
        return;
      }
      std::vector<LspDiagnostic> diags;
      const auto list = params.find("diagnostics");
      if (list != params.end() && list->is_array()) {
        for (const auto & item : *list) {
          if (auto d = parse_lsp_diagnostic(item)) {
            diags.push_back(std::move(*d));
          }
        }
      }
      std::lock_guard<std::mutex> lock(slot_mutex);
      slot = std::move(diags);
    }));

  ScopedHandler on_status(
    *this, add_notification_handler(k_file_status, [&](const json & params) {
      if (params.is_object() && is_string_field(params, "uri", uri) &&
          is_string_field(params, "state", idle_state)) {
        done.resolve(CollectSignal::Idle);
      }
    }));

  if (!is_alive()) {
    return CollectResult::tool_error("tool exited: " + close_reason());
  }

  ScopedDocument document(*this, uri, language_id, text);
  if (!document.opened()) {
    return CollectResult::tool_error("cannot send the shim document to the tool");
  }

  DeadlineTimer timer(timeout, [&done] { done.resolve(CollectSignal::TimedOut); });

  switch (done.wait()) {
    case CollectSignal::Idle: {
      std::lock_guard<std::mutex> lock(slot_mutex);
      return CollectResult::ok(slot, encoding_);
    }
    case CollectSignal::TimedOut:
      return CollectResult::timeout(
        "no idle status within " + std::to_string(timeout.count()) + " ms");
    case CollectSignal::ToolFailed: {
      std::lock_guard<std::mutex> lock(slot_mutex);
      return CollectResult::tool_error("tool exited: " + tool_failure);
    }
  }
  return CollectResult::tool_error("unexpected collect state");
}

// ============================================================================
// Receiver
// ============================================================================

void ClientSession::receive_loop()
{
  while (!stop_) {
    auto r = reader_.read(k_receive_poll_ms);
    switch (r.status) {
      case FrameReader::Status::Timeout:
        continue;
      case FrameReader::Status::Message:
        if (!r.message.is_object()) {
          handle_close("malformed message: not a JSON object");
          return;
        }
        try {
          dispatch(r.message);
        } catch (const json::exception & e) {
          handle_close(std::string("malformed message: ") + e.what());
          return;
        }
        continue;
      case FrameReader::Status::Closed:
        handle_close(r.error);
        return;
      case FrameReader::Status::Malformed:
        handle_close("malformed message: " + r.error);
        return;
    }
  }
}

void ClientSession::dispatch(const json & msg)
{
  const bool has_method = msg.contains("method");
  const bool has_id = msg.contains("id");

  // Response to one of our requests.
  if (!has_method && has_id) {
    if (!msg["id"].is_number_integer()) {
      return;
    }
    const int64_t id = msg["id"].get<int64_t>();
    std::shared_ptr<OneShot<Response>> cell;
    {
      std::lock_guard<std::mutex> lock(pending_mutex_);
      const auto it = pending_.find(id);
      if (it == pending_.end()) {
        return;
      }
      cell = it->second;
    }
    Response response;
    if (msg.contains("error")) {
      response.error = msg["error"].is_object() ? msg["error"].value("message", "request failed")
                                                : "request failed";
    } else {
      response.ok = true;
      response.result = msg.value("result", json());
    }
    cell->resolve(std::move(response));
    return;
  }

  if (!has_method || !msg["method"].is_string()) {
    return;
  }
  const std::string method = msg["method"].get<std::string>();

  // Requests from the tool (workDoneProgress/create, configuration, ...) get a null result.
  if (has_id) {
    json reply;
    reply["jsonrpc"] = "2.0";
    reply["id"] = msg["id"];
    reply["result"] = nullptr;
    (void)send(reply);
    return;
  }

  const json params = msg.value("params", json());
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  for (const auto & [id, entry] : handlers_) {
    if (entry.on_notification && entry.method == method) {
      entry.on_notification(params);
    }
  }
}

void ClientSession::handle_close(const std::string & reason)
{
  std::map<int64_t, std::shared_ptr<OneShot<Response>>> pending;
  {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    close_reason_ = reason.empty() ? "stream closed" : reason;
  }
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    alive_ = false;
    pending.swap(pending_);
  }
  for (auto & [id, cell] : pending) {
    Response failed;
    failed.error = "tool exited: " + close_reason();
    cell->resolve(std::move(failed));
  }

  const std::string why = close_reason();
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  for (const auto & [id, entry] : handlers_) {
    if (entry.on_close) {
      entry.on_close(why);
    }
  }
}

}  // namespace shimbridge::lsp
