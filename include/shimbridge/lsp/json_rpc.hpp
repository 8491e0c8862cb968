// shimbridge/lsp/json_rpc.hpp - Content-Length framed JSON-RPC over file descriptors
#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace shimbridge::lsp
{

/// Write one framed message. Returns false if the peer is gone.
[[nodiscard]] bool write_framed(int fd, const nlohmann::json & msg);

/**
 * Incremental reader for framed messages.
 *
 * The reader keeps partial input between calls, so a message split across
 * several reads is reassembled.
 */
class FrameReader
{
public:
  enum class Status {
    Message,    ///< A complete message was decoded
    Timeout,    ///< No complete message within the poll timeout
    Closed,     ///< The peer closed the stream
    Malformed,  ///< Header or body could not be decoded
  };

  struct Result
  {
    Status status = Status::Timeout;
    nlohmann::json message;
    std::string error;
  };

  explicit FrameReader(int fd) : fd_(fd) {}

  /// Wait at most `timeout_ms` for data and decode one message if available.
  Result read(int timeout_ms);

private:
  /// Try to decode a message from the buffered bytes.
  std::optional<Result> decode();

  int fd_;
  std::string buffer_;
};

/// Build a JSON-RPC notification.
[[nodiscard]] nlohmann::json make_notification(const std::string & method, nlohmann::json params);

/// Build a JSON-RPC request.
[[nodiscard]] nlohmann::json make_request(
  int64_t id, const std::string & method, nlohmann::json params);

}  // namespace shimbridge::lsp
