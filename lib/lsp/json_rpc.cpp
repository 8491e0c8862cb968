// shimbridge/lsp/json_rpc.cpp - Content-Length framing
#include "shimbridge/lsp/json_rpc.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string_view>
#include <utility>

namespace shimbridge::lsp
{

using json = nlohmann::json;

namespace
{

constexpr std::string_view k_header_end = "\r\n\r\n";
constexpr std::string_view k_content_length = "Content-Length:";
constexpr size_t k_max_message_size = size_t{64} * 1024 * 1024;

bool write_all(int fd, const void * data, size_t n)
{
  const auto * p = static_cast<const uint8_t *>(data);
  size_t off = 0;
  while (off < n) {
    const ssize_t w = ::write(fd, p + off, n - off);
    if (w < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    off += static_cast<size_t>(w);
  }
  return true;
}

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

}  // namespace

bool write_framed(int fd, const json & msg)
{
  const std::string body = msg.dump();
  std::string frame = "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
  frame += body;
  return write_all(fd, frame.data(), frame.size());
}

std::optional<FrameReader::Result> FrameReader::decode()
{
  const size_t header_end = buffer_.find(k_header_end);
  if (header_end == std::string::npos) {
    if (buffer_.size() > 8192) {
      return Result{Status::Malformed, {}, "header section too long"};
    }
    return std::nullopt;
  }

  std::optional<size_t> content_length;
  size_t pos = 0;
  while (pos < header_end) {
    size_t eol = buffer_.find("\r\n", pos);
    if (eol == std::string::npos || eol > header_end) {
      eol = header_end;
    }
    const std::string_view line(buffer_.data() + pos, eol - pos);
    if (starts_with(line, k_content_length)) {
      std::string rest(line.substr(k_content_length.size()));
      char * end = nullptr;
      const unsigned long long n = std::strtoull(rest.c_str(), &end, 10);
      if (end == rest.c_str() || n > k_max_message_size) {
        return Result{Status::Malformed, {}, "invalid Content-Length header"};
      }
      content_length = static_cast<size_t>(n);
    }
    pos = eol + 2;
  }

  if (!content_length) {
    return Result{Status::Malformed, {}, "missing Content-Length header"};
  }

  const size_t body_start = header_end + k_header_end.size();
  if (buffer_.size() - body_start < *content_length) {
    return std::nullopt;
  }

  const std::string body = buffer_.substr(body_start, *content_length);
  buffer_.erase(0, body_start + *content_length);

  try {
    return Result{Status::Message, json::parse(body), {}};
  } catch (const json::parse_error & e) {
    return Result{Status::Malformed, {}, std::string("invalid JSON body: ") + e.what()};
  }
}

FrameReader::Result FrameReader::read(int timeout_ms)
{
  if (auto r = decode()) {
    return std::move(*r);
  }

  for (;;) {
    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr == 0) {
      return Result{Status::Timeout, {}, {}};
    }
    if (pr < 0) {
      if (errno == EINTR) continue;
      return Result{Status::Closed, {}, "poll failed"};
    }

    char chunk[4096];
    const ssize_t n = ::read(fd_, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR) continue;
      return Result{Status::Closed, {}, "read failed"};
    }
    if (n == 0) {
      return Result{Status::Closed, {}, "stream closed"};
    }
    buffer_.append(chunk, static_cast<size_t>(n));

    if (auto r = decode()) {
      return std::move(*r);
    }
  }
}

json make_notification(const std::string & method, json params)
{
  json msg;
  msg["jsonrpc"] = "2.0";
  msg["method"] = method;
  msg["params"] = std::move(params);
  return msg;
}

json make_request(int64_t id, const std::string & method, json params)
{
  json msg;
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["method"] = method;
  msg["params"] = std::move(params);
  return msg;
}

}  // namespace shimbridge::lsp
