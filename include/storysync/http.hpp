#pragma once

#include "storysync/config.hpp"
#include "storysync/error.hpp"
#include "storysync/transport.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace storysync {

/// Minimal HTTP/1.1 framing: one request and one response per connection,
/// bodies framed by Content-Length.

using http_headers = std::vector<std::pair<std::string, std::string>>;

struct http_request {
  std::string method;
  std::string path;
  http_headers headers;
  std::string body;
};

struct http_response {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
};

/// A request that must be answered with a specific HTTP status.
class http_status_error : public sync_error {
public:
  http_status_error(int status, const std::string &message)
      : sync_error(error_kind::malformed_payload, message), status_(status) {}

  int status() const { return status_; }

private:
  int status_;
};

inline const char *reason_phrase(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 408:
    return "Request Timeout";
  case 413:
    return "Payload Too Large";
  default:
    return "Internal Server Error";
  }
}

inline std::string to_lower(std::string s) {
  for (auto &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

inline std::string trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t");
  if (start == std::string::npos)
    return "";
  auto end = s.find_last_not_of(" \t\r");
  return s.substr(start, end - start + 1);
}

inline std::optional<std::string> header_value(const http_headers &headers,
                                               const std::string &name) {
  auto wanted = to_lower(name);
  for (const auto &h : headers) {
    if (to_lower(h.first) == wanted)
      return h.second;
  }
  return std::nullopt;
}

inline std::string format_request(const std::string &host, uint16_t port,
                                  std::string_view path,
                                  const std::string &body) {
  std::ostringstream req;
  req << "POST " << path << " HTTP/1.1\r\n";
  req << "Host: " << host << ":" << port << "\r\n";
  req << "Content-Type: application/json\r\n";
  req << "Content-Length: " << body.size() << "\r\n";
  req << "Connection: close\r\n\r\n";
  req << body;
  return req.str();
}

inline std::string format_response(const http_response &resp) {
  std::ostringstream out;
  out << "HTTP/1.1 " << resp.status << " " << reason_phrase(resp.status)
      << "\r\n";
  out << "Content-Type: " << resp.content_type << "\r\n";
  out << "Content-Length: " << resp.body.size() << "\r\n";
  out << "Connection: close\r\n\r\n";
  out << resp.body;
  return out.str();
}

/// Start line and headers of one message, plus any body bytes that arrived
/// in the same reads.
struct http_head {
  std::string start_line;
  http_headers headers;
  std::string rest;
};

inline http_head read_head(int fd, const io_deadline &deadline) {
  std::string buffer;
  char chunk[4096];
  size_t end = std::string::npos;
  while ((end = buffer.find("\r\n\r\n")) == std::string::npos) {
    if (buffer.size() > kMaxHeaderBytes)
      throw http_status_error(400, "header block too large");
    size_t n = recv_some(fd, chunk, sizeof(chunk), deadline);
    if (n == 0)
      throw sync_error(error_kind::connection_failed,
                       "connection closed before headers were complete");
    buffer.append(chunk, n);
  }

  http_head head;
  head.rest = buffer.substr(end + 4);

  std::istringstream lines(buffer.substr(0, end));
  std::string line;
  std::getline(lines, line);
  head.start_line = trim(line);
  while (std::getline(lines, line)) {
    auto colon = line.find(':');
    if (colon == std::string::npos)
      throw http_status_error(400, "malformed header line");
    head.headers.emplace_back(trim(line.substr(0, colon)),
                              trim(line.substr(colon + 1)));
  }
  return head;
}

inline std::optional<size_t> content_length(const http_headers &headers) {
  auto value = header_value(headers, "Content-Length");
  if (!value)
    return std::nullopt;
  try {
    size_t used = 0;
    auto length = std::stoull(*value, &used);
    if (used != value->size())
      throw http_status_error(400, "invalid Content-Length");
    return static_cast<size_t>(length);
  } catch (const std::logic_error &) {
    throw http_status_error(400, "invalid Content-Length");
  }
}

/// Read until `body` holds `length` bytes.
inline void read_body(int fd, std::string &body, size_t length,
                      const io_deadline &deadline) {
  char chunk[16384];
  while (body.size() < length) {
    size_t want = std::min(sizeof(chunk), length - body.size());
    size_t n = recv_some(fd, chunk, want, deadline);
    if (n == 0)
      throw sync_error(error_kind::connection_failed,
                       "connection closed mid-body");
    body.append(chunk, n);
  }
  body.resize(length);
}

/// Read one request. Malformed framing throws http_status_error carrying the
/// status to answer with.
inline http_request read_http_request(int fd, size_t max_body_bytes,
                                      const io_deadline &deadline) {
  auto head = read_head(fd, deadline);

  http_request req;
  std::istringstream start(head.start_line);
  std::string version;
  start >> req.method >> req.path >> version;
  if (req.method.empty() || req.path.empty() || version.rfind("HTTP/", 0) != 0)
    throw http_status_error(400, "malformed request line");
  req.headers = std::move(head.headers);

  auto length = content_length(req.headers).value_or(0);
  if (length > max_body_bytes)
    throw http_status_error(413, "request body exceeds " +
                                     std::to_string(max_body_bytes) + " bytes");

  req.body = std::move(head.rest);
  read_body(fd, req.body, length, deadline);
  return req;
}

struct http_reply {
  int status = 0;
  std::string body;
};

/// Read one response. Without Content-Length the body runs to end of stream.
inline http_reply read_http_response(int fd, size_t max_body_bytes,
                                     const io_deadline &deadline) {
  auto head = read_head(fd, deadline);

  http_reply reply;
  std::istringstream start(head.start_line);
  std::string version;
  start >> version >> reply.status;
  if (version.rfind("HTTP/", 0) != 0 || reply.status == 0)
    throw sync_error(error_kind::malformed_payload, "malformed status line");

  reply.body = std::move(head.rest);
  auto length = content_length(head.headers);
  if (length) {
    if (*length > max_body_bytes)
      throw sync_error(error_kind::malformed_payload, "response too large");
    read_body(fd, reply.body, *length, deadline);
    return reply;
  }

  char chunk[16384];
  for (;;) {
    size_t n = recv_some(fd, chunk, sizeof(chunk), deadline);
    if (n == 0)
      break;
    reply.body.append(chunk, n);
    if (reply.body.size() > max_body_bytes)
      throw sync_error(error_kind::malformed_payload, "response too large");
  }
  return reply;
}

} // namespace storysync
