#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace storysync {

/// Failure categories shared by the server lifecycle and the client calls.
enum class error_kind {
  bind_failure,
  render_failure,
  auth_failure,
  not_found,
  malformed_payload,
  timeout,
  connection_failed,
  unexpected_response,
  remote_error,
};

inline std::string_view to_string(error_kind kind) {
  switch (kind) {
  case error_kind::bind_failure:
    return "bind_failure";
  case error_kind::render_failure:
    return "render_failure";
  case error_kind::auth_failure:
    return "auth_failure";
  case error_kind::not_found:
    return "not_found";
  case error_kind::malformed_payload:
    return "malformed_payload";
  case error_kind::timeout:
    return "timeout";
  case error_kind::connection_failed:
    return "connection_failed";
  case error_kind::unexpected_response:
    return "unexpected_response";
  case error_kind::remote_error:
    return "remote_error";
  }
  return "unknown";
}

class sync_error : public std::runtime_error {
public:
  sync_error(error_kind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  error_kind kind() const { return kind_; }

private:
  error_kind kind_;
};

} // namespace storysync
