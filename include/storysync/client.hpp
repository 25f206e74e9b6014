#pragma once

#include "storysync/config.hpp"
#include "storysync/error.hpp"
#include "storysync/handler.hpp"
#include "storysync/http.hpp"
#include "storysync/pairing.hpp"
#include "storysync/protocol.hpp"
#include "storysync/transport.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace storysync {
namespace client {

namespace detail {

/// POST one request to ip:port/sync and decode the single response.
inline sync_response round_trip(const std::string &ip, uint16_t port,
                                const sync_request &request,
                                std::chrono::milliseconds timeout,
                                const client_options &options) {
  // Throws sync_error(malformed_payload) for text that is not valid UTF-8,
  // before any connection is made.
  auto text = format_request(ip, port, kSyncPath, serialize_request(request));

  auto deadline = io_deadline::after(timeout);
  http_reply reply;
  try {
    auto sock = connect_tcp(ip, port, deadline);
    send_all(sock.get(), text.data(), text.size(), deadline);
    reply = read_http_response(sock.get(), options.max_response_bytes, deadline);
  } catch (const sync_error &e) {
    if (e.kind() == error_kind::timeout) {
      throw sync_error(error_kind::timeout,
                       "Connection failed: timed out after " +
                           std::to_string(timeout.count()) + " ms");
    }
    if (e.kind() == error_kind::malformed_payload) {
      throw sync_error(error_kind::malformed_payload,
                       std::string("Invalid response: ") + e.what());
    }
    throw sync_error(error_kind::connection_failed,
                     std::string("Connection failed: ") + e.what());
  }

  if (reply.status != 200) {
    throw sync_error(error_kind::malformed_payload,
                     "Invalid response: HTTP " + std::to_string(reply.status) +
                         ": " + reply.body);
  }
  try {
    return parse_response(reply.body);
  } catch (const sync_error &e) {
    throw sync_error(error_kind::malformed_payload,
                     std::string("Invalid response: ") + e.what());
  }
}

/// Turn a response that is not the expected variant into a sync_error. An
/// error response keeps the server's message verbatim.
[[noreturn]] inline void fail_with(const sync_response &resp) {
  if (auto *err = std::get_if<response::error>(&resp)) {
    if (err->message == kInvalidTokenMessage)
      throw sync_error(error_kind::auth_failure, err->message);
    if (err->message.rfind("Story not found: ", 0) == 0)
      throw sync_error(error_kind::not_found, err->message);
    throw sync_error(error_kind::remote_error, err->message);
  }
  throw sync_error(error_kind::unexpected_response, "Unexpected response type");
}

} // namespace detail

/// List the stories a remote server offers.
inline std::vector<story_preview> connect(const std::string &ip, uint16_t port,
                                          const std::string &token,
                                          const client_options &options = {}) {
  auto resp = detail::round_trip(ip, port,
                                 sync_request{token, action::list_stories{}},
                                 options.list_timeout, options);
  if (auto *list = std::get_if<response::stories_list>(&resp))
    return std::move(list->stories);
  detail::fail_with(resp);
}

/// Fetch the full payload of one remote story.
inline std::string pull(const std::string &ip, uint16_t port,
                        const std::string &token, const std::string &story_id,
                        const client_options &options = {}) {
  auto resp = detail::round_trip(
      ip, port, sync_request{token, action::pull_story{story_id}},
      options.transfer_timeout, options);
  if (auto *data = std::get_if<response::story_data>(&resp))
    return std::move(data->data);
  detail::fail_with(resp);
}

/// Hand a story to a remote server. Returns once the server confirmed it.
inline void push(const std::string &ip, uint16_t port, const std::string &token,
                 const std::string &story_data,
                 const client_options &options = {}) {
  auto resp = detail::round_trip(
      ip, port, sync_request{token, action::push_story{story_data}},
      options.transfer_timeout, options);
  if (std::holds_alternative<response::success>(resp))
    return;
  detail::fail_with(resp);
}

inline std::vector<story_preview> connect(const pairing_payload &pairing,
                                          const client_options &options = {}) {
  return connect(pairing.ip, pairing.port, pairing.token, options);
}

inline std::string pull(const pairing_payload &pairing,
                        const std::string &story_id,
                        const client_options &options = {}) {
  return pull(pairing.ip, pairing.port, pairing.token, story_id, options);
}

inline void push(const pairing_payload &pairing, const std::string &story_data,
                 const client_options &options = {}) {
  push(pairing.ip, pairing.port, pairing.token, story_data, options);
}

} // namespace client
} // namespace storysync
