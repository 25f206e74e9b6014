#pragma once

#include "storysync/http.hpp"
#include "storysync/log.hpp"
#include "storysync/protocol.hpp"
#include "storysync/session.hpp"

#include <string>
#include <type_traits>
#include <variant>

namespace storysync {

constexpr const char kInvalidTokenMessage[] = "Invalid authentication token";
constexpr const char kStoryReceivedMessage[] = "Story received successfully";

/// Answer one request against `sess`. The token check comes first for every
/// action; each request touches the session exactly once.
inline sync_response handle(session &sess, const sync_request &request) {
  if (request.token != sess.token()) {
    logger()->warn("rejected {} request: invalid token",
                   action_type(request.action));
    return response::error{kInvalidTokenMessage};
  }

  return std::visit(
      [&sess](const auto &act) -> sync_response {
        using T = std::decay_t<decltype(act)>;
        if constexpr (std::is_same_v<T, action::list_stories>) {
          return response::stories_list{sess.list_previews()};
        } else if constexpr (std::is_same_v<T, action::pull_story>) {
          auto payload = sess.find_payload(act.story_id);
          if (!payload)
            return response::error{"Story not found: " + act.story_id};
          return response::story_data{std::move(*payload)};
        } else {
          logger()->info("received pushed story ({} bytes)",
                         act.story_data.size());
          sess.record_received(act.story_data);
          return response::success{kStoryReceivedMessage};
        }
      },
      request.action);
}

inline http_response plain_text(int status, std::string message) {
  http_response resp;
  resp.status = status;
  resp.content_type = "text/plain; charset=utf-8";
  resp.body = std::move(message);
  return resp;
}

/// Route one HTTP exchange. Only POST /sync reaches handle(); a body that
/// does not decode as a request is answered with 400 and never touches the
/// session.
inline http_response handle_http(session &sess, const http_request &req) {
  if (req.path != kSyncPath)
    return plain_text(404, "no such endpoint: " + req.path);
  if (req.method != "POST")
    return plain_text(405, "method not allowed: " + req.method);

  sync_request request;
  try {
    request = parse_request(req.body);
  } catch (const sync_error &e) {
    logger()->warn("malformed sync request: {}", e.what());
    return plain_text(400, std::string("Failed to parse request body: ") +
                               e.what());
  }

  http_response resp;
  try {
    resp.body = serialize_response(handle(sess, request));
  } catch (const sync_error &e) {
    logger()->error("cannot answer {} request: {}", action_type(request.action),
                    e.what());
    return plain_text(500, e.what());
  }
  return resp;
}

} // namespace storysync
