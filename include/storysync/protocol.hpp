#pragma once

#include "storysync/error.hpp"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace storysync {

using json = nlohmann::json;

/// Summary metadata for one offered story.
struct story_preview {
  std::string id;
  std::string title;
  std::optional<std::string> genre;
  std::int64_t updated_at = 0;
  std::size_t entry_count = 0;
};

inline bool operator==(const story_preview &a, const story_preview &b) {
  return a.id == b.id && a.title == b.title && a.genre == b.genre &&
         a.updated_at == b.updated_at && a.entry_count == b.entry_count;
}

namespace action {

struct list_stories {};

struct pull_story {
  std::string story_id;
};

struct push_story {
  std::string story_data;
};

} // namespace action

using sync_action =
    std::variant<action::list_stories, action::pull_story, action::push_story>;

struct sync_request {
  std::string token;
  sync_action action;
};

namespace response {

struct stories_list {
  std::vector<story_preview> stories;
};

struct story_data {
  std::string data;
};

struct success {
  std::string message;
};

struct error {
  std::string message;
};

} // namespace response

using sync_response =
    std::variant<response::stories_list, response::story_data,
                 response::success, response::error>;

/// Wire tags. Variant names are lower camel case; fields inside the
/// action variants stay snake_case, as deployed peers send them.
namespace tag {
constexpr const char kListStories[] = "listStories";
constexpr const char kPullStory[] = "pullStory";
constexpr const char kPushStory[] = "pushStory";
constexpr const char kStoriesList[] = "storiesList";
constexpr const char kStoryData[] = "storyData";
constexpr const char kSuccess[] = "success";
constexpr const char kError[] = "error";
} // namespace tag

// --- story_preview ---

inline void to_json(json &j, const story_preview &p) {
  j = json{{"id", p.id},
           {"title", p.title},
           {"genre", p.genre ? json(*p.genre) : json(nullptr)},
           {"updatedAt", p.updated_at},
           {"entryCount", p.entry_count}};
}

inline void from_json(const json &j, story_preview &p) {
  j.at("id").get_to(p.id);
  j.at("title").get_to(p.title);
  if (j.contains("genre") && !j["genre"].is_null()) {
    p.genre = j["genre"].get<std::string>();
  } else {
    p.genre.reset();
  }
  j.at("updatedAt").get_to(p.updated_at);
  j.at("entryCount").get_to(p.entry_count);
}

// --- actions ---

inline json action_to_json(const sync_action &a) {
  if (std::holds_alternative<action::list_stories>(a))
    return json{{"type", tag::kListStories}};
  if (auto *pull = std::get_if<action::pull_story>(&a))
    return json{{"type", tag::kPullStory}, {"story_id", pull->story_id}};
  const auto &push = std::get<action::push_story>(a);
  return json{{"type", tag::kPushStory}, {"story_data", push.story_data}};
}

inline sync_action action_from_json(const json &j) {
  if (!j.is_object())
    throw sync_error(error_kind::malformed_payload, "action must be an object");

  auto type = j.at("type").get<std::string>();
  if (type == tag::kListStories)
    return action::list_stories{};
  if (type == tag::kPullStory)
    return action::pull_story{j.at("story_id").get<std::string>()};
  if (type == tag::kPushStory)
    return action::push_story{j.at("story_data").get<std::string>()};
  throw sync_error(error_kind::malformed_payload,
                   "unknown action type: " + type);
}

inline std::string_view action_type(const sync_action &a) {
  switch (a.index()) {
  case 0:
    return tag::kListStories;
  case 1:
    return tag::kPullStory;
  default:
    return tag::kPushStory;
  }
}

// --- request ---

inline void to_json(json &j, const sync_request &r) {
  j = json{{"token", r.token}, {"action", action_to_json(r.action)}};
}

inline void from_json(const json &j, sync_request &r) {
  if (!j.is_object())
    throw sync_error(error_kind::malformed_payload, "request must be an object");
  j.at("token").get_to(r.token);
  r.action = action_from_json(j.at("action"));
}

// --- response ---

inline json response_to_json(const sync_response &r) {
  return std::visit(
      [](const auto &v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, response::stories_list>) {
          return json{{"type", tag::kStoriesList}, {"stories", v.stories}};
        } else if constexpr (std::is_same_v<T, response::story_data>) {
          return json{{"type", tag::kStoryData}, {"data", v.data}};
        } else if constexpr (std::is_same_v<T, response::success>) {
          return json{{"type", tag::kSuccess}, {"message", v.message}};
        } else {
          return json{{"type", tag::kError}, {"message", v.message}};
        }
      },
      r);
}

inline sync_response response_from_json(const json &j) {
  if (!j.is_object())
    throw sync_error(error_kind::malformed_payload,
                     "response must be an object");

  auto type = j.at("type").get<std::string>();
  if (type == tag::kStoriesList)
    return response::stories_list{
        j.at("stories").get<std::vector<story_preview>>()};
  if (type == tag::kStoryData)
    return response::story_data{j.at("data").get<std::string>()};
  if (type == tag::kSuccess)
    return response::success{j.at("message").get<std::string>()};
  if (type == tag::kError)
    return response::error{j.at("message").get<std::string>()};
  throw sync_error(error_kind::malformed_payload,
                   "unknown response type: " + type);
}

inline std::string_view response_type(const sync_response &r) {
  switch (r.index()) {
  case 0:
    return tag::kStoriesList;
  case 1:
    return tag::kStoryData;
  case 2:
    return tag::kSuccess;
  default:
    return tag::kError;
  }
}

// --- text codec ---

namespace detail {

// parse_error::what() quotes the bytes last read, which may be part of a
// token. Report only the position for those.
inline std::string describe(const json::exception &e) {
  if (auto *pe = dynamic_cast<const json::parse_error *>(&e))
    return "syntax error at byte " + std::to_string(pe->byte);
  return e.what();
}

} // namespace detail

/// Strings that are not valid UTF-8 cannot be encoded; that is reported as
/// sync_error(malformed_payload) and the text is never altered.
inline std::string serialize_request(const sync_request &r) {
  try {
    return json(r).dump();
  } catch (const json::exception &e) {
    throw sync_error(error_kind::malformed_payload,
                     std::string("cannot encode request: ") + e.what());
  }
}

/// Parse a request body. Any decoding problem is reported as
/// sync_error(malformed_payload).
inline sync_request parse_request(std::string_view text) {
  try {
    return json::parse(text.begin(), text.end()).get<sync_request>();
  } catch (const json::exception &e) {
    throw sync_error(error_kind::malformed_payload, detail::describe(e));
  }
}

inline std::string serialize_response(const sync_response &r) {
  try {
    return response_to_json(r).dump();
  } catch (const json::exception &e) {
    throw sync_error(error_kind::malformed_payload,
                     std::string("cannot encode response: ") + e.what());
  }
}

inline sync_response parse_response(std::string_view text) {
  try {
    return response_from_json(json::parse(text.begin(), text.end()));
  } catch (const json::exception &e) {
    throw sync_error(error_kind::malformed_payload, detail::describe(e));
  }
}

} // namespace storysync
