#pragma once

#include "storysync/protocol.hpp"

#include <functional>
#include <string>
#include <variant>

namespace storysync {

struct extraction_failure {
  std::string reason;
};

using preview_result = std::variant<story_preview, extraction_failure>;

/// Derives a preview from a story payload. Must not have side effects.
using preview_extractor = std::function<preview_result(const std::string &)>;

/// Best-effort preview of an exported story document:
///   {"story": {"id", "title", "genre", "updatedAt", ...}, "entries": [...]}
/// Missing or mistyped story fields fall back to defaults; only invalid JSON
/// or a missing "story" object is a failure.
inline preview_result extract_preview(const std::string &payload) {
  json doc = json::parse(payload, nullptr, false);
  if (doc.is_discarded())
    return extraction_failure{"Invalid JSON"};
  if (!doc.is_object() || !doc.contains("story"))
    return extraction_failure{"Missing 'story' field in export"};

  const json &story = doc["story"];
  story_preview preview;
  preview.title = "Untitled";

  if (story.is_object()) {
    auto id = story.find("id");
    if (id != story.end() && id->is_string())
      preview.id = id->get<std::string>();

    auto title = story.find("title");
    if (title != story.end() && title->is_string())
      preview.title = title->get<std::string>();

    auto genre = story.find("genre");
    if (genre != story.end() && genre->is_string())
      preview.genre = genre->get<std::string>();

    auto updated = story.find("updatedAt");
    if (updated != story.end() && updated->is_number_integer())
      preview.updated_at = updated->get<std::int64_t>();
  }

  auto entries = doc.find("entries");
  if (entries != doc.end() && entries->is_array())
    preview.entry_count = entries->size();

  return preview;
}

} // namespace storysync
