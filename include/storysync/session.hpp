#pragma once

#include "storysync/log.hpp"
#include "storysync/preview.hpp"
#include "storysync/protocol.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace storysync {

struct story_record {
  story_preview preview;
  std::string payload;
};

/// One pairing: its token, the stories it offers and the stories pushed to
/// it. Shared between the serving task and the owning application; every
/// method takes the internal lock for the whole operation.
class session {
  struct passkey {
    explicit passkey() = default;
  };

public:
  /// Build a session from serialized story documents. Documents the
  /// extractor rejects are logged and left out.
  static std::shared_ptr<session>
  create(std::string token, const std::vector<std::string> &story_inputs,
         const preview_extractor &extractor = extract_preview) {
    std::vector<story_record> offered;
    offered.reserve(story_inputs.size());
    for (size_t i = 0; i < story_inputs.size(); ++i) {
      auto result = extractor(story_inputs[i]);
      if (auto *failure = std::get_if<extraction_failure>(&result)) {
        logger()->warn("skipping story #{}: {}", i, failure->reason);
        continue;
      }
      story_record record{std::get<story_preview>(std::move(result)),
                          story_inputs[i]};
      if (auto reason = unencodable(record)) {
        logger()->warn("skipping story #{}: {}", i, *reason);
        continue;
      }
      offered.push_back(std::move(record));
    }
    return std::make_shared<session>(passkey{}, std::move(token),
                                     std::move(offered));
  }

  /// Use create().
  session(passkey, std::string token, std::vector<story_record> offered)
      : token_(std::move(token)), offered_(std::move(offered)) {}

  session(const session &) = delete;
  session &operator=(const session &) = delete;

  const std::string &token() const { return token_; }

  std::vector<story_preview> list_previews() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<story_preview> previews;
    previews.reserve(offered_.size());
    for (const auto &record : offered_)
      previews.push_back(record.preview);
    return previews;
  }

  std::optional<std::string> find_payload(const std::string &story_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto &record : offered_) {
      if (record.preview.id == story_id)
        return record.payload;
    }
    return std::nullopt;
  }

  size_t offered_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return offered_.size();
  }

  void record_received(std::string payload) {
    std::lock_guard<std::mutex> lock(mu_);
    received_.push_back(std::move(payload));
  }

  std::vector<std::string> peek_received() const {
    std::lock_guard<std::mutex> lock(mu_);
    return received_;
  }

  std::vector<std::string> drain_received() {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> drained;
    drained.swap(received_);
    return drained;
  }

private:
  // A record is only offered if both its preview and its payload can go on
  // the wire; otherwise every list or pull touching it would fail.
  static std::optional<std::string> unencodable(const story_record &record) {
    try {
      (void)json(record.preview).dump();
      (void)json(record.payload).dump();
    } catch (const json::exception &e) {
      return "not valid UTF-8 (json error " + std::to_string(e.id) + ")";
    }
    return std::nullopt;
  }

  const std::string token_;

  mutable std::mutex mu_;
  std::vector<story_record> offered_;
  std::vector<std::string> received_;
};

} // namespace storysync
