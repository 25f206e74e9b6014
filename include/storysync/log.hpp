#pragma once

#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace storysync {

/// Library-wide logger, named "storysync". An application that registers
/// its own logger under that name before first use gets it instead.
inline std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> instance = [] {
    auto existing = spdlog::get("storysync");
    if (existing)
      return existing;
    return spdlog::stderr_color_mt("storysync");
  }();
  return instance;
}

inline void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

} // namespace storysync
