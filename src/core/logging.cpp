#include "fuzzcache/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace fuzzcache {

std::shared_ptr<spdlog::logger> Logger() {
  static const std::shared_ptr<spdlog::logger> logger = []() {
    if (auto existing = spdlog::get(kLoggerName)) {
      return existing;
    }
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    return created;
  }();
  return logger;
}

}  // namespace fuzzcache
