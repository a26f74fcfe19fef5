#pragma once

#include "fuzzcache/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>

namespace fuzzcache::tests {

// FUZZCACHE_TEST_LOG=1|true|yes|on turns test output on; debug builds default to on.
inline bool LoggingEnabled() {
  static const bool enabled = []() {
#if defined(NDEBUG)
    constexpr bool kDefault = false;
#else
    constexpr bool kDefault = true;
#endif
    const char* env = std::getenv("FUZZCACHE_TEST_LOG");
    if (env == nullptr) {
      return kDefault;
    }
    std::string value(env);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value == "1" || value == "true" || value == "yes" || value == "on";
  }();
  return enabled;
}

inline std::shared_ptr<spdlog::logger> TestLogger() {
  static const std::shared_ptr<spdlog::logger> logger = []() {
    auto created = spdlog::stdout_color_mt("fuzzcache-test");
    created->set_pattern("[fuzzcache-test] %^%l%$ %v");
    created->set_level(LoggingEnabled() ? spdlog::level::info : spdlog::level::off);
    return created;
  }();
  return logger;
}

// Routes library debug output to stderr while test logging is on.
inline void EnableLibraryLogging() {
  if (LoggingEnabled()) {
    fuzzcache::Logger()->set_level(spdlog::level::debug);
  }
}

inline void Log(std::string_view message) {
  TestLogger()->info("{}", message);
}

inline void LogError(std::string_view message) {
  TestLogger()->error("{}", message);
}

template <typename Value>
void LogKV(std::string_view key, const Value& value) {
  TestLogger()->info("{}={}", key, value);
}

}  // namespace fuzzcache::tests
