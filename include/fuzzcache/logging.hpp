#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace fuzzcache {

inline constexpr const char* kLoggerName = "fuzzcache";

// Reuses a logger the application registered under kLoggerName; otherwise creates a
// stderr logger at warn level on first use.
std::shared_ptr<spdlog::logger> Logger();

}  // namespace fuzzcache
