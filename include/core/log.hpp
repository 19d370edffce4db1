#pragma once

#include <cstdint>
#include <string>

namespace hw_guard::core {

enum class log_level : std::uint8_t {
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3,
};

// Process-wide threshold; lines below it are dropped.
void set_log_level(log_level level) noexcept;
[[nodiscard]] log_level current_log_level() noexcept;
[[nodiscard]] bool log_enabled(log_level level) noexcept;

// Writes "[tag] message" to stderr. Safe to call from the scan worker.
void log(log_level level, const char* tag, const std::string& message);

log_level parse_log_level(const std::string& value);

}  // namespace hw_guard::core
