#include "core/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iterator>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace hw_guard::core {
namespace {

std::atomic<log_level> g_level{log_level::INFO};
std::mutex g_stderr_mutex;

const char* level_prefix(const log_level level) noexcept {
  switch (level) {
    case log_level::DEBUG:
      return "debug";
    case log_level::INFO:
      return "info";
    case log_level::WARNING:
      return "warning";
    case log_level::ERROR:
      return "error";
  }
  return "info";
}

}  // namespace

void set_log_level(const log_level level) noexcept { g_level.store(level, std::memory_order_relaxed); }

log_level current_log_level() noexcept { return g_level.load(std::memory_order_relaxed); }

bool log_enabled(const log_level level) noexcept {
  return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(current_log_level());
}

void log(const log_level level, const char* tag, const std::string& message) {
  if (!log_enabled(level)) {
    return;
  }

  const std::lock_guard<std::mutex> lock(g_stderr_mutex);
  std::cerr << '[' << tag << "] ";
  if (level != log_level::INFO) {
    std::cerr << level_prefix(level) << ": ";
  }
  std::cerr << message << '\n';
}

log_level parse_log_level(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  std::transform(value.begin(), value.end(), std::back_inserter(lower),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "debug") {
    return log_level::DEBUG;
  }
  if (lower == "info") {
    return log_level::INFO;
  }
  if (lower == "warning" || lower == "warn") {
    return log_level::WARNING;
  }
  if (lower == "error") {
    return log_level::ERROR;
  }
  throw std::runtime_error("unknown log level: " + value);
}

}  // namespace hw_guard::core
