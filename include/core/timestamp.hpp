#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace hw_guard::core {

using steady_clock = std::chrono::steady_clock;

// Injectable time source; detectors and the coordinator read time only through this.
using clock_fn = std::function<steady_clock::time_point()>;

inline clock_fn system_steady_clock() {
  return [] { return steady_clock::now(); };
}

inline std::uint64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

}  // namespace hw_guard::core
