#pragma once

#include <chrono>

#include "core/timestamp.hpp"

namespace hw_guard::core {

// Rate limiter for periodic checks: due() is true before the first mark() and
// whenever at least `interval` has passed since the last one.
class IntervalGate {
 public:
  explicit IntervalGate(std::chrono::milliseconds interval) noexcept;

  [[nodiscard]] bool due(steady_clock::time_point now) const noexcept;

  void mark(steady_clock::time_point now) noexcept;

  void reset() noexcept;

  [[nodiscard]] std::chrono::milliseconds interval() const noexcept;

 private:
  std::chrono::milliseconds interval_{};
  steady_clock::time_point last_{};
  bool marked_{false};
};

}  // namespace hw_guard::core
