#include "core/interval_gate.hpp"

namespace hw_guard::core {

IntervalGate::IntervalGate(const std::chrono::milliseconds interval) noexcept : interval_(interval) {}

bool IntervalGate::due(const steady_clock::time_point now) const noexcept {
  if (!marked_) {
    return true;
  }
  return now - last_ >= interval_;
}

void IntervalGate::mark(const steady_clock::time_point now) noexcept {
  last_ = now;
  marked_ = true;
}

void IntervalGate::reset() noexcept { marked_ = false; }

std::chrono::milliseconds IntervalGate::interval() const noexcept { return interval_; }

}  // namespace hw_guard::core
