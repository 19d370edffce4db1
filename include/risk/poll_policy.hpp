#pragma once

#include <chrono>
#include <optional>

#include "core/config.hpp"
#include "model/safety_state.hpp"

namespace hw_guard::risk {

// Returned while monitoring is disabled. Callers must not sleep on it; they recheck
// every disabled_recheck_interval instead.
inline constexpr std::chrono::milliseconds kPollDisabled = std::chrono::milliseconds::max();

[[nodiscard]] constexpr bool is_poll_disabled(const std::chrono::milliseconds interval) noexcept {
  return interval == kPollDisabled;
}

struct poll_inputs {
  bool monitoring_disabled{false};
  bool errors_in_last_check{false};
  bool workload_active{false};
  // Set by a manual override; skips every rule except the disable latch.
  std::optional<std::chrono::milliseconds> pinned_interval{};
};

struct poll_decision {
  model::poll_mode mode{model::poll_mode::NORMAL};
  std::chrono::milliseconds interval{};
};

poll_decision decide_poll_interval(const core::SafetyConfig& config, const poll_inputs& inputs) noexcept;

}  // namespace hw_guard::risk
