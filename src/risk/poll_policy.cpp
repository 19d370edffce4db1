#include "risk/poll_policy.hpp"

namespace hw_guard::risk {

poll_decision decide_poll_interval(const core::SafetyConfig& config, const poll_inputs& inputs) noexcept {
  if (inputs.monitoring_disabled) {
    return {model::poll_mode::DISABLED, kPollDisabled};
  }

  if (inputs.pinned_interval) {
    return {model::poll_mode::OVERRIDE, *inputs.pinned_interval};
  }

  if (inputs.errors_in_last_check) {
    return {model::poll_mode::CRITICAL, config.critical_poll_interval};
  }

  if (inputs.workload_active) {
    return {model::poll_mode::WORKLOAD_THROTTLED, config.workload_poll_interval};
  }

  return {model::poll_mode::NORMAL, config.normal_poll_interval};
}

}  // namespace hw_guard::risk
