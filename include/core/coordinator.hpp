#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "core/interval_gate.hpp"
#include "core/timestamp.hpp"
#include "device/access_lock.hpp"
#include "model/safety_state.hpp"
#include "risk/poll_policy.hpp"
#include "sensors/kernel_log.hpp"
#include "sensors/pcie_errors.hpp"
#include "sensors/workload_detector.hpp"

namespace hw_guard::core {

// Decides, once per polling tick, whether and how fast device telemetry may be read.
// Owns the workload and PCIe error detectors; every public call is serialized by one
// mutex so overrides from a control thread cannot race the polling loop.
class SafetyCoordinator {
 public:
  // Throws std::runtime_error if the config is invalid.
  explicit SafetyCoordinator(SafetyConfig config, OverrideConfig overrides = {});
  SafetyCoordinator(SafetyConfig config, OverrideConfig overrides, std::unique_ptr<sensors::KernelLogSource> log_source,
                    clock_fn clock);

  SafetyCoordinator(const SafetyCoordinator&) = delete;
  SafetyCoordinator& operator=(const SafetyCoordinator&) = delete;

  // risk::kPollDisabled while monitoring is disabled.
  std::chrono::milliseconds get_safe_poll_interval();
  [[nodiscard]] model::poll_mode current_poll_mode() const;

  // Blocks up to max_lock_wait. Does not take the coordinator mutex while waiting.
  device::DeviceLock acquire_device_lock(std::uint32_t device_id);

  std::pair<bool, std::string> is_monitoring_safe();
  nlohmann::json get_workload_summary();

  void force_safety_mode(bool enabled);
  void set_custom_poll_interval(std::chrono::milliseconds interval);
  void clear_overrides();
  void reset_error_count();

  // Averages power and current across the devices read this tick for the next
  // workload correlation.
  void record_telemetry(const std::vector<model::telemetry_record>& records);

  [[nodiscard]] const SafetyConfig& config() const noexcept;
  [[nodiscard]] std::uint64_t lock_timeouts() const noexcept;
  [[nodiscard]] std::uint32_t pcie_error_count() const;
  [[nodiscard]] model::workload_state workload_state() const;

 private:
  risk::poll_decision decide_locked();
  void run_error_check_if_due(steady_clock::time_point now);
  void refresh_workloads();

  SafetyConfig config_;
  clock_fn clock_;

  mutable std::mutex mutex_;
  sensors::WorkloadDetector workload_detector_;
  sensors::PcieErrorDetector error_detector_;
  IntervalGate error_gate_;
  bool errors_in_last_check_{false};
  bool scanned_once_{false};

  model::safety_override override_mode_{model::safety_override::AUTO};
  std::optional<std::chrono::milliseconds> custom_interval_{};
  std::optional<std::chrono::milliseconds> pinned_interval_{};

  model::telemetry_hint hint_{};
  risk::poll_decision last_decision_{};
  std::atomic<std::uint64_t> lock_timeouts_{0};
};

}  // namespace hw_guard::core
