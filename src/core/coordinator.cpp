#include "core/coordinator.hpp"

#include <utility>

#include "core/log.hpp"

namespace hw_guard::core {
namespace {

const SafetyConfig& validated(const SafetyConfig& config) {
  validate_safety_config(config);
  return config;
}

nlohmann::json record_to_json(const model::workload_record& record) {
  return nlohmann::json{
      {"pid", record.pid},
      {"cmdline", record.cmdline_snippet},
      {"framework", model::to_string(record.framework)},
      {"model_type", model::to_string(record.model)},
      {"workload_type", model::to_string(record.workload)},
      {"confidence", record.confidence},
      {"correlation_score", record.correlation_score},
      {"memory_gb", record.memory_gb},
      {"threads", record.thread_count},
  };
}

}  // namespace

SafetyCoordinator::SafetyCoordinator(SafetyConfig config, OverrideConfig overrides)
    : SafetyCoordinator(config, std::move(overrides), sensors::make_log_source(config.log_source, config.log_timeout),
                        system_steady_clock()) {}

SafetyCoordinator::SafetyCoordinator(SafetyConfig config, OverrideConfig overrides,
                                     std::unique_ptr<sensors::KernelLogSource> log_source, clock_fn clock)
    : config_(validated(config)),
      clock_(std::move(clock)),
      workload_detector_(config_.min_workload_memory_gb, config_.workload_check_interval, config_.proc_root, clock_),
      error_detector_(config_.error_detection_window, config_.max_errors_before_disable, std::move(log_source), clock_),
      error_gate_(std::chrono::duration_cast<std::chrono::milliseconds>(config_.error_detection_window)) {
  if (overrides.custom_poll_interval) {
    set_custom_poll_interval(*overrides.custom_poll_interval);
  }
  if (overrides.force_safety_mode != model::safety_override::AUTO) {
    force_safety_mode(overrides.force_safety_mode == model::safety_override::FORCED_ON);
  }
}

void SafetyCoordinator::run_error_check_if_due(const steady_clock::time_point now) {
  if (!error_gate_.due(now)) {
    return;
  }
  error_gate_.mark(now);
  errors_in_last_check_ = error_detector_.check_for_errors().found;
}

void SafetyCoordinator::refresh_workloads() {
  if (!scanned_once_) {
    // The first decision is never made on an empty snapshot.
    workload_detector_.detect_active_workloads(hint_);
    scanned_once_ = true;
    return;
  }
  workload_detector_.refresh(hint_, config_.workload_scan_budget);
}

risk::poll_decision SafetyCoordinator::decide_locked() {
  risk::poll_inputs inputs{};
  inputs.monitoring_disabled = error_detector_.should_disable_monitoring();

  if (!inputs.monitoring_disabled) {
    run_error_check_if_due(clock_());
    inputs.monitoring_disabled = error_detector_.should_disable_monitoring();
  }

  inputs.pinned_interval = pinned_interval_;
  inputs.errors_in_last_check = errors_in_last_check_;

  if (!inputs.monitoring_disabled && !inputs.pinned_interval && !inputs.errors_in_last_check) {
    refresh_workloads();
    inputs.workload_active = workload_detector_.latest().is_workload_active;
  }

  const risk::poll_decision decision = risk::decide_poll_interval(config_, inputs);
  if (decision.mode != last_decision_.mode) {
    log(decision.mode == model::poll_mode::DISABLED ? log_level::ERROR : log_level::INFO, "coordinator",
        std::string("poll mode ") + model::to_string(last_decision_.mode) + " -> " + model::to_string(decision.mode));
  }
  last_decision_ = decision;
  return decision;
}

std::chrono::milliseconds SafetyCoordinator::get_safe_poll_interval() {
  const std::lock_guard<std::mutex> lock(mutex_);
  return decide_locked().interval;
}

model::poll_mode SafetyCoordinator::current_poll_mode() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return last_decision_.mode;
}

device::DeviceLock SafetyCoordinator::acquire_device_lock(const std::uint32_t device_id) {
  device::DeviceLock handle = device::DeviceLock::acquire(device_id, config_.lock_path_template, config_.max_lock_wait);
  if (!handle.is_locked()) {
    lock_timeouts_.fetch_add(1, std::memory_order_relaxed);
  }
  return handle;
}

std::pair<bool, std::string> SafetyCoordinator::is_monitoring_safe() {
  const std::lock_guard<std::mutex> lock(mutex_);
  if (!error_detector_.should_disable_monitoring()) {
    run_error_check_if_due(clock_());
  }

  if (error_detector_.should_disable_monitoring()) {
    return {false, "Monitoring disabled: " + std::to_string(error_detector_.error_count()) +
                       " PCIe errors detected (limit " + std::to_string(config_.max_errors_before_disable) +
                       "); reset the error count to resume"};
  }
  if (!error_detector_.log_source_available()) {
    return {true, "Monitoring is safe (kernel log unavailable; PCIe error detection degraded)"};
  }
  return {true, "Monitoring is safe"};
}

nlohmann::json SafetyCoordinator::get_workload_summary() {
  const std::lock_guard<std::mutex> lock(mutex_);
  const risk::poll_decision decision = decide_locked();
  const model::workload_state& state = workload_detector_.latest();

  const bool safety_mode = override_mode_ == model::safety_override::FORCED_ON ||
                           decision.mode == model::poll_mode::WORKLOAD_THROTTLED ||
                           decision.mode == model::poll_mode::CRITICAL || decision.mode == model::poll_mode::DISABLED;

  nlohmann::json workloads = nlohmann::json::array();
  for (const auto& record : state.active_ml_workloads) {
    workloads.push_back(record_to_json(record));
  }

  nlohmann::json summary{
      {"active_ml_processes", state.total_ml_processes},
      {"total_ml_memory_gb", state.total_ml_memory_gb},
      {"high_memory_processes", state.high_memory_processes},
      {"is_workload_active", state.is_workload_active},
      {"safety_mode_enabled", safety_mode},
      {"safety_override", model::to_string(override_mode_)},
      {"poll_mode", model::to_string(decision.mode)},
      {"monitoring_disabled", decision.mode == model::poll_mode::DISABLED},
      {"pcie_error_count", error_detector_.error_count()},
      {"log_source_available", error_detector_.log_source_available()},
      {"lock_timeouts", lock_timeouts_.load(std::memory_order_relaxed)},
      {"skipped_processes", state.skipped_processes},
      {"workloads", std::move(workloads)},
  };

  if (risk::is_poll_disabled(decision.interval)) {
    summary["current_poll_interval"] = nullptr;
    summary["current_poll_interval_ms"] = nullptr;
  } else {
    summary["current_poll_interval"] = static_cast<double>(decision.interval.count()) / 1000.0;
    summary["current_poll_interval_ms"] = decision.interval.count();
  }
  return summary;
}

void SafetyCoordinator::force_safety_mode(const bool enabled) {
  const std::lock_guard<std::mutex> lock(mutex_);
  if (enabled) {
    override_mode_ = model::safety_override::FORCED_ON;
    pinned_interval_ = config_.workload_poll_interval;
  } else {
    override_mode_ = model::safety_override::FORCED_OFF;
    pinned_interval_ = custom_interval_.value_or(config_.normal_poll_interval);
  }
  log(log_level::INFO, "coordinator",
      std::string("safety mode forced ") + (enabled ? "on" : "off") + ", interval pinned to " +
          std::to_string(pinned_interval_->count()) + "ms");
}

void SafetyCoordinator::set_custom_poll_interval(const std::chrono::milliseconds interval) {
  if (interval.count() <= 0) {
    log(log_level::WARNING, "coordinator",
        "ignoring non-positive custom poll interval " + std::to_string(interval.count()) + "ms");
    return;
  }

  const std::lock_guard<std::mutex> lock(mutex_);
  custom_interval_ = interval;
  pinned_interval_ = interval;
  log(log_level::INFO, "coordinator", "custom poll interval " + std::to_string(interval.count()) + "ms");
}

void SafetyCoordinator::clear_overrides() {
  const std::lock_guard<std::mutex> lock(mutex_);
  override_mode_ = model::safety_override::AUTO;
  custom_interval_.reset();
  pinned_interval_.reset();
  log(log_level::INFO, "coordinator", "overrides cleared");
}

void SafetyCoordinator::reset_error_count() {
  const std::lock_guard<std::mutex> lock(mutex_);
  error_detector_.reset_error_count();
  errors_in_last_check_ = false;
}

void SafetyCoordinator::record_telemetry(const std::vector<model::telemetry_record>& records) {
  if (records.empty()) {
    return;
  }

  double power_w = 0.0;
  double current_a = 0.0;
  for (const auto& record : records) {
    power_w += record.power_w;
    current_a += record.current_a;
  }

  const auto count = static_cast<double>(records.size());
  const std::lock_guard<std::mutex> lock(mutex_);
  hint_.average_power_w = power_w / count;
  hint_.average_current_a = current_a / count;
}

const SafetyConfig& SafetyCoordinator::config() const noexcept { return config_; }

std::uint64_t SafetyCoordinator::lock_timeouts() const noexcept {
  return lock_timeouts_.load(std::memory_order_relaxed);
}

std::uint32_t SafetyCoordinator::pcie_error_count() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return error_detector_.error_count();
}

model::workload_state SafetyCoordinator::workload_state() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return workload_detector_.latest();
}

}  // namespace hw_guard::core
