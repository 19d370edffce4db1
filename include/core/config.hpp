#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "core/log.hpp"
#include "model/safety_state.hpp"

namespace hw_guard::core {

struct SafetyConfig {
  std::chrono::milliseconds normal_poll_interval{100};
  std::chrono::milliseconds workload_poll_interval{2000};
  std::chrono::milliseconds critical_poll_interval{5000};
  // Cadence for callers to recheck once monitoring has been disabled.
  std::chrono::milliseconds disabled_recheck_interval{30000};

  std::chrono::milliseconds max_lock_wait{1000};
  std::string lock_path_template{"/tmp/tt_device_lock_{device}"};

  std::chrono::seconds error_detection_window{60};
  std::uint32_t max_errors_before_disable{3};
  std::string log_source{"dmesg"};
  std::chrono::milliseconds log_timeout{5000};

  std::chrono::milliseconds workload_check_interval{1000};
  double min_workload_memory_gb{1.0};
  std::chrono::milliseconds workload_scan_budget{100};
  std::string proc_root{"/proc"};
};

// Throws std::runtime_error on any non-positive duration, a zero error threshold,
// a negative memory threshold or a lock template without a {device} placeholder.
void validate_safety_config(const SafetyConfig& config);

struct TelemetryConfig {
  std::uint32_t max_retries{3};
  std::chrono::milliseconds retry_base_delay{100};
  std::string hwmon_root{"/sys/class/hwmon"};
};

struct OverrideConfig {
  model::safety_override force_safety_mode{model::safety_override::AUTO};
  std::optional<std::chrono::milliseconds> custom_poll_interval{};
};

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  // Empty skips AUTH.
  std::string password{};
  int db{0};
  bool enabled{false};
};

struct GuardConfig {
  SafetyConfig safety{};
  TelemetryConfig telemetry{};
  OverrideConfig overrides{};
  bool skip_on_lock_timeout{false};
  bool stdout_debug{true};
  log_level level{log_level::INFO};
  RedisConfig redis{};
};

GuardConfig load_guard_config(const std::string& path);

}  // namespace hw_guard::core
