#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "core/config.hpp"
#include "core/coordinator.hpp"
#include "device/telemetry_reader.hpp"
#include "model/safety_state.hpp"
#include "sensors/hwmon_telemetry.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"

namespace hw_guard::core {

struct MonitorStats {
  std::size_t ticks_executed{0};
  std::size_t disabled_ticks{0};
  std::size_t devices_read{0};
  std::size_t devices_skipped{0};
  std::size_t fallback_reads{0};
  std::size_t sink_cycles{0};
  std::size_t redis_errors{0};
  float last_redis_latency_ms{0.0F};
};

// Collaborators the polling loop calls out to. Defaults read hwmon and sleep on the
// calling thread.
struct MonitorHooks {
  std::uint32_t device_count{0};
  std::function<model::telemetry_record(std::uint32_t)> read_device{};
  std::function<void(std::chrono::milliseconds)> sleep{};
  // Polled while sleeping; returning true ends the sleep early.
  std::function<bool()> wake_requested{};
  device::TelemetryReader::Options reader{};
};

class Monitor {
 public:
  explicit Monitor(GuardConfig config);
  Monitor(GuardConfig config, std::unique_ptr<SafetyCoordinator> coordinator, MonitorHooks hooks);

  MonitorStats run_for_ticks(std::size_t total_ticks);

  void set_wake_requested(std::function<bool()> wake_requested);

  SafetyCoordinator& coordinator() noexcept;

 private:
  void poll_devices(MonitorStats& stats, std::vector<model::telemetry_record>& records);
  void publish_sinks(MonitorStats& stats, const std::vector<model::telemetry_record>& records);
  void sleep_for(std::chrono::milliseconds delay);
  void connect_redis();

  GuardConfig config_;
  std::unique_ptr<SafetyCoordinator> coordinator_;
  std::unique_ptr<sensors::HwmonTelemetry> hwmon_{};
  MonitorHooks hooks_;
  device::TelemetryReader reader_;

  sinks::StdoutDebugSink stdout_sink_{};
  std::unique_ptr<sinks::RedisTsSink> redis_sink_{};
  bool redis_was_ok_{true};
};

}  // namespace hw_guard::core
