#include "core/monitor.hpp"

#include <algorithm>
#include <string>
#include <thread>
#include <utility>

#include "core/log.hpp"
#include "risk/poll_policy.hpp"

namespace hw_guard::core {
namespace {

constexpr std::chrono::milliseconds kSleepSlice{100};

MonitorHooks hwmon_hooks(sensors::HwmonTelemetry& hwmon) {
  MonitorHooks hooks{};
  hooks.device_count = static_cast<std::uint32_t>(hwmon.device_count());
  hooks.read_device = [&hwmon](const std::uint32_t index) { return hwmon.read(index); };
  return hooks;
}

}  // namespace

Monitor::Monitor(GuardConfig config)
    : config_(std::move(config)),
      coordinator_(std::make_unique<SafetyCoordinator>(config_.safety, config_.overrides)),
      hwmon_(std::make_unique<sensors::HwmonTelemetry>(config_.telemetry.hwmon_root)),
      hooks_(hwmon_hooks(*hwmon_)),
      reader_(device::TelemetryReader::Options{config_.telemetry.retry_base_delay, {}, 0}) {
  connect_redis();
}

Monitor::Monitor(GuardConfig config, std::unique_ptr<SafetyCoordinator> coordinator, MonitorHooks hooks)
    : config_(std::move(config)),
      coordinator_(std::move(coordinator)),
      hooks_(std::move(hooks)),
      reader_(hooks_.reader) {
  connect_redis();
}

void Monitor::connect_redis() {
  if (!config_.redis.enabled) {
    return;
  }

  sinks::RedisTsOptions options{};
  options.host = config_.redis.host;
  options.port = config_.redis.port;
  options.unix_socket = config_.redis.unix_socket;
  options.password = config_.redis.password;
  options.db = config_.redis.db;
  options.device_count = hooks_.device_count;
  redis_sink_ = std::make_unique<sinks::RedisTsSink>(options);

  const std::string address =
      options.unix_socket.empty() ? options.host + ":" + std::to_string(options.port) : "unix://" + options.unix_socket;
  if (redis_sink_->check_connectivity()) {
    log(log_level::INFO, "monitor", "redis connectivity confirmed at " + address);
  } else {
    log(log_level::WARNING, "monitor", "redis connectivity check failed at " + address);
  }
}

MonitorStats Monitor::run_for_ticks(const std::size_t total_ticks) {
  MonitorStats stats{};

  for (std::size_t i = 0; total_ticks == 0 || i < total_ticks; ++i) {
    const std::chrono::milliseconds interval = coordinator_->get_safe_poll_interval();
    std::vector<model::telemetry_record> records;

    if (risk::is_poll_disabled(interval)) {
      ++stats.disabled_ticks;
      publish_sinks(stats, records);
      ++stats.ticks_executed;
      sleep_for(config_.safety.disabled_recheck_interval);
      continue;
    }

    poll_devices(stats, records);
    coordinator_->record_telemetry(records);
    publish_sinks(stats, records);

    ++stats.ticks_executed;
    sleep_for(interval);
  }

  return stats;
}

void Monitor::poll_devices(MonitorStats& stats, std::vector<model::telemetry_record>& records) {
  if (!hooks_.read_device) {
    return;
  }

  for (std::uint32_t index = 0; index < hooks_.device_count; ++index) {
    const device::DeviceLock lock = coordinator_->acquire_device_lock(index);
    if (!lock.is_locked() && config_.skip_on_lock_timeout) {
      ++stats.devices_skipped;
      continue;
    }

    auto result = reader_.read_with_retry(hooks_.read_device, index, "read_telemetry", config_.telemetry.max_retries);
    ++stats.devices_read;
    if (result.used_fallback) {
      // Zeroed fallback records would drag the power averages down.
      ++stats.fallback_reads;
      continue;
    }
    records.push_back(std::move(result.value));
  }
}

void Monitor::publish_sinks(MonitorStats& stats, const std::vector<model::telemetry_record>& records) {
  if (!config_.stdout_debug && redis_sink_ == nullptr) {
    return;
  }

  ++stats.sink_cycles;
  const nlohmann::json summary = coordinator_->get_workload_summary();

  if (config_.stdout_debug) {
    stdout_sink_.publish(summary, records);
  }

  if (redis_sink_ != nullptr) {
    const bool ok = redis_sink_->publish(summary, records);
    if (!ok) {
      ++stats.redis_errors;
      if (redis_was_ok_) {
        log(log_level::WARNING, "redis", "publish failed");
        redis_was_ok_ = false;
      }
    } else {
      stats.last_redis_latency_ms = redis_sink_->last_publish_latency_ms();
      if (!redis_was_ok_) {
        log(log_level::INFO, "redis", "publish recovered");
        redis_was_ok_ = true;
      }
    }
  }
}

void Monitor::sleep_for(const std::chrono::milliseconds delay) {
  if (hooks_.sleep) {
    hooks_.sleep(delay);
    return;
  }

  const auto deadline = std::chrono::steady_clock::now() + delay;
  while (true) {
    if (hooks_.wake_requested && hooks_.wake_requested()) {
      return;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(remaining, kSleepSlice));
  }
}

void Monitor::set_wake_requested(std::function<bool()> wake_requested) {
  hooks_.wake_requested = std::move(wake_requested);
}

SafetyCoordinator& Monitor::coordinator() noexcept { return *coordinator_; }

}  // namespace hw_guard::core
