#include <csignal>
#include <iostream>
#include <sstream>
#include <string>

#include "core/config.hpp"
#include "core/log.hpp"
#include "core/monitor.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;
volatile std::sig_atomic_t g_reset_requested = 0;

void handle_shutdown_signal(int /*signal*/) { g_shutdown_requested = 1; }

void handle_reset_signal(int /*signal*/) { g_reset_requested = 1; }

}  // namespace

std::string format_config_settings(const hw_guard::core::GuardConfig& config, const std::string& config_path) {
  const auto& safety = config.safety;
  std::ostringstream output;
  output << "[guard] loaded config from " << config_path
         << " | normal_interval_ms=" << safety.normal_poll_interval.count()
         << " | workload_interval_ms=" << safety.workload_poll_interval.count()
         << " | critical_interval_ms=" << safety.critical_poll_interval.count()
         << " | lock_max_wait_ms=" << safety.max_lock_wait.count()
         << " | lock_path_template=" << safety.lock_path_template
         << " | error_window_s=" << safety.error_detection_window.count()
         << " | max_errors=" << safety.max_errors_before_disable
         << " | log_source=" << safety.log_source
         << " | min_workload_memory_gb=" << safety.min_workload_memory_gb
         << " | force_safety_mode=" << hw_guard::model::to_string(config.overrides.force_safety_mode)
         << " | max_retries=" << config.telemetry.max_retries
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  output << " | redis_db=" << config.redis.db << " | redis_auth=" << (config.redis.password.empty() ? "off" : "on");
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);
  std::signal(SIGUSR1, handle_reset_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/guard.yaml";

  hw_guard::core::GuardConfig config{};
  try {
    config = hw_guard::core::load_guard_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  hw_guard::core::set_log_level(config.level);
  std::cerr << format_config_settings(config, config_path) << '\n';

  try {
    hw_guard::core::Monitor monitor{config};
    monitor.set_wake_requested([] { return g_shutdown_requested != 0 || g_reset_requested != 0; });

    while (g_shutdown_requested == 0) {
      if (g_reset_requested != 0) {
        g_reset_requested = 0;
        monitor.coordinator().reset_error_count();
      }
      monitor.run_for_ticks(1);
    }
  } catch (const std::exception& ex) {
    std::cerr << "[guard] fatal: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << "[guard] shutdown signal received; exiting cleanly\n";

  return 0;
}
