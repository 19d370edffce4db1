#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace hw_guard::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& value) {
  const std::string lower = to_lower(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  const long long parsed = std::stoll(value, &consumed);
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  return parsed;
}

std::chrono::milliseconds parse_positive_ms(const std::string& key, const std::string& value) {
  const long long parsed = parse_integer(key, value);
  if (parsed <= 0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return std::chrono::milliseconds(parsed);
}

model::safety_override parse_override(const std::string& value) {
  const std::string lower = to_lower(value);
  if (lower == "auto") {
    return model::safety_override::AUTO;
  }
  if (lower == "on" || lower == "true") {
    return model::safety_override::FORCED_ON;
  }
  if (lower == "off" || lower == "false") {
    return model::safety_override::FORCED_OFF;
  }
  throw std::runtime_error("poll.force_safety_mode must be auto, on or off");
}

void apply_key_value(GuardConfig& config, const std::string& key, const std::string& value) {
  SafetyConfig& safety = config.safety;

  if (key == "poll.normal_interval_ms") {
    safety.normal_poll_interval = parse_positive_ms(key, value);
    return;
  }
  if (key == "poll.workload_interval_ms") {
    safety.workload_poll_interval = parse_positive_ms(key, value);
    return;
  }
  if (key == "poll.critical_interval_ms") {
    safety.critical_poll_interval = parse_positive_ms(key, value);
    return;
  }
  if (key == "poll.disabled_recheck_ms") {
    safety.disabled_recheck_interval = parse_positive_ms(key, value);
    return;
  }
  if (key == "poll.custom_interval_ms") {
    config.overrides.custom_poll_interval = parse_positive_ms(key, value);
    return;
  }
  if (key == "poll.force_safety_mode") {
    config.overrides.force_safety_mode = parse_override(value);
    return;
  }

  if (key == "lock.max_wait_ms") {
    safety.max_lock_wait = parse_positive_ms(key, value);
    return;
  }
  if (key == "lock.path_template") {
    safety.lock_path_template = value;
    return;
  }
  if (key == "lock.skip_on_timeout") {
    config.skip_on_lock_timeout = parse_bool(value);
    return;
  }

  if (key == "error_detection.window_s") {
    const auto seconds = parse_integer(key, value);
    if (seconds <= 0) {
      throw std::runtime_error("error_detection.window_s must be greater than 0");
    }
    safety.error_detection_window = std::chrono::seconds(seconds);
    return;
  }
  if (key == "error_detection.max_errors_before_disable") {
    const auto count = parse_integer(key, value);
    if (count < 1) {
      throw std::runtime_error("error_detection.max_errors_before_disable must be at least 1");
    }
    safety.max_errors_before_disable = static_cast<std::uint32_t>(count);
    return;
  }
  if (key == "error_detection.log_source") {
    const std::string source = to_lower(value);
    if (source != "dmesg" && source != "none") {
      throw std::runtime_error("error_detection.log_source must be dmesg or none");
    }
    safety.log_source = source;
    return;
  }
  if (key == "error_detection.log_timeout_ms") {
    safety.log_timeout = parse_positive_ms(key, value);
    return;
  }

  if (key == "workload.check_interval_ms") {
    safety.workload_check_interval = parse_positive_ms(key, value);
    return;
  }
  if (key == "workload.min_memory_gb") {
    safety.min_workload_memory_gb = std::stod(value);
    if (safety.min_workload_memory_gb < 0.0) {
      throw std::runtime_error("workload.min_memory_gb must not be negative");
    }
    return;
  }
  if (key == "workload.scan_budget_ms") {
    safety.workload_scan_budget = parse_positive_ms(key, value);
    return;
  }
  if (key == "workload.proc_root") {
    safety.proc_root = value;
    return;
  }

  if (key == "telemetry.max_retries") {
    const auto retries = parse_integer(key, value);
    if (retries < 0 || retries > 10) {
      throw std::runtime_error("telemetry.max_retries must be in range 0..10");
    }
    config.telemetry.max_retries = static_cast<std::uint32_t>(retries);
    return;
  }
  if (key == "telemetry.retry_base_delay_ms") {
    config.telemetry.retry_base_delay = parse_positive_ms(key, value);
    return;
  }
  if (key == "telemetry.hwmon_root") {
    config.telemetry.hwmon_root = value;
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }
  if (key == "agent.log_level") {
    config.level = parse_log_level(value);
    return;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }
  if (key == "redis.db") {
    const auto db = parse_integer(key, value);
    if (db < 0) {
      throw std::runtime_error("redis.db must not be negative");
    }
    config.redis.db = static_cast<int>(db);
    return;
  }

  if (key == "redis.address") {
    config.redis.enabled = !value.empty();
    if (value.rfind("unix://", 0) == 0) {
      config.redis.unix_socket = value.substr(std::string("unix://").size());
      config.redis.host.clear();
      config.redis.port = 0;
      return;
    }

    if (!value.empty() && value.front() == '/') {
      config.redis.unix_socket = value;
      config.redis.host.clear();
      config.redis.port = 0;
      return;
    }

    config.redis.unix_socket.clear();
    const auto split = value.find(':');
    if (split == std::string::npos) {
      config.redis.host = value;
      return;
    }

    config.redis.host = value.substr(0, split);
    const auto parsed_port = std::stoi(value.substr(split + 1));
    if (parsed_port <= 0 || parsed_port > 65535) {
      throw std::runtime_error("redis.address port must be in range 1..65535");
    }

    config.redis.port = static_cast<std::uint16_t>(parsed_port);
  }
}

}  // namespace

void validate_safety_config(const SafetyConfig& config) {
  const auto require_positive = [](const std::chrono::milliseconds value, const char* name) {
    if (value.count() <= 0) {
      throw std::runtime_error(std::string(name) + " must be greater than 0");
    }
  };

  require_positive(config.normal_poll_interval, "normal_poll_interval");
  require_positive(config.workload_poll_interval, "workload_poll_interval");
  require_positive(config.critical_poll_interval, "critical_poll_interval");
  require_positive(config.disabled_recheck_interval, "disabled_recheck_interval");
  require_positive(config.max_lock_wait, "max_lock_wait");
  require_positive(config.log_timeout, "log_timeout");
  require_positive(config.workload_check_interval, "workload_check_interval");
  require_positive(config.workload_scan_budget, "workload_scan_budget");

  if (config.error_detection_window.count() <= 0) {
    throw std::runtime_error("error_detection_window must be greater than 0");
  }
  if (config.max_errors_before_disable < 1) {
    throw std::runtime_error("max_errors_before_disable must be at least 1");
  }
  if (config.min_workload_memory_gb < 0.0) {
    throw std::runtime_error("min_workload_memory_gb must not be negative");
  }
  if (config.lock_path_template.find("{device}") == std::string::npos) {
    throw std::runtime_error("lock path template must contain {device}");
  }
}

GuardConfig load_guard_config(const std::string& path) {
  GuardConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() < depth) {
        throw std::runtime_error("unexpected indentation at key " + key);
      }
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate_safety_config(config.safety);
  return config;
}

}  // namespace hw_guard::core
