#include "sinks/redis_ts.hpp"

#include "core/log.hpp"
#include "core/timestamp.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace hw_guard::sinks {
namespace {

constexpr const char* kSafetySeries[] = {
    "safety:poll_interval_ms", "safety:poll_mode",        "safety:workload_active",
    "safety:active_ml_processes", "safety:total_ml_memory_gb", "safety:pcie_errors",
    "safety:monitoring_disabled", "safety:lock_timeouts",  "safety:skipped_processes",
    "safety:log_source_available",
};

constexpr const char* kDeviceSeries[] = {"power_w", "current_a", "voltage_v", "asic_temp_c"};

double sanitize_value(const double value) { return std::isfinite(value) ? value : 0.0; }

double json_number(const nlohmann::json& summary, const char* key) {
  const auto it = summary.find(key);
  if (it == summary.end()) {
    return 0.0;
  }
  if (it->is_boolean()) {
    return it->get<bool>() ? 1.0 : 0.0;
  }
  if (it->is_number()) {
    return sanitize_value(it->get<double>());
  }
  return 0.0;
}

double poll_mode_code(const nlohmann::json& summary) {
  const auto it = summary.find("poll_mode");
  if (it == summary.end() || !it->is_string()) {
    return 0.0;
  }
  const std::string mode = it->get<std::string>();
  for (std::uint8_t code = 0; code <= static_cast<std::uint8_t>(model::poll_mode::OVERRIDE); ++code) {
    if (mode == model::to_string(static_cast<model::poll_mode>(code))) {
      return static_cast<double>(code);
    }
  }
  return 0.0;
}

std::string device_suffix(const std::uint32_t index, const char* field) {
  return "device:" + std::to_string(index) + ":" + field;
}

}  // namespace

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {
  for (const char* suffix : kSafetySeries) {
    series_suffixes_.emplace_back(suffix);
  }
  for (std::uint32_t index = 0; index < options_.device_count; ++index) {
    for (const char* field : kDeviceSeries) {
      series_suffixes_.push_back(device_suffix(index, field));
    }
  }

  const std::size_t max_args = 1 + series_suffixes_.size() * 3;
  command_args_.reserve(max_args);
  command_argv_.reserve(max_args);
  command_argv_len_.reserve(max_args);
}

RedisTsSink::~RedisTsSink() = default;

RedisTsSink::RedisTsSink(RedisTsSink&&) noexcept = default;
RedisTsSink& RedisTsSink::operator=(RedisTsSink&&) noexcept = default;

bool RedisTsSink::check_connectivity() { return ensure_connected(); }

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }

  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      core::log(core::log_level::WARNING, "redis", std::string("connect failed: ") + raw->errstr);
      redisFree(raw);
    } else {
      core::log(core::log_level::WARNING, "redis", "connect failed: out of memory");
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db() || !ensure_schema()) {
    context_.reset();
    return false;
  }

  return true;
}

bool RedisTsSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    core::log(core::log_level::ERROR, "redis", "AUTH rejected");
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::ensure_schema() {
  if (schema_ready_) {
    return true;
  }

  for (const auto& suffix : series_suffixes_) {
    const std::string key = options_.key_prefix + ":" + suffix;
    redisReply* reply = static_cast<redisReply*>(
        redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST", key.c_str()));
    if (reply == nullptr) {
      return false;
    }

    const bool already_exists =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "already exists") != nullptr;
    const bool unknown_command =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "unknown command") != nullptr;
    const bool ok = reply->type != REDIS_REPLY_ERROR || already_exists;
    const std::string reply_message = reply->str != nullptr ? reply->str : "unknown";
    freeReplyObject(reply);

    if (unknown_command) {
      core::log(core::log_level::ERROR, "redis", "RedisTimeSeries module not available (TS.CREATE unknown command)");
      timeseries_available_ = false;
      return false;
    }
    if (!ok) {
      core::log(core::log_level::ERROR, "redis", "schema error on TS.CREATE " + key + ": " + reply_message);
      return false;
    }
  }

  schema_ready_ = true;
  return true;
}

bool RedisTsSink::publish(const nlohmann::json& summary, const std::vector<model::telemetry_record>& devices) {
  if (!ensure_connected()) {
    return false;
  }

  if (publish_impl(summary, devices)) {
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  return publish_impl(summary, devices);
}

bool RedisTsSink::publish_impl(const nlohmann::json& summary, const std::vector<model::telemetry_record>& devices) {
  const std::string timestamp = std::to_string(core::unix_timestamp_now_ms());

  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.emplace_back("TS.MADD");

  const auto append_metric = [&](const std::string& suffix, const double value) {
    command_args_.push_back(options_.key_prefix + ":" + suffix);
    command_args_.push_back(timestamp);
    command_args_.push_back(std::to_string(value));
  };

  // A disabled monitor has no interval; -1 keeps the series continuous.
  const auto interval = summary.find("current_poll_interval_ms");
  append_metric("safety:poll_interval_ms",
                interval != summary.end() && interval->is_number() ? interval->get<double>() : -1.0);
  append_metric("safety:poll_mode", poll_mode_code(summary));
  append_metric("safety:workload_active", json_number(summary, "is_workload_active"));
  append_metric("safety:active_ml_processes", json_number(summary, "active_ml_processes"));
  append_metric("safety:total_ml_memory_gb", json_number(summary, "total_ml_memory_gb"));
  append_metric("safety:pcie_errors", json_number(summary, "pcie_error_count"));
  append_metric("safety:monitoring_disabled", json_number(summary, "monitoring_disabled"));
  append_metric("safety:lock_timeouts", json_number(summary, "lock_timeouts"));
  append_metric("safety:skipped_processes", json_number(summary, "skipped_processes"));
  append_metric("safety:log_source_available", json_number(summary, "log_source_available"));

  for (const auto& record : devices) {
    if (record.device_index >= options_.device_count) {
      continue;
    }
    append_metric(device_suffix(record.device_index, "power_w"), sanitize_value(record.power_w));
    append_metric(device_suffix(record.device_index, "current_a"), sanitize_value(record.current_a));
    append_metric(device_suffix(record.device_index, "voltage_v"), sanitize_value(record.voltage_v));
    append_metric(device_suffix(record.device_index, "asic_temp_c"), sanitize_value(record.asic_temperature_c));
  }

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  const auto publish_start = std::chrono::steady_clock::now();
  redisReply* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(),
                       command_argv_len_.data()));
  const auto publish_end = std::chrono::steady_clock::now();
  last_publish_latency_ms_ =
      std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(publish_end - publish_start).count();
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

float RedisTsSink::last_publish_latency_ms() const noexcept { return last_publish_latency_ms_; }

const std::vector<std::string>& RedisTsSink::series_suffixes() const noexcept { return series_suffixes_; }

}  // namespace hw_guard::sinks
