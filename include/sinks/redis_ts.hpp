#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/safety_state.hpp"

struct redisContext;

namespace hw_guard::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"hw_guard"};
  std::uint32_t connect_timeout_ms{1000};
  // One set of device:<index>:* series is created per device.
  std::uint32_t device_count{0};
};

// Publishes the coordinator status summary and per-device telemetry to RedisTimeSeries
// with one TS.MADD per tick.
class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  bool check_connectivity();
  bool publish(const nlohmann::json& summary, const std::vector<model::telemetry_record>& devices);

  [[nodiscard]] float last_publish_latency_ms() const noexcept;
  [[nodiscard]] const std::vector<std::string>& series_suffixes() const noexcept;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool ensure_schema();
  bool publish_impl(const nlohmann::json& summary, const std::vector<model::telemetry_record>& devices);

  RedisTsOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> series_suffixes_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  bool timeseries_available_{true};
  bool schema_ready_{false};
  float last_publish_latency_ms_{0.0F};
};

}  // namespace hw_guard::sinks
