#include "sinks/stdout_debug.hpp"

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <string>

namespace hw_guard::sinks {
namespace {

template <typename T>
T value_or(const nlohmann::json& summary, const char* key, T fallback) {
  const auto it = summary.find(key);
  if (it == summary.end() || it->is_null()) {
    return fallback;
  }
  return it->get<T>();
}

}  // namespace

StdoutDebugSink::StdoutDebugSink(std::FILE* out) noexcept : out_(out) {}

std::string StdoutDebugSink::format_line(const nlohmann::json& summary,
                                         const std::vector<model::telemetry_record>& devices) {
  char buffer[256];
  const auto interval_ms = value_or<long long>(summary, "current_poll_interval_ms", -1);
  std::snprintf(buffer, sizeof(buffer),
                "[safety] mode=%s interval_ms=%lld workloads=%zu ml_mem_gb=%.2f pcie_errors=%u lock_timeouts=%" PRIu64,
                value_or<std::string>(summary, "poll_mode", "unknown").c_str(), interval_ms,
                value_or<std::size_t>(summary, "active_ml_processes", 0),
                value_or<double>(summary, "total_ml_memory_gb", 0.0),
                value_or<unsigned>(summary, "pcie_error_count", 0U),
                value_or<std::uint64_t>(summary, "lock_timeouts", 0));

  std::string line(buffer);
  for (const auto& record : devices) {
    std::snprintf(buffer, sizeof(buffer), " dev%u=%.1fW/%.1fC", record.device_index, record.power_w,
                  record.asic_temperature_c);
    line += buffer;
  }
  return line;
}

void StdoutDebugSink::publish(const nlohmann::json& summary, const std::vector<model::telemetry_record>& devices) const {
  const std::string line = format_line(summary, devices);
  std::fprintf(out_, "%s\n", line.c_str());
  std::fflush(out_);
}

}  // namespace hw_guard::sinks
