#include "device/telemetry_reader.hpp"

#include <array>
#include <thread>

namespace hw_guard::device {
namespace {

constexpr std::uint32_t kMaxShift = 16;

std::uint32_t seed_or_random(const std::uint32_t seed) {
  if (seed != 0) {
    return seed;
  }
  std::random_device device;
  return device();
}

std::chrono::milliseconds exponential_step(const std::chrono::milliseconds base, const std::uint32_t attempt) {
  const std::uint32_t shift = attempt > kMaxShift ? kMaxShift : attempt - 1;
  return base * (1LL << shift);
}

}  // namespace

model::telemetry_record fallback_value<model::telemetry_record>::make(const std::string& /*operation*/,
                                                                       const std::uint32_t device_index) {
  model::telemetry_record record{};
  record.device_index = device_index;
  return record;
}

model::smbus_telemetry fallback_value<model::smbus_telemetry>::make(const std::string& /*operation*/,
                                                                     std::uint32_t /*device_index*/) {
  static constexpr std::array<const char*, 14> kSmbusKeys = {
      "BOARD_ID_HIGH",      "BOARD_ID_LOW",  "ASIC_TEMPERATURE", "VREG_TEMPERATURE", "BOARD_TEMPERATURE",
      "AICLK",              "AXICLK",        "ARCCLK",           "VCORE",            "TDP",
      "TDC",                "ARC0_HEALTH",   "FAN_SPEED",        "FW_BUNDLE_VERSION",
  };

  model::smbus_telemetry registers;
  for (const char* key : kSmbusKeys) {
    registers.emplace(key, "0x0");
  }
  return registers;
}

TelemetryReader::TelemetryReader() : TelemetryReader(Options{}) {}

TelemetryReader::TelemetryReader(Options options)
    : options_(std::move(options)), rng_(seed_or_random(options_.jitter_seed)) {
  if (!options_.sleep) {
    options_.sleep = [](const std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

std::chrono::milliseconds TelemetryReader::backoff_delay(const std::uint32_t attempt) {
  if (attempt == 0) {
    return std::chrono::milliseconds{0};
  }

  std::chrono::milliseconds jitter{0};
  if (options_.base_delay.count() > 1) {
    std::uniform_int_distribution<long long> distribution(0, options_.base_delay.count() - 1);
    const std::lock_guard<std::mutex> lock(rng_mutex_);
    jitter = std::chrono::milliseconds(distribution(rng_));
  }
  return exponential_step(options_.base_delay, attempt) + jitter;
}

std::chrono::milliseconds TelemetryReader::worst_case_backoff(const std::uint32_t max_retries,
                                                              const std::chrono::milliseconds base_delay) {
  std::chrono::milliseconds total{0};
  for (std::uint32_t attempt = 1; attempt <= max_retries; ++attempt) {
    total += exponential_step(base_delay, attempt) + base_delay;
  }
  return total;
}

void TelemetryReader::pause(const std::chrono::milliseconds delay) const {
  if (delay.count() > 0) {
    options_.sleep(delay);
  }
}

void TelemetryReader::note_failure(const std::string& operation, const std::uint32_t device_index,
                                   const std::uint32_t attempt, const std::uint32_t max_retries,
                                   const char* what) const {
  if (!core::log_enabled(core::log_level::DEBUG)) {
    return;
  }
  core::log(core::log_level::DEBUG, "telemetry",
            operation + " failed on device " + std::to_string(device_index) + " (attempt " +
                std::to_string(attempt + 1) + "/" + std::to_string(max_retries + 1) + "): " + what);
}

void TelemetryReader::note_exhausted(const std::string& operation, const std::uint32_t device_index,
                                     const std::uint32_t attempts) const {
  core::log(core::log_level::WARNING, "telemetry",
            operation + " on device " + std::to_string(device_index) + " failed after " + std::to_string(attempts) +
                " attempts; using fallback data");
}

}  // namespace hw_guard::device
