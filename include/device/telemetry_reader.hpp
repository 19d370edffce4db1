#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <type_traits>
#include <utility>

#include "core/log.hpp"
#include "model/safety_state.hpp"

namespace hw_guard::device {

template <typename T>
struct read_result {
  T value{};
  bool used_fallback{false};
  std::uint32_t attempts{0};
};

// Structurally valid stand-in returned when every attempt of `operation` failed.
template <typename T>
struct fallback_value {
  static T make(const std::string& /*operation*/, std::uint32_t /*device_index*/) { return T{}; }
};

template <>
struct fallback_value<model::telemetry_record> {
  static model::telemetry_record make(const std::string& operation, std::uint32_t device_index);
};

template <>
struct fallback_value<model::smbus_telemetry> {
  static model::smbus_telemetry make(const std::string& operation, std::uint32_t device_index);
};

class TelemetryReader {
 public:
  using sleep_fn = std::function<void(std::chrono::milliseconds)>;

  struct Options {
    std::chrono::milliseconds base_delay{100};
    // Defaults to std::this_thread::sleep_for.
    sleep_fn sleep{};
    // 0 seeds from std::random_device.
    std::uint32_t jitter_seed{0};
  };

  TelemetryReader();
  explicit TelemetryReader(Options options);

  // Calls read_fn(device_index) up to max_retries + 1 times. Anything thrown by read_fn
  // counts as a failed attempt and is logged. Never throws: after the last failure the
  // operation's fallback value is returned with used_fallback set.
  template <typename Fn>
  auto read_with_retry(Fn&& read_fn, std::uint32_t device_index, const std::string& operation,
                       std::uint32_t max_retries) -> read_result<std::decay_t<std::invoke_result_t<Fn&, std::uint32_t>>> {
    using value_type = std::decay_t<std::invoke_result_t<Fn&, std::uint32_t>>;
    read_result<value_type> result{};

    for (std::uint32_t attempt = 0; attempt <= max_retries; ++attempt) {
      if (attempt > 0) {
        pause(backoff_delay(attempt));
      }

      ++result.attempts;
      try {
        result.value = read_fn(device_index);
        return result;
      } catch (const std::exception& ex) {
        note_failure(operation, device_index, attempt, max_retries, ex.what());
      } catch (...) {
        note_failure(operation, device_index, attempt, max_retries, "non-standard exception");
      }
    }

    note_exhausted(operation, device_index, result.attempts);
    result.value = fallback_value<value_type>::make(operation, device_index);
    result.used_fallback = true;
    return result;
  }

  // Delay before attempt k (k >= 1): base * 2^(k-1) plus jitter in [0, base).
  std::chrono::milliseconds backoff_delay(std::uint32_t attempt);

  // Upper bound of the total sleep across max_retries retries.
  static std::chrono::milliseconds worst_case_backoff(std::uint32_t max_retries,
                                                      std::chrono::milliseconds base_delay = std::chrono::milliseconds{100});

 private:
  void pause(std::chrono::milliseconds delay) const;
  void note_failure(const std::string& operation, std::uint32_t device_index, std::uint32_t attempt,
                    std::uint32_t max_retries, const char* what) const;
  void note_exhausted(const std::string& operation, std::uint32_t device_index, std::uint32_t attempts) const;

  Options options_;
  std::mutex rng_mutex_;
  std::mt19937 rng_;
};

}  // namespace hw_guard::device
