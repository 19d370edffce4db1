#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/timestamp.hpp"
#include "sensors/kernel_log.hpp"

namespace hw_guard::sensors {

struct error_check {
  bool found{false};
  std::vector<std::string> matched_lines{};
  bool source_available{true};
};

// Scans the recent kernel log for PCIe interference signatures. The error count only
// grows until reset_error_count(); once it reaches max_errors_before_disable monitoring
// stays disabled.
class PcieErrorDetector {
 public:
  PcieErrorDetector(std::chrono::seconds window, std::uint32_t max_errors_before_disable,
                    std::unique_ptr<KernelLogSource> source, core::clock_fn clock = core::system_steady_clock());

  error_check check_for_errors();

  [[nodiscard]] bool should_disable_monitoring() const noexcept;
  void reset_error_count();

  [[nodiscard]] std::uint32_t error_count() const noexcept;
  [[nodiscard]] bool log_source_available() const noexcept;
  [[nodiscard]] std::optional<core::steady_clock::time_point> last_check_time() const noexcept;
  [[nodiscard]] std::chrono::seconds window() const noexcept;

  // Name of the first signature the line matches (case-insensitive), nullptr if none.
  static const char* match_signature(const std::string& line);
  // Number of signatures the line matches; this is what one line adds to error_count().
  static std::uint32_t count_signatures(const std::string& line);

 private:
  std::chrono::seconds window_;
  std::uint32_t max_errors_;
  std::unique_ptr<KernelLogSource> source_;
  core::clock_fn clock_;
  std::uint32_t error_count_{0};
  bool source_available_{true};
  std::optional<core::steady_clock::time_point> last_check_{};
};

}  // namespace hw_guard::sensors
