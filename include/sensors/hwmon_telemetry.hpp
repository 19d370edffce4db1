#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "model/safety_state.hpp"

namespace hw_guard::sensors {

// Telemetry for Tenstorrent boards exposed through the kernel driver's hwmon nodes.
class HwmonTelemetry {
 public:
  struct DeviceNode {
    std::string chip{};
    std::string dir{};
  };

  explicit HwmonTelemetry(const std::string& hwmon_root = "/sys/class/hwmon");
  explicit HwmonTelemetry(std::vector<DeviceNode> devices);

  [[nodiscard]] std::size_t device_count() const noexcept;
  [[nodiscard]] const std::vector<DeviceNode>& devices() const noexcept;

  // Throws std::runtime_error when the device is unknown or an attribute cannot be read.
  // temp1_input is required; missing voltage, current or power attributes read as zero.
  model::telemetry_record read(std::uint32_t device_index);

  static bool is_tenstorrent_chip(const std::string& name) noexcept;

 private:
  void discover(const std::string& hwmon_root);

  std::vector<DeviceNode> devices_{};
  std::vector<std::uint64_t> heartbeats_{};
};

}  // namespace hw_guard::sensors
