#include "sensors/hwmon_telemetry.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

#include "core/log.hpp"

namespace hw_guard::sensors {
namespace {

struct FileCloser {
  void operator()(std::FILE* file) const noexcept {
    if (file != nullptr) {
      std::fclose(file);
    }
  }
};

using file_ptr = std::unique_ptr<std::FILE, FileCloser>;

// nullopt when the attribute is not exposed; throws when it exists but cannot be read.
std::optional<long long> read_attribute(const std::string& dir, const char* attribute) {
  const std::string path = dir + "/" + attribute;
  file_ptr file(std::fopen(path.c_str(), "r"));
  if (!file) {
    if (errno == ENOENT) {
      return std::nullopt;
    }
    throw std::runtime_error("cannot open " + path + ": " + std::strerror(errno));
  }

  long long value = 0;
  if (std::fscanf(file.get(), "%lld", &value) != 1) {
    throw std::runtime_error("malformed value in " + path);
  }
  return value;
}

}  // namespace

HwmonTelemetry::HwmonTelemetry(const std::string& hwmon_root) { discover(hwmon_root); }

HwmonTelemetry::HwmonTelemetry(std::vector<DeviceNode> devices)
    : devices_(std::move(devices)), heartbeats_(devices_.size(), 0) {}

bool HwmonTelemetry::is_tenstorrent_chip(const std::string& name) noexcept {
  return name == "wormhole" || name == "blackhole" || name == "grayskull";
}

void HwmonTelemetry::discover(const std::string& hwmon_root) {
  std::error_code ec;
  auto it = std::filesystem::directory_iterator(hwmon_root, ec);
  if (ec) {
    core::log(core::log_level::WARNING, "hwmon", "cannot list " + hwmon_root + ": " + ec.message());
    return;
  }

  const auto end = std::filesystem::directory_iterator{};
  for (; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }

    std::ifstream name_file(it->path() / "name");
    std::string chip;
    if (!name_file.is_open() || !std::getline(name_file, chip) || !is_tenstorrent_chip(chip)) {
      continue;
    }
    devices_.push_back(DeviceNode{chip, it->path().string()});
  }

  // Directory order is arbitrary; hwmonN numbering follows probe order.
  std::sort(devices_.begin(), devices_.end(),
            [](const DeviceNode& lhs, const DeviceNode& rhs) { return lhs.dir < rhs.dir; });
  heartbeats_.assign(devices_.size(), 0);

  core::log(core::log_level::INFO, "hwmon",
            "found " + std::to_string(devices_.size()) + " Tenstorrent device(s) under " + hwmon_root);
}

std::size_t HwmonTelemetry::device_count() const noexcept { return devices_.size(); }

const std::vector<HwmonTelemetry::DeviceNode>& HwmonTelemetry::devices() const noexcept { return devices_; }

model::telemetry_record HwmonTelemetry::read(const std::uint32_t device_index) {
  if (device_index >= devices_.size()) {
    throw std::runtime_error("no hwmon device with index " + std::to_string(device_index));
  }
  const std::string& dir = devices_[device_index].dir;

  const auto temp_mc = read_attribute(dir, "temp1_input");
  if (!temp_mc) {
    throw std::runtime_error(dir + " exposes no temp1_input");
  }

  model::telemetry_record record{};
  record.device_index = device_index;
  record.asic_temperature_c = static_cast<double>(*temp_mc) / 1000.0;
  record.voltage_v = static_cast<double>(read_attribute(dir, "in0_input").value_or(0)) / 1000.0;
  record.current_a = static_cast<double>(read_attribute(dir, "curr1_input").value_or(0)) / 1000.0;
  record.power_w = static_cast<double>(read_attribute(dir, "power1_input").value_or(0)) / 1000000.0;
  record.heartbeat = ++heartbeats_[device_index];
  return record;
}

}  // namespace hw_guard::sensors
