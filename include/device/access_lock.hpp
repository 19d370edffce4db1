#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace hw_guard::device {

// Scoped exclusive access to one device, shared with every cooperating process on the
// host through flock(2) on a per-device lock file. Holds no data, only lock state.
//
// A handle whose wait timed out is still returned, with is_locked() == false; the caller
// decides whether to read unsynchronized or skip the device.
class DeviceLock {
 public:
  DeviceLock() = default;
  ~DeviceLock();

  DeviceLock(const DeviceLock&) = delete;
  DeviceLock& operator=(const DeviceLock&) = delete;
  DeviceLock(DeviceLock&& other) noexcept;
  DeviceLock& operator=(DeviceLock&& other) noexcept;

  static DeviceLock acquire(std::uint32_t device_id, const std::string& path_template,
                            std::chrono::milliseconds max_wait);

  [[nodiscard]] bool is_locked() const noexcept;
  [[nodiscard]] std::uint32_t device_id() const noexcept;
  [[nodiscard]] const std::string& path() const noexcept;

  // Unlocks if held and closes the descriptor. Safe to call more than once.
  void release() noexcept;

  static std::string lock_path_for(std::uint32_t device_id, const std::string& path_template);

 private:
  DeviceLock(std::uint32_t device_id, std::string path, int fd, bool locked) noexcept;

  std::uint32_t device_id_{0};
  std::string path_{};
  int fd_{-1};
  bool locked_{false};
};

}  // namespace hw_guard::device
