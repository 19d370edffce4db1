#include "device/access_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <thread>
#include <utility>

#include "core/log.hpp"

namespace hw_guard::device {
namespace {

constexpr std::chrono::milliseconds kRetryInterval{10};
constexpr const char* kPlaceholder = "{device}";

}  // namespace

DeviceLock::DeviceLock(const std::uint32_t device_id, std::string path, const int fd, const bool locked) noexcept
    : device_id_(device_id), path_(std::move(path)), fd_(fd), locked_(locked) {}

DeviceLock::~DeviceLock() { release(); }

DeviceLock::DeviceLock(DeviceLock&& other) noexcept
    : device_id_(other.device_id_), path_(std::move(other.path_)), fd_(other.fd_), locked_(other.locked_) {
  other.fd_ = -1;
  other.locked_ = false;
}

DeviceLock& DeviceLock::operator=(DeviceLock&& other) noexcept {
  if (this != &other) {
    release();
    device_id_ = other.device_id_;
    path_ = std::move(other.path_);
    fd_ = other.fd_;
    locked_ = other.locked_;
    other.fd_ = -1;
    other.locked_ = false;
  }
  return *this;
}

std::string DeviceLock::lock_path_for(const std::uint32_t device_id, const std::string& path_template) {
  std::string path = path_template;
  const std::string id = std::to_string(device_id);
  const std::size_t placeholder_len = std::strlen(kPlaceholder);
  for (auto pos = path.find(kPlaceholder); pos != std::string::npos; pos = path.find(kPlaceholder, pos + id.size())) {
    path.replace(pos, placeholder_len, id);
  }
  return path;
}

DeviceLock DeviceLock::acquire(const std::uint32_t device_id, const std::string& path_template,
                               const std::chrono::milliseconds max_wait) {
  std::string path = lock_path_for(device_id, path_template);

  const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0666);
  if (fd < 0) {
    core::log(core::log_level::ERROR, "lock",
              "cannot open " + path + " for device " + std::to_string(device_id) + ": " + std::strerror(errno));
    return DeviceLock(device_id, std::move(path), -1, false);
  }

  // umask may strip group/other bits; other monitor users still need to open the file.
  (void)::fchmod(fd, 0666);

  const auto deadline = std::chrono::steady_clock::now() + max_wait;
  while (true) {
    if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
      core::log(core::log_level::DEBUG, "lock", "acquired device " + std::to_string(device_id));
      return DeviceLock(device_id, std::move(path), fd, true);
    }

    if (errno != EWOULDBLOCK && errno != EINTR) {
      core::log(core::log_level::ERROR, "lock",
                "flock failed for device " + std::to_string(device_id) + ": " + std::strerror(errno));
      break;
    }

    if (std::chrono::steady_clock::now() >= deadline) {
      core::log(core::log_level::WARNING, "lock",
                "device " + std::to_string(device_id) + " still held after " + std::to_string(max_wait.count()) +
                    "ms; continuing without exclusive access");
      break;
    }

    std::this_thread::sleep_for(kRetryInterval);
  }

  return DeviceLock(device_id, std::move(path), fd, false);
}

bool DeviceLock::is_locked() const noexcept { return locked_; }

std::uint32_t DeviceLock::device_id() const noexcept { return device_id_; }

const std::string& DeviceLock::path() const noexcept { return path_; }

void DeviceLock::release() noexcept {
  if (fd_ < 0) {
    locked_ = false;
    return;
  }

  if (locked_) {
    (void)::flock(fd_, LOCK_UN);
    locked_ = false;
  }

  ::close(fd_);
  fd_ = -1;
}

}  // namespace hw_guard::device
