#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "core/outcome.hpp"

namespace hw_guard::sensors {

// Source of recent kernel log lines. DEFAULTED (with no lines) means the source could
// not be read this time: missing tool, permission denied, timeout or non-zero exit.
class KernelLogSource {
 public:
  virtual ~KernelLogSource() = default;

  virtual core::probe<std::vector<std::string>> read_recent(std::chrono::seconds window) = 0;
  [[nodiscard]] virtual const char* name() const noexcept = 0;
};

// Runs `dmesg -T --since "<window> seconds ago"` and kills it after `timeout`.
std::unique_ptr<KernelLogSource> make_dmesg_source(std::chrono::milliseconds timeout);

// For platforms without a kernel log; every read is DEFAULTED.
std::unique_ptr<KernelLogSource> make_none_source();

// "dmesg" or "none".
std::unique_ptr<KernelLogSource> make_log_source(const std::string& kind, std::chrono::milliseconds timeout);

}  // namespace hw_guard::sensors
