#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/outcome.hpp"

namespace hw_guard::sensors {

// Reader over a procfs tree. The root is injectable so tests can point it at a
// synthetic directory laid out like /proc.
class ProcessTable {
 public:
  struct ProcessInfo {
    std::int32_t pid{0};
    // argv joined with single spaces; empty for kernel threads.
    std::string cmdline{};
    std::uint64_t rss_kb{0};
    std::uint32_t threads{0};
  };

  explicit ProcessTable(std::string proc_root = "/proc");

  [[nodiscard]] std::vector<std::int32_t> list_pids() const;

  // SKIPPED when the process vanished or its cmdline is not readable. A missing or
  // partial status file leaves rss/threads at zero.
  [[nodiscard]] core::probe<ProcessInfo> read_process(std::int32_t pid) const;

  [[nodiscard]] const std::string& root() const noexcept;

 private:
  static constexpr std::size_t kReadBufferSize = 512;

  [[nodiscard]] std::string pid_path(std::int32_t pid, const char* leaf) const;
  bool read_status(std::int32_t pid, ProcessInfo& info) const;

  std::string proc_root_;
};

}  // namespace hw_guard::sensors
