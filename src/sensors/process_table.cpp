#include "sensors/process_table.hpp"

#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <system_error>
#include <utility>

namespace hw_guard::sensors {
namespace {

struct FileCloser {
  void operator()(std::FILE* file) const {
    if (file != nullptr) {
      std::fclose(file);
    }
  }
};

using file_ptr = std::unique_ptr<std::FILE, FileCloser>;

bool parse_pid(const std::string& name, std::int32_t& pid) noexcept {
  if (name.empty()) {
    return false;
  }
  const auto result = std::from_chars(name.data(), name.data() + name.size(), pid);
  return result.ec == std::errc{} && result.ptr == name.data() + name.size() && pid > 0;
}

const char* open_failure_reason(const int error) noexcept {
  if (error == ENOENT || error == ESRCH) {
    return "vanished";
  }
  if (error == EACCES || error == EPERM) {
    return "access denied";
  }
  return "unreadable";
}

}  // namespace

ProcessTable::ProcessTable(std::string proc_root) : proc_root_(std::move(proc_root)) {}

const std::string& ProcessTable::root() const noexcept { return proc_root_; }

std::string ProcessTable::pid_path(const std::int32_t pid, const char* leaf) const {
  return proc_root_ + "/" + std::to_string(pid) + "/" + leaf;
}

std::vector<std::int32_t> ProcessTable::list_pids() const {
  std::vector<std::int32_t> pids;

  std::error_code ec;
  std::filesystem::directory_iterator it(proc_root_, ec);
  if (ec) {
    return pids;
  }

  const auto end = std::filesystem::directory_iterator{};
  for (; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    std::int32_t pid = 0;
    if (parse_pid(it->path().filename().string(), pid)) {
      pids.push_back(pid);
    }
  }
  return pids;
}

core::probe<ProcessTable::ProcessInfo> ProcessTable::read_process(const std::int32_t pid) const {
  const std::string cmdline_path = pid_path(pid, "cmdline");
  file_ptr cmdline_file(std::fopen(cmdline_path.c_str(), "rb"));
  if (cmdline_file == nullptr) {
    return core::probe<ProcessInfo>::skipped(std::string("pid ") + std::to_string(pid) + " " +
                                             open_failure_reason(errno));
  }

  ProcessInfo info{};
  info.pid = pid;

  char buffer[kReadBufferSize]{};
  bool pending_separator = false;
  std::size_t bytes_read = 0;
  while ((bytes_read = std::fread(buffer, 1, sizeof(buffer), cmdline_file.get())) > 0) {
    for (std::size_t i = 0; i < bytes_read; ++i) {
      if (buffer[i] == '\0') {
        pending_separator = !info.cmdline.empty();
        continue;
      }
      if (pending_separator) {
        info.cmdline.push_back(' ');
        pending_separator = false;
      }
      info.cmdline.push_back(buffer[i]);
    }
  }

  if (std::ferror(cmdline_file.get()) != 0) {
    return core::probe<ProcessInfo>::skipped("pid " + std::to_string(pid) + " cmdline read failed");
  }

  if (!read_status(pid, info)) {
    return core::probe<ProcessInfo>::skipped("pid " + std::to_string(pid) + " vanished");
  }

  return core::probe<ProcessInfo>::success(std::move(info));
}

bool ProcessTable::read_status(const std::int32_t pid, ProcessInfo& info) const {
  const std::string status_path = pid_path(pid, "status");
  file_ptr status_file(std::fopen(status_path.c_str(), "r"));
  if (status_file == nullptr) {
    // Exited between the cmdline and status reads.
    return errno != ENOENT && errno != ESRCH;
  }

  char line[kReadBufferSize]{};
  while (std::fgets(line, static_cast<int>(sizeof(line)), status_file.get()) != nullptr) {
    unsigned long long value = 0;
    if (std::sscanf(line, "VmRSS: %llu kB", &value) == 1) {
      info.rss_kb = value;
    } else if (std::sscanf(line, "Threads: %llu", &value) == 1) {
      info.threads = static_cast<std::uint32_t>(value);
    }
  }

  if (std::ferror(status_file.get()) != 0) {
    std::clearerr(status_file.get());
  }
  return true;
}

}  // namespace hw_guard::sensors
