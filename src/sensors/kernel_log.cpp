#include "sensors/kernel_log.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace hw_guard::sensors {
namespace {

constexpr int kExecFailedStatus = 127;

using lines_probe = core::probe<std::vector<std::string>>;

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    if (end > start) {
      lines.emplace_back(text, start, end - start);
    }
    start = end + 1;
  }
  return lines;
}

class DmesgLogSource final : public KernelLogSource {
 public:
  explicit DmesgLogSource(const std::chrono::milliseconds timeout) noexcept : timeout_(timeout) {}

  lines_probe read_recent(const std::chrono::seconds window) override {
    int pipe_fds[2]{};
    if (pipe(pipe_fds) != 0) {
      return lines_probe::defaulted({}, std::string("pipe failed: ") + std::strerror(errno));
    }

    const std::string since = std::to_string(window.count()) + " seconds ago";
    const pid_t pid = fork();
    if (pid < 0) {
      close(pipe_fds[0]);
      close(pipe_fds[1]);
      return lines_probe::defaulted({}, std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
      close(pipe_fds[0]);
      dup2(pipe_fds[1], STDOUT_FILENO);
      const int devnull = open("/dev/null", O_WRONLY);
      if (devnull >= 0) {
        dup2(devnull, STDERR_FILENO);
        close(devnull);
      }
      close(pipe_fds[1]);

      execlp("dmesg", "dmesg", "-T", "--since", since.c_str(), static_cast<char*>(nullptr));
      _exit(kExecFailedStatus);
    }

    close(pipe_fds[1]);
    std::string output;
    const bool finished = drain(pipe_fds[0], output);
    close(pipe_fds[0]);

    if (!finished) {
      kill(pid, SIGKILL);
      waitpid(pid, nullptr, 0);
      return lines_probe::defaulted({}, "dmesg timed out after " + std::to_string(timeout_.count()) + "ms");
    }

    int status = 0;
    if (waitpid(pid, &status, 0) != pid) {
      return lines_probe::defaulted({}, std::string("waitpid failed: ") + std::strerror(errno));
    }
    if (!WIFEXITED(status)) {
      return lines_probe::defaulted({}, "dmesg terminated by signal");
    }
    if (WEXITSTATUS(status) == kExecFailedStatus) {
      return lines_probe::defaulted({}, "dmesg not available");
    }
    if (WEXITSTATUS(status) != 0) {
      // Typically kernel.dmesg_restrict for unprivileged users.
      return lines_probe::defaulted({}, "dmesg exited with status " + std::to_string(WEXITSTATUS(status)));
    }

    return lines_probe::success(split_lines(output));
  }

  const char* name() const noexcept override { return "dmesg"; }

 private:
  // Reads until EOF. Returns false if the deadline passed first.
  bool drain(const int fd, std::string& output) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    char chunk[4096]{};

    while (true) {
      const auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        return false;
      }

      pollfd descriptor{fd, POLLIN, 0};
      const int ready = poll(&descriptor, 1, static_cast<int>(remaining.count()));
      if (ready < 0) {
        if (errno == EINTR) {
          continue;
        }
        return false;
      }
      if (ready == 0) {
        return false;
      }

      const ssize_t bytes_read = read(fd, chunk, sizeof(chunk));
      if (bytes_read > 0) {
        output.append(chunk, static_cast<std::size_t>(bytes_read));
        continue;
      }
      if (bytes_read == 0) {
        return true;
      }
      if (errno != EINTR && errno != EAGAIN) {
        return true;
      }
    }
  }

  std::chrono::milliseconds timeout_;
};

class NoneLogSource final : public KernelLogSource {
 public:
  lines_probe read_recent(std::chrono::seconds /*window*/) override {
    return lines_probe::defaulted({}, "no kernel log source configured");
  }

  const char* name() const noexcept override { return "none"; }
};

}  // namespace

std::unique_ptr<KernelLogSource> make_dmesg_source(const std::chrono::milliseconds timeout) {
  return std::make_unique<DmesgLogSource>(timeout);
}

std::unique_ptr<KernelLogSource> make_none_source() { return std::make_unique<NoneLogSource>(); }

std::unique_ptr<KernelLogSource> make_log_source(const std::string& kind, const std::chrono::milliseconds timeout) {
  if (kind == "dmesg") {
    return make_dmesg_source(timeout);
  }
  if (kind == "none") {
    return make_none_source();
  }
  throw std::runtime_error("unknown kernel log source: " + kind);
}

}  // namespace hw_guard::sensors
