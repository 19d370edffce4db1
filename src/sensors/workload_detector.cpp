#include "sensors/workload_detector.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <utility>

#include "core/log.hpp"
#include "core/math.hpp"
#include "sensors/workload_classifier.hpp"

namespace hw_guard::sensors {
namespace {

constexpr std::size_t kCmdlineSnippetLength = 100;

std::string snippet(const std::string& cmdline) {
  if (cmdline.size() <= kCmdlineSnippetLength) {
    return cmdline;
  }
  return cmdline.substr(0, kCmdlineSnippetLength);
}

}  // namespace

WorkloadDetector::WorkloadDetector(const double min_workload_memory_gb, const std::chrono::milliseconds check_interval,
                                   std::string proc_root, core::clock_fn clock)
    : table_(std::move(proc_root)),
      min_workload_memory_gb_(min_workload_memory_gb),
      gate_(check_interval),
      clock_(std::move(clock)) {}

WorkloadDetector::~WorkloadDetector() {
  if (pending_.valid()) {
    pending_.wait();
  }
}

model::workload_state WorkloadDetector::scan_processes(const ProcessTable& table, const double min_workload_memory_gb,
                                                       const model::telemetry_hint& hint) {
  model::workload_state state{};
  state.timestamp_ms = core::unix_timestamp_now_ms();

  for (const std::int32_t pid : table.list_pids()) {
    const auto process = table.read_process(pid);
    if (!process.ok()) {
      ++state.skipped_processes;
      continue;
    }

    const auto& info = process.value;
    if (info.cmdline.empty()) {
      continue;
    }

    const double memory_gb = core::kib_to_gib(info.rss_kb);
    const classification result = classify_cmdline(info.cmdline);

    if (is_ml_workload(result)) {
      model::workload_record record{};
      record.pid = info.pid;
      record.cmdline_snippet = snippet(info.cmdline);
      record.framework = result.framework;
      record.model = result.model;
      record.workload = result.workload;
      record.confidence = result.confidence;
      record.correlation_score = correlation_score(memory_gb, info.threads, hint);
      record.memory_gb = memory_gb;
      record.thread_count = info.threads;

      state.active_ml_workloads.push_back(std::move(record));
      state.total_ml_memory_gb += memory_gb;
      ++state.total_ml_processes;
    }

    if (memory_gb > min_workload_memory_gb) {
      ++state.high_memory_processes;
    }
  }

  state.is_workload_active = state.total_ml_processes > 0 || state.total_ml_memory_gb > min_workload_memory_gb ||
                             state.high_memory_processes > 0;

  std::stable_sort(state.active_ml_workloads.begin(), state.active_ml_workloads.end(),
                   [](const model::workload_record& lhs, const model::workload_record& rhs) {
                     if (lhs.correlation_score != rhs.correlation_score) {
                       return lhs.correlation_score > rhs.correlation_score;
                     }
                     return lhs.confidence > rhs.confidence;
                   });

  if (state.skipped_processes > 0 && core::log_enabled(core::log_level::DEBUG)) {
    core::log(core::log_level::DEBUG, "workload",
              "scan skipped " + std::to_string(state.skipped_processes) + " vanished or inaccessible processes");
  }
  return state;
}

model::workload_state WorkloadDetector::detect_active_workloads(const model::telemetry_hint& hint) {
  // A background scan may still be running; let it finish so it cannot overwrite this one.
  if (pending_.valid()) {
    (void)collect_pending(std::chrono::milliseconds::max());
  }

  gate_.mark(clock_());
  latest_ = scan_processes(table_, min_workload_memory_gb_, hint);
  return latest_;
}

bool WorkloadDetector::refresh(const model::telemetry_hint& hint, const std::chrono::milliseconds budget) {
  const auto now = clock_();

  if (gate_.due(now)) {
    if (pending_.valid()) {
      ++overlapping_scans_skipped_;
      core::log(core::log_level::DEBUG, "workload", "previous scan still running; serving last workload state");
    } else {
      gate_.mark(now);
      try {
        pending_ = std::async(std::launch::async, [table = table_, min_gb = min_workload_memory_gb_, hint] {
          return scan_processes(table, min_gb, hint);
        });
      } catch (const std::system_error& ex) {
        core::log(core::log_level::WARNING, "workload",
                  std::string("cannot start scan worker (") + ex.what() + "); scanning inline");
        latest_ = scan_processes(table_, min_workload_memory_gb_, hint);
        return true;
      }
    }
  }

  if (!pending_.valid()) {
    return false;
  }
  return collect_pending(budget);
}

bool WorkloadDetector::collect_pending(const std::chrono::milliseconds budget) {
  if (budget == std::chrono::milliseconds::max()) {
    pending_.wait();
  } else if (pending_.wait_for(budget) != std::future_status::ready) {
    return false;
  }

  try {
    latest_ = pending_.get();
  } catch (const std::exception& ex) {
    core::log(core::log_level::ERROR, "workload", std::string("scan failed: ") + ex.what());
    return false;
  }
  return true;
}

const model::workload_state& WorkloadDetector::latest() const noexcept { return latest_; }

bool WorkloadDetector::scan_in_flight() const noexcept { return pending_.valid(); }

std::size_t WorkloadDetector::overlapping_scans_skipped() const noexcept { return overlapping_scans_skipped_; }

}  // namespace hw_guard::sensors
