#pragma once

#include <chrono>
#include <cstddef>
#include <future>
#include <string>

#include "core/interval_gate.hpp"
#include "core/timestamp.hpp"
#include "model/safety_state.hpp"
#include "sensors/process_table.hpp"

namespace hw_guard::sensors {

class WorkloadDetector {
 public:
  WorkloadDetector(double min_workload_memory_gb, std::chrono::milliseconds check_interval,
                   std::string proc_root = "/proc", core::clock_fn clock = core::system_steady_clock());
  ~WorkloadDetector();

  WorkloadDetector(const WorkloadDetector&) = delete;
  WorkloadDetector& operator=(const WorkloadDetector&) = delete;

  // Full scan on the calling thread; the result becomes latest().
  model::workload_state detect_active_workloads(const model::telemetry_hint& hint);

  // Starts a background scan when the check interval has elapsed and none is in flight,
  // then waits at most `budget` for the in-flight scan. Returns true when a new state
  // was published; otherwise latest() still holds the previous one.
  bool refresh(const model::telemetry_hint& hint, std::chrono::milliseconds budget);

  [[nodiscard]] const model::workload_state& latest() const noexcept;
  [[nodiscard]] bool scan_in_flight() const noexcept;
  [[nodiscard]] std::size_t overlapping_scans_skipped() const noexcept;

  static model::workload_state scan_processes(const ProcessTable& table, double min_workload_memory_gb,
                                              const model::telemetry_hint& hint);

 private:
  bool collect_pending(std::chrono::milliseconds budget);

  ProcessTable table_;
  double min_workload_memory_gb_;
  core::IntervalGate gate_;
  core::clock_fn clock_;
  std::future<model::workload_state> pending_{};
  model::workload_state latest_{};
  std::size_t overlapping_scans_skipped_{0};
};

}  // namespace hw_guard::sensors
