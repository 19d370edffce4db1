#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/timestamp.hpp"
#include "model/safety_state.hpp"
#include "sensors/hwmon_telemetry.hpp"
#include "sensors/kernel_log.hpp"
#include "sensors/pcie_errors.hpp"
#include "sensors/process_table.hpp"
#include "sensors/workload_classifier.hpp"
#include "sensors/workload_detector.hpp"

using hw_guard::core::probe;
using hw_guard::model::framework_kind;
using hw_guard::model::model_kind;
using hw_guard::model::telemetry_hint;
using hw_guard::model::workload_kind;
using hw_guard::sensors::HwmonTelemetry;
using hw_guard::sensors::KernelLogSource;
using hw_guard::sensors::PcieErrorDetector;
using hw_guard::sensors::ProcessTable;
using hw_guard::sensors::WorkloadDetector;
using hw_guard::sensors::classify_cmdline;
using hw_guard::sensors::correlation_score;
using hw_guard::sensors::is_ml_workload;

namespace fs = std::filesystem;

namespace {

bool almost_equal(double a, double b, double eps = 1e-4) { return std::fabs(a - b) <= eps; }

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

fs::path make_temp_dir(const char* tag) {
  std::string pattern = (fs::temp_directory_path() / (std::string("hw_guard_") + tag + "_XXXXXX")).string();
  if (mkdtemp(pattern.data()) == nullptr) {
    throw std::runtime_error("mkdtemp failed");
  }
  return fs::path(pattern);
}

void write_file(const fs::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary);
  out << content;
}

// argv is NUL-separated in procfs.
void add_fake_process(const fs::path& proc_root, int pid, const std::string& nul_cmdline, unsigned long long rss_kb,
                      unsigned threads) {
  const fs::path dir = proc_root / std::to_string(pid);
  fs::create_directories(dir);
  write_file(dir / "cmdline", nul_cmdline);
  write_file(dir / "status", "Name:\tfake\nVmRSS:\t" + std::to_string(rss_kb) + " kB\nThreads:\t" +
                                 std::to_string(threads) + "\n");
}

std::string argv_of(const std::vector<std::string>& args) {
  std::string out;
  for (const auto& arg : args) {
    out += arg;
    out.push_back('\0');
  }
  return out;
}

class ScriptedLogSource final : public KernelLogSource {
 public:
  ScriptedLogSource(std::vector<std::vector<std::string>> batches, bool available)
      : batches_(std::move(batches)), available_(available) {}

  probe<std::vector<std::string>> read_recent(std::chrono::seconds /*window*/) override {
    if (!available_) {
      return probe<std::vector<std::string>>::defaulted({}, "permission denied");
    }
    if (next_ >= batches_.size()) {
      return probe<std::vector<std::string>>::success({});
    }
    return probe<std::vector<std::string>>::success(batches_[next_++]);
  }

  const char* name() const noexcept override { return "scripted"; }

 private:
  std::vector<std::vector<std::string>> batches_;
  bool available_;
  std::size_t next_{0};
};

int test_classifier_torchrun_training() {
  const auto result = classify_cmdline("torchrun --nproc_per_node=8 train_llama.py");
  if (result.framework != framework_kind::PYTORCH) {
    return fail("test_classifier_torchrun_training", "torchrun should classify as pytorch");
  }
  if (result.workload != workload_kind::TRAINING) {
    return fail("test_classifier_torchrun_training", "train_llama.py should classify as training");
  }
  if (result.model != model_kind::LLM) {
    return fail("test_classifier_torchrun_training", "llama should classify as llm");
  }
  if (!(result.confidence > 0.7F) || !is_ml_workload(result)) {
    return fail("test_classifier_torchrun_training", "confidence should exceed 0.7");
  }
  return 0;
}

int test_classifier_plain_script_is_unknown() {
  const auto result = classify_cmdline("python script.py");
  if (result.framework != framework_kind::UNKNOWN || result.model != model_kind::UNKNOWN ||
      result.workload != workload_kind::UNKNOWN) {
    return fail("test_classifier_plain_script_is_unknown", "plain script should be unknown on every axis");
  }
  if (result.confidence > 0.3F || is_ml_workload(result)) {
    return fail("test_classifier_plain_script_is_unknown", "plain script must not count as a workload");
  }

  const auto mixed_case = classify_cmdline("/usr/bin/python3 -m TensorFlow.serve --model mobilenet_v2");
  if (mixed_case.framework != framework_kind::TENSORFLOW || mixed_case.model != model_kind::COMPUTER_VISION ||
      mixed_case.workload != workload_kind::INFERENCE) {
    return fail("test_classifier_plain_script_is_unknown", "matching should be case-insensitive");
  }

  const auto model_only = classify_cmdline("python eval_whisper.py");
  if (model_only.framework != framework_kind::UNKNOWN || model_only.model != model_kind::AUDIO_SPEECH ||
      !almost_equal(model_only.confidence, 0.7)) {
    return fail("test_classifier_plain_script_is_unknown", "model-only match should score 0.7");
  }
  return 0;
}

int test_classifier_framework_row_order() {
  const auto launcher = classify_cmdline("python -m accelerate launch train.py");
  if (launcher.framework != framework_kind::PYTORCH || launcher.workload != workload_kind::TRAINING) {
    return fail("test_classifier_framework_row_order", "accelerate launcher should classify as pytorch training");
  }

  const auto pipeline = classify_cmdline("python run_transformers_pipeline.py");
  if (pipeline.framework != framework_kind::PYTORCH) {
    return fail("test_classifier_framework_row_order", "transformers should hit the pytorch row first");
  }

  const auto peft = classify_cmdline("python -m peft.tuners --model llama");
  if (peft.framework != framework_kind::HUGGINGFACE) {
    return fail("test_classifier_framework_row_order", "peft should classify as huggingface");
  }

  const auto benchmarks = classify_cmdline("python3 tf_cnn_benchmarks.py --batch_size=64");
  if (benchmarks.framework != framework_kind::TENSORFLOW || benchmarks.workload != workload_kind::EVALUATION) {
    return fail("test_classifier_framework_row_order", "tf_ prefix should classify as tensorflow");
  }
  return 0;
}

int test_correlation_score_thresholds() {
  const telemetry_hint idle{};
  if (!almost_equal(correlation_score(0.5, 2, idle), 0.0)) {
    return fail("test_correlation_score_thresholds", "small idle process should score zero");
  }
  if (!almost_equal(correlation_score(5.0, 10, idle), 0.4)) {
    return fail("test_correlation_score_thresholds", "mid memory and threads should score 0.2 + 0.2");
  }

  telemetry_hint busy{};
  busy.average_power_w = 75.0;
  busy.average_current_a = 45.0;
  if (!almost_equal(correlation_score(16.0, 32, busy), 1.0)) {
    return fail("test_correlation_score_thresholds", "score must be capped at 1.0");
  }

  telemetry_hint warm{};
  warm.average_power_w = 40.0;
  warm.average_current_a = 25.0;
  if (!almost_equal(correlation_score(0.0, 0, warm), 0.3)) {
    return fail("test_correlation_score_thresholds", "mid power and current should score 0.2 + 0.1");
  }
  return 0;
}

int test_process_table_skips_vanished_processes() {
  const fs::path root = make_temp_dir("proc_skip");
  add_fake_process(root, 100, argv_of({"python", "script.py"}), 2048, 1);
  fs::create_directories(root / "200");  // no cmdline: exited mid-scan
  fs::create_directories(root / "self");
  fs::create_directories(root / "sys");

  const ProcessTable table(root.string());
  const auto pids = table.list_pids();
  if (pids.size() != 2) {
    fs::remove_all(root);
    return fail("test_process_table_skips_vanished_processes", "only numeric entries should be listed");
  }

  const auto alive = table.read_process(100);
  const auto gone = table.read_process(200);
  fs::remove_all(root);

  if (!alive.ok() || alive.value.cmdline != "python script.py" || alive.value.rss_kb != 2048 ||
      alive.value.threads != 1) {
    return fail("test_process_table_skips_vanished_processes", "cmdline or status parsed incorrectly");
  }
  if (gone.status != hw_guard::core::outcome::SKIPPED) {
    return fail("test_process_table_skips_vanished_processes", "missing process should be SKIPPED");
  }
  return 0;
}

int test_workload_scan_over_fake_proc() {
  const fs::path root = make_temp_dir("proc_scan");
  add_fake_process(root, 10, argv_of({"torchrun", "--nproc_per_node=8", "train_llama.py"}), 9ULL * 1024 * 1024, 24);
  add_fake_process(root, 11, argv_of({"python", "script.py"}), 512, 1);
  add_fake_process(root, 12, argv_of({"python", "infer_bert.py"}), 1024, 2);
  add_fake_process(root, 13, "", 0, 1);  // kernel thread
  fs::create_directories(root / "14");

  const ProcessTable table(root.string());
  const auto state = WorkloadDetector::scan_processes(table, 1.0, telemetry_hint{});
  fs::remove_all(root);

  if (state.total_ml_processes != 2 || state.active_ml_workloads.size() != 2) {
    return fail("test_workload_scan_over_fake_proc", "expected exactly two ML processes");
  }
  if (state.active_ml_workloads.front().pid != 10) {
    return fail("test_workload_scan_over_fake_proc", "records should be ordered by correlation score");
  }
  if (!almost_equal(state.active_ml_workloads.front().correlation_score, 0.7)) {
    return fail("test_workload_scan_over_fake_proc", "9GB and 24 threads should score 0.4 + 0.3");
  }
  if (state.skipped_processes != 1) {
    return fail("test_workload_scan_over_fake_proc", "unreadable process should be counted as skipped");
  }
  if (state.high_memory_processes != 1 || !state.is_workload_active) {
    return fail("test_workload_scan_over_fake_proc", "large torchrun process should make the workload active");
  }
  return 0;
}

int test_workload_idle_host_is_inactive() {
  const fs::path root = make_temp_dir("proc_idle");
  add_fake_process(root, 1, argv_of({"/sbin/init"}), 4096, 1);
  add_fake_process(root, 2, argv_of({"python", "script.py"}), 1024, 1);

  const ProcessTable table(root.string());
  const auto state = WorkloadDetector::scan_processes(table, 1.0, telemetry_hint{});
  fs::remove_all(root);

  if (state.is_workload_active || !state.active_ml_workloads.empty()) {
    return fail("test_workload_idle_host_is_inactive", "idle host should not report a workload");
  }

  const fs::path big_root = make_temp_dir("proc_big");
  add_fake_process(big_root, 3, argv_of({"/usr/bin/database"}), 3ULL * 1024 * 1024, 4);
  const ProcessTable big_table(big_root.string());
  const auto big_state = WorkloadDetector::scan_processes(big_table, 1.0, telemetry_hint{});
  fs::remove_all(big_root);

  if (!big_state.is_workload_active || big_state.total_ml_processes != 0) {
    return fail("test_workload_idle_host_is_inactive", "a high-memory non-ML process should still mark activity");
  }
  return 0;
}

int test_workload_detector_interval_gate() {
  const fs::path root = make_temp_dir("proc_gate");
  add_fake_process(root, 10, argv_of({"python", "train.py"}), 1024, 1);

  auto now = std::make_shared<hw_guard::core::steady_clock::time_point>(hw_guard::core::steady_clock::now());
  WorkloadDetector detector(1.0, std::chrono::milliseconds(1000), root.string(), [now] { return *now; });

  if (!detector.refresh(telemetry_hint{}, std::chrono::milliseconds::max())) {
    fs::remove_all(root);
    return fail("test_workload_detector_interval_gate", "first refresh should publish a state");
  }
  if (detector.latest().total_ml_processes != 1) {
    fs::remove_all(root);
    return fail("test_workload_detector_interval_gate", "first scan should find the training process");
  }

  add_fake_process(root, 11, argv_of({"python", "finetune.py"}), 1024, 1);
  if (detector.refresh(telemetry_hint{}, std::chrono::milliseconds::max()) || detector.latest().total_ml_processes != 1) {
    fs::remove_all(root);
    return fail("test_workload_detector_interval_gate", "refresh inside the interval must serve the previous state");
  }

  *now += std::chrono::milliseconds(1000);
  const bool refreshed = detector.refresh(telemetry_hint{}, std::chrono::milliseconds::max());
  fs::remove_all(root);
  if (!refreshed || detector.latest().total_ml_processes != 2) {
    return fail("test_workload_detector_interval_gate", "refresh after the interval should rescan");
  }
  return 0;
}

int test_workload_detector_skips_overlapping_scan() {
  const fs::path root = make_temp_dir("proc_overlap");
  const fs::path blocked = root / "50";
  fs::create_directories(blocked);
  write_file(blocked / "status", "VmRSS:\t1024 kB\nThreads:\t1\n");
  const std::string fifo = (blocked / "cmdline").string();
  if (mkfifo(fifo.c_str(), 0600) != 0) {
    fs::remove_all(root);
    return fail("test_workload_detector_skips_overlapping_scan", "mkfifo failed");
  }

  auto now = std::make_shared<hw_guard::core::steady_clock::time_point>(hw_guard::core::steady_clock::now());
  WorkloadDetector detector(1.0, std::chrono::milliseconds(1000), root.string(), [now] { return *now; });

  // The worker blocks opening the FIFO until a writer appears.
  const bool first = detector.refresh(telemetry_hint{}, std::chrono::milliseconds(20));
  *now += std::chrono::milliseconds(1000);
  const bool second = detector.refresh(telemetry_hint{}, std::chrono::milliseconds(20));
  const bool in_flight = detector.scan_in_flight();
  const std::size_t skipped = detector.overlapping_scans_skipped();

  const int writer = open(fifo.c_str(), O_WRONLY);
  if (writer >= 0) {
    const std::string payload = argv_of({"python", "train.py"});
    (void)write(writer, payload.data(), payload.size());
    close(writer);
  }

  const bool collected = detector.refresh(telemetry_hint{}, std::chrono::milliseconds::max());
  fs::remove_all(root);

  if (first || second || !in_flight) {
    return fail("test_workload_detector_skips_overlapping_scan", "blocked scan should leave the stale state in place");
  }
  if (skipped != 1) {
    return fail("test_workload_detector_skips_overlapping_scan", "due scan should be skipped while one is in flight");
  }
  if (writer < 0 || !collected || detector.latest().total_ml_processes != 1) {
    return fail("test_workload_detector_skips_overlapping_scan", "unblocked scan should publish its result");
  }
  return 0;
}

int test_pcie_signature_matching() {
  const std::vector<std::string> matching = {
      "[Mon Oct 19 10:00:00 2026] pcieport 0000:00:01.0: DPC: containment event, status:0x1f01",
      "pcieport 0000:00:1c.0: PCIe Bus Error: severity=Corrected, type=Physical Layer",
      "tenstorrent 0000:01:00.0: AER: Multiple Uncorrected (Fatal) error received",
      "  [ 0] RxErr  Unmasked Uncorrectable Error",
      "pcieport 0000:00:01.0: AER: device recovery failed",
  };
  for (const auto& line : matching) {
    if (PcieErrorDetector::match_signature(line) == nullptr) {
      return fail("test_pcie_signature_matching", "known interference signature was not matched");
    }
  }

  const std::vector<std::string> benign = {
      "tenstorrent 0000:01:00.0: firmware loaded",
      "aer: enabled with IRQ 24 (tenstorrent mentioned later)",
      "usb 1-1: new high-speed USB device number 2",
  };
  for (const auto& line : benign) {
    if (PcieErrorDetector::match_signature(line) != nullptr) {
      return fail("test_pcie_signature_matching", "benign line should not match");
    }
  }
  return 0;
}

int test_pcie_disable_latch_until_reset() {
  auto source = std::make_unique<ScriptedLogSource>(
      std::vector<std::vector<std::string>>{
          {"pcieport 0000:00:01.0: DPC: containment event"},
          {"kernel: eth0 link up", "pcieport 0000:00:01.0: PCIe Bus Error: severity=Uncorrected"},
      },
      true);
  PcieErrorDetector detector(std::chrono::seconds(60), 2, std::move(source));

  const auto first = detector.check_for_errors();
  if (!first.found || first.matched_lines.size() != 1 || detector.should_disable_monitoring()) {
    return fail("test_pcie_disable_latch_until_reset", "one match must not disable yet");
  }

  const auto second = detector.check_for_errors();
  if (!second.found || detector.error_count() != 2 || !detector.should_disable_monitoring()) {
    return fail("test_pcie_disable_latch_until_reset", "second match should reach the limit");
  }

  for (int i = 0; i < 5; ++i) {
    const auto quiet = detector.check_for_errors();
    if (quiet.found || !detector.should_disable_monitoring()) {
      return fail("test_pcie_disable_latch_until_reset", "disable must hold across quiet checks");
    }
  }
  if (!detector.last_check_time().has_value()) {
    return fail("test_pcie_disable_latch_until_reset", "last check time should be recorded");
  }

  detector.reset_error_count();
  if (detector.should_disable_monitoring() || detector.error_count() != 0) {
    return fail("test_pcie_disable_latch_until_reset", "reset should clear the latch");
  }
  return 0;
}

int test_pcie_unavailable_source_is_not_fatal() {
  PcieErrorDetector detector(std::chrono::seconds(60), 1,
                             std::make_unique<ScriptedLogSource>(std::vector<std::vector<std::string>>{}, false));

  const auto check = detector.check_for_errors();
  if (check.found || check.source_available || detector.log_source_available()) {
    return fail("test_pcie_unavailable_source_is_not_fatal", "unavailable log should read as no errors");
  }
  if (detector.should_disable_monitoring()) {
    return fail("test_pcie_unavailable_source_is_not_fatal", "unavailable log must not disable monitoring");
  }

  auto none = hw_guard::sensors::make_none_source();
  if (none->read_recent(std::chrono::seconds(60)).status != hw_guard::core::outcome::DEFAULTED) {
    return fail("test_pcie_unavailable_source_is_not_fatal", "none source should always default");
  }

  bool threw = false;
  try {
    (void)hw_guard::sensors::make_log_source("journal", std::chrono::milliseconds(100));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_pcie_unavailable_source_is_not_fatal", "unknown log source kind should throw");
  }
  return 0;
}

int test_pcie_line_counts_every_signature() {
  const std::string both = "tenstorrent 0000:01:00.0: PCIe Bus Error: severity=Corrected, AER: status 0x1";
  if (PcieErrorDetector::count_signatures(both) != 2) {
    return fail("test_pcie_line_counts_every_signature", "line should match the bus error and tenstorrent aer");
  }
  if (PcieErrorDetector::count_signatures("usb 1-1: new device") != 0) {
    return fail("test_pcie_line_counts_every_signature", "benign line should match nothing");
  }

  PcieErrorDetector detector(std::chrono::seconds(60), 2,
                             std::make_unique<ScriptedLogSource>(std::vector<std::vector<std::string>>{{both}}, true));
  const auto check = detector.check_for_errors();
  if (!check.found || check.matched_lines.size() != 1) {
    return fail("test_pcie_line_counts_every_signature", "the line should be reported once");
  }
  if (detector.error_count() != 2 || !detector.should_disable_monitoring()) {
    return fail("test_pcie_line_counts_every_signature", "each matched signature should add one error");
  }
  return 0;
}

// Puts an executable `dmesg` built from `body` first on PATH for the lifetime of the object.
class FakeDmesg {
 public:
  FakeDmesg(const char* tag, const std::string& body, bool keep_system_path = true)
      : dir_(make_temp_dir(tag)), saved_path_(std::getenv("PATH") != nullptr ? std::getenv("PATH") : "") {
    if (!body.empty()) {
      const fs::path script = dir_ / "dmesg";
      write_file(script, "#!/bin/sh\n" + body);
      if (chmod(script.c_str(), 0755) != 0) {
        throw std::runtime_error("chmod failed on fake dmesg");
      }
    }
    const std::string path = keep_system_path ? dir_.string() + ":" + saved_path_ : dir_.string();
    setenv("PATH", path.c_str(), 1);
  }

  ~FakeDmesg() {
    setenv("PATH", saved_path_.c_str(), 1);
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  FakeDmesg(const FakeDmesg&) = delete;
  FakeDmesg& operator=(const FakeDmesg&) = delete;

 private:
  fs::path dir_;
  std::string saved_path_;
};

int test_dmesg_source_reads_child_output() {
  FakeDmesg fake("dmesg_ok",
                 "echo \"args: $*\"\n"
                 "echo 'tenstorrent 0000:01:00.0: PCIe Bus Error: severity=Corrected, AER: status 0x1'\n"
                 "echo 'usb 1-1: new device'\n");
  auto source = hw_guard::sensors::make_dmesg_source(std::chrono::milliseconds(2000));

  const auto lines = source->read_recent(std::chrono::seconds(45));
  if (!lines.ok() || lines.value.size() != 3) {
    return fail("test_dmesg_source_reads_child_output", "dmesg output should be split into lines");
  }
  if (lines.value[0] != "args: -T --since 45 seconds ago") {
    return fail("test_dmesg_source_reads_child_output", "dmesg should be asked for the detection window");
  }

  PcieErrorDetector detector(std::chrono::seconds(45), 5,
                             hw_guard::sensors::make_dmesg_source(std::chrono::milliseconds(2000)));
  const auto check = detector.check_for_errors();
  if (!check.source_available || check.matched_lines.size() != 1 || detector.error_count() != 2) {
    return fail("test_dmesg_source_reads_child_output", "two-signature line should add two errors");
  }
  return 0;
}

int test_dmesg_source_failures_default() {
  {
    FakeDmesg fake("dmesg_denied", "echo 'dmesg: read kernel buffer failed' >&2\nexit 1\n");
    auto source = hw_guard::sensors::make_dmesg_source(std::chrono::milliseconds(2000));
    const auto lines = source->read_recent(std::chrono::seconds(60));
    if (lines.status != hw_guard::core::outcome::DEFAULTED || !lines.value.empty() ||
        lines.detail.find("status 1") == std::string::npos) {
      return fail("test_dmesg_source_failures_default", "non-zero exit should default");
    }
  }

  {
    FakeDmesg missing("dmesg_missing", "", false);
    auto source = hw_guard::sensors::make_dmesg_source(std::chrono::milliseconds(2000));
    const auto lines = source->read_recent(std::chrono::seconds(60));
    if (lines.status != hw_guard::core::outcome::DEFAULTED || lines.detail != "dmesg not available") {
      return fail("test_dmesg_source_failures_default", "missing binary should default");
    }
  }

  {
    FakeDmesg hung("dmesg_hung", "exec sleep 10\n");
    const auto started = std::chrono::steady_clock::now();
    auto source = hw_guard::sensors::make_dmesg_source(std::chrono::milliseconds(300));
    const auto lines = source->read_recent(std::chrono::seconds(60));
    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (lines.status != hw_guard::core::outcome::DEFAULTED || lines.detail.find("timed out") == std::string::npos) {
      return fail("test_dmesg_source_failures_default", "hung dmesg should time out");
    }
    if (elapsed < std::chrono::milliseconds(250) || elapsed > std::chrono::seconds(3)) {
      return fail("test_dmesg_source_failures_default", "timeout should bound the read");
    }
    // The killed child must already be reaped.
    if (waitpid(-1, nullptr, WNOHANG) > 0) {
      return fail("test_dmesg_source_failures_default", "timed out child was left unreaped");
    }
  }
  return 0;
}

int test_hwmon_telemetry_reads_tenstorrent_nodes() {
  const fs::path root = make_temp_dir("hwmon");
  fs::create_directories(root / "hwmon0");
  fs::create_directories(root / "hwmon1");
  fs::create_directories(root / "hwmon2");
  write_file(root / "hwmon0" / "name", "coretemp\n");
  write_file(root / "hwmon0" / "temp1_input", "50000\n");
  write_file(root / "hwmon1" / "name", "wormhole\n");
  write_file(root / "hwmon1" / "temp1_input", "45500\n");
  write_file(root / "hwmon1" / "power1_input", "35000000\n");
  write_file(root / "hwmon1" / "curr1_input", "25000\n");
  write_file(root / "hwmon1" / "in0_input", "800\n");
  write_file(root / "hwmon2" / "name", "blackhole\n");

  HwmonTelemetry telemetry(root.string());
  if (telemetry.device_count() != 2) {
    fs::remove_all(root);
    return fail("test_hwmon_telemetry_reads_tenstorrent_nodes", "only Tenstorrent nodes should be discovered");
  }

  const auto record = telemetry.read(0);
  const auto again = telemetry.read(0);
  bool missing_temp_threw = false;
  try {
    (void)telemetry.read(1);
  } catch (const std::runtime_error&) {
    missing_temp_threw = true;
  }
  bool bad_index_threw = false;
  try {
    (void)telemetry.read(7);
  } catch (const std::runtime_error&) {
    bad_index_threw = true;
  }
  fs::remove_all(root);

  if (!almost_equal(record.asic_temperature_c, 45.5) || !almost_equal(record.power_w, 35.0) ||
      !almost_equal(record.current_a, 25.0) || !almost_equal(record.voltage_v, 0.8)) {
    return fail("test_hwmon_telemetry_reads_tenstorrent_nodes", "hwmon units converted incorrectly");
  }
  if (again.heartbeat != record.heartbeat + 1) {
    return fail("test_hwmon_telemetry_reads_tenstorrent_nodes", "heartbeat should advance per read");
  }
  if (!missing_temp_threw || !bad_index_threw) {
    return fail("test_hwmon_telemetry_reads_tenstorrent_nodes", "failed reads must throw");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_classifier_torchrun_training(); rc != 0) return rc;
  if (int rc = test_classifier_plain_script_is_unknown(); rc != 0) return rc;
  if (int rc = test_classifier_framework_row_order(); rc != 0) return rc;
  if (int rc = test_correlation_score_thresholds(); rc != 0) return rc;
  if (int rc = test_process_table_skips_vanished_processes(); rc != 0) return rc;
  if (int rc = test_workload_scan_over_fake_proc(); rc != 0) return rc;
  if (int rc = test_workload_idle_host_is_inactive(); rc != 0) return rc;
  if (int rc = test_workload_detector_interval_gate(); rc != 0) return rc;
  if (int rc = test_workload_detector_skips_overlapping_scan(); rc != 0) return rc;
  if (int rc = test_pcie_signature_matching(); rc != 0) return rc;
  if (int rc = test_pcie_disable_latch_until_reset(); rc != 0) return rc;
  if (int rc = test_pcie_unavailable_source_is_not_fatal(); rc != 0) return rc;
  if (int rc = test_pcie_line_counts_every_signature(); rc != 0) return rc;
  if (int rc = test_dmesg_source_reads_child_output(); rc != 0) return rc;
  if (int rc = test_dmesg_source_failures_default(); rc != 0) return rc;
  if (int rc = test_hwmon_telemetry_reads_tenstorrent_nodes(); rc != 0) return rc;

  std::cout << "[PASS] sensors unit tests\n";
  return 0;
}
