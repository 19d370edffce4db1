#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace hw_guard::model {

enum class framework_kind : std::uint8_t {
    UNKNOWN = 0,
    PYTORCH = 1,
    TENSORFLOW = 2,
    JAX = 3,
    HUGGINGFACE = 4,
};

enum class model_kind : std::uint8_t {
    UNKNOWN = 0,
    LLM = 1,
    COMPUTER_VISION = 2,
    AUDIO_SPEECH = 3,
};

enum class workload_kind : std::uint8_t {
    UNKNOWN = 0,
    TRAINING = 1,
    INFERENCE = 2,
    EVALUATION = 3,
};

enum class poll_mode : std::uint8_t {
    NORMAL = 0,
    WORKLOAD_THROTTLED = 1,
    CRITICAL = 2,
    DISABLED = 3,
    OVERRIDE = 4,
};

enum class safety_override : std::uint8_t {
    AUTO = 0,
    FORCED_ON = 1,
    FORCED_OFF = 2,
};

const char* to_string(framework_kind kind) noexcept;
const char* to_string(model_kind kind) noexcept;
const char* to_string(workload_kind kind) noexcept;
const char* to_string(poll_mode mode) noexcept;
const char* to_string(safety_override value) noexcept;

struct workload_record {
    std::int32_t pid{0};
    std::string cmdline_snippet{};
    framework_kind framework{framework_kind::UNKNOWN};
    model_kind model{model_kind::UNKNOWN};
    workload_kind workload{workload_kind::UNKNOWN};
    float confidence{0.0F};
    float correlation_score{0.0F};
    double memory_gb{0.0};
    std::uint32_t thread_count{0};
};

// Snapshot produced by one process-table scan. Replaced wholesale by the next scan.
struct workload_state {
    std::vector<workload_record> active_ml_workloads{};
    std::size_t total_ml_processes{0};
    double total_ml_memory_gb{0.0};
    std::size_t high_memory_processes{0};
    std::size_t skipped_processes{0};
    bool is_workload_active{false};
    std::uint64_t timestamp_ms{0};
};

// One device readout. Units follow the hwmon ABI after scaling.
struct telemetry_record {
    std::uint32_t device_index{0};
    double voltage_v{0.0};
    double current_a{0.0};
    double power_w{0.0};
    double asic_temperature_c{0.0};
    std::uint64_t heartbeat{0};
};

// Raw SMBUS register dump keyed by register name, values as hex strings.
using smbus_telemetry = std::unordered_map<std::string, std::string>;

// Averages across all devices, used to correlate processes with hardware activity.
struct telemetry_hint {
    double average_power_w{0.0};
    double average_current_a{0.0};
};

}  // namespace hw_guard::model
