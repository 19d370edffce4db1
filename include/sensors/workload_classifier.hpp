#pragma once

#include <cstdint>
#include <string>

#include "model/safety_state.hpp"

namespace hw_guard::sensors {

struct classification {
  model::framework_kind framework{model::framework_kind::UNKNOWN};
  model::model_kind model{model::model_kind::UNKNOWN};
  model::workload_kind workload{model::workload_kind::UNKNOWN};
  float confidence{0.0F};
};

// Minimum confidence for a process to count as an ML workload.
inline constexpr float kMinWorkloadConfidence = 0.3F;

// Substring classification of a command line against ordered per-axis tables.
// Matching is case-insensitive and the first matching kind on each axis wins.
classification classify_cmdline(const std::string& cmdline);

[[nodiscard]] inline bool is_ml_workload(const classification& result) noexcept {
  return result.confidence > kMinWorkloadConfidence;
}

// Heuristic likelihood in [0,1] that a process is what drives the devices.
float correlation_score(double memory_gb, std::uint32_t threads, const model::telemetry_hint& hint) noexcept;

}  // namespace hw_guard::sensors
