#pragma once

#include <cstdio>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/safety_state.hpp"

namespace hw_guard::sinks {

class StdoutDebugSink {
 public:
  explicit StdoutDebugSink(std::FILE* out = stdout) noexcept;

  void publish(const nlohmann::json& summary, const std::vector<model::telemetry_record>& devices) const;

  static std::string format_line(const nlohmann::json& summary, const std::vector<model::telemetry_record>& devices);

 private:
  std::FILE* out_;
};

}  // namespace hw_guard::sinks
