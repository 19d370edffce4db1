#pragma once

#include <algorithm>
#include <cstdint>

namespace hw_guard::core {

inline constexpr float clamp01(const float value) noexcept {
  return std::clamp(value, 0.0F, 1.0F);
}

inline constexpr double kib_to_gib(const std::uint64_t kib) noexcept {
  return static_cast<double>(kib) / (1024.0 * 1024.0);
}

}  // namespace hw_guard::core
