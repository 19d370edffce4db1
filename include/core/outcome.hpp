#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace hw_guard::core {

// How a best-effort environment probe ended.
//   OK        the value was read.
//   SKIPPED   the subject went away or was inaccessible; callers drop it and continue.
//   DEFAULTED the source is unavailable; value holds the conservative default.
enum class outcome : std::uint8_t {
  OK = 0,
  SKIPPED = 1,
  DEFAULTED = 2,
};

template <typename T>
struct probe {
  outcome status{outcome::OK};
  T value{};
  std::string detail{};

  [[nodiscard]] bool ok() const noexcept { return status == outcome::OK; }

  static probe success(T v) { return probe{outcome::OK, std::move(v), {}}; }
  static probe skipped(std::string why) { return probe{outcome::SKIPPED, T{}, std::move(why)}; }
  static probe defaulted(T v, std::string why) { return probe{outcome::DEFAULTED, std::move(v), std::move(why)}; }
};

}  // namespace hw_guard::core
