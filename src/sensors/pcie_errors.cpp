#include "sensors/pcie_errors.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>
#include <utility>

#include "core/log.hpp"

namespace hw_guard::sensors {
namespace {

struct signature {
  const char* name;
  std::string_view needle;
  // When set, must appear after `needle` on the same line.
  std::string_view followed_by;
};

constexpr signature kSignatures[] = {
    {"dpc containment", "dpc: containment event", {}},
    {"pcie bus error", "pcie bus error", {}},
    {"uncorrectable error", "unmasked uncorrectable error", {}},
    {"symbol error", "sdes", {}},
    {"aer recovery failed", "aer: device recovery failed", {}},
    {"tenstorrent aer", "tenstorrent", "aer:"},
};

std::string lowercase(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  std::transform(text.begin(), text.end(), std::back_inserter(out),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool signature_matches(const signature& sig, const std::string_view text) {
  const auto pos = text.find(sig.needle);
  if (pos == std::string_view::npos) {
    return false;
  }
  return sig.followed_by.empty() || text.find(sig.followed_by, pos + sig.needle.size()) != std::string_view::npos;
}

}  // namespace

PcieErrorDetector::PcieErrorDetector(const std::chrono::seconds window, const std::uint32_t max_errors_before_disable,
                                     std::unique_ptr<KernelLogSource> source, core::clock_fn clock)
    : window_(window),
      max_errors_(max_errors_before_disable),
      source_(source ? std::move(source) : make_none_source()),
      clock_(std::move(clock)) {}

const char* PcieErrorDetector::match_signature(const std::string& line) {
  const std::string lower = lowercase(line);
  for (const auto& sig : kSignatures) {
    if (signature_matches(sig, lower)) {
      return sig.name;
    }
  }
  return nullptr;
}

std::uint32_t PcieErrorDetector::count_signatures(const std::string& line) {
  const std::string lower = lowercase(line);
  std::uint32_t count = 0;
  for (const auto& sig : kSignatures) {
    if (signature_matches(sig, lower)) {
      ++count;
    }
  }
  return count;
}

error_check PcieErrorDetector::check_for_errors() {
  error_check result{};
  last_check_ = clock_();

  auto lines = source_->read_recent(window_);
  if (!lines.ok()) {
    if (source_available_) {
      core::log(core::log_level::WARNING, "pcie",
                std::string(source_->name()) + " unavailable (" + lines.detail + "); assuming no errors");
    }
    source_available_ = false;
    result.source_available = false;
    return result;
  }

  if (!source_available_) {
    core::log(core::log_level::INFO, "pcie", std::string(source_->name()) + " readable again");
  }
  source_available_ = true;

  // Each signature a line matches adds one error. Consecutive windows overlap, so an
  // event still inside the window is counted again by the next check.
  for (auto& line : lines.value) {
    const std::uint32_t hits = count_signatures(line);
    if (hits == 0) {
      continue;
    }
    error_count_ += hits;
    core::log(core::log_level::WARNING, "pcie", std::string(match_signature(line)) + ": " + line);
    result.matched_lines.push_back(std::move(line));
  }

  result.found = !result.matched_lines.empty();
  if (result.found && should_disable_monitoring()) {
    core::log(core::log_level::ERROR, "pcie",
              "error count " + std::to_string(error_count_) + " reached limit " + std::to_string(max_errors_) +
                  "; monitoring disabled until reset");
  }
  return result;
}

bool PcieErrorDetector::should_disable_monitoring() const noexcept { return error_count_ >= max_errors_; }

void PcieErrorDetector::reset_error_count() {
  if (error_count_ > 0) {
    core::log(core::log_level::INFO, "pcie", "error count reset from " + std::to_string(error_count_));
  }
  error_count_ = 0;
}

std::uint32_t PcieErrorDetector::error_count() const noexcept { return error_count_; }

bool PcieErrorDetector::log_source_available() const noexcept { return source_available_; }

std::optional<core::steady_clock::time_point> PcieErrorDetector::last_check_time() const noexcept {
  return last_check_;
}

std::chrono::seconds PcieErrorDetector::window() const noexcept { return window_; }

}  // namespace hw_guard::sensors
