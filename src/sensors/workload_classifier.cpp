#include "sensors/workload_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>
#include <utility>
#include <vector>

#include "core/math.hpp"

namespace hw_guard::sensors {
namespace {

constexpr float kFrameworkScore = 0.8F;
constexpr float kModelScore = 0.7F;
constexpr float kWorkloadScore = 0.6F;

template <typename Kind>
struct pattern_row {
  Kind kind;
  std::vector<std::string_view> needles;
};

// Rows are tried in order; the first row with a matching needle wins.
const pattern_row<model::framework_kind> kFrameworkPatterns[] = {
    {model::framework_kind::PYTORCH, {"torch", "torchrun", "pytorch", "transformers", "accelerate", "deepspeed",
                                      "lightning"}},
    {model::framework_kind::TENSORFLOW, {"tensorflow", "tf.", "keras", "tf_"}},
    {model::framework_kind::JAX, {"jax", "flax", "optax", "dm-haiku", "haiku"}},
    {model::framework_kind::HUGGINGFACE, {"transformers", "accelerate", "datasets", "peft"}},
};

const pattern_row<model::model_kind> kModelPatterns[] = {
    {model::model_kind::LLM, {"gpt", "bert", "roberta", "llama", "mistral", "falcon", "bloom", "t5", "bart"}},
    {model::model_kind::COMPUTER_VISION, {"resnet", "vgg", "inception", "mobilenet", "efficientnet", "yolo", "rcnn",
                                          "unet", "segformer"}},
    {model::model_kind::AUDIO_SPEECH, {"whisper", "wav2vec", "hubert", "speechbrain", "espnet"}},
};

const pattern_row<model::workload_kind> kWorkloadPatterns[] = {
    {model::workload_kind::TRAINING, {"train", "finetune", "fine-tune", "fit"}},
    {model::workload_kind::INFERENCE, {"inference", "infer", "predict", "generate", "serve"}},
    {model::workload_kind::EVALUATION, {"eval", "test", "benchmark"}},
};

template <typename Kind, std::size_t N>
Kind first_match(const pattern_row<Kind> (&table)[N], const std::string& haystack, const Kind fallback) {
  for (const auto& row : table) {
    for (const std::string_view needle : row.needles) {
      if (haystack.find(needle) != std::string::npos) {
        return row.kind;
      }
    }
  }
  return fallback;
}

}  // namespace

classification classify_cmdline(const std::string& cmdline) {
  std::string lower;
  lower.reserve(cmdline.size());
  std::transform(cmdline.begin(), cmdline.end(), std::back_inserter(lower),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  classification result{};
  result.framework = first_match(kFrameworkPatterns, lower, model::framework_kind::UNKNOWN);
  result.model = first_match(kModelPatterns, lower, model::model_kind::UNKNOWN);
  result.workload = first_match(kWorkloadPatterns, lower, model::workload_kind::UNKNOWN);

  if (result.framework != model::framework_kind::UNKNOWN) {
    result.confidence = std::max(result.confidence, kFrameworkScore);
  }
  if (result.model != model::model_kind::UNKNOWN) {
    result.confidence = std::max(result.confidence, kModelScore);
  }
  if (result.workload != model::workload_kind::UNKNOWN) {
    result.confidence = std::max(result.confidence, kWorkloadScore);
  }
  return result;
}

float correlation_score(const double memory_gb, const std::uint32_t threads, const model::telemetry_hint& hint) noexcept {
  float score = 0.0F;

  if (memory_gb > 8.0) {
    score += 0.4F;
  } else if (memory_gb > 4.0) {
    score += 0.2F;
  }

  if (threads > 16) {
    score += 0.3F;
  } else if (threads > 8) {
    score += 0.2F;
  }

  if (hint.average_power_w > 60.0) {
    score += 0.3F;
  } else if (hint.average_power_w > 30.0) {
    score += 0.2F;
  }

  // Current draw tracks load more closely than power.
  if (hint.average_current_a > 40.0) {
    score += 0.2F;
  } else if (hint.average_current_a > 20.0) {
    score += 0.1F;
  }

  return core::clamp01(score);
}

}  // namespace hw_guard::sensors
