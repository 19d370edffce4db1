#include "model/safety_state.hpp"

namespace hw_guard::model {

const char* to_string(const framework_kind kind) noexcept {
  switch (kind) {
    case framework_kind::PYTORCH:
      return "pytorch";
    case framework_kind::TENSORFLOW:
      return "tensorflow";
    case framework_kind::JAX:
      return "jax";
    case framework_kind::HUGGINGFACE:
      return "huggingface";
    case framework_kind::UNKNOWN:
      break;
  }
  return "unknown";
}

const char* to_string(const model_kind kind) noexcept {
  switch (kind) {
    case model_kind::LLM:
      return "llm";
    case model_kind::COMPUTER_VISION:
      return "computer_vision";
    case model_kind::AUDIO_SPEECH:
      return "audio_speech";
    case model_kind::UNKNOWN:
      break;
  }
  return "unknown";
}

const char* to_string(const workload_kind kind) noexcept {
  switch (kind) {
    case workload_kind::TRAINING:
      return "training";
    case workload_kind::INFERENCE:
      return "inference";
    case workload_kind::EVALUATION:
      return "evaluation";
    case workload_kind::UNKNOWN:
      break;
  }
  return "unknown";
}

const char* to_string(const poll_mode mode) noexcept {
  switch (mode) {
    case poll_mode::NORMAL:
      return "normal";
    case poll_mode::WORKLOAD_THROTTLED:
      return "workload_throttled";
    case poll_mode::CRITICAL:
      return "critical";
    case poll_mode::DISABLED:
      return "disabled";
    case poll_mode::OVERRIDE:
      return "override";
  }
  return "normal";
}

const char* to_string(const safety_override value) noexcept {
  switch (value) {
    case safety_override::FORCED_ON:
      return "on";
    case safety_override::FORCED_OFF:
      return "off";
    case safety_override::AUTO:
      break;
  }
  return "auto";
}

}  // namespace hw_guard::model
