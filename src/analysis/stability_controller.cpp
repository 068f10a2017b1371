#include "analysis/stability_controller.h"

#include <cmath>

#include "util/exception.h"

namespace chordlive {

void StabilityConfig::validate() const {
  CHORDLIVE_CHECK_MSG(smoothing >= 0.0f && smoothing < 1.0f, ErrorCode::InvalidParameter,
                      "smoothing must be in [0, 1)");
  CHORDLIVE_CHECK_MSG(confidence_threshold >= 0.0f && confidence_threshold <= 1.0f,
                      ErrorCode::InvalidParameter, "confidence threshold must be in [0, 1]");
  CHORDLIVE_CHECK_MSG(confidence_delta >= 0.0f, ErrorCode::InvalidParameter,
                      "confidence delta must not be negative");
}

StabilityController::StabilityController(const StabilityConfig& config,
                                         const ChordMatcher& matcher)
    : config_(config), matcher_(matcher) {
  config_.validate();
}

const Chromagram& StabilityController::smooth(const Chromagram& chroma) {
  if (!state_.smoothed) {
    state_.smoothed = chroma;
    return *state_.smoothed;
  }

  const float a = config_.smoothing;
  Chromagram& s = *state_.smoothed;
  for (int i = 0; i < kNumPitchClasses; ++i) {
    s[i] = a * s[i] + (1.0f - a) * chroma[i];
  }
  return s;
}

ChordResult StabilityController::apply_threshold(const ChordResult& result) const {
  ChordResult out = result;
  if (out.confidence < config_.confidence_threshold) {
    out.label = kNoChordLabel;
    out.root = -1;
  }
  return out;
}

bool StabilityController::should_emit(const ChordResult& result) const {
  if (result.label != state_.last_label) {
    return true;
  }
  return result.is_chord() &&
         std::abs(result.confidence - state_.last_confidence) > config_.confidence_delta;
}

void StabilityController::mark_emitted(const ChordResult& result) {
  state_.last_label = result.label;
  state_.last_confidence = result.confidence;
}

StabilityDecision StabilityController::update(const Chromagram& chroma) {
  StabilityDecision decision;
  decision.result = apply_threshold(matcher_.match(smooth(chroma)));
  decision.emit = should_emit(decision.result);
  if (decision.emit) {
    mark_emitted(decision.result);
  }
  return decision;
}

void StabilityController::reset() { state_ = SmoothingState(); }

}  // namespace chordlive
