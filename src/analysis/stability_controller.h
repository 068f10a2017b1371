#pragma once

/// @file stability_controller.h
/// @brief Temporal smoothing and change detection for live chord results.

#include <optional>
#include <string>

#include "analysis/chord_matcher.h"
#include "util/types.h"

namespace chordlive {

/// @brief Constants for the stability stage.
namespace stability_constants {
/// @brief Weight of the previous smoothed chroma (history dominates).
constexpr float kSmoothing = 0.7f;

/// @brief Minimum confidence for a chord label to be reported.
constexpr float kConfidenceThreshold = 0.55f;

/// @brief Confidence movement that re-emits an unchanged chord.
constexpr float kConfidenceDelta = 0.05f;
}  // namespace stability_constants

/// @brief Configuration for StabilityController.
struct StabilityConfig {
  float smoothing = stability_constants::kSmoothing;                       ///< History weight [0, 1)
  float confidence_threshold = stability_constants::kConfidenceThreshold;  ///< Label suppression below this
  float confidence_delta = stability_constants::kConfidenceDelta;          ///< Re-emit threshold

  /// @brief Throws ChordliveException if any field is out of range.
  void validate() const;
};

/// @brief State carried across analysis cycles.
struct SmoothingState {
  std::optional<Chromagram> smoothed;           ///< Absent before the first cycle
  std::string last_label = kNoChordLabel;       ///< Last emitted label
  float last_confidence = 0.0f;                 ///< Confidence at last emission
};

/// @brief Outcome of one analysis cycle.
struct StabilityDecision {
  ChordResult result;   ///< Thresholded result for the smoothed chroma
  bool emit = false;    ///< True if the result should be surfaced
};

/// @brief Smooths chroma over time and decides when a result is worth surfacing.
/// @details Each cycle blends the new chroma into the history
/// (s = a * prev + (1 - a) * new), matches the blend, suppresses labels below
/// the confidence threshold and emits only when the label changes or an
/// unchanged chord's confidence moves by more than confidence_delta.
class StabilityController {
 public:
  /// @brief Constructs controller.
  /// @param config Stability configuration
  /// @param matcher Matcher used for the smoothed chroma (copied; shares the bank)
  /// @throws ChordliveException if the configuration is invalid
  explicit StabilityController(const StabilityConfig& config = StabilityConfig(),
                               const ChordMatcher& matcher = ChordMatcher());

  /// @brief Blends a new chroma vector into the smoothed history.
  /// @param chroma New chroma vector
  /// @return Updated smoothed chroma (equal to chroma on the first call)
  const Chromagram& smooth(const Chromagram& chroma);

  /// @brief Applies the confidence threshold to a match.
  /// @param result Raw match
  /// @return Result with the label replaced by kNoChordLabel below threshold
  ChordResult apply_threshold(const ChordResult& result) const;

  /// @brief Decides whether a thresholded result should be surfaced.
  /// @param result Thresholded result
  /// @return True if the label changed, or a chord's confidence moved by more than delta
  bool should_emit(const ChordResult& result) const;

  /// @brief Records a surfaced result as the hysteresis reference.
  void mark_emitted(const ChordResult& result);

  /// @brief Runs one full cycle: smooth, match, threshold, decide, record.
  /// @param chroma New chroma vector
  /// @return Decision for this cycle
  StabilityDecision update(const Chromagram& chroma);

  /// @brief Forgets the smoothing history and the last emission.
  void reset();

  /// @brief Returns the carried state.
  const SmoothingState& state() const { return state_; }

  /// @brief Returns configuration.
  const StabilityConfig& config() const { return config_; }

 private:
  StabilityConfig config_;
  ChordMatcher matcher_;
  SmoothingState state_;
};

}  // namespace chordlive
