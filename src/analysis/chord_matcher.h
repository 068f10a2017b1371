#pragma once

/// @file chord_matcher.h
/// @brief Template matching of chroma vectors against the chord bank.

#include <string>
#include <vector>

#include "analysis/chord_templates.h"
#include "util/types.h"

namespace chordlive {

/// @brief Label reported when no chord is recognized.
constexpr const char* kNoChordLabel = "N.C.";

/// @brief Chord recognition result.
struct ChordResult {
  std::string label = kNoChordLabel;  ///< Template label or kNoChordLabel
  float confidence = 0.0f;            ///< Fraction of chroma energy on chord tones [0, 1]
  int root = -1;                      ///< Root pitch class (0-11), -1 when no chord
  ChordQuality quality = ChordQuality::Major;  ///< Quality of the matched template

  /// @brief Returns true if the label names a chord.
  bool is_chord() const { return label != kNoChordLabel; }

  /// @brief Returns "<label> (<confidence>)" with two decimals, e.g. "Am (0.87)".
  std::string to_string() const;
};

/// @brief Scores chroma vectors against a fixed template bank.
/// @details The score of a template is the fraction of the (non-negative,
/// sum-normalized) chroma energy that falls on the template's chord tones.
/// An exact template scores 1.0 against itself. Ties keep the first template
/// in bank order.
class ChordMatcher {
 public:
  /// @brief Constructs matcher over a template bank.
  /// @param bank Templates in iteration order
  explicit ChordMatcher(std::vector<ChordTemplate> bank = default_chord_bank());

  /// @brief Finds the best matching chord.
  /// @param chroma Chroma vector (need not be normalized)
  /// @return Best template label and score, or kNoChordLabel with 0 if nothing scores above 0
  ChordResult match(const Chromagram& chroma) const;

  /// @brief Scores a chroma vector against one template.
  /// @param chroma Chroma vector (negative values clamped, sum-normalized internally)
  /// @param tmpl Chord template
  /// @return Score in [0, 1]
  static float score(const Chromagram& chroma, const ChordTemplate& tmpl);

  /// @brief Returns the template bank.
  const std::vector<ChordTemplate>& bank() const { return bank_; }

 private:
  std::vector<ChordTemplate> bank_;
};

}  // namespace chordlive
