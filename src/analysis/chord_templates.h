#pragma once

/// @file chord_templates.h
/// @brief Chord templates for chord recognition.

#include <string>
#include <vector>

#include "util/types.h"

namespace chordlive {

/// @brief Template for a chord type.
struct ChordTemplate {
  PitchClass root;        ///< Root pitch class
  ChordQuality quality;   ///< Chord quality
  Chromagram pattern;     ///< Binary chroma pattern (1 on chord tones)

  /// @brief Returns chord label (e.g., "C", "F#m").
  std::string to_string() const;

  /// @brief Returns number of chord tones (non-zero pattern entries).
  int tone_count() const;
};

/// @brief Creates a major chord template for a given root.
/// @param root Root pitch class
/// @return Chord template with pattern [1, 0, 0, 0, 1, 0, 0, 1, 0, 0, 0, 0] rotated
ChordTemplate create_major_template(PitchClass root);

/// @brief Creates a minor chord template for a given root.
/// @param root Root pitch class
/// @return Chord template with pattern [1, 0, 0, 1, 0, 0, 0, 1, 0, 0, 0, 0] rotated
ChordTemplate create_minor_template(PitchClass root);

/// @brief Transposes a chord template by a given number of semitones.
/// @param tmpl Original template
/// @param semitones Semitones to transpose (positive = up)
/// @return Transposed template
ChordTemplate transpose_template(const ChordTemplate& tmpl, int semitones);

/// @brief Generates the 24 major/minor triad templates.
/// @return Templates ordered by root (C..B), major before minor
std::vector<ChordTemplate> generate_triad_templates();

/// @brief Returns the process-wide template bank.
/// @details Built once on first use and never modified; safe to share
///          between threads.
const std::vector<ChordTemplate>& default_chord_bank();

/// @brief Converts chord quality to its label suffix ("" or "m").
std::string chord_quality_to_string(ChordQuality quality);

/// @brief Converts pitch class to string.
std::string pitch_class_to_string(PitchClass pc);

}  // namespace chordlive
