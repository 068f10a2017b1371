#include "analysis/chord_templates.h"

#include <initializer_list>

namespace chordlive {

namespace {

/// @brief Creates a chord pattern from intervals.
Chromagram create_pattern(PitchClass root, std::initializer_list<int> intervals) {
  Chromagram pattern = {};
  int root_idx = static_cast<int>(root);

  for (int interval : intervals) {
    int idx = (root_idx + interval) % kNumPitchClasses;
    pattern[idx] = 1.0f;
  }

  return pattern;
}

/// @brief Rotates a pattern by semitones.
Chromagram rotate_pattern(const Chromagram& pattern, int semitones) {
  Chromagram rotated;
  int shift = ((semitones % kNumPitchClasses) + kNumPitchClasses) % kNumPitchClasses;
  for (int i = 0; i < kNumPitchClasses; ++i) {
    int src = (i - shift + kNumPitchClasses) % kNumPitchClasses;
    rotated[i] = pattern[src];
  }
  return rotated;
}

}  // namespace

std::string pitch_class_to_string(PitchClass pc) { return pitch_class_name(pc); }

std::string chord_quality_to_string(ChordQuality quality) {
  switch (quality) {
    case ChordQuality::Major:
      return "";
    case ChordQuality::Minor:
      return "m";
  }
  return "";
}

std::string ChordTemplate::to_string() const {
  return pitch_class_to_string(root) + chord_quality_to_string(quality);
}

int ChordTemplate::tone_count() const {
  int count = 0;
  for (float v : pattern) {
    if (v > 0.0f) ++count;
  }
  return count;
}

ChordTemplate create_major_template(PitchClass root) {
  ChordTemplate tmpl;
  tmpl.root = root;
  tmpl.quality = ChordQuality::Major;
  tmpl.pattern = create_pattern(root, {0, 4, 7});  // Root, major 3rd, perfect 5th
  return tmpl;
}

ChordTemplate create_minor_template(PitchClass root) {
  ChordTemplate tmpl;
  tmpl.root = root;
  tmpl.quality = ChordQuality::Minor;
  tmpl.pattern = create_pattern(root, {0, 3, 7});  // Root, minor 3rd, perfect 5th
  return tmpl;
}

ChordTemplate transpose_template(const ChordTemplate& tmpl, int semitones) {
  int shift = ((semitones % kNumPitchClasses) + kNumPitchClasses) % kNumPitchClasses;
  ChordTemplate transposed;
  transposed.root =
      static_cast<PitchClass>((static_cast<int>(tmpl.root) + shift) % kNumPitchClasses);
  transposed.quality = tmpl.quality;
  transposed.pattern = rotate_pattern(tmpl.pattern, shift);
  return transposed;
}

std::vector<ChordTemplate> generate_triad_templates() {
  std::vector<ChordTemplate> templates;
  templates.reserve(kNumPitchClasses * 2);

  const ChordTemplate c_major = create_major_template(PitchClass::C);
  const ChordTemplate c_minor = create_minor_template(PitchClass::C);

  for (int root = 0; root < kNumPitchClasses; ++root) {
    templates.push_back(transpose_template(c_major, root));
    templates.push_back(transpose_template(c_minor, root));
  }

  return templates;
}

const std::vector<ChordTemplate>& default_chord_bank() {
  static const std::vector<ChordTemplate> bank = generate_triad_templates();
  return bank;
}

}  // namespace chordlive
