#include "analysis/chord_matcher.h"

#include <algorithm>
#include <cstdio>
#include <utility>

#include "util/math_utils.h"

namespace chordlive {

namespace {

/// @brief Clamps negatives to zero and normalizes to unit sum (zero stays zero).
Chromagram sanitize(const Chromagram& chroma) {
  Chromagram out;
  for (int i = 0; i < kNumPitchClasses; ++i) {
    out[i] = std::max(chroma[i], 0.0f);
  }
  normalize_sum(out.data(), out.size());
  return out;
}

/// @brief Dot product of normalized chroma with the sum-normalized pattern,
/// rescaled by the number of chord tones.
float score_normalized(const Chromagram& chroma, const ChordTemplate& tmpl) {
  Chromagram weights;
  for (int i = 0; i < kNumPitchClasses; ++i) {
    weights[i] = std::max(tmpl.pattern[i], 0.0f);
  }
  if (!normalize_sum(weights.data(), weights.size())) {
    return 0.0f;
  }

  float dot = 0.0f;
  for (int i = 0; i < kNumPitchClasses; ++i) {
    dot += chroma[i] * weights[i];
  }
  return clamp(dot * static_cast<float>(tmpl.tone_count()), 0.0f, 1.0f);
}

}  // namespace

std::string ChordResult::to_string() const {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%s (%.2f)", label.c_str(), confidence);
  return buf;
}

ChordMatcher::ChordMatcher(std::vector<ChordTemplate> bank) : bank_(std::move(bank)) {}

float ChordMatcher::score(const Chromagram& chroma, const ChordTemplate& tmpl) {
  return score_normalized(sanitize(chroma), tmpl);
}

ChordResult ChordMatcher::match(const Chromagram& chroma) const {
  Chromagram normalized = sanitize(chroma);

  ChordResult result;
  float best_score = 0.0f;
  const ChordTemplate* best = nullptr;

  for (const auto& tmpl : bank_) {
    float s = score_normalized(normalized, tmpl);
    if (s > best_score) {
      best_score = s;
      best = &tmpl;
    }
  }

  if (best == nullptr) {
    return result;
  }

  result.label = best->to_string();
  result.confidence = best_score;
  result.root = static_cast<int>(best->root);
  result.quality = best->quality;
  return result;
}

}  // namespace chordlive
