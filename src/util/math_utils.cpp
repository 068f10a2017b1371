/// @file math_utils.cpp
/// @brief Implementation of math utility functions.

#include "util/math_utils.h"

#include <cmath>

namespace chordlive {

float rms(const float* data, size_t size) {
  if (size == 0 || data == nullptr) return 0.0f;

  double sum_sq = 0.0;
  for (size_t i = 0; i < size; ++i) {
    sum_sq += static_cast<double>(data[i]) * data[i];
  }
  return static_cast<float>(std::sqrt(sum_sq / static_cast<double>(size)));
}

}  // namespace chordlive
