/// @file window.cpp
/// @brief Hann window generation.

#include "core/window.h"

#include <cmath>

namespace chordlive {

std::vector<float> hann_window(int length) {
  if (length <= 0) return {};
  if (length == 1) return {1.0f};

  constexpr double kTwoPi = 6.283185307179586;
  const double denom = static_cast<double>(length - 1);

  std::vector<float> window(length);
  for (int i = 0; i < length; ++i) {
    window[i] = static_cast<float>(0.5 * (1.0 - std::cos(kTwoPi * i / denom)));
  }
  return window;
}

}  // namespace chordlive
