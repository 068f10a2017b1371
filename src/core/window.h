#pragma once

/// @file window.h
/// @brief Analysis window for spectral frames.

#include <vector>

namespace chordlive {

/// @brief Creates a symmetric Hann (raised cosine) window.
/// @param length Window length in samples
/// @return Window coefficients, zero at both ends; a single 1.0 for length 1
std::vector<float> hann_window(int length);

}  // namespace chordlive
