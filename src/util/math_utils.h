#pragma once

/// @file math_utils.h
/// @brief Mathematical utility functions for signal processing.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>

namespace chordlive {

/// @brief Clamps a value between min and max.
/// @tparam T Numeric type
/// @param value Value to clamp
/// @param min_val Minimum bound
/// @param max_val Maximum bound
/// @return Clamped value
template <typename T>
T clamp(T value, T min_val, T max_val) {
  return std::max(min_val, std::min(value, max_val));
}

/// @brief Computes the arithmetic mean.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Mean value (0 if empty)
template <typename T>
T mean(const T* data, size_t size) {
  if (size == 0) return T{0};
  T sum = std::accumulate(data, data + size, T{0});
  return sum / static_cast<T>(size);
}

/// @brief Normalizes array to unit L1 norm (sum of values) in-place.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return False (data untouched) if the sum is not positive
template <typename T>
bool normalize_sum(T* data, size_t size) {
  T total = std::accumulate(data, data + size, T{0});
  if (!(total > T{0})) {
    return false;
  }
  for (size_t i = 0; i < size; ++i) {
    data[i] /= total;
  }
  return true;
}

/// @brief Computes root-mean-square level of a signal.
/// @param data Pointer to samples
/// @param size Number of samples
/// @return RMS value (0 if empty)
float rms(const float* data, size_t size);

}  // namespace chordlive
