#pragma once

/// @file chroma.h
/// @brief Pitch-class energy (chroma) extraction from raw sample blocks.

#include <complex>
#include <cstddef>
#include <memory>
#include <vector>

#include "util/types.h"

namespace chordlive {

class FFT;

/// @brief Spectral value accumulated into the chroma bins.
enum class SpectralWeighting {
  Magnitude,  ///< |X(k)|
  Power,      ///< |X(k)|^2
};

/// @brief Configuration for chroma extraction.
struct ChromaConfig {
  int n_fft = 2048;                                   ///< Analysis frame length (FFT size)
  int hop_length = 512;                               ///< Hop between frames (n_fft / 4)
  float fmin = 20.0f;                                 ///< Bins at or below this are ignored (Hz)
  float tuning_ref_hz = 440.0f;                       ///< Reference frequency for A4
  float magnitude_floor = 1e-10f;                     ///< Bins with |X(k)| at or below this are ignored
  SpectralWeighting weighting = SpectralWeighting::Power;  ///< Accumulated spectral value

  /// @brief Returns number of frequency bins.
  int n_bins() const { return n_fft / 2 + 1; }

  /// @brief Throws ChordliveException if any field is out of range.
  void validate() const;
};

/// @brief Returns an all-zero chromagram.
inline Chromagram zero_chroma() { return Chromagram{}; }

/// @brief Returns true if every bin of the chromagram is zero.
bool is_zero_chroma(const Chromagram& chroma);

/// @brief Converts a block of samples into a normalized 12-bin chromagram.
/// @details Removes the block's DC offset, slides a windowed frame across it,
/// folds every spectral bin onto its nearest pitch class and averages over
/// frames. The result sums to 1, or is all-zero when the block is shorter
/// than one frame or carries no energy.
///
/// Thread Safety: an instance owns FFT scratch state and must not be shared
/// between threads.
class ChromaExtractor {
 public:
  /// @brief Constructs extractor with configuration.
  /// @param config Chroma configuration
  /// @throws ChordliveException if the configuration is invalid
  explicit ChromaExtractor(const ChromaConfig& config = ChromaConfig());

  ~ChromaExtractor();

  ChromaExtractor(const ChromaExtractor&) = delete;
  ChromaExtractor& operator=(const ChromaExtractor&) = delete;
  ChromaExtractor(ChromaExtractor&&) noexcept;
  ChromaExtractor& operator=(ChromaExtractor&&) noexcept;

  /// @brief Extracts the chromagram of a block.
  /// @param samples Pointer to samples
  /// @param n_samples Number of samples
  /// @param sample_rate Sample rate in Hz
  /// @return Normalized chromagram, or all-zero for insufficient or silent input
  Chromagram extract(const float* samples, size_t n_samples, int sample_rate);

  /// @brief Extracts the chromagram of a vector of samples.
  Chromagram extract(const std::vector<float>& samples, int sample_rate) {
    return extract(samples.data(), samples.size(), sample_rate);
  }

  /// @brief Returns the number of frames processed by the last call.
  int last_frame_count() const { return last_frame_count_; }

  /// @brief Returns configuration.
  const ChromaConfig& config() const { return config_; }

 private:
  ChromaConfig config_;
  std::unique_ptr<FFT> fft_;
  std::vector<float> window_;

  // Working buffers (reused to avoid allocation)
  std::vector<float> signal_;
  std::vector<float> frame_;
  std::vector<std::complex<float>> spectrum_;

  int last_frame_count_ = 0;
};

}  // namespace chordlive
