#pragma once

/// @file fft.h
/// @brief FFT wrapper using KissFFT.

#include <complex>
#include <memory>

namespace chordlive {

/// @brief Real-valued FFT processor using KissFFT.
/// @details Provides the forward real FFT used by chroma extraction.
///
/// Thread Safety:
/// - Different instances can be used concurrently from different threads.
/// - A single instance must NOT be shared between threads without external
///   synchronization, as KissFFT state is modified during computation.
class FFT {
 public:
  /// @brief Constructs FFT processor.
  /// @param n_fft FFT size (must be even and positive)
  /// @throws ChordliveException if n_fft is invalid or allocation fails
  explicit FFT(int n_fft);

  ~FFT();

  // Non-copyable, movable
  FFT(const FFT&) = delete;
  FFT& operator=(const FFT&) = delete;
  FFT(FFT&&) noexcept;
  FFT& operator=(FFT&&) noexcept;

  /// @brief Performs forward FFT (real to complex).
  /// @param input Input signal (n_fft samples)
  /// @param output Complex spectrum (n_bins values)
  void forward(const float* input, std::complex<float>* output);

  /// @brief Returns FFT size.
  int n_fft() const { return n_fft_; }

  /// @brief Returns number of frequency bins (n_fft/2 + 1).
  int n_bins() const { return n_fft_ / 2 + 1; }

 private:
  int n_fft_;
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace chordlive
