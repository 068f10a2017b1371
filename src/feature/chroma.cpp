#include "feature/chroma.h"

#include <array>
#include <cmath>

#include "core/convert.h"
#include "core/fft.h"
#include "core/window.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace chordlive {

void ChromaConfig::validate() const {
  CHORDLIVE_CHECK_MSG(n_fft >= 4 && n_fft % 2 == 0, ErrorCode::InvalidParameter,
                      "n_fft must be even and at least 4");
  CHORDLIVE_CHECK_MSG(hop_length > 0, ErrorCode::InvalidParameter, "hop_length must be positive");
  CHORDLIVE_CHECK_MSG(fmin >= 0.0f, ErrorCode::InvalidParameter, "fmin must not be negative");
  CHORDLIVE_CHECK_MSG(tuning_ref_hz > 0.0f, ErrorCode::InvalidParameter,
                      "tuning reference must be positive");
  CHORDLIVE_CHECK_MSG(magnitude_floor >= 0.0f, ErrorCode::InvalidParameter,
                      "magnitude floor must not be negative");
}

bool is_zero_chroma(const Chromagram& chroma) {
  for (float v : chroma) {
    if (v != 0.0f) return false;
  }
  return true;
}

ChromaExtractor::ChromaExtractor(const ChromaConfig& config) : config_(config) {
  config_.validate();
  fft_ = std::make_unique<FFT>(config_.n_fft);
  window_ = hann_window(config_.n_fft);
  frame_.resize(config_.n_fft);
  spectrum_.resize(config_.n_bins());
}

ChromaExtractor::~ChromaExtractor() = default;

ChromaExtractor::ChromaExtractor(ChromaExtractor&&) noexcept = default;
ChromaExtractor& ChromaExtractor::operator=(ChromaExtractor&&) noexcept = default;

Chromagram ChromaExtractor::extract(const float* samples, size_t n_samples, int sample_rate) {
  last_frame_count_ = 0;

  const size_t n_fft = static_cast<size_t>(config_.n_fft);
  if (samples == nullptr || n_samples < n_fft || sample_rate <= 0) {
    return zero_chroma();
  }

  // DC offset removal
  float dc = mean(samples, n_samples);
  signal_.resize(n_samples);
  for (size_t i = 0; i < n_samples; ++i) {
    signal_[i] = samples[i] - dc;
  }

  const int n_bins = config_.n_bins();
  const double nyquist = static_cast<double>(sample_rate) / 2.0;
  const double ref_hz = static_cast<double>(config_.tuning_ref_hz);

  std::array<double, kNumPitchClasses> acc = {};
  int frames = 0;

  for (size_t start = 0; start + n_fft <= n_samples; start += config_.hop_length) {
    for (size_t i = 0; i < n_fft; ++i) {
      frame_[i] = signal_[start + i] * window_[i];
    }
    fft_->forward(frame_.data(), spectrum_.data());

    for (int k = 0; k < n_bins; ++k) {
      double freq = bin_to_hz(k, sample_rate, config_.n_fft);
      if (freq <= config_.fmin || freq > nyquist) {
        continue;
      }

      double value = std::abs(spectrum_[k]);
      if (value <= config_.magnitude_floor) {
        continue;
      }
      if (config_.weighting == SpectralWeighting::Power) {
        value *= value;
      }

      int pc = hz_to_pitch_class(freq, ref_hz);
      acc[pc] += value;
    }

    ++frames;
  }

  last_frame_count_ = frames;

  Chromagram chroma = zero_chroma();
  if (frames == 0) {
    return chroma;
  }

  for (int c = 0; c < kNumPitchClasses; ++c) {
    acc[c] /= static_cast<double>(frames);
  }
  if (!normalize_sum(acc.data(), acc.size())) {
    return chroma;
  }

  for (int c = 0; c < kNumPitchClasses; ++c) {
    chroma[c] = static_cast<float>(acc[c]);
  }
  return chroma;
}

}  // namespace chordlive
