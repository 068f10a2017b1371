/// @file fft.cpp
/// @brief Implementation of FFT wrapper.

#include "core/fft.h"

#include "util/exception.h"

extern "C" {
#include "kiss_fft.h"
#include "kiss_fftr.h"
}

namespace chordlive {

struct FFT::Impl {
  kiss_fftr_cfg forward_cfg;

  explicit Impl(int n_fft) {
    forward_cfg = kiss_fftr_alloc(n_fft, 0, nullptr, nullptr);
    CHORDLIVE_CHECK_MSG(forward_cfg != nullptr, ErrorCode::InvalidParameter,
                        "Failed to allocate KissFFT config");
  }

  ~Impl() {
    if (forward_cfg) kiss_fft_free(forward_cfg);
  }
};

FFT::FFT(int n_fft) : n_fft_(n_fft) {
  // kiss_fftr only supports even sizes
  CHORDLIVE_CHECK_MSG(n_fft > 0 && n_fft % 2 == 0, ErrorCode::InvalidParameter,
                      "FFT size must be even and positive");
  impl_ = std::make_unique<Impl>(n_fft);
}

FFT::~FFT() = default;

FFT::FFT(FFT&&) noexcept = default;
FFT& FFT::operator=(FFT&&) noexcept = default;

void FFT::forward(const float* input, std::complex<float>* output) {
  kiss_fftr(impl_->forward_cfg, input, reinterpret_cast<kiss_fft_cpx*>(output));
}

}  // namespace chordlive
