/// @file fft.cpp
/// @brief Implementation of FFT wrapper.

#include "core/fft.h"

#include <cmath>

#include "util/exception.h"

extern "C" {
#include "kiss_fft.h"
#include "kiss_fftr.h"
}

namespace bandprint {

struct FFT::Impl {
  kiss_fftr_cfg cfg = nullptr;
  std::vector<std::complex<float>> scratch;

  explicit Impl(int n_fft) : scratch(n_fft / 2 + 1) {
    cfg = kiss_fftr_alloc(n_fft, 0, nullptr, nullptr);
    BANDPRINT_CHECK_MSG(cfg != nullptr, ErrorCode::InvalidParameter,
                        "Failed to allocate KissFFT config");
  }

  ~Impl() {
    if (cfg) kiss_fft_free(cfg);
  }
};

FFT::FFT(int n_fft) : n_fft_(n_fft) {
  BANDPRINT_CHECK_MSG(n_fft > 0 && n_fft % 2 == 0, ErrorCode::InvalidParameter,
                      "FFT size must be a positive even number");
  impl_ = std::make_unique<Impl>(n_fft);
}

FFT::~FFT() = default;

FFT::FFT(FFT&&) noexcept = default;
FFT& FFT::operator=(FFT&&) noexcept = default;

void FFT::forward(const float* input, std::complex<float>* output) {
  kiss_fftr(impl_->cfg, input, reinterpret_cast<kiss_fft_cpx*>(output));
}

void FFT::forward_magnitude(const float* input, float* magnitude) {
  forward(input, impl_->scratch.data());
  const int bins = n_bins();
  for (int k = 0; k < bins; ++k) {
    magnitude[k] = std::abs(impl_->scratch[k]);
  }
}

}  // namespace bandprint
