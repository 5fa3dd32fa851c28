#pragma once

/// @file fft.h
/// @brief Real FFT wrapper using KissFFT.

#include <complex>
#include <memory>
#include <vector>

namespace bandprint {

/// @brief Forward real FFT processor using KissFFT.
/// @details Not thread-safe: KissFFT scratch state is modified during computation.
///          Each extraction worker owns its own instance.
class FFT {
 public:
  /// @brief Constructs FFT processor.
  /// @param n_fft FFT size (even; power of 2 for speed)
  /// @throws BandprintException if n_fft is invalid or allocation fails
  explicit FFT(int n_fft);

  ~FFT();

  FFT(const FFT&) = delete;
  FFT& operator=(const FFT&) = delete;
  FFT(FFT&&) noexcept;
  FFT& operator=(FFT&&) noexcept;

  /// @brief Forward FFT (real to complex).
  /// @param input Input signal [n_fft]
  /// @param output Complex spectrum [n_bins]
  void forward(const float* input, std::complex<float>* output);

  /// @brief Forward FFT returning magnitudes only.
  /// @param input Input signal [n_fft]
  /// @param magnitude Output magnitudes [n_bins]
  void forward_magnitude(const float* input, float* magnitude);

  int n_fft() const { return n_fft_; }

  /// @brief Returns number of frequency bins (n_fft/2 + 1).
  int n_bins() const { return n_fft_ / 2 + 1; }

 private:
  int n_fft_;
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace bandprint
