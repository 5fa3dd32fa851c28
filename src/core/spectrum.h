#pragma once

/// @file spectrum.h
/// @brief Short-time magnitude spectrum for fingerprint extraction.

#include <vector>

#include "core/audio.h"
#include "util/types.h"

namespace bandprint {

/// @brief Configuration for STFT computation.
struct StftConfig {
  int n_fft = 2048;                      ///< FFT size
  int hop_length = 512;                  ///< Hop length between frames
  WindowType window = WindowType::Hann;  ///< Window function
  bool center = false;                   ///< Zero-pad n_fft/2 on both sides
};

/// @brief Magnitude spectrogram computed via STFT.
/// @details Memory layout is [n_bins x n_frames] row-major:
///          data[bin * n_frames + frame]. Magnitudes are divided by the window
///          sum so a full-scale sinusoid peaks near 0.5 regardless of n_fft.
class Spectrogram {
 public:
  Spectrogram();

  /// @brief Computes the magnitude STFT of audio.
  /// @return Empty spectrogram if the audio is shorter than one frame
  /// @throws BandprintException if n_fft or hop_length is invalid
  static Spectrogram compute(const Audio& audio, const StftConfig& config = StftConfig());

  int n_bins() const { return n_bins_; }
  int n_frames() const { return n_frames_; }
  int n_fft() const { return n_fft_; }
  int hop_length() const { return hop_length_; }
  int sample_rate() const { return sample_rate_; }
  bool empty() const { return n_frames_ == 0 || n_bins_ == 0; }

  /// @brief Frames per second.
  float frame_rate() const;

  /// @brief Magnitude spectrum [n_bins x n_frames].
  const std::vector<float>& magnitude() const { return magnitude_; }

  /// @brief View over the magnitude spectrum.
  MatrixView<float> view() const {
    return MatrixView<float>(magnitude_.data(), static_cast<size_t>(n_bins_),
                             static_cast<size_t>(n_frames_));
  }

  float at(int bin, int frame) const { return magnitude_[static_cast<size_t>(bin) * n_frames_ + frame]; }

 private:
  std::vector<float> magnitude_;
  int n_bins_;
  int n_frames_;
  int n_fft_;
  int hop_length_;
  int sample_rate_;
};

}  // namespace bandprint
