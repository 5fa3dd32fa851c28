#include "core/spectrum.h"

#include <algorithm>

#include "core/convert.h"
#include "core/fft.h"
#include "core/window.h"
#include "util/exception.h"

namespace bandprint {

Spectrogram::Spectrogram() : n_bins_(0), n_frames_(0), n_fft_(0), hop_length_(0), sample_rate_(0) {}

float Spectrogram::frame_rate() const {
  if (hop_length_ == 0) return 0.0f;
  return static_cast<float>(sample_rate_) / static_cast<float>(hop_length_);
}

Spectrogram Spectrogram::compute(const Audio& audio, const StftConfig& config) {
  BANDPRINT_CHECK_MSG(config.n_fft > 0 && config.n_fft % 2 == 0, ErrorCode::InvalidParameter,
                      "n_fft must be a positive even number");
  BANDPRINT_CHECK_MSG(config.hop_length > 0, ErrorCode::InvalidParameter,
                      "hop_length must be positive");

  Spectrogram result;
  result.n_fft_ = config.n_fft;
  result.hop_length_ = config.hop_length;
  result.sample_rate_ = audio.sample_rate();
  if (audio.empty()) {
    return result;
  }

  const int n_fft = config.n_fft;
  const int hop = config.hop_length;
  const float* signal = audio.data();
  size_t signal_length = audio.size();

  std::vector<float> padded;
  if (config.center) {
    padded.assign(signal_length + n_fft, 0.0f);
    std::copy(signal, signal + signal_length, padded.begin() + n_fft / 2);
    signal = padded.data();
    signal_length = padded.size();
  }

  const int n_frames = count_frames(static_cast<long long>(signal_length), n_fft, hop);
  if (n_frames == 0) {
    return result;
  }

  const std::vector<float>& window = get_window_cached(config.window, n_fft);
  const float scale = 1.0f / std::max(window_sum(window), 1e-6f);
  const int n_bins = n_fft / 2 + 1;

  result.n_bins_ = n_bins;
  result.n_frames_ = n_frames;
  result.magnitude_.resize(static_cast<size_t>(n_bins) * n_frames);

  FFT fft(n_fft);
  std::vector<float> frame(n_fft);
  std::vector<float> frame_mag(n_bins);

  for (int t = 0; t < n_frames; ++t) {
    const float* src = signal + static_cast<size_t>(t) * hop;
    for (int i = 0; i < n_fft; ++i) {
      frame[i] = src[i] * window[i];
    }
    fft.forward_magnitude(frame.data(), frame_mag.data());
    // Transpose into [n_bins x n_frames]
    for (int k = 0; k < n_bins; ++k) {
      result.magnitude_[static_cast<size_t>(k) * n_frames + t] = frame_mag[k] * scale;
    }
  }
  return result;
}

}  // namespace bandprint
