#include "core/convert.h"

#include <cmath>

namespace bandprint {

float hz_to_midi(float hz) {
  if (hz <= 0) return 0.0f;
  return 12.0f * std::log2(hz / 440.0f) + 69.0f;
}

float midi_to_hz(float midi) { return 440.0f * std::pow(2.0f, (midi - 69.0f) / 12.0f); }

float bin_to_hz(int bin, int sr, int n_fft) {
  return static_cast<float>(bin) * static_cast<float>(sr) / static_cast<float>(n_fft);
}

int hz_to_bin(float hz, int sr, int n_fft) {
  return static_cast<int>(std::round(hz * n_fft / static_cast<float>(sr)));
}

float frames_to_time(int frames, int sr, int hop_length) {
  return static_cast<float>(frames) * static_cast<float>(hop_length) / static_cast<float>(sr);
}

int time_to_frames(float time, int sr, int hop_length) {
  return static_cast<int>(std::floor(time * static_cast<float>(sr) / static_cast<float>(hop_length)));
}

int seconds_to_frames(float seconds, float frame_rate) {
  if (frame_rate <= 0.0f || seconds <= 0.0f) return 0;
  return static_cast<int>(std::lround(seconds * frame_rate));
}

int count_frames(long long n_samples, int n_fft, int hop_length) {
  if (n_fft <= 0 || hop_length <= 0 || n_samples < n_fft) return 0;
  return 1 + static_cast<int>((n_samples - n_fft) / hop_length);
}

}  // namespace bandprint
