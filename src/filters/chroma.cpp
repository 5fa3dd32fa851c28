#include "filters/chroma.h"

#include <cmath>

#include "core/convert.h"
#include "util/exception.h"

namespace bandprint {

int hz_to_pitch_class(float hz, float tuning) {
  if (hz <= 0.0f) {
    return -1;
  }
  return static_cast<int>(std::lround(hz_to_chroma(hz, tuning))) % 12;
}

float hz_to_chroma(float hz, float tuning) {
  if (hz <= 0.0f) {
    return -1.0f;
  }
  float chroma = std::fmod(hz_to_midi(hz) - tuning, 12.0f);
  if (chroma < 0.0f) {
    chroma += 12.0f;
  }
  return chroma;
}

Filterbank create_chroma_filterbank(int sr, int n_fft, const ChromaFilterConfig& config) {
  BANDPRINT_CHECK(sr > 0, ErrorCode::InvalidParameter);
  BANDPRINT_CHECK(n_fft > 0, ErrorCode::InvalidParameter);
  BANDPRINT_CHECK(config.n_chroma > 0, ErrorCode::InvalidParameter);
  BANDPRINT_CHECK_MSG(config.fmin < config.fmax, ErrorCode::InvalidParameter,
                      "Chroma range must satisfy fmin < fmax");

  Filterbank bank;
  bank.n_filters = config.n_chroma;
  bank.n_bins = n_fft / 2 + 1;
  bank.weights.assign(static_cast<size_t>(bank.n_filters) * bank.n_bins, 0.0f);

  const int n_chroma = config.n_chroma;
  for (int k = 1; k < bank.n_bins; ++k) {
    float freq = bin_to_hz(k, sr, n_fft);
    if (freq < config.fmin || freq > config.fmax) {
      continue;
    }
    float scaled = hz_to_chroma(freq, config.tuning) * n_chroma / 12.0f;
    int low = static_cast<int>(std::floor(scaled)) % n_chroma;
    int high = (low + 1) % n_chroma;
    float frac = scaled - std::floor(scaled);
    bank.weights[static_cast<size_t>(low) * bank.n_bins + k] += 1.0f - frac;
    bank.weights[static_cast<size_t>(high) * bank.n_bins + k] += frac;
  }

  for (int c = 0; c < n_chroma; ++c) {
    float* row = bank.weights.data() + static_cast<size_t>(c) * bank.n_bins;
    float sum = 0.0f;
    for (int k = 0; k < bank.n_bins; ++k) sum += row[k];
    if (sum > 0.0f) {
      for (int k = 0; k < bank.n_bins; ++k) row[k] /= sum;
    }
  }
  return bank;
}

}  // namespace bandprint
