#include "filters/bands.h"

#include <algorithm>
#include <cmath>

#include "core/convert.h"
#include "util/exception.h"

namespace bandprint {

std::vector<float> band_edges(const BandFilterConfig& config, int sr) {
  const float nyquist = static_cast<float>(sr) / 2.0f;
  const float fmax = std::min(config.fmax, nyquist);
  BANDPRINT_CHECK_MSG(config.n_bands > 0, ErrorCode::InvalidParameter, "n_bands must be positive");
  BANDPRINT_CHECK_MSG(config.fmin > 0.0f && config.fmin < fmax, ErrorCode::InvalidParameter,
                      "Band range must satisfy 0 < fmin < fmax");

  std::vector<float> edges(config.n_bands + 1);
  const float log_lo = std::log(config.fmin);
  const float log_hi = std::log(fmax);
  for (int i = 0; i <= config.n_bands; ++i) {
    edges[i] = std::exp(log_lo + (log_hi - log_lo) * i / config.n_bands);
  }
  return edges;
}

Filterbank create_band_filterbank(int sr, int n_fft, const BandFilterConfig& config) {
  BANDPRINT_CHECK(sr > 0, ErrorCode::InvalidParameter);
  BANDPRINT_CHECK(n_fft > 0, ErrorCode::InvalidParameter);

  std::vector<float> edges = band_edges(config, sr);

  Filterbank bank;
  bank.n_filters = config.n_bands;
  bank.n_bins = n_fft / 2 + 1;
  bank.weights.assign(static_cast<size_t>(bank.n_filters) * bank.n_bins, 0.0f);

  for (int b = 0; b < config.n_bands; ++b) {
    float* row = bank.weights.data() + static_cast<size_t>(b) * bank.n_bins;
    int count = 0;
    for (int k = 1; k < bank.n_bins; ++k) {
      float hz = bin_to_hz(k, sr, n_fft);
      if (hz >= edges[b] && hz < edges[b + 1]) {
        row[k] = 1.0f;
        ++count;
      }
    }
    if (count == 0) {
      float center = std::sqrt(edges[b] * edges[b + 1]);
      int k = std::max(1, std::min(bank.n_bins - 1, hz_to_bin(center, sr, n_fft)));
      row[k] = 1.0f;
      count = 1;
    }
    for (int k = 0; k < bank.n_bins; ++k) {
      row[k] /= static_cast<float>(count);
    }
  }
  return bank;
}

}  // namespace bandprint
