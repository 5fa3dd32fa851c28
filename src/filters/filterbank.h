#pragma once

/// @file filterbank.h
/// @brief Spectral filterbank container and projection.

#include <vector>

#include "core/spectrum.h"

namespace bandprint {

/// @brief Weights mapping FFT bins onto a smaller set of filters.
/// @details weights is [n_filters x n_bins] row-major.
struct Filterbank {
  int n_filters = 0;
  int n_bins = 0;
  std::vector<float> weights;

  const float* row(int filter) const {
    return weights.data() + static_cast<size_t>(filter) * n_bins;
  }
};

/// @brief Projects a spectrogram through a filterbank.
/// @param spec Magnitude spectrogram [n_bins x n_frames]
/// @param bank Filterbank whose n_bins matches the spectrogram
/// @param use_power Square magnitudes before projecting
/// @return Frame-major features [n_frames x n_filters]
/// @throws BandprintException if the bin counts differ
std::vector<float> apply_filterbank(const Spectrogram& spec, const Filterbank& bank,
                                    bool use_power = false);

}  // namespace bandprint
