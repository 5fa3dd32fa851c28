#pragma once

/// @file bands.h
/// @brief Logarithmically spaced band filterbank.

#include "filters/filterbank.h"

namespace bandprint {

/// @brief Configuration for a log-spaced band filterbank.
struct BandFilterConfig {
  int n_bands = 32;
  float fmin = 40.0f;     ///< Lower edge of the first band in Hz
  float fmax = 10000.0f;  ///< Upper edge of the last band in Hz (clamped to Nyquist)
};

/// @brief Returns the n_bands + 1 band edges in Hz, geometrically spaced.
std::vector<float> band_edges(const BandFilterConfig& config, int sr);

/// @brief Creates a rectangular averaging filterbank over log-spaced bands.
/// @details Each band averages the bins whose center frequency falls in
///          [lo, hi). A band narrower than one bin takes the nearest bin.
/// @throws BandprintException on invalid sr, n_fft, band count or range
Filterbank create_band_filterbank(int sr, int n_fft,
                                  const BandFilterConfig& config = BandFilterConfig());

}  // namespace bandprint
