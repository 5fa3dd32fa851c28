#pragma once

/// @file chroma.h
/// @brief Chroma filterbank generation.

#include "filters/filterbank.h"

namespace bandprint {

/// @brief Configuration for a chroma filterbank.
struct ChromaFilterConfig {
  int n_chroma = 12;      ///< Number of chroma bins
  float tuning = 0.0f;    ///< Tuning deviation in fractions of a chroma bin
  float fmin = 80.0f;     ///< Bins below this frequency are ignored
  float fmax = 5000.0f;   ///< Bins above this frequency are ignored
};

/// @brief Converts frequency to the nearest pitch class (0-11, C=0).
/// @return Pitch class, or -1 if hz <= 0
int hz_to_pitch_class(float hz, float tuning = 0.0f);

/// @brief Converts frequency to fractional pitch class in [0, 12).
/// @return Fractional pitch class, or -1 if hz <= 0
float hz_to_chroma(float hz, float tuning = 0.0f);

/// @brief Creates a chroma filterbank [n_chroma x n_bins].
/// @details Each bin in [fmin, fmax] is split linearly between its two
///          nearest pitch classes; each row is normalized to unit sum.
Filterbank create_chroma_filterbank(int sr, int n_fft,
                                    const ChromaFilterConfig& config = ChromaFilterConfig());

}  // namespace bandprint
