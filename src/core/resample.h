#pragma once

/// @file resample.h
/// @brief Sample rate conversion to extractor analysis rates (r8brain).

#include <vector>

#include "core/audio.h"

namespace bandprint {

/// @brief Resamples audio to a target rate.
/// @return The input itself when the rates already match
Audio resample(const Audio& audio, int target_sr);

/// @brief Resamples raw samples.
/// @throws BandprintException if either rate is not positive
std::vector<float> resample(const float* samples, size_t size, int src_sr, int target_sr);

}  // namespace bandprint
