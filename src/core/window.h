#pragma once

/// @file window.h
/// @brief Analysis window generators.

#include <vector>

#include "util/types.h"

namespace bandprint {

/// @brief Creates a window of the specified type.
/// @param type Window type
/// @param length Window length in samples
/// @return Window coefficients
std::vector<float> create_window(WindowType type, int length);

/// @brief Returns a cached window (thread-local cache).
/// @details Extraction workers run on separate threads; each keeps its own cache.
const std::vector<float>& get_window_cached(WindowType type, int length);

/// @brief Creates a periodic Hann window.
std::vector<float> hann_window(int length);

/// @brief Returns the sum of window coefficients (used to normalize magnitudes).
float window_sum(const std::vector<float>& window);

}  // namespace bandprint
