/// @file window.cpp
/// @brief Implementation of window functions.

#include "core/window.h"

#include <cmath>
#include <map>
#include <numeric>
#include <utility>

namespace bandprint {

namespace {
constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 2.0f * kPi;

thread_local std::map<std::pair<WindowType, int>, std::vector<float>> g_window_cache;
}  // namespace

std::vector<float> create_window(WindowType type, int length) {
  switch (type) {
    case WindowType::Hann:
      return hann_window(length);
    case WindowType::Rectangular:
      return std::vector<float>(length, 1.0f);
  }
  return hann_window(length);
}

const std::vector<float>& get_window_cached(WindowType type, int length) {
  auto key = std::make_pair(type, length);
  auto it = g_window_cache.find(key);
  if (it != g_window_cache.end()) {
    return it->second;
  }
  auto result = g_window_cache.emplace(key, create_window(type, length));
  return result.first->second;
}

std::vector<float> hann_window(int length) {
  // Periodic form (denominator = length) so overlapping frames sum to a constant
  std::vector<float> window(length);
  for (int i = 0; i < length; ++i) {
    window[i] = 0.5f * (1.0f - std::cos(kTwoPi * i / length));
  }
  return window;
}

float window_sum(const std::vector<float>& window) {
  return std::accumulate(window.begin(), window.end(), 0.0f);
}

}  // namespace bandprint
