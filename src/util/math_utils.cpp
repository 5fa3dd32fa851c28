/// @file math_utils.cpp
/// @brief Implementation of math utility functions.

#include "util/math_utils.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace bandprint {

float cosine_similarity(const float* a, const float* b, size_t size) {
  if (size == 0) return 0.0f;

  float dot = 0.0f;
  float norm_a = 0.0f;
  float norm_b = 0.0f;

  for (size_t i = 0; i < size; ++i) {
    dot += a[i] * b[i];
    norm_a += a[i] * a[i];
    norm_b += b[i] * b[i];
  }

  float denom = std::sqrt(norm_a) * std::sqrt(norm_b);
  if (denom < 1e-10f) return 0.0f;
  return dot / denom;
}

float pearson_correlation(const float* a, const float* b, size_t size) {
  if (size < 2) return 0.0f;

  // Accumulate in double: signatures can hold hundreds of thousands of values
  double mean_a = 0.0;
  double mean_b = 0.0;
  for (size_t i = 0; i < size; ++i) {
    mean_a += a[i];
    mean_b += b[i];
  }
  mean_a /= static_cast<double>(size);
  mean_b /= static_cast<double>(size);

  double num = 0.0;
  double den_a = 0.0;
  double den_b = 0.0;
  for (size_t i = 0; i < size; ++i) {
    double da = a[i] - mean_a;
    double db = b[i] - mean_b;
    num += da * db;
    den_a += da * da;
    den_b += db * db;
  }

  double denom = std::sqrt(den_a * den_b);
  if (denom < 1e-10) return 0.0f;
  return static_cast<float>(num / denom);
}

float median(const float* data, size_t size) {
  if (size == 0) return 0.0f;

  std::vector<float> sorted(data, data + size);
  std::sort(sorted.begin(), sorted.end());

  if (size % 2 == 0) {
    return (sorted[size / 2 - 1] + sorted[size / 2]) / 2.0f;
  }
  return sorted[size / 2];
}

float percentile(const float* data, size_t size, float p) {
  if (size == 0) return 0.0f;

  std::vector<float> sorted(data, data + size);
  std::sort(sorted.begin(), sorted.end());

  float idx = (clamp(p, 0.0f, 100.0f) / 100.0f) * (size - 1);
  size_t lo = static_cast<size_t>(idx);
  size_t hi = std::min(lo + 1, size - 1);
  float frac = idx - lo;

  return sorted[lo] * (1.0f - frac) + sorted[hi] * frac;
}

std::vector<float> smooth_rows(const float* data, int n_rows, int n_cols, int width) {
  std::vector<float> out(static_cast<size_t>(n_rows) * n_cols, 0.0f);
  if (n_rows <= 0 || n_cols <= 0) return out;
  width = std::max(1, width);

  std::vector<float> running(n_cols, 0.0f);
  for (int t = 0; t < n_rows; ++t) {
    const float* row = data + static_cast<size_t>(t) * n_cols;
    for (int c = 0; c < n_cols; ++c) running[c] += row[c];
    if (t >= width) {
      const float* old = data + static_cast<size_t>(t - width) * n_cols;
      for (int c = 0; c < n_cols; ++c) running[c] -= old[c];
    }
    int count = std::min(t + 1, width);
    float* dst = out.data() + static_cast<size_t>(t) * n_cols;
    for (int c = 0; c < n_cols; ++c) dst[c] = running[c] / static_cast<float>(count);
  }
  return out;
}

std::vector<float> pool_rows(const float* data, int n_rows, int n_cols, int group) {
  if (n_rows <= 0 || n_cols <= 0) return {};
  group = std::max(1, group);

  int n_out = (n_rows + group - 1) / group;
  std::vector<float> out(static_cast<size_t>(n_out) * n_cols, 0.0f);
  for (int g = 0; g < n_out; ++g) {
    int start = g * group;
    int end = std::min(start + group, n_rows);
    float* dst = out.data() + static_cast<size_t>(g) * n_cols;
    for (int t = start; t < end; ++t) {
      const float* row = data + static_cast<size_t>(t) * n_cols;
      for (int c = 0; c < n_cols; ++c) dst[c] += row[c];
    }
    float inv = 1.0f / static_cast<float>(end - start);
    for (int c = 0; c < n_cols; ++c) dst[c] *= inv;
  }
  return out;
}

}  // namespace bandprint
