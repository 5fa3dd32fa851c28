#pragma once

/// @file math_utils.h
/// @brief Numeric helpers shared by extractors and scorers.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>

namespace bandprint {

/// @brief Clamps a value between min and max.
template <typename T>
T clamp(T value, T min_val, T max_val) {
  return std::max(min_val, std::min(value, max_val));
}

/// @brief Returns the index of the maximum element (0 if empty).
template <typename T>
size_t argmax(const T* data, size_t size) {
  if (size == 0) return 0;
  return std::distance(data, std::max_element(data, data + size));
}

/// @brief Computes the arithmetic mean (0 if empty).
template <typename T>
T mean(const T* data, size_t size) {
  if (size == 0) return T{0};
  T sum = std::accumulate(data, data + size, T{0});
  return sum / static_cast<T>(size);
}

/// @brief Computes the L2 norm.
template <typename T>
T norm_l2(const T* data, size_t size) {
  T sum_sq = T{0};
  for (size_t i = 0; i < size; ++i) {
    sum_sq += data[i] * data[i];
  }
  return std::sqrt(sum_sq);
}

/// @brief Normalizes array to unit L2 norm in-place.
/// @return Norm before normalization (arrays with norm below 1e-10 are left untouched)
template <typename T>
T normalize_l2(T* data, size_t size) {
  T n = norm_l2(data, size);
  if (n > T{1e-10}) {
    for (size_t i = 0; i < size; ++i) {
      data[i] /= n;
    }
  }
  return n;
}

/// @brief Computes cosine similarity between two vectors.
/// @return Similarity in [-1, 1] (0 if either vector is all zero)
float cosine_similarity(const float* a, const float* b, size_t size);

/// @brief Computes Pearson correlation coefficient.
/// @return Correlation in [-1, 1] (0 for constant input or size < 2)
float pearson_correlation(const float* a, const float* b, size_t size);

/// @brief Computes the median value (0 if empty).
float median(const float* data, size_t size);

/// @brief Computes the p-th percentile, p in [0, 100] (0 if empty).
float percentile(const float* data, size_t size, float p);

/// @brief Moving average over rows of a row-major [n_rows x n_cols] matrix.
/// @param data Matrix data
/// @param n_rows Number of rows (time frames)
/// @param n_cols Number of columns (features per frame)
/// @param width Window length in rows; the window trails the current row
/// @return Smoothed matrix with the same shape
std::vector<float> smooth_rows(const float* data, int n_rows, int n_cols, int width);

/// @brief Averages groups of consecutive rows of a row-major matrix.
/// @param data Matrix data
/// @param n_rows Number of rows
/// @param n_cols Number of columns
/// @param group Rows per group; a trailing partial group is averaged over what it has
/// @return Pooled matrix [ceil(n_rows / group) x n_cols]
std::vector<float> pool_rows(const float* data, int n_rows, int n_cols, int group);

}  // namespace bandprint
