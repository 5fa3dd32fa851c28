#pragma once

/// @file scoring.h
/// @brief Similarity between two signatures of the same algorithm.

#include <cstdint>
#include <utility>
#include <vector>

#include "fingerprint/signature.h"

namespace bandprint {

/// @brief Landmarks sorted by (hash, time) for merge-join lookups.
class LandmarkIndex {
 public:
  LandmarkIndex() = default;
  explicit LandmarkIndex(const std::vector<Landmark>& landmarks);

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  const std::vector<std::pair<uint32_t, int32_t>>& entries() const { return entries_; }

 private:
  std::vector<std::pair<uint32_t, int32_t>> entries_;
};

/// @brief Best normalized correlation of two band matrices over time shifts.
/// @details Each band is centred over the overlapping frames before correlating.
/// @param max_shift_frames Largest shift tried in either direction
/// @return Score in [0, 1]; 0 if band counts differ or no shift overlaps
///         at least half of the shorter matrix
float band_similarity(const Signature& a, const Signature& b, int max_shift_frames);

/// @brief Offset-vote score of two landmark sets.
/// @details Matching hashes vote for time offset (t_b - t_a). The best window
///          of three adjacent offsets, divided by the smaller landmark count.
/// @return Score in [0, 1]
float landmark_similarity(const LandmarkIndex& a, const LandmarkIndex& b);

}  // namespace bandprint
