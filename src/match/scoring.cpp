#include "match/scoring.h"

#include <Eigen/Core>

#include <algorithm>
#include <cmath>
#include <unordered_map>

#include "util/math_utils.h"

namespace bandprint {

namespace {

using RowMatrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// @brief Correlation of two [frames x bands] blocks with every band centred over the block.
/// @details Only each band's movement over time is compared; the average
///          band profile, which most music shares, does not contribute.
float block_correlation(const float* a, const float* b, Eigen::Index frames, Eigen::Index bands) {
  Eigen::Map<const RowMatrix> ma(a, frames, bands);
  Eigen::Map<const RowMatrix> mb(b, frames, bands);
  const RowMatrix da = ma.rowwise() - ma.colwise().mean();
  const RowMatrix db = mb.rowwise() - mb.colwise().mean();
  const double den = std::sqrt(static_cast<double>(da.squaredNorm()) *
                               static_cast<double>(db.squaredNorm()));
  if (den < 1e-12) return 0.0f;
  return static_cast<float>(static_cast<double>(da.cwiseProduct(db).sum()) / den);
}

}  // namespace

LandmarkIndex::LandmarkIndex(const std::vector<Landmark>& landmarks) {
  entries_.reserve(landmarks.size());
  for (const auto& lm : landmarks) {
    entries_.emplace_back(lm.hash, lm.time);
  }
  std::sort(entries_.begin(), entries_.end());
}

float band_similarity(const Signature& a, const Signature& b, int max_shift_frames) {
  if (a.n_bands <= 0 || a.n_bands != b.n_bands) return 0.0f;
  const int bands = a.n_bands;
  const int n_a = a.n_frames();
  const int n_b = b.n_frames();
  if (n_a == 0 || n_b == 0) return 0.0f;

  const int min_overlap = std::max(1, (std::min(n_a, n_b) + 1) / 2);
  float best = 0.0f;
  // Row i of a aligns with row i + shift of b
  for (int shift = -max_shift_frames; shift <= max_shift_frames; ++shift) {
    const int lo = std::max(0, -shift);
    const int hi = std::min(n_a, n_b - shift);
    const int overlap = hi - lo;
    if (overlap < min_overlap) continue;
    const float r = block_correlation(a.frames.data() + static_cast<size_t>(lo) * bands,
                                      b.frames.data() + static_cast<size_t>(lo + shift) * bands,
                                      overlap, bands);
    best = std::max(best, r);
  }
  return clamp(best, 0.0f, 1.0f);
}

float landmark_similarity(const LandmarkIndex& a, const LandmarkIndex& b) {
  if (a.empty() || b.empty()) return 0.0f;

  std::unordered_map<int32_t, int> votes;
  const auto& ea = a.entries();
  const auto& eb = b.entries();
  size_t i = 0;
  size_t j = 0;
  while (i < ea.size() && j < eb.size()) {
    if (ea[i].first < eb[j].first) {
      ++i;
    } else if (eb[j].first < ea[i].first) {
      ++j;
    } else {
      const uint32_t hash = ea[i].first;
      size_t i_end = i;
      size_t j_end = j;
      while (i_end < ea.size() && ea[i_end].first == hash) ++i_end;
      while (j_end < eb.size() && eb[j_end].first == hash) ++j_end;
      for (size_t x = i; x < i_end; ++x) {
        for (size_t y = j; y < j_end; ++y) {
          ++votes[eb[y].second - ea[x].second];
        }
      }
      i = i_end;
      j = j_end;
    }
  }
  if (votes.empty()) return 0.0f;

  int best = 0;
  for (const auto& [offset, count] : votes) {
    int window = count;
    auto prev = votes.find(offset - 1);
    auto next = votes.find(offset + 1);
    if (prev != votes.end()) window += prev->second;
    if (next != votes.end()) window += next->second;
    best = std::max(best, window);
  }
  const float denom = static_cast<float>(std::min(a.size(), b.size()));
  return clamp(static_cast<float>(best) / denom, 0.0f, 1.0f);
}

}  // namespace bandprint
