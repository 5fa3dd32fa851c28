#pragma once

/// @file signature.h
/// @brief Fingerprint signature representation.

#include <cstdint>
#include <vector>

#include "fingerprint/algorithm.h"
#include "util/types.h"

namespace bandprint {

/// @brief Hashable time-anchored feature.
struct Landmark {
  uint32_t hash = 0;
  int32_t time = 0;  ///< Analysis frame index of the anchor

  bool operator==(const Landmark& other) const {
    return hash == other.hash && time == other.time;
  }
  bool operator!=(const Landmark& other) const { return !(*this == other); }
};

/// @brief Fingerprint of one file under one algorithm.
/// @details Band algorithms fill frames/n_bands; landmark algorithms fill
///          landmarks. A signature is never mutated after extraction; a
///          changed source file produces a new one.
struct Signature {
  SignatureAlgorithm algorithm = SignatureAlgorithm::Spectral;

  int n_bands = 0;
  float frame_rate = 0.0f;     ///< Frames (or landmark time units) per second
  std::vector<float> frames;   ///< [n_frames x n_bands] row-major
  std::vector<Landmark> landmarks;

  int64_t generated_at = 0;    ///< Seconds since the Unix epoch
  int64_t source_mtime = 0;    ///< Source last-write time in file-clock ticks
  uint64_t source_size = 0;    ///< Source size in bytes

  int n_frames() const {
    return n_bands > 0 ? static_cast<int>(frames.size() / static_cast<size_t>(n_bands)) : 0;
  }

  bool empty() const { return frames.empty() && landmarks.empty(); }

  /// @brief True if the representation carries the same content.
  /// @details File metadata and generation time are ignored.
  bool same_content(const Signature& other) const {
    return algorithm == other.algorithm && n_bands == other.n_bands &&
           frame_rate == other.frame_rate && frames == other.frames &&
           landmarks == other.landmarks;
  }
};

}  // namespace bandprint
