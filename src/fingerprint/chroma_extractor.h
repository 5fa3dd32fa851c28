#pragma once

/// @file chroma_extractor.h
/// @brief Chroma-sequence landmark extractor.

#include "filters/filterbank.h"
#include "fingerprint/extractor.h"

namespace bandprint {

/// @brief Hashes short sequences of dominant pitch-class pairs.
/// @details Per frame: 12-bin chroma from the power spectrum, L2-normalized,
///          smoothed. Silent frames are dropped. Each frame is coded as
///          strongest * 12 + second strongest (0..143); codes of frames t,
///          t + s and t + 2s form one 24-bit hash. Consecutive identical
///          hashes collapse into the first.
class ChromaExtractor : public SignatureExtractor {
 public:
  explicit ChromaExtractor(const ChromaExtractorConfig& config);

  SignatureAlgorithm algorithm() const override { return SignatureAlgorithm::ChromaprintStyle; }
  int analysis_rate() const override { return config_.sample_rate; }

  /// @brief One STFT frame plus the span of a single hash.
  size_t min_samples() const override;

 protected:
  Signature compute(const Audio& audio) override;

 private:
  ChromaExtractorConfig config_;
  Filterbank bank_;
};

/// @brief Codes a 12-bin chroma frame as strongest * 12 + second strongest.
int chroma_pair_code(const float* chroma);

}  // namespace bandprint
