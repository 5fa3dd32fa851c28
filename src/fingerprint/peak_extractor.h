#pragma once

/// @file peak_extractor.h
/// @brief Spectral peak-pair landmark extractor.

#include <vector>

#include "fingerprint/extractor.h"

namespace bandprint {

/// @brief Time-frequency peak in the log-magnitude spectrogram.
struct SpectralPeak {
  int frame;
  int bin;
  float level_db;
};

/// @brief Pairs spectral peaks into (f1, df, dt) landmark hashes.
class PeakExtractor : public SignatureExtractor {
 public:
  explicit PeakExtractor(const PeakExtractorConfig& config);

  SignatureAlgorithm algorithm() const override { return SignatureAlgorithm::AudfprintStyle; }
  int analysis_rate() const override { return config_.sample_rate; }

  /// @brief Two STFT frames, the shortest span a peak pair can cover.
  size_t min_samples() const override {
    return static_cast<size_t>(config_.n_fft + config_.hop_length);
  }

 protected:
  Signature compute(const Audio& audio) override;

 private:
  PeakExtractorConfig config_;
};

/// @brief Finds local maxima above a per-frame adaptive threshold.
/// @param level_db Log-magnitude [n_bins x n_frames]
/// @return Peaks ordered by frame, then bin
std::vector<SpectralPeak> find_spectral_peaks(const std::vector<float>& level_db, int n_bins,
                                              int n_frames, const PeakExtractorConfig& config);

/// @brief Packs an anchor bin, bin delta and frame delta into a 20-bit hash.
/// @details Layout: f1 (8 bits) | df + 32 (6 bits) | dt (6 bits).
uint32_t landmark_hash(int f1, int df, int dt);

}  // namespace bandprint
