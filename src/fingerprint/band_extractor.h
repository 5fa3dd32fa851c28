#pragma once

/// @file band_extractor.h
/// @brief Log-band spectral envelope extractor (Spectral and Lightweight).

#include "filters/filterbank.h"
#include "fingerprint/extractor.h"

namespace bandprint {

/// @brief Produces a pooled [n_frames x n_bands] log-magnitude matrix.
class BandExtractor : public SignatureExtractor {
 public:
  /// @throws BandprintException on an invalid configuration
  BandExtractor(SignatureAlgorithm algorithm, const BandExtractorConfig& config);

  SignatureAlgorithm algorithm() const override { return algorithm_; }
  int analysis_rate() const override { return config_.sample_rate; }
  size_t min_samples() const override { return static_cast<size_t>(config_.n_fft); }

  const BandExtractorConfig& config() const { return config_; }

 protected:
  Audio select(const Audio& audio) const override;
  Signature compute(const Audio& audio) override;

 private:
  SignatureAlgorithm algorithm_;
  BandExtractorConfig config_;
  Filterbank bank_;
};

}  // namespace bandprint
