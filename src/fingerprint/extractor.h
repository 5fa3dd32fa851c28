#pragma once

/// @file extractor.h
/// @brief Signature extractor interface and factory.

#include <cstddef>
#include <memory>

#include "core/audio.h"
#include "fingerprint/signature.h"

namespace bandprint {

/// @brief Parameters of the log-band extractors (Spectral and Lightweight).
struct BandExtractorConfig {
  int sample_rate = 22050;   ///< Analysis rate
  int n_fft = 2048;
  int hop_length = 512;
  int n_bands = 32;
  float fmin = 40.0f;
  float fmax = 10000.0f;
  int pool = 4;              ///< Frames averaged into one signature row
  float max_seconds = 0.0f;  ///< Analyse only the middle segment of this length (0 = all)

  static BandExtractorConfig spectral() { return BandExtractorConfig(); }

  static BandExtractorConfig lightweight() {
    BandExtractorConfig c;
    c.sample_rate = 11025;
    c.n_fft = 1024;
    c.hop_length = 512;
    c.n_bands = 16;
    c.fmin = 60.0f;
    c.fmax = 5000.0f;
    c.pool = 2;
    c.max_seconds = 60.0f;
    return c;
  }
};

/// @brief Parameters of the chroma-sequence landmark extractor.
struct ChromaExtractorConfig {
  int sample_rate = 22050;
  int n_fft = 4096;
  int hop_length = 1024;
  float fmin = 80.0f;
  float fmax = 5000.0f;
  int smooth_frames = 4;             ///< Moving-average length over chroma frames
  int frame_spacing = 4;             ///< Distance between the three hashed frames
  float silence_threshold = 1e-8f;   ///< Chroma frames with a smaller L2 norm are dropped
};

/// @brief Parameters of the spectral-peak landmark extractor.
struct PeakExtractorConfig {
  int sample_rate = 11025;
  int n_fft = 512;
  int hop_length = 256;
  int freq_radius = 3;               ///< Local-maximum neighbourhood in bins
  int time_radius = 2;               ///< Local-maximum neighbourhood in frames
  float threshold_db = 10.0f;        ///< Required excess over the frame median
  float floor_db = -90.0f;           ///< Absolute floor (silence never peaks)
  int max_peaks_per_frame = 5;
  int fanout = 6;                    ///< Targets paired with each anchor
  int max_dt = 63;                   ///< Target zone length in frames
  int max_df = 31;                   ///< Target zone half-height in bins
};

/// @brief Per-algorithm extractor parameters.
struct ExtractorConfig {
  BandExtractorConfig spectral = BandExtractorConfig::spectral();
  BandExtractorConfig lightweight = BandExtractorConfig::lightweight();
  ChromaExtractorConfig chromaprint;
  PeakExtractorConfig audfprint;
};

/// @brief Converts mono PCM into a Signature of one algorithm.
/// @details Instances hold FFT state and scratch buffers, so each worker
///          thread owns its own. extract() is deterministic: identical input
///          yields identical signature content.
class SignatureExtractor {
 public:
  virtual ~SignatureExtractor() = default;

  virtual SignatureAlgorithm algorithm() const = 0;

  /// @brief Sample rate the input is resampled to before analysis.
  virtual int analysis_rate() const = 0;

  /// @brief Minimum number of samples at the analysis rate.
  virtual size_t min_samples() const = 0;

  /// @brief Extracts a signature.
  /// @details Source metadata fields are left zero for the caller to fill.
  /// @throws BandprintException UnsupportedFormat if the audio is too short,
  ///         InvalidParameter if the audio has no sample rate
  Signature extract(const Audio& audio);

 protected:
  /// @brief Selects the part of the input to analyse (whole input by default).
  virtual Audio select(const Audio& audio) const { return audio; }

  /// @brief Computes the representation from audio at the analysis rate.
  virtual Signature compute(const Audio& audio) = 0;
};

/// @brief Creates the extractor for an algorithm.
std::unique_ptr<SignatureExtractor> create_extractor(SignatureAlgorithm algorithm,
                                                     const ExtractorConfig& config = ExtractorConfig());

/// @brief One-shot extraction from raw samples.
Signature extract_signature(const float* samples, size_t size, int sample_rate,
                            SignatureAlgorithm algorithm,
                            const ExtractorConfig& config = ExtractorConfig());

/// @brief One-shot extraction from an Audio buffer.
Signature extract_signature(const Audio& audio, SignatureAlgorithm algorithm,
                            const ExtractorConfig& config = ExtractorConfig());

}  // namespace bandprint
