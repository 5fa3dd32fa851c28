#include "fingerprint/band_extractor.h"

#include <cmath>

#include "core/spectrum.h"
#include "filters/bands.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace bandprint {

namespace {
// Window-normalized magnitudes of program material sit around 1e-4..1e-1;
// the gain moves them into the logarithmic part of log1p.
constexpr float kBandGain = 1000.0f;
}  // namespace

BandExtractor::BandExtractor(SignatureAlgorithm algorithm, const BandExtractorConfig& config)
    : algorithm_(algorithm), config_(config) {
  BANDPRINT_CHECK_MSG(config.sample_rate > 0 && config.hop_length > 0 && config.pool > 0,
                      ErrorCode::InvalidParameter, "Invalid band extractor configuration");
  BandFilterConfig bands;
  bands.n_bands = config.n_bands;
  bands.fmin = config.fmin;
  bands.fmax = config.fmax;
  bank_ = create_band_filterbank(config.sample_rate, config.n_fft, bands);
}

Audio BandExtractor::select(const Audio& audio) const {
  return config_.max_seconds > 0.0f ? audio.middle(config_.max_seconds) : audio;
}

Signature BandExtractor::compute(const Audio& audio) {
  StftConfig stft;
  stft.n_fft = config_.n_fft;
  stft.hop_length = config_.hop_length;
  stft.window = WindowType::Hann;
  Spectrogram spec = Spectrogram::compute(audio, stft);

  std::vector<float> bands = apply_filterbank(spec, bank_);
  for (float& v : bands) {
    v = std::log1p(kBandGain * v);
  }

  Signature signature;
  signature.n_bands = config_.n_bands;
  signature.frame_rate = spec.frame_rate() / static_cast<float>(config_.pool);
  signature.frames = pool_rows(bands.data(), spec.n_frames(), config_.n_bands, config_.pool);
  return signature;
}

}  // namespace bandprint
