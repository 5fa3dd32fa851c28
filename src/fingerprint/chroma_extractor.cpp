#include "fingerprint/chroma_extractor.h"

#include "core/spectrum.h"
#include "filters/chroma.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace bandprint {

namespace {
constexpr int kChroma = 12;
}  // namespace

int chroma_pair_code(const float* chroma) {
  int first = static_cast<int>(argmax(chroma, kChroma));
  int second = first == 0 ? 1 : 0;
  for (int c = 0; c < kChroma; ++c) {
    if (c != first && chroma[c] > chroma[second]) second = c;
  }
  return first * kChroma + second;
}

ChromaExtractor::ChromaExtractor(const ChromaExtractorConfig& config) : config_(config) {
  BANDPRINT_CHECK_MSG(config.sample_rate > 0 && config.hop_length > 0 &&
                          config.frame_spacing > 0 && config.smooth_frames > 0,
                      ErrorCode::InvalidParameter, "Invalid chroma extractor configuration");
  ChromaFilterConfig chroma;
  chroma.n_chroma = kChroma;
  chroma.fmin = config.fmin;
  chroma.fmax = config.fmax;
  bank_ = create_chroma_filterbank(config.sample_rate, config.n_fft, chroma);
}

size_t ChromaExtractor::min_samples() const {
  return static_cast<size_t>(config_.n_fft) +
         static_cast<size_t>(2 * config_.frame_spacing) * config_.hop_length;
}

Signature ChromaExtractor::compute(const Audio& audio) {
  StftConfig stft;
  stft.n_fft = config_.n_fft;
  stft.hop_length = config_.hop_length;
  Spectrogram spec = Spectrogram::compute(audio, stft);
  const int n_frames = spec.n_frames();

  std::vector<float> chroma = apply_filterbank(spec, bank_, true);
  std::vector<bool> voiced(n_frames);
  for (int t = 0; t < n_frames; ++t) {
    float norm = normalize_l2(chroma.data() + static_cast<size_t>(t) * kChroma, kChroma);
    voiced[t] = norm >= config_.silence_threshold;
  }
  std::vector<float> smoothed = smooth_rows(chroma.data(), n_frames, kChroma,
                                            config_.smooth_frames);

  std::vector<int> codes;
  std::vector<int> times;
  for (int t = 0; t < n_frames; ++t) {
    if (!voiced[t]) continue;
    codes.push_back(chroma_pair_code(smoothed.data() + static_cast<size_t>(t) * kChroma));
    times.push_back(t);
  }

  Signature signature;
  signature.frame_rate = spec.frame_rate();
  const int s = config_.frame_spacing;
  const int n_codes = static_cast<int>(codes.size());
  for (int i = 0; i + 2 * s < n_codes; ++i) {
    uint32_t hash = (static_cast<uint32_t>(codes[i]) << 16) |
                    (static_cast<uint32_t>(codes[i + s]) << 8) |
                    static_cast<uint32_t>(codes[i + 2 * s]);
    if (!signature.landmarks.empty() && signature.landmarks.back().hash == hash) continue;
    signature.landmarks.push_back({hash, static_cast<int32_t>(times[i])});
  }
  return signature;
}

}  // namespace bandprint
