#include "fingerprint/extractor.h"

#include <chrono>
#include <string>

#include "core/resample.h"
#include "fingerprint/band_extractor.h"
#include "fingerprint/chroma_extractor.h"
#include "fingerprint/peak_extractor.h"
#include "util/exception.h"

namespace bandprint {

Signature SignatureExtractor::extract(const Audio& audio) {
  BANDPRINT_CHECK_MSG(audio.sample_rate() > 0 || audio.empty(), ErrorCode::InvalidParameter,
                      "Audio has no sample rate");

  Audio analysed = audio.empty() ? audio : resample(select(audio), analysis_rate());
  if (analysed.size() < min_samples()) {
    throw BandprintException(
        ErrorCode::UnsupportedFormat,
        std::string("Audio too short for ") + algorithm_id(algorithm()) + ": " +
            std::to_string(analysed.size()) + " samples at " + std::to_string(analysis_rate()) +
            " Hz, need " + std::to_string(min_samples()));
  }

  Signature signature = compute(analysed);
  signature.algorithm = algorithm();
  signature.generated_at = std::chrono::duration_cast<std::chrono::seconds>(
                               std::chrono::system_clock::now().time_since_epoch())
                               .count();
  return signature;
}

std::unique_ptr<SignatureExtractor> create_extractor(SignatureAlgorithm algorithm,
                                                     const ExtractorConfig& config) {
  switch (algorithm) {
    case SignatureAlgorithm::Spectral:
      return std::make_unique<BandExtractor>(SignatureAlgorithm::Spectral, config.spectral);
    case SignatureAlgorithm::Lightweight:
      return std::make_unique<BandExtractor>(SignatureAlgorithm::Lightweight, config.lightweight);
    case SignatureAlgorithm::ChromaprintStyle:
      return std::make_unique<ChromaExtractor>(config.chromaprint);
    case SignatureAlgorithm::AudfprintStyle:
      return std::make_unique<PeakExtractor>(config.audfprint);
  }
  throw BandprintException(ErrorCode::InvalidParameter, "Unknown signature algorithm");
}

Signature extract_signature(const float* samples, size_t size, int sample_rate,
                            SignatureAlgorithm algorithm, const ExtractorConfig& config) {
  return extract_signature(Audio::from_buffer(samples, size, sample_rate), algorithm, config);
}

Signature extract_signature(const Audio& audio, SignatureAlgorithm algorithm,
                            const ExtractorConfig& config) {
  return create_extractor(algorithm, config)->extract(audio);
}

}  // namespace bandprint
