#include "fingerprint/algorithm.h"

#include "util/exception.h"

namespace bandprint {

const std::vector<AlgorithmInfo>& all_algorithms() {
  static const std::vector<AlgorithmInfo> kAlgorithms = {
      {SignatureAlgorithm::Spectral, "spectral", "Spectral Analysis",
       "Log-band spectral envelope; balanced accuracy and speed"},
      {SignatureAlgorithm::Lightweight, "lightweight", "Lightweight STFT",
       "Coarse bands over the middle minute; fastest"},
      {SignatureAlgorithm::ChromaprintStyle, "chromaprint", "Chromaprint-style",
       "Pitch-class sequences; robust to level and timbre changes"},
      {SignatureAlgorithm::AudfprintStyle, "audfprint", "Audfprint-style",
       "Spectral peak landmarks; robust to noise and partial overlap"},
  };
  return kAlgorithms;
}

const AlgorithmInfo& algorithm_info(SignatureAlgorithm algorithm) {
  for (const auto& info : all_algorithms()) {
    if (info.algorithm == algorithm) return info;
  }
  throw BandprintException(ErrorCode::InvalidParameter, "Unknown signature algorithm");
}

const char* algorithm_id(SignatureAlgorithm algorithm) { return algorithm_info(algorithm).id; }

bool try_parse_algorithm(const std::string& id, SignatureAlgorithm& out) {
  for (const auto& info : all_algorithms()) {
    if (id == info.id) {
      out = info.algorithm;
      return true;
    }
  }
  return false;
}

SignatureAlgorithm parse_algorithm(const std::string& id) {
  SignatureAlgorithm algorithm;
  BANDPRINT_CHECK_MSG(try_parse_algorithm(id, algorithm), ErrorCode::InvalidParameter,
                      "Unknown algorithm: " + id);
  return algorithm;
}

}  // namespace bandprint
