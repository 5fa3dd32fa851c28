#pragma once

/// @file algorithm.h
/// @brief Signature algorithm identifiers.

#include <string>
#include <vector>

namespace bandprint {

/// @brief Fingerprint algorithms. Each has a fixed signature representation.
enum class SignatureAlgorithm {
  Spectral,          ///< Log-band frame matrix (default)
  Lightweight,       ///< Coarse log-band matrix over the middle minute
  ChromaprintStyle,  ///< Chroma-sequence landmarks
  AudfprintStyle,    ///< Spectral peak-pair landmarks
};

/// @brief Algorithm descriptor shown to users.
struct AlgorithmInfo {
  SignatureAlgorithm algorithm;
  const char* id;           ///< Stable id used in the cache file
  const char* name;         ///< Display name
  const char* description;  ///< One-line description
};

/// @brief Returns the stable string id ("spectral", "lightweight", ...).
const char* algorithm_id(SignatureAlgorithm algorithm);

/// @brief Parses a stable id.
/// @throws BandprintException InvalidParameter for an unknown id
SignatureAlgorithm parse_algorithm(const std::string& id);

/// @brief Parses a stable id without throwing.
/// @return false if the id is unknown
bool try_parse_algorithm(const std::string& id, SignatureAlgorithm& out);

/// @brief Returns the descriptor of an algorithm.
const AlgorithmInfo& algorithm_info(SignatureAlgorithm algorithm);

/// @brief Returns descriptors of all algorithms, default first.
const std::vector<AlgorithmInfo>& all_algorithms();

/// @brief True for algorithms whose signature is a landmark list.
inline bool is_landmark_algorithm(SignatureAlgorithm algorithm) {
  return algorithm == SignatureAlgorithm::ChromaprintStyle ||
         algorithm == SignatureAlgorithm::AudfprintStyle;
}

}  // namespace bandprint
