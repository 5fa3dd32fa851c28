#pragma once

/// @file corpus.h
/// @brief Flattening fingerprint stores into a match corpus.

#include <string>
#include <vector>

#include "fingerprint/signature.h"

namespace bandprint {

class FingerprintStore;

/// @brief One candidate signature with its folder weight.
struct CorpusEntry {
  std::string path;      ///< Full path (folder / filename)
  std::string folder;
  std::string filename;
  float folder_weight = 1.0f;
  Signature signature;
};

/// @brief Collects fresh signatures of one algorithm from several stores.
/// @details Ignored folders, excluded files and stale entries are skipped.
///          Files in reference folders get reference_weight, others 1.0.
std::vector<CorpusEntry> build_corpus(const std::vector<const FingerprintStore*>& stores,
                                      SignatureAlgorithm algorithm, float reference_weight);

}  // namespace bandprint
