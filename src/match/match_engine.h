#pragma once

/// @file match_engine.h
/// @brief Ranked matching and duplicate clustering over a corpus.

#include <string>
#include <vector>

#include "match/corpus.h"
#include "match/scoring.h"

namespace bandprint {

/// @brief Lowest accepted match threshold.
constexpr float kMinThreshold = 0.5f;

/// @brief Highest accepted match threshold.
constexpr float kMaxThreshold = 0.95f;

/// @brief Configuration for matching.
struct MatchConfig {
  float threshold = 0.7f;          ///< Minimum raw score, within [0.5, 0.95]
  float reference_weight = 1.5f;   ///< Weight of reference-folder candidates
  float max_shift_seconds = 2.0f;  ///< Band alignment search range
  bool include_self = true;        ///< Keep the query's own entry in results
  int max_results = 0;             ///< 0 = unlimited
  int num_threads = 1;             ///< Threads for duplicate detection
};

/// @brief One ranked candidate.
struct MatchResult {
  std::string query_file;
  std::string candidate_file;
  SignatureAlgorithm algorithm = SignatureAlgorithm::Spectral;
  float score = 0.0f;
  float folder_weight = 1.0f;

  float weighted_score() const { return score * folder_weight; }
};

/// @brief Connected component of the pairwise similarity graph.
struct DuplicateCluster {
  SignatureAlgorithm algorithm = SignatureAlgorithm::Spectral;
  std::vector<std::string> files;  ///< Sorted paths
  float max_score = 0.0f;
  float min_edge_score = 0.0f;
};

/// @brief Clamps a user-supplied threshold into the accepted range.
float clamp_threshold(float threshold);

/// @brief Scores queries against a corpus and clusters duplicates.
/// @details Stateless apart from configuration; const methods are safe to
///          call from several threads.
class MatchEngine {
 public:
  /// @throws BandprintException InvalidParameter if the configuration is out of range
  explicit MatchEngine(const MatchConfig& config = MatchConfig());

  const MatchConfig& config() const { return config_; }

  /// @brief Similarity of two signatures of the same algorithm.
  /// @return Score in [0, 1]; 0 when algorithms differ
  float score(const Signature& a, const Signature& b) const;

  /// @brief Ranks corpus entries against a query.
  /// @details Only entries of the given algorithm with score >= threshold are
  ///          kept, ordered by weighted score, raw score, then path.
  /// @throws BandprintException InvalidParameter for a threshold outside
  ///         [0.5, 0.95] or a query of another algorithm
  std::vector<MatchResult> find_matches(const std::string& query_file, const Signature& query,
                                        const std::vector<CorpusEntry>& corpus,
                                        SignatureAlgorithm algorithm, float threshold) const;

  /// @brief find_matches with the configured threshold.
  std::vector<MatchResult> find_matches(const std::string& query_file, const Signature& query,
                                        const std::vector<CorpusEntry>& corpus,
                                        SignatureAlgorithm algorithm) const;

  /// @brief Clusters entries whose pairwise score reaches the threshold.
  /// @return Clusters of two or more files, strongest first
  std::vector<DuplicateCluster> find_duplicates(const std::vector<CorpusEntry>& corpus,
                                                SignatureAlgorithm algorithm,
                                                float threshold) const;

  std::vector<DuplicateCluster> find_duplicates(const std::vector<CorpusEntry>& corpus,
                                                SignatureAlgorithm algorithm) const;

 private:
  struct Prepared;

  float score_prepared(const Prepared& a, const Prepared& b) const;
  int shift_frames(const Signature& signature) const;

  MatchConfig config_;
};

}  // namespace bandprint
