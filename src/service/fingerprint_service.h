#pragma once

/// @file fingerprint_service.h
/// @brief Application-facing facade over stores, extraction, batches and matching.

#include <memory>
#include <string>
#include <vector>

#include "generation/generation_coordinator.h"
#include "match/match_engine.h"
#include "store/fingerprint_store.h"
#include "store/store_registry.h"

namespace bandprint {

/// @brief Service-wide defaults.
struct ServiceConfig {
  SignatureAlgorithm default_algorithm = SignatureAlgorithm::Spectral;
  MatchConfig match;
  CoordinatorConfig generation;
};

/// @brief Entry point for front ends (GUI, CLI).
/// @details Folder flag and exclusion changes are saved immediately. Stores
///          are shared with the batches this service starts, so a change made
///          while a batch runs is kept when the batch saves.
///          Thresholds passed in are clamped to [0.5, 0.95].
class FingerprintService {
 public:
  explicit FingerprintService(const ServiceConfig& config = ServiceConfig(),
                              std::shared_ptr<const AudioFileSource> source = nullptr,
                              std::shared_ptr<const AudioDecoder> decoder = nullptr);

  const ServiceConfig& config() const { return config_; }

  /// @brief Descriptors of the available algorithms.
  const std::vector<AlgorithmInfo>& algorithms() const { return all_algorithms(); }

  /// @brief Starts fingerprinting individual files.
  /// @return Batch handle for progress, cancel and wait
  std::unique_ptr<GenerationCoordinator> generate(
      const std::vector<std::string>& files, SignatureAlgorithm algorithm,
      GenerationProgressCallback on_progress = nullptr,
      GenerationCompletionCallback on_complete = nullptr) const;

  /// @brief Starts fingerprinting a folder (optionally its whole tree).
  std::unique_ptr<GenerationCoordinator> generate_folder(
      const std::string& folder, bool recursive, SignatureAlgorithm algorithm,
      GenerationProgressCallback on_progress = nullptr,
      GenerationCompletionCallback on_complete = nullptr) const;

  /// @brief Cache summary over the folder's audio files.
  FolderInfo get_info(const std::string& folder) const;

  /// @brief Ranks files in folders against a query file.
  /// @details A query without a fresh cached signature is extracted on the fly.
  /// @throws BandprintException if the query cannot be decoded or extracted
  std::vector<MatchResult> find_matches(const std::string& query_path,
                                        const std::vector<std::string>& folders,
                                        SignatureAlgorithm algorithm, float threshold) const;

  /// @brief Clusters duplicate recordings across folders.
  std::vector<DuplicateCluster> find_duplicates(const std::vector<std::string>& folders,
                                                SignatureAlgorithm algorithm,
                                                float threshold) const;

  /// @throws BandprintException CacheWriteFailed
  void set_reference_folder(const std::string& folder, bool value) const;
  bool toggle_reference_folder(const std::string& folder) const;
  void set_ignore_folder(const std::string& folder, bool value) const;
  bool toggle_ignore_folder(const std::string& folder) const;

  /// @return New exclusion state
  bool toggle_file_exclusion(const std::string& file_path) const;
  void set_file_excluded(const std::string& file_path, bool excluded) const;
  bool is_file_excluded(const std::string& file_path) const;

  /// @brief Every folder at or below root that holds a fingerprint cache.
  std::vector<std::string> discover_folders(const std::string& root) const;

 private:
  std::unique_ptr<GenerationCoordinator> make_coordinator() const;
  std::vector<std::shared_ptr<FingerprintStore>> open_stores(
      const std::vector<std::string>& folders) const;
  MatchEngine make_engine() const;

  ServiceConfig config_;
  std::shared_ptr<const AudioFileSource> source_;
  std::shared_ptr<const AudioDecoder> decoder_;
  std::shared_ptr<StoreRegistry> stores_;
};

}  // namespace bandprint
