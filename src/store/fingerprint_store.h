#pragma once

/// @file fingerprint_store.h
/// @brief Thread-safe in-memory view of one folder's fingerprint cache.

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "store/folder_cache.h"

namespace bandprint {

/// @brief Summary of a folder's cache state.
struct FolderInfo {
  std::string folder;
  int total_files = 0;                             ///< Files considered
  std::map<SignatureAlgorithm, int> coverage;      ///< Fresh signatures per algorithm
  int excluded_count = 0;
  std::vector<std::string> excluded_files;
  bool is_reference_folder = false;
  bool ignore_fingerprints = false;
};

/// @brief Per-folder fingerprint store.
/// @details All mutations stay in memory until save(). Every member is
///          guarded by one mutex, so extraction workers may put() concurrently.
///          Filenames are relative to the folder.
class FingerprintStore {
 public:
  /// @brief Creates a store over an already loaded cache.
  FingerprintStore(std::string folder, FolderFingerprintCache cache);

  /// @brief Loads the folder's cache file (soft failure: empty cache).
  static std::unique_ptr<FingerprintStore> open(const std::string& folder);

  FingerprintStore(const FingerprintStore&) = delete;
  FingerprintStore& operator=(const FingerprintStore&) = delete;

  const std::string& folder() const { return folder_; }

  /// @brief Absolute path of a file in this folder.
  std::string path_of(const std::string& filename) const;

  std::optional<Signature> get(const std::string& filename, SignatureAlgorithm algorithm) const;

  /// @brief Inserts or replaces a signature.
  /// @details The record's metadata becomes the signature's source metadata.
  ///          If that differs from what was recorded, signatures of other
  ///          algorithms (computed from the old contents) are dropped.
  void put(const std::string& filename, SignatureAlgorithm algorithm, Signature signature);

  /// @brief put() unless the file is excluded or the folder ignored, checked atomically.
  /// @return false if the signature was discarded
  bool put_unless_skipped(const std::string& filename, SignatureAlgorithm algorithm,
                          Signature signature);

  /// @brief True if the folder is ignored or the file excluded.
  bool skips(const std::string& filename) const;

  /// @brief True if the record is missing or its metadata disagrees with the live file.
  bool is_stale(const std::string& filename) const;

  /// @brief True if the algorithm's signature is missing or was computed from other contents.
  bool is_stale(const std::string& filename, SignatureAlgorithm algorithm) const;

  void set_reference_flag(bool value);
  void set_ignore_flag(bool value);
  bool is_reference_folder() const;
  bool ignores_fingerprints() const;

  void exclude(const std::string& filename);
  void unexclude(const std::string& filename);

  /// @return New exclusion state
  bool toggle_exclusion(const std::string& filename);
  bool is_excluded(const std::string& filename) const;
  std::vector<std::string> excluded_files() const;

  /// @return true if a record was removed
  bool remove(const std::string& filename);

  /// @brief Removes records whose file no longer exists.
  /// @return Number of records removed
  int prune_missing();

  /// @brief Filenames with a record, sorted.
  std::vector<std::string> filenames() const;

  /// @brief Summary over the given filenames (coverage counts fresh signatures).
  FolderInfo info(const std::vector<std::string>& filenames) const;

  /// @brief Summary over the recorded filenames.
  FolderInfo info() const;

  /// @brief Copy of the current cache contents.
  FolderFingerprintCache snapshot() const;

  /// @brief True if there are mutations not yet saved.
  bool dirty() const;

  /// @brief Saves atomically and clears the dirty flag.
  /// @throws BandprintException CacheWriteFailed; in-memory state is kept for a retry
  void save();

 private:
  void put_locked(const std::string& filename, SignatureAlgorithm algorithm, Signature signature);
  bool is_stale_locked(const std::string& filename, const FileFingerprintRecord* record,
                       const Signature* signature) const;

  std::string folder_;
  FolderFingerprintCache cache_;
  bool dirty_ = false;
  mutable std::mutex mutex_;
  std::mutex save_mutex_;
};

}  // namespace bandprint
