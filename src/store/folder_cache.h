#pragma once

/// @file folder_cache.h
/// @brief Persisted per-folder fingerprint cache (.audio_fingerprints.json).

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "fingerprint/signature.h"

namespace bandprint {

/// @brief Cache file name inside each folder.
constexpr const char* kCacheFileName = ".audio_fingerprints.json";

/// @brief Cache schema version written by this library.
constexpr int kCacheVersion = 2;

/// @brief Live file metadata used for staleness checks.
struct FileStat {
  int64_t mtime = 0;  ///< Last-write time in file-clock ticks
  uint64_t size = 0;

  bool operator==(const FileStat& other) const {
    return mtime == other.mtime && size == other.size;
  }
  bool operator!=(const FileStat& other) const { return !(*this == other); }
};

/// @brief Signatures of one file, keyed by algorithm.
struct FileFingerprintRecord {
  FileStat stat;  ///< Metadata recorded by the latest put
  std::map<SignatureAlgorithm, Signature> signatures;
};

/// @brief The persisted unit, one per folder.
struct FolderFingerprintCache {
  int version = kCacheVersion;
  std::map<std::string, FileFingerprintRecord> files;
  std::set<std::string> excluded_files;
  bool is_reference_folder = false;
  bool ignore_fingerprints = false;
};

/// @brief Lexically normalizes a folder path and strips a trailing separator.
std::string normalize_folder(const std::string& folder);

/// @brief Returns the cache file path for a folder.
std::string cache_file_path(const std::string& folder);

/// @brief Stats a file.
/// @return Metadata, or nullopt if the file does not exist or is not a regular file
std::optional<FileStat> stat_file(const std::string& path);

/// @brief Reads a folder's cache.
/// @details Never throws for I/O: a missing file yields an empty cache, an
///          unreadable or newer-version file is logged and yields an empty
///          cache. Version 1 signatures are dropped (logged) while flags and
///          exclusions are kept.
FolderFingerprintCache load_folder_cache(const std::string& folder);

/// @brief Writes a folder's cache atomically (temp file + rename).
/// @throws BandprintException CacheWriteFailed; the previous file is left intact
void save_folder_cache(const std::string& folder, const FolderFingerprintCache& cache);

/// @brief Serializes a cache to its JSON text.
std::string serialize_folder_cache(const FolderFingerprintCache& cache);

/// @brief Parses cache JSON text.
/// @throws BandprintException CacheReadFailed on malformed JSON or unsupported version
FolderFingerprintCache parse_folder_cache(const std::string& text);

/// @brief Returns every folder at or below root that holds a cache file, sorted.
/// @details Unreadable sub-directories are skipped. A missing root yields an empty list.
std::vector<std::string> discover_fingerprint_folders(const std::string& root);

}  // namespace bandprint
