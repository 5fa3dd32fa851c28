#include "store/fingerprint_store.h"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace bandprint {

FingerprintStore::FingerprintStore(std::string folder, FolderFingerprintCache cache)
    : folder_(normalize_folder(folder)), cache_(std::move(cache)) {}

std::unique_ptr<FingerprintStore> FingerprintStore::open(const std::string& folder) {
  return std::make_unique<FingerprintStore>(folder, load_folder_cache(folder));
}

std::string FingerprintStore::path_of(const std::string& filename) const {
  return (fs::path(folder_) / filename).string();
}

std::optional<Signature> FingerprintStore::get(const std::string& filename,
                                               SignatureAlgorithm algorithm) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = cache_.files.find(filename);
  if (it == cache_.files.end()) return std::nullopt;
  auto sig = it->second.signatures.find(algorithm);
  if (sig == it->second.signatures.end()) return std::nullopt;
  return sig->second;
}

void FingerprintStore::put(const std::string& filename, SignatureAlgorithm algorithm,
                           Signature signature) {
  std::lock_guard<std::mutex> lock(mutex_);
  put_locked(filename, algorithm, std::move(signature));
}

bool FingerprintStore::put_unless_skipped(const std::string& filename,
                                          SignatureAlgorithm algorithm, Signature signature) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cache_.ignore_fingerprints || cache_.excluded_files.count(filename) > 0) return false;
  put_locked(filename, algorithm, std::move(signature));
  return true;
}

bool FingerprintStore::skips(const std::string& filename) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.ignore_fingerprints || cache_.excluded_files.count(filename) > 0;
}

void FingerprintStore::put_locked(const std::string& filename, SignatureAlgorithm algorithm,
                                  Signature signature) {
  FileFingerprintRecord& record = cache_.files[filename];
  FileStat stat{signature.source_mtime, signature.source_size};
  if (record.stat != stat) {
    for (auto it = record.signatures.begin(); it != record.signatures.end();) {
      it = it->first == algorithm ? std::next(it) : record.signatures.erase(it);
    }
    record.stat = stat;
  }
  signature.algorithm = algorithm;
  record.signatures[algorithm] = std::move(signature);
  dirty_ = true;
}

bool FingerprintStore::is_stale_locked(const std::string& filename,
                                       const FileFingerprintRecord* record,
                                       const Signature* signature) const {
  if (record == nullptr) return true;
  std::optional<FileStat> live = stat_file(path_of(filename));
  if (!live || *live != record->stat) return true;
  if (signature != nullptr) {
    return FileStat{signature->source_mtime, signature->source_size} != *live;
  }
  return false;
}

bool FingerprintStore::is_stale(const std::string& filename) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = cache_.files.find(filename);
  return is_stale_locked(filename, it == cache_.files.end() ? nullptr : &it->second, nullptr);
}

bool FingerprintStore::is_stale(const std::string& filename, SignatureAlgorithm algorithm) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = cache_.files.find(filename);
  if (it == cache_.files.end()) return true;
  auto sig = it->second.signatures.find(algorithm);
  if (sig == it->second.signatures.end()) return true;
  return is_stale_locked(filename, &it->second, &sig->second);
}

void FingerprintStore::set_reference_flag(bool value) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cache_.is_reference_folder != value) dirty_ = true;
  cache_.is_reference_folder = value;
}

void FingerprintStore::set_ignore_flag(bool value) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cache_.ignore_fingerprints != value) dirty_ = true;
  cache_.ignore_fingerprints = value;
}

bool FingerprintStore::is_reference_folder() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.is_reference_folder;
}

bool FingerprintStore::ignores_fingerprints() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.ignore_fingerprints;
}

void FingerprintStore::exclude(const std::string& filename) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cache_.excluded_files.insert(filename).second) dirty_ = true;
}

void FingerprintStore::unexclude(const std::string& filename) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cache_.excluded_files.erase(filename) > 0) dirty_ = true;
}

bool FingerprintStore::toggle_exclusion(const std::string& filename) {
  std::lock_guard<std::mutex> lock(mutex_);
  dirty_ = true;
  if (cache_.excluded_files.erase(filename) > 0) return false;
  cache_.excluded_files.insert(filename);
  return true;
}

bool FingerprintStore::is_excluded(const std::string& filename) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.excluded_files.count(filename) > 0;
}

std::vector<std::string> FingerprintStore::excluded_files() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<std::string>(cache_.excluded_files.begin(), cache_.excluded_files.end());
}

bool FingerprintStore::remove(const std::string& filename) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cache_.files.erase(filename) == 0) return false;
  dirty_ = true;
  return true;
}

int FingerprintStore::prune_missing() {
  std::lock_guard<std::mutex> lock(mutex_);
  int removed = 0;
  for (auto it = cache_.files.begin(); it != cache_.files.end();) {
    if (!stat_file(path_of(it->first))) {
      it = cache_.files.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0) {
    dirty_ = true;
    spdlog::debug("Pruned {} missing files from {}", removed, folder_);
  }
  return removed;
}

std::vector<std::string> FingerprintStore::filenames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(cache_.files.size());
  for (const auto& entry : cache_.files) names.push_back(entry.first);
  return names;
}

FolderInfo FingerprintStore::info(const std::vector<std::string>& filenames) const {
  std::lock_guard<std::mutex> lock(mutex_);
  FolderInfo info;
  info.folder = folder_;
  info.total_files = static_cast<int>(filenames.size());
  info.excluded_files.assign(cache_.excluded_files.begin(), cache_.excluded_files.end());
  info.excluded_count = static_cast<int>(info.excluded_files.size());
  info.is_reference_folder = cache_.is_reference_folder;
  info.ignore_fingerprints = cache_.ignore_fingerprints;
  for (const auto& algo : all_algorithms()) {
    info.coverage[algo.algorithm] = 0;
  }
  for (const auto& name : filenames) {
    auto it = cache_.files.find(name);
    if (it == cache_.files.end()) continue;
    for (const auto& [algorithm, sig] : it->second.signatures) {
      if (!is_stale_locked(name, &it->second, &sig)) ++info.coverage[algorithm];
    }
  }
  return info;
}

FolderInfo FingerprintStore::info() const { return info(filenames()); }

FolderFingerprintCache FingerprintStore::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_;
}

bool FingerprintStore::dirty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dirty_;
}

void FingerprintStore::save() {
  // Serializes concurrent saves (checkpoints) while leaving put() unblocked during I/O
  std::lock_guard<std::mutex> save_lock(save_mutex_);
  FolderFingerprintCache copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    copy = cache_;
    dirty_ = false;
  }
  try {
    save_folder_cache(folder_, copy);
  } catch (...) {
    std::lock_guard<std::mutex> lock(mutex_);
    dirty_ = true;
    throw;
  }
}

}  // namespace bandprint
