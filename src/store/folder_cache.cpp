#include "store/folder_cache.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "util/exception.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace bandprint {

namespace {

json signature_to_json(const Signature& sig) {
  json j;
  j["generated_at"] = sig.generated_at;
  j["source_mtime"] = sig.source_mtime;
  j["source_size"] = sig.source_size;
  j["frame_rate"] = sig.frame_rate;
  if (is_landmark_algorithm(sig.algorithm)) {
    // Flat [hash0, time0, hash1, time1, ...]
    json flat = json::array();
    for (const auto& lm : sig.landmarks) {
      flat.push_back(lm.hash);
      flat.push_back(lm.time);
    }
    j["landmarks"] = std::move(flat);
  } else {
    j["n_bands"] = sig.n_bands;
    j["frames"] = sig.frames;
  }
  return j;
}

Signature signature_from_json(SignatureAlgorithm algorithm, const json& j) {
  Signature sig;
  sig.algorithm = algorithm;
  sig.generated_at = j.at("generated_at").get<int64_t>();
  sig.source_mtime = j.at("source_mtime").get<int64_t>();
  sig.source_size = j.at("source_size").get<uint64_t>();
  sig.frame_rate = j.at("frame_rate").get<float>();
  if (is_landmark_algorithm(algorithm)) {
    const json& flat = j.at("landmarks");
    if (flat.size() % 2 != 0) {
      throw BandprintException(ErrorCode::CacheReadFailed, "Odd landmark array length");
    }
    sig.landmarks.reserve(flat.size() / 2);
    for (size_t i = 0; i < flat.size(); i += 2) {
      sig.landmarks.push_back({flat[i].get<uint32_t>(), flat[i + 1].get<int32_t>()});
    }
  } else {
    sig.n_bands = j.at("n_bands").get<int>();
    sig.frames = j.at("frames").get<std::vector<float>>();
    if (sig.n_bands <= 0 || sig.frames.size() % static_cast<size_t>(sig.n_bands) != 0) {
      throw BandprintException(ErrorCode::CacheReadFailed, "Band matrix shape mismatch");
    }
  }
  return sig;
}

}  // namespace

std::string normalize_folder(const std::string& folder) {
  fs::path p = fs::path(folder).lexically_normal();
  if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
    p = p.parent_path();
  }
  return p.string();
}

std::string cache_file_path(const std::string& folder) {
  return (fs::path(folder) / kCacheFileName).string();
}

std::optional<FileStat> stat_file(const std::string& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  FileStat stat;
  auto size = fs::file_size(path, ec);
  if (ec) return std::nullopt;
  auto mtime = fs::last_write_time(path, ec);
  if (ec) return std::nullopt;
  stat.size = static_cast<uint64_t>(size);
  stat.mtime = static_cast<int64_t>(mtime.time_since_epoch().count());
  return stat;
}

std::string serialize_folder_cache(const FolderFingerprintCache& cache) {
  json root;
  root["version"] = kCacheVersion;
  json files = json::object();
  for (const auto& [filename, record] : cache.files) {
    json entry;
    entry["mtime"] = record.stat.mtime;
    entry["size"] = record.stat.size;
    json fingerprints = json::object();
    for (const auto& [algorithm, sig] : record.signatures) {
      fingerprints[algorithm_id(algorithm)] = signature_to_json(sig);
    }
    entry["fingerprints"] = std::move(fingerprints);
    files[filename] = std::move(entry);
  }
  root["files"] = std::move(files);
  root["excluded_files"] = json(std::vector<std::string>(cache.excluded_files.begin(),
                                                         cache.excluded_files.end()));
  root["is_reference_folder"] = cache.is_reference_folder;
  root["ignore_fingerprints"] = cache.ignore_fingerprints;
  return root.dump();
}

FolderFingerprintCache parse_folder_cache(const std::string& text) {
  json root;
  try {
    root = json::parse(text);
  } catch (const json::parse_error& e) {
    throw BandprintException(ErrorCode::CacheReadFailed, std::string("Malformed JSON: ") + e.what());
  }
  BANDPRINT_CHECK_MSG(root.is_object(), ErrorCode::CacheReadFailed, "Cache root is not an object");

  FolderFingerprintCache cache;
  const json version_field = root.value("version", json(1));
  BANDPRINT_CHECK_MSG(version_field.is_number_integer(), ErrorCode::CacheReadFailed,
                      "Cache version is not an integer");
  const int version = version_field.get<int>();
  BANDPRINT_CHECK_MSG(version >= 1 && version <= kCacheVersion, ErrorCode::CacheReadFailed,
                      "Unsupported cache version " + std::to_string(version));

  try {
    cache.is_reference_folder = root.value("is_reference_folder", false);
    cache.ignore_fingerprints = root.value("ignore_fingerprints", false);
    if (root.contains("excluded_files")) {
      for (const auto& name : root.at("excluded_files")) {
        cache.excluded_files.insert(name.get<std::string>());
      }
    }
  } catch (const json::exception& e) {
    throw BandprintException(ErrorCode::CacheReadFailed, std::string("Bad folder flags: ") + e.what());
  }

  int dropped = 0;
  const json files = root.value("files", json::object());
  BANDPRINT_CHECK_MSG(files.is_object(), ErrorCode::CacheReadFailed, "\"files\" is not an object");
  for (auto it = files.begin(); it != files.end(); ++it) {
    const json& entry = it.value();
    if (!entry.is_object()) {
      ++dropped;
      continue;
    }
    FileFingerprintRecord record;
    try {
      record.stat.mtime = entry.value("mtime", int64_t{0});
      record.stat.size = entry.value("size", uint64_t{0});
    } catch (const json::exception&) {
      ++dropped;
      continue;
    }
    // Version 1 stored a single "fingerprint" vector (or bare vectors under
    // "fingerprints") in a format that no longer compares with current ones.
    if (version < kCacheVersion || !entry.contains("fingerprints")) {
      ++dropped;
      continue;
    }
    const json& fingerprints = entry.at("fingerprints");
    if (!fingerprints.is_object()) {
      ++dropped;
      continue;
    }
    for (auto fp = fingerprints.begin(); fp != fingerprints.end(); ++fp) {
      SignatureAlgorithm algorithm;
      if (!try_parse_algorithm(fp.key(), algorithm)) {
        ++dropped;
        continue;
      }
      try {
        record.signatures.emplace(algorithm, signature_from_json(algorithm, fp.value()));
      } catch (const json::exception&) {
        ++dropped;
      } catch (const BandprintException&) {
        ++dropped;
      }
    }
    if (!record.signatures.empty()) {
      cache.files.emplace(it.key(), std::move(record));
    }
  }
  if (dropped > 0) {
    spdlog::warn("Dropped {} outdated or malformed fingerprint entries (cache version {})", dropped,
                 version);
  }
  return cache;
}

FolderFingerprintCache load_folder_cache(const std::string& folder) {
  const std::string path = cache_file_path(folder);
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return FolderFingerprintCache();
  }
  if (!fs::is_regular_file(path, ec)) {
    spdlog::warn("Fingerprint cache {} is not a regular file; treating as empty", path);
    return FolderFingerprintCache();
  }

  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    spdlog::warn("Cannot open fingerprint cache {}; treating as empty", path);
    return FolderFingerprintCache();
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  try {
    FolderFingerprintCache cache = parse_folder_cache(buffer.str());
    spdlog::debug("Loaded {} fingerprint records from {}", cache.files.size(), path);
    return cache;
  } catch (const BandprintException& e) {
    spdlog::warn("Unreadable fingerprint cache {}: {}; treating as empty", path, e.what());
    return FolderFingerprintCache();
  }
}

void save_folder_cache(const std::string& folder, const FolderFingerprintCache& cache) {
  const fs::path final_path = cache_file_path(folder);
  std::error_code ec;
  BANDPRINT_CHECK_MSG(fs::is_directory(folder, ec), ErrorCode::CacheWriteFailed,
                      "Folder does not exist: " + folder);

  const std::string content = serialize_folder_cache(cache);

  fs::path temp_path = final_path;
  temp_path += "." + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
               ".tmp";
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    BANDPRINT_CHECK_MSG(out.is_open(), ErrorCode::CacheWriteFailed,
                        "Cannot create " + temp_path.string());
    out << content;
    out.flush();
    if (!out) {
      out.close();
      fs::remove(temp_path, ec);
      throw BandprintException(ErrorCode::CacheWriteFailed, "Write failed: " + temp_path.string());
    }
  }

  fs::rename(temp_path, final_path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp_path, ignored);
    throw BandprintException(ErrorCode::CacheWriteFailed,
                             "Rename failed for " + final_path.string() + ": " + ec.message());
  }
  spdlog::debug("Saved {} fingerprint records to {}", cache.files.size(), final_path.string());
}

std::vector<std::string> discover_fingerprint_folders(const std::string& root) {
  std::vector<std::string> folders;
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return folders;
  }
  if (fs::exists(fs::path(root) / kCacheFileName, ec)) {
    folders.push_back(normalize_folder(root));
  }

  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  const fs::recursive_directory_iterator end;
  while (!ec && it != end) {
    std::error_code check;
    if (it->is_directory(check) && fs::exists(it->path() / kCacheFileName, check)) {
      folders.push_back(normalize_folder(it->path().string()));
    }
    it.increment(ec);
  }
  if (ec) {
    spdlog::warn("Folder discovery under {} stopped early: {}", root, ec.message());
  }
  std::sort(folders.begin(), folders.end());
  folders.erase(std::unique(folders.begin(), folders.end()), folders.end());
  return folders;
}

}  // namespace bandprint
