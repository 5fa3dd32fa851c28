#include "service/fingerprint_service.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

#include "util/exception.h"

namespace fs = std::filesystem;

namespace bandprint {

namespace {

/// @brief Splits a file path into its normalized folder and filename.
std::pair<std::string, std::string> split_path(const std::string& file_path) {
  fs::path p = fs::path(file_path).lexically_normal();
  std::string folder = p.has_parent_path() ? normalize_folder(p.parent_path().string()) : ".";
  return {folder, p.filename().string()};
}

}  // namespace

FingerprintService::FingerprintService(const ServiceConfig& config,
                                       std::shared_ptr<const AudioFileSource> source,
                                       std::shared_ptr<const AudioDecoder> decoder)
    : config_(config),
      source_(std::move(source)),
      decoder_(std::move(decoder)),
      stores_(std::make_shared<StoreRegistry>()) {
  if (!source_) source_ = std::make_shared<DirectoryAudioFileSource>();
  if (!decoder_) decoder_ = std::make_shared<FileAudioDecoder>();
  // Validates the match configuration up front
  make_engine();
}

std::unique_ptr<GenerationCoordinator> FingerprintService::make_coordinator() const {
  return std::make_unique<GenerationCoordinator>(config_.generation, source_, decoder_, stores_);
}

MatchEngine FingerprintService::make_engine() const { return MatchEngine(config_.match); }

std::unique_ptr<GenerationCoordinator> FingerprintService::generate(
    const std::vector<std::string>& files, SignatureAlgorithm algorithm,
    GenerationProgressCallback on_progress, GenerationCompletionCallback on_complete) const {
  GenerationRequest request;
  request.files = files;
  request.algorithm = algorithm;
  auto coordinator = make_coordinator();
  coordinator->start(std::move(request), std::move(on_progress), std::move(on_complete));
  return coordinator;
}

std::unique_ptr<GenerationCoordinator> FingerprintService::generate_folder(
    const std::string& folder, bool recursive, SignatureAlgorithm algorithm,
    GenerationProgressCallback on_progress, GenerationCompletionCallback on_complete) const {
  GenerationRequest request;
  request.folders.push_back(folder);
  request.recursive = recursive;
  request.algorithm = algorithm;
  auto coordinator = make_coordinator();
  coordinator->start(std::move(request), std::move(on_progress), std::move(on_complete));
  return coordinator;
}

FolderInfo FingerprintService::get_info(const std::string& folder) const {
  auto store = stores_->open(folder);
  std::vector<std::string> filenames;
  for (const auto& path : source_->list(folder, false)) {
    filenames.push_back(fs::path(path).filename().string());
  }
  return store->info(filenames);
}

std::vector<std::shared_ptr<FingerprintStore>> FingerprintService::open_stores(
    const std::vector<std::string>& folders) const {
  std::vector<std::string> unique;
  for (const auto& folder : folders) {
    unique.push_back(normalize_folder(folder));
  }
  std::sort(unique.begin(), unique.end());
  unique.erase(std::unique(unique.begin(), unique.end()), unique.end());

  std::vector<std::shared_ptr<FingerprintStore>> stores;
  for (const auto& folder : unique) {
    stores.push_back(stores_->open(folder));
  }
  return stores;
}

std::vector<MatchResult> FingerprintService::find_matches(const std::string& query_path,
                                                          const std::vector<std::string>& folders,
                                                          SignatureAlgorithm algorithm,
                                                          float threshold) const {
  auto [query_folder, query_name] = split_path(query_path);
  const std::string query_file = (fs::path(query_folder) / query_name).string();

  Signature query;
  auto query_store = stores_->open(query_folder);
  std::optional<Signature> cached;
  if (!query_store->is_stale(query_name, algorithm)) {
    cached = query_store->get(query_name, algorithm);
  }
  if (cached) {
    query = std::move(*cached);
  } else {
    spdlog::debug("No fresh {} signature for {}; extracting", algorithm_id(algorithm), query_file);
    query = create_extractor(algorithm, config_.generation.extractor)
                ->extract(decoder_->decode(query_file));
  }

  auto stores = open_stores(folders);
  std::vector<const FingerprintStore*> views;
  for (const auto& store : stores) views.push_back(store.get());
  std::vector<CorpusEntry> corpus =
      build_corpus(views, algorithm, config_.match.reference_weight);

  return make_engine().find_matches(query_file, query, corpus, algorithm,
                                    clamp_threshold(threshold));
}

std::vector<DuplicateCluster> FingerprintService::find_duplicates(
    const std::vector<std::string>& folders, SignatureAlgorithm algorithm, float threshold) const {
  auto stores = open_stores(folders);
  std::vector<const FingerprintStore*> views;
  for (const auto& store : stores) views.push_back(store.get());
  std::vector<CorpusEntry> corpus =
      build_corpus(views, algorithm, config_.match.reference_weight);
  return make_engine().find_duplicates(corpus, algorithm, clamp_threshold(threshold));
}

void FingerprintService::set_reference_folder(const std::string& folder, bool value) const {
  auto store = stores_->open(folder);
  store->set_reference_flag(value);
  store->save();
}

bool FingerprintService::toggle_reference_folder(const std::string& folder) const {
  auto store = stores_->open(folder);
  const bool value = !store->is_reference_folder();
  store->set_reference_flag(value);
  store->save();
  return value;
}

void FingerprintService::set_ignore_folder(const std::string& folder, bool value) const {
  auto store = stores_->open(folder);
  store->set_ignore_flag(value);
  store->save();
}

bool FingerprintService::toggle_ignore_folder(const std::string& folder) const {
  auto store = stores_->open(folder);
  const bool value = !store->ignores_fingerprints();
  store->set_ignore_flag(value);
  store->save();
  return value;
}

bool FingerprintService::toggle_file_exclusion(const std::string& file_path) const {
  auto [folder, filename] = split_path(file_path);
  auto store = stores_->open(folder);
  const bool excluded = store->toggle_exclusion(filename);
  store->save();
  return excluded;
}

void FingerprintService::set_file_excluded(const std::string& file_path, bool excluded) const {
  auto [folder, filename] = split_path(file_path);
  auto store = stores_->open(folder);
  if (excluded) {
    store->exclude(filename);
  } else {
    store->unexclude(filename);
  }
  store->save();
}

bool FingerprintService::is_file_excluded(const std::string& file_path) const {
  auto [folder, filename] = split_path(file_path);
  return stores_->open(folder)->is_excluded(filename);
}

std::vector<std::string> FingerprintService::discover_folders(const std::string& root) const {
  return discover_fingerprint_folders(root);
}

}  // namespace bandprint
