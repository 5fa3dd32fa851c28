#include "generation/generation_coordinator.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <map>
#include <optional>
#include <system_error>

#include "store/fingerprint_store.h"
#include "util/exception.h"

namespace fs = std::filesystem;

namespace bandprint {

namespace {

struct WorkItem {
  FingerprintStore* store;
  std::string filename;
  std::string path;
};

enum class FileOutcome { Stored, Skipped, Failed };

/// @brief Decodes, extracts and stores one file.
/// @details A file excluded (or whose folder became ignored) after it was
///          queued is skipped, and a signature finished after that point is
///          discarded.
FileOutcome process_file(const WorkItem& item, SignatureAlgorithm algorithm,
                         SignatureExtractor& extractor, const AudioDecoder& decoder,
                         FileFailure& failure) {
  try {
    if (item.store->skips(item.filename)) {
      spdlog::debug("{} was excluded while queued", item.path);
      return FileOutcome::Skipped;
    }
    std::optional<FileStat> stat = stat_file(item.path);
    BANDPRINT_CHECK_MSG(stat.has_value(), ErrorCode::FileNotFound, "File not found: " + item.path);
    Signature signature = extractor.extract(decoder.decode(item.path));
    signature.source_mtime = stat->mtime;
    signature.source_size = stat->size;
    if (!item.store->put_unless_skipped(item.filename, algorithm, std::move(signature))) {
      spdlog::debug("{} was excluded during extraction; signature discarded", item.path);
      return FileOutcome::Skipped;
    }
    return FileOutcome::Stored;
  } catch (const BandprintException& e) {
    spdlog::warn("Skipping {}: {}", item.path, e.what());
    failure = FileFailure{item.path, e.code(), e.what()};
  } catch (const std::exception& e) {
    spdlog::warn("Skipping {}: {}", item.path, e.what());
    failure = FileFailure{item.path, ErrorCode::DecodeFailed, e.what()};
  }
  return FileOutcome::Failed;
}

}  // namespace

const char* state_name(GenerationState state) {
  switch (state) {
    case GenerationState::Idle:
      return "idle";
    case GenerationState::Scanning:
      return "scanning";
    case GenerationState::Extracting:
      return "extracting";
    case GenerationState::Cancelling:
      return "cancelling";
  }
  return "unknown";
}

GenerationCoordinator::GenerationCoordinator(const CoordinatorConfig& config,
                                             std::shared_ptr<const AudioFileSource> source,
                                             std::shared_ptr<const AudioDecoder> decoder,
                                             std::shared_ptr<StoreRegistry> stores)
    : config_(config),
      source_(std::move(source)),
      decoder_(std::move(decoder)),
      stores_(std::move(stores)) {
  BANDPRINT_CHECK_MSG(config.num_workers >= 0 && config.checkpoint_interval >= 0,
                      ErrorCode::InvalidParameter, "Invalid coordinator configuration");
  if (!source_) source_ = std::make_shared<DirectoryAudioFileSource>();
  if (!decoder_) decoder_ = std::make_shared<FileAudioDecoder>();
  if (!stores_) stores_ = std::make_shared<StoreRegistry>();
}

GenerationCoordinator::~GenerationCoordinator() {
  cancel();
  if (driver_.joinable()) {
    driver_.join();
  }
}

int GenerationCoordinator::resolve_workers(int requested) {
  if (requested > 0) return requested;
  int hw = static_cast<int>(std::thread::hardware_concurrency());
  return std::max(1, hw - 1);
}

void GenerationCoordinator::begin() {
  GenerationState expected = GenerationState::Idle;
  BANDPRINT_CHECK_MSG(state_.compare_exchange_strong(expected, GenerationState::Scanning),
                      ErrorCode::InvalidParameter, "A generation batch is already running");
  cancel_requested_ = false;
}

void GenerationCoordinator::cancel() {
  cancel_requested_ = true;
  GenerationState current = state_.load();
  while (current == GenerationState::Scanning || current == GenerationState::Extracting) {
    if (state_.compare_exchange_weak(current, GenerationState::Cancelling)) break;
  }
}

void GenerationCoordinator::start(GenerationRequest request,
                                  GenerationProgressCallback on_progress,
                                  GenerationCompletionCallback on_complete) {
  begin();
  // The previous driver has already published its result
  if (driver_.joinable()) {
    driver_.join();
  }
  {
    std::lock_guard<std::mutex> lock(result_mutex_);
    finished_ = false;
  }

  auto drive = [this, request = std::move(request), on_progress = std::move(on_progress),
                on_complete = std::move(on_complete)]() {
    GenerationResult result;
    result.algorithm = request.algorithm;
    try {
      result = execute(request, on_progress);
    } catch (const BandprintException& e) {
      spdlog::error("Generation batch failed: {}", e.what());
      result.error = e.code();
      result.error_message = e.what();
    } catch (const std::exception& e) {
      spdlog::error("Generation batch failed: {}", e.what());
      result.error = ErrorCode::InvalidParameter;
      result.error_message = e.what();
    }
    if (on_complete) {
      on_complete(result);
    }
    {
      std::lock_guard<std::mutex> lock(result_mutex_);
      last_result_ = std::move(result);
      finished_ = true;
      state_ = GenerationState::Idle;
    }
    result_cv_.notify_all();
  };

  try {
    driver_ = std::thread(std::move(drive));
  } catch (const std::system_error& e) {
    spdlog::error("Could not start generation batch: {}", e.what());
    {
      std::lock_guard<std::mutex> lock(result_mutex_);
      last_result_ = GenerationResult();
      last_result_.error = ErrorCode::InvalidParameter;
      last_result_.error_message = e.what();
      finished_ = true;
      state_ = GenerationState::Idle;
    }
    result_cv_.notify_all();
    throw;
  }
}

GenerationResult GenerationCoordinator::run(const GenerationRequest& request,
                                            GenerationProgressCallback on_progress) {
  begin();
  GenerationResult result;
  try {
    result = execute(request, on_progress);
  } catch (...) {
    state_ = GenerationState::Idle;
    throw;
  }
  state_ = GenerationState::Idle;
  return result;
}

GenerationResult GenerationCoordinator::wait() {
  std::unique_lock<std::mutex> lock(result_mutex_);
  result_cv_.wait(lock, [this] { return finished_; });
  return last_result_;
}

GenerationResult GenerationCoordinator::execute(const GenerationRequest& request,
                                                const GenerationProgressCallback& on_progress) {
  const SignatureAlgorithm algorithm = request.algorithm;
  GenerationResult result;
  result.algorithm = algorithm;

  // Scanning
  std::vector<std::string> paths;
  for (const auto& file : request.files) {
    paths.push_back(fs::path(file).lexically_normal().string());
  }
  for (const auto& folder : request.folders) {
    std::vector<std::string> listed = source_->list(folder, request.recursive);
    paths.insert(paths.end(), listed.begin(), listed.end());
  }
  std::sort(paths.begin(), paths.end());
  paths.erase(std::unique(paths.begin(), paths.end()), paths.end());

  // Held for the whole batch so other users of the registry share these stores
  std::map<std::string, std::shared_ptr<FingerprintStore>> stores;
  std::vector<WorkItem> work;
  for (const auto& path : paths) {
    fs::path p(path);
    std::string folder = p.has_parent_path() ? normalize_folder(p.parent_path().string()) : ".";
    auto& store = stores[folder];
    if (!store) {
      store = stores_->open(folder);
    }
    std::string filename = p.filename().string();
    if (store->skips(filename) || !store->is_stale(filename, algorithm)) {
      ++result.skipped;
      continue;
    }
    work.push_back({store.get(), filename, path});
  }

  const int total = static_cast<int>(work.size());
  spdlog::info("Fingerprinting {} of {} files with {} ({} up to date or skipped)", total,
               paths.size(), algorithm_id(algorithm), result.skipped);

  // Extracting
  GenerationState expected = GenerationState::Scanning;
  state_.compare_exchange_strong(expected, GenerationState::Extracting);

  const int n_workers = std::max(1, std::min(resolve_workers(config_.num_workers), total));
  std::vector<std::unique_ptr<SignatureExtractor>> extractors;
  for (int i = 0; i < n_workers; ++i) {
    extractors.push_back(create_extractor(algorithm, config_.extractor));
  }

  std::atomic<int> next{0};
  std::atomic<bool> stop{false};
  std::mutex progress_mutex;
  int completed = 0;
  std::map<FingerprintStore*, int> folder_completed;

  auto worker = [&](SignatureExtractor& extractor) {
    while (!cancel_requested_ && !stop) {
      const int index = next.fetch_add(1);
      if (index >= total) break;
      const WorkItem& item = work[index];
      FileFailure failure;
      const FileOutcome outcome = process_file(item, algorithm, extractor, *decoder_, failure);

      FingerprintStore* checkpoint = nullptr;
      {
        std::lock_guard<std::mutex> lock(progress_mutex);
        ++completed;
        if (outcome == FileOutcome::Failed) {
          ++result.failed;
          result.failures.push_back(std::move(failure));
        } else if (outcome == FileOutcome::Skipped) {
          ++result.skipped;
        } else {
          ++result.succeeded;
          if (config_.checkpoint_interval > 0 &&
              ++folder_completed[item.store] % config_.checkpoint_interval == 0) {
            checkpoint = item.store;
          }
        }
        if (on_progress) {
          try {
            on_progress(GenerationProgress{completed, total, item.path});
          } catch (const std::exception& e) {
            spdlog::warn("Progress callback threw: {}", e.what());
          }
        }
      }

      if (checkpoint != nullptr) {
        try {
          checkpoint->save();
        } catch (const BandprintException& e) {
          spdlog::error("Checkpoint save failed, stopping batch: {}", e.what());
          std::lock_guard<std::mutex> lock(progress_mutex);
          if (result.ok()) {
            result.error = e.code();
            result.error_message = e.what();
          }
          stop = true;
        }
      }
    }
  };

  std::vector<std::thread> threads;
  auto join_all = [&threads]() {
    for (auto& t : threads) {
      if (t.joinable()) t.join();
    }
  };
  try {
    for (int i = 1; i < n_workers; ++i) {
      threads.emplace_back(worker, std::ref(*extractors[i]));
    }
  } catch (const std::system_error& e) {
    // Workers already running must finish before the batch state unwinds
    spdlog::error("Could not start worker thread: {}", e.what());
    stop = true;
    join_all();
    throw;
  }
  worker(*extractors[0]);
  join_all();

  // Drained: flush every folder that changed, best effort
  for (auto& [folder, store] : stores) {
    if (!store->dirty()) continue;
    try {
      store->save();
    } catch (const BandprintException& e) {
      spdlog::error("Failed to save fingerprints for {}: {}", folder, e.what());
      if (result.ok()) {
        result.error = e.code();
        result.error_message = e.what();
      }
    }
  }

  result.cancelled = cancel_requested_;
  std::sort(result.failures.begin(), result.failures.end(),
            [](const FileFailure& a, const FileFailure& b) { return a.path < b.path; });
  if (result.cancelled) {
    spdlog::info("Fingerprinting cancelled after {} of {} files", completed, total);
  }
  spdlog::info("Fingerprinting finished: {} succeeded, {} failed, {} skipped", result.succeeded,
               result.failed, result.skipped);
  return result;
}

}  // namespace bandprint
