#pragma once

/// @file generation_coordinator.h
/// @brief Batch fingerprint generation with a bounded worker pool.

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "fingerprint/extractor.h"
#include "io/audio_decoder.h"
#include "io/audio_file_source.h"
#include "store/store_registry.h"
#include "util/types.h"

namespace bandprint {

/// @brief Coordinator lifecycle.
enum class GenerationState {
  Idle,
  Scanning,    ///< Listing files and consulting caches
  Extracting,  ///< Workers decoding and extracting
  Cancelling,  ///< In-flight files finishing, no new files start
};

/// @brief Returns a lowercase name for a state.
const char* state_name(GenerationState state);

/// @brief What to fingerprint.
struct GenerationRequest {
  std::vector<std::string> files;    ///< Individual files (full paths)
  std::vector<std::string> folders;  ///< Folders whose audio files are added
  bool recursive = false;            ///< Descend into sub-folders of folders
  SignatureAlgorithm algorithm = SignatureAlgorithm::Spectral;
};

/// @brief Progress after each processed file.
struct GenerationProgress {
  int completed = 0;
  int total = 0;
  std::string current_file;
};

/// @brief A file that could not be fingerprinted.
struct FileFailure {
  std::string path;
  ErrorCode code = ErrorCode::DecodeFailed;
  std::string reason;
};

/// @brief Outcome of a batch.
struct GenerationResult {
  SignatureAlgorithm algorithm = SignatureAlgorithm::Spectral;
  int succeeded = 0;
  int failed = 0;
  int skipped = 0;  ///< Fresh cache hits, excluded files and files in ignored folders
  bool cancelled = false;
  std::vector<FileFailure> failures;

  ErrorCode error = ErrorCode::Ok;  ///< Cache-level error (CacheWriteFailed)
  std::string error_message;

  bool ok() const { return error == ErrorCode::Ok; }
};

/// @brief Coordinator configuration.
struct CoordinatorConfig {
  int num_workers = 0;          ///< 0 = hardware threads - 1, at least 1
  int checkpoint_interval = 0;  ///< Save a folder every N completed files (0 = at the end only)
  ExtractorConfig extractor;
};

using GenerationProgressCallback = std::function<void(const GenerationProgress& progress)>;
using GenerationCompletionCallback = std::function<void(const GenerationResult& result)>;

/// @brief Runs one batch at a time over its own worker pool.
/// @details start() returns immediately; the batch runs on a
///          coordinator-owned thread. Callbacks are invoked from worker
///          threads, one at a time. A single file's failure never aborts the
///          batch; cancellation or a failed checkpoint save stops new files
///          from starting. Stores are saved after the workers drain.
class GenerationCoordinator {
 public:
  /// @param stores Registry shared with other users of the same folders; a
  ///               private one is created when null
  explicit GenerationCoordinator(const CoordinatorConfig& config = CoordinatorConfig(),
                                 std::shared_ptr<const AudioFileSource> source = nullptr,
                                 std::shared_ptr<const AudioDecoder> decoder = nullptr,
                                 std::shared_ptr<StoreRegistry> stores = nullptr);

  /// @brief Cancels a running batch and joins its thread.
  ~GenerationCoordinator();

  GenerationCoordinator(const GenerationCoordinator&) = delete;
  GenerationCoordinator& operator=(const GenerationCoordinator&) = delete;

  /// @brief Starts a batch in the background.
  /// @throws BandprintException InvalidParameter if a batch is already running
  void start(GenerationRequest request, GenerationProgressCallback on_progress = nullptr,
             GenerationCompletionCallback on_complete = nullptr);

  /// @brief Runs a batch on the calling thread.
  /// @throws BandprintException InvalidParameter if a batch is already running
  GenerationResult run(const GenerationRequest& request,
                       GenerationProgressCallback on_progress = nullptr);

  /// @brief Requests cancellation. Never blocks; no effect when idle.
  void cancel();

  /// @brief Blocks until the current (or last) background batch has finished.
  GenerationResult wait();

  GenerationState state() const { return state_.load(); }
  bool running() const { return state() != GenerationState::Idle; }

  /// @brief Worker count for a requested value (0 = hardware threads - 1, at least 1).
  static int resolve_workers(int requested);

 private:
  GenerationResult execute(const GenerationRequest& request,
                           const GenerationProgressCallback& on_progress);
  void begin();

  CoordinatorConfig config_;
  std::shared_ptr<const AudioFileSource> source_;
  std::shared_ptr<const AudioDecoder> decoder_;
  std::shared_ptr<StoreRegistry> stores_;

  std::atomic<GenerationState> state_{GenerationState::Idle};
  std::atomic<bool> cancel_requested_{false};

  std::thread driver_;
  std::mutex result_mutex_;
  std::condition_variable result_cv_;
  bool finished_ = true;
  GenerationResult last_result_;
};

}  // namespace bandprint
