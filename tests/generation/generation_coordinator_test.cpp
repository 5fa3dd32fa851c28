/// @file generation_coordinator_test.cpp
/// @brief Tests for batch fingerprint generation.

#include "generation/generation_coordinator.h"

#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <future>
#include <set>

#include "store/fingerprint_store.h"
#include "util/exception.h"
#include "util/test_signals.h"

using namespace bandprint;
namespace fs = std::filesystem;

namespace {

/// @brief Returns a short tone for any file; names starting with "bad" fail.
class FakeDecoder : public AudioDecoder {
 public:
  Audio decode(const std::string& path) const override {
    ++calls;
    const std::string name = fs::path(path).filename().string();
    if (name.rfind("bad", 0) == 0) {
      throw BandprintException(ErrorCode::DecodeFailed, "Corrupt header: " + path);
    }
    if (name.rfind("short", 0) == 0) {
      return Audio::from_vector(std::vector<float>(100, 0.1f), 22050);
    }
    return Audio::from_vector(test::sine(22050, 440.0f, 22050), 22050);
  }

  mutable std::atomic<int> calls{0};
};

/// @brief Blocks every decode until released.
class GatedDecoder : public AudioDecoder {
 public:
  GatedDecoder() : gate_(released_.get_future().share()) {}

  Audio decode(const std::string&) const override {
    gate_.wait();
    return Audio::from_vector(test::sine(22050, 440.0f, 22050), 22050);
  }

  void release() { released_.set_value(); }

 private:
  std::promise<void> released_;
  std::shared_future<void> gate_;
};

std::vector<std::string> make_files(const test::TempDir& dir, const std::string& folder,
                                    const std::vector<std::string>& names) {
  std::vector<std::string> paths;
  const std::string base = dir.folder(folder);
  for (const auto& name : names) {
    std::string path = base + "/" + name;
    std::ofstream out(path);
    out << "placeholder " << name;
    paths.push_back(path);
  }
  return paths;
}

std::vector<std::string> numbered(int count) {
  std::vector<std::string> names;
  for (int i = 0; i < count; ++i) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "take_%03d.wav", i);
    names.push_back(buf);
  }
  return names;
}

CoordinatorConfig single_worker() {
  CoordinatorConfig config;
  config.num_workers = 1;
  return config;
}

}  // namespace

TEST_CASE("state_name", "[generation]") {
  REQUIRE(std::string(state_name(GenerationState::Idle)) == "idle");
  REQUIRE(std::string(state_name(GenerationState::Scanning)) == "scanning");
  REQUIRE(std::string(state_name(GenerationState::Extracting)) == "extracting");
  REQUIRE(std::string(state_name(GenerationState::Cancelling)) == "cancelling");
}

TEST_CASE("resolve_workers", "[generation]") {
  REQUIRE(GenerationCoordinator::resolve_workers(3) == 3);
  REQUIRE(GenerationCoordinator::resolve_workers(0) >= 1);
}

TEST_CASE("run fingerprints a folder and aggregates failures", "[generation]") {
  test::TempDir dir;
  make_files(dir, "may", {"song1.wav", "song2.wav", "bad_take.wav", "short.wav", "notes.txt"});
  const std::string folder = (dir.path() / "may").string();
  auto decoder = std::make_shared<FakeDecoder>();

  CoordinatorConfig config;
  config.num_workers = 2;
  GenerationCoordinator coordinator(config, nullptr, decoder);
  REQUIRE(coordinator.state() == GenerationState::Idle);

  GenerationRequest request;
  request.folders = {folder};
  std::vector<GenerationProgress> seen;
  GenerationResult result =
      coordinator.run(request, [&seen](const GenerationProgress& p) { seen.push_back(p); });

  REQUIRE(result.ok());
  REQUIRE_FALSE(result.cancelled);
  REQUIRE(result.algorithm == SignatureAlgorithm::Spectral);
  REQUIRE(result.succeeded == 2);
  REQUIRE(result.failed == 2);
  REQUIRE(result.skipped == 0);
  REQUIRE(result.failures.size() == 2);
  REQUIRE(fs::path(result.failures[0].path).filename().string() == "bad_take.wav");
  REQUIRE(result.failures[0].code == ErrorCode::DecodeFailed);
  REQUIRE(fs::path(result.failures[1].path).filename().string() == "short.wav");
  REQUIRE(result.failures[1].code == ErrorCode::UnsupportedFormat);

  REQUIRE(seen.size() == 4);
  REQUIRE(seen.back().completed == 4);
  REQUIRE(seen.back().total == 4);
  REQUIRE(coordinator.state() == GenerationState::Idle);

  auto store = FingerprintStore::open(folder);
  REQUIRE(store->filenames() == std::vector<std::string>{"song1.wav", "song2.wav"});
  auto sig = store->get("song1.wav", SignatureAlgorithm::Spectral);
  REQUIRE(sig.has_value());
  REQUIRE(sig->source_size == fs::file_size(dir.path() / "may" / "song1.wav"));
  REQUIRE_FALSE(store->is_stale("song1.wav", SignatureAlgorithm::Spectral));

  SECTION("second run skips fresh files") {
    decoder->calls = 0;
    GenerationResult again = coordinator.run(request);
    REQUIRE(again.succeeded == 0);
    REQUIRE(again.skipped == 2);
    REQUIRE(again.failed == 2);
    REQUIRE(decoder->calls == 2);
  }

  SECTION("another algorithm is computed separately") {
    request.algorithm = SignatureAlgorithm::Lightweight;
    GenerationResult light = coordinator.run(request);
    REQUIRE(light.succeeded == 2);
    auto reopened = FingerprintStore::open(folder);
    REQUIRE(reopened->get("song1.wav", SignatureAlgorithm::Spectral).has_value());
    REQUIRE(reopened->get("song1.wav", SignatureAlgorithm::Lightweight).has_value());
  }
}

TEST_CASE("run skips excluded files and ignored folders", "[generation]") {
  test::TempDir dir;
  auto kept = make_files(dir, "kept", {"a.wav", "b.wav"});
  auto ignored = make_files(dir, "ignored", {"c.wav"});
  {
    auto store = FingerprintStore::open((dir.path() / "kept").string());
    store->exclude("b.wav");
    store->save();
    auto ig = FingerprintStore::open((dir.path() / "ignored").string());
    ig->set_ignore_flag(true);
    ig->save();
  }

  auto decoder = std::make_shared<FakeDecoder>();
  GenerationCoordinator coordinator(single_worker(), nullptr, decoder);
  GenerationRequest request;
  request.files = {kept[0], kept[1], ignored[0], kept[0]};

  GenerationResult result = coordinator.run(request);
  REQUIRE(result.succeeded == 1);
  REQUIRE(result.skipped == 2);
  REQUIRE(decoder->calls == 1);
}

TEST_CASE("missing files are reported", "[generation]") {
  test::TempDir dir;
  GenerationCoordinator coordinator(single_worker(), nullptr, std::make_shared<FakeDecoder>());
  GenerationRequest request;
  request.files = {(dir.path() / "gone.wav").string()};

  GenerationResult result = coordinator.run(request);
  REQUIRE(result.failed == 1);
  REQUIRE(result.failures[0].code == ErrorCode::FileNotFound);
}

TEST_CASE("cancel stops new files from starting", "[generation]") {
  test::TempDir dir;
  make_files(dir, "batch", numbered(100));
  const std::string folder = (dir.path() / "batch").string();

  GenerationCoordinator coordinator(single_worker(), nullptr, std::make_shared<FakeDecoder>());
  GenerationRequest request;
  request.folders = {folder};

  std::atomic<bool> completed_called{false};
  coordinator.start(
      request,
      [&coordinator](const GenerationProgress& p) {
        if (p.completed == 40) coordinator.cancel();
      },
      [&completed_called](const GenerationResult&) { completed_called = true; });

  GenerationResult result = coordinator.wait();
  REQUIRE(completed_called);
  REQUIRE(result.cancelled);
  REQUIRE(result.succeeded == 40);
  REQUIRE(result.failed == 0);
  REQUIRE(coordinator.state() == GenerationState::Idle);

  // Completed work is kept
  auto store = FingerprintStore::open(folder);
  REQUIRE(store->filenames().size() == 40);

  SECTION("a new batch resumes where the cancelled one stopped") {
    coordinator.start(request);
    GenerationResult rest = coordinator.wait();
    REQUIRE_FALSE(rest.cancelled);
    REQUIRE(rest.skipped == 40);
    REQUIRE(rest.succeeded == 60);
  }
}

TEST_CASE("cancel when idle has no effect", "[generation]") {
  test::TempDir dir;
  auto files = make_files(dir, "one", {"a.wav"});
  GenerationCoordinator coordinator(single_worker(), nullptr, std::make_shared<FakeDecoder>());

  coordinator.cancel();
  REQUIRE(coordinator.state() == GenerationState::Idle);

  GenerationRequest request;
  request.files = files;
  GenerationResult result = coordinator.run(request);
  REQUIRE_FALSE(result.cancelled);
  REQUIRE(result.succeeded == 1);
}

TEST_CASE("only one batch runs at a time", "[generation]") {
  test::TempDir dir;
  auto files = make_files(dir, "gate", {"a.wav", "b.wav"});
  auto decoder = std::make_shared<GatedDecoder>();
  GenerationCoordinator coordinator(single_worker(), nullptr, decoder);

  GenerationRequest request;
  request.files = files;
  coordinator.start(request);
  REQUIRE(coordinator.running());

  try {
    coordinator.start(request);
    FAIL("expected exception");
  } catch (const BandprintException& e) {
    REQUIRE(e.code() == ErrorCode::InvalidParameter);
  }
  REQUIRE_THROWS_AS(coordinator.run(request), BandprintException);

  decoder->release();
  GenerationResult result = coordinator.wait();
  REQUIRE(result.succeeded == 2);
  REQUIRE_FALSE(coordinator.running());
}

TEST_CASE("checkpoints save during the batch", "[generation]") {
  test::TempDir dir;
  make_files(dir, "cp", numbered(6));
  const std::string folder = (dir.path() / "cp").string();

  CoordinatorConfig config = single_worker();
  config.checkpoint_interval = 2;
  GenerationCoordinator coordinator(config, nullptr, std::make_shared<FakeDecoder>());
  GenerationRequest request;
  request.folders = {folder};

  std::vector<size_t> on_disk;
  GenerationResult result = coordinator.run(request, [&](const GenerationProgress& p) {
    if (p.completed == 3) {
      on_disk.push_back(load_folder_cache(folder).files.size());
    }
  });
  REQUIRE(result.succeeded == 6);
  // The checkpoint after file 2 is visible while file 3 reports progress
  REQUIRE(on_disk == std::vector<size_t>{2});
}

TEST_CASE("cache write failure is reported in the result", "[generation]") {
  test::TempDir dir;
  auto files = make_files(dir, "locked", {"a.wav"});
  // A directory in place of the cache file makes the final rename fail
  fs::create_directories(dir.path() / "locked" / kCacheFileName / "blocker");

  GenerationCoordinator coordinator(single_worker(), nullptr, std::make_shared<FakeDecoder>());
  GenerationRequest request;
  request.files = files;

  GenerationResult result = coordinator.run(request);
  REQUIRE(result.succeeded == 1);
  REQUIRE_FALSE(result.ok());
  REQUIRE(result.error == ErrorCode::CacheWriteFailed);
  REQUIRE_FALSE(result.error_message.empty());
}
