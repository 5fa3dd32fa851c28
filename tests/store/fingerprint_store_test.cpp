/// @file fingerprint_store_test.cpp
/// @brief Tests for the per-folder fingerprint store.

#include "store/fingerprint_store.h"

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include "util/exception.h"
#include "util/test_signals.h"

using namespace bandprint;
namespace fs = std::filesystem;

namespace {

void write_bytes(const fs::path& path, size_t count) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << std::string(count, 'x');
}

/// @brief Signature stamped with the live file's metadata.
Signature stamped(const std::string& path, SignatureAlgorithm algorithm) {
  Signature sig;
  sig.algorithm = algorithm;
  if (is_landmark_algorithm(algorithm)) {
    sig.landmarks = {{1u, 0}, {2u, 3}};
  } else {
    sig.n_bands = 2;
    sig.frames = {1.0f, 2.0f};
  }
  sig.frame_rate = 10.0f;
  auto stat = stat_file(path);
  if (stat) {
    sig.source_mtime = stat->mtime;
    sig.source_size = stat->size;
  }
  return sig;
}

}  // namespace

TEST_CASE("FingerprintStore put / get", "[fingerprint_store]") {
  test::TempDir dir;
  write_bytes(dir.path() / "a.wav", 100);
  auto store = FingerprintStore::open(dir.path().string());

  REQUIRE_FALSE(store->get("a.wav", SignatureAlgorithm::Spectral).has_value());
  REQUIRE_FALSE(store->dirty());

  store->put("a.wav", SignatureAlgorithm::Spectral,
             stamped(store->path_of("a.wav"), SignatureAlgorithm::Spectral));
  REQUIRE(store->dirty());
  auto sig = store->get("a.wav", SignatureAlgorithm::Spectral);
  REQUIRE(sig.has_value());
  REQUIRE(sig->n_bands == 2);
  REQUIRE(store->filenames() == std::vector<std::string>{"a.wav"});
}

TEST_CASE("FingerprintStore staleness", "[fingerprint_store]") {
  test::TempDir dir;
  const auto file = dir.path() / "a.wav";
  write_bytes(file, 100);
  auto store = FingerprintStore::open(dir.path().string());

  REQUIRE(store->is_stale("a.wav"));
  store->put("a.wav", SignatureAlgorithm::Spectral,
             stamped(file.string(), SignatureAlgorithm::Spectral));

  SECTION("fresh after put") {
    REQUIRE_FALSE(store->is_stale("a.wav"));
    REQUIRE_FALSE(store->is_stale("a.wav", SignatureAlgorithm::Spectral));
    REQUIRE(store->is_stale("a.wav", SignatureAlgorithm::ChromaprintStyle));
  }

  SECTION("stale after modification") {
    write_bytes(file, 200);
    REQUIRE(store->is_stale("a.wav"));
    REQUIRE(store->is_stale("a.wav", SignatureAlgorithm::Spectral));
  }

  SECTION("stale after deletion") {
    fs::remove(file);
    REQUIRE(store->is_stale("a.wav"));
    REQUIRE(store->prune_missing() == 1);
    REQUIRE(store->filenames().empty());
  }
}

TEST_CASE("FingerprintStore put with new metadata drops other algorithms",
          "[fingerprint_store]") {
  test::TempDir dir;
  const auto file = dir.path() / "a.wav";
  write_bytes(file, 100);
  auto store = FingerprintStore::open(dir.path().string());

  store->put("a.wav", SignatureAlgorithm::Spectral,
             stamped(file.string(), SignatureAlgorithm::Spectral));
  store->put("a.wav", SignatureAlgorithm::AudfprintStyle,
             stamped(file.string(), SignatureAlgorithm::AudfprintStyle));
  REQUIRE(store->get("a.wav", SignatureAlgorithm::Spectral).has_value());

  write_bytes(file, 300);
  store->put("a.wav", SignatureAlgorithm::AudfprintStyle,
             stamped(file.string(), SignatureAlgorithm::AudfprintStyle));

  REQUIRE_FALSE(store->get("a.wav", SignatureAlgorithm::Spectral).has_value());
  REQUIRE(store->get("a.wav", SignatureAlgorithm::AudfprintStyle).has_value());
  REQUIRE_FALSE(store->is_stale("a.wav", SignatureAlgorithm::AudfprintStyle));
}

TEST_CASE("FingerprintStore exclusions", "[fingerprint_store]") {
  test::TempDir dir;
  FingerprintStore store(dir.path().string(), FolderFingerprintCache());

  REQUIRE_FALSE(store.is_excluded("noise.wav"));
  REQUIRE(store.toggle_exclusion("noise.wav"));
  REQUIRE(store.is_excluded("noise.wav"));
  REQUIRE(store.excluded_files() == std::vector<std::string>{"noise.wav"});
  REQUIRE_FALSE(store.toggle_exclusion("noise.wav"));
  REQUIRE_FALSE(store.is_excluded("noise.wav"));

  store.exclude("b.wav");
  store.exclude("b.wav");
  REQUIRE(store.excluded_files().size() == 1);
  store.unexclude("b.wav");
  REQUIRE(store.excluded_files().empty());
}

TEST_CASE("FingerprintStore folder flags persist", "[fingerprint_store]") {
  test::TempDir dir;
  {
    auto store = FingerprintStore::open(dir.path().string());
    store->set_reference_flag(true);
    store->exclude("x.wav");
    REQUIRE(store->dirty());
    store->save();
    REQUIRE_FALSE(store->dirty());
  }

  auto reopened = FingerprintStore::open(dir.path().string());
  REQUIRE(reopened->is_reference_folder());
  REQUIRE_FALSE(reopened->ignores_fingerprints());
  REQUIRE(reopened->is_excluded("x.wav"));

  reopened->set_reference_flag(true);
  REQUIRE_FALSE(reopened->dirty());
}

TEST_CASE("FingerprintStore failed save keeps state dirty", "[fingerprint_store]") {
  test::TempDir dir;
  FingerprintStore store((dir.path() / "gone").string(), FolderFingerprintCache());
  store.set_ignore_flag(true);

  try {
    store.save();
    FAIL("expected exception");
  } catch (const BandprintException& e) {
    REQUIRE(e.code() == ErrorCode::CacheWriteFailed);
  }
  REQUIRE(store.dirty());
  REQUIRE(store.ignores_fingerprints());
}

TEST_CASE("FingerprintStore info counts fresh signatures", "[fingerprint_store]") {
  test::TempDir dir;
  write_bytes(dir.path() / "a.wav", 10);
  write_bytes(dir.path() / "b.wav", 20);
  auto store = FingerprintStore::open(dir.path().string());

  store->put("a.wav", SignatureAlgorithm::Spectral,
             stamped(store->path_of("a.wav"), SignatureAlgorithm::Spectral));
  store->put("b.wav", SignatureAlgorithm::Spectral,
             stamped(store->path_of("b.wav"), SignatureAlgorithm::Spectral));
  store->put("a.wav", SignatureAlgorithm::ChromaprintStyle,
             stamped(store->path_of("a.wav"), SignatureAlgorithm::ChromaprintStyle));
  store->exclude("b.wav");
  write_bytes(dir.path() / "b.wav", 25);

  FolderInfo info = store->info({"a.wav", "b.wav", "c.wav"});
  REQUIRE(info.total_files == 3);
  REQUIRE(info.coverage.size() == 4);
  REQUIRE(info.coverage[SignatureAlgorithm::Spectral] == 1);
  REQUIRE(info.coverage[SignatureAlgorithm::ChromaprintStyle] == 1);
  REQUIRE(info.coverage[SignatureAlgorithm::AudfprintStyle] == 0);
  REQUIRE(info.excluded_count == 1);
  REQUIRE(info.excluded_files == std::vector<std::string>{"b.wav"});
}

TEST_CASE("FingerprintStore concurrent put", "[fingerprint_store]") {
  test::TempDir dir;
  FingerprintStore store(dir.path().string(), FolderFingerprintCache());

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&store, t]() {
      for (int i = 0; i < 50; ++i) {
        Signature sig;
        sig.n_bands = 1;
        sig.frames = {static_cast<float>(i)};
        store.put("f" + std::to_string(t) + "_" + std::to_string(i) + ".wav",
                  SignatureAlgorithm::Spectral, sig);
      }
    });
  }
  for (auto& th : threads) th.join();

  REQUIRE(store.filenames().size() == 200);
  REQUIRE_NOTHROW(store.save());
  REQUIRE(load_folder_cache(dir.path().string()).files.size() == 200);
}

TEST_CASE("FingerprintStore put_unless_skipped", "[fingerprint_store]") {
  test::TempDir dir;
  write_bytes(dir.path() / "a.wav", 100);
  write_bytes(dir.path() / "b.wav", 100);
  auto store = FingerprintStore::open(dir.path().string());
  const std::string a = (dir.path() / "a.wav").string();
  const std::string b = (dir.path() / "b.wav").string();

  store->exclude("b.wav");
  REQUIRE_FALSE(store->skips("a.wav"));
  REQUIRE(store->skips("b.wav"));
  REQUIRE(store->put_unless_skipped("a.wav", SignatureAlgorithm::Spectral,
                                    stamped(a, SignatureAlgorithm::Spectral)));
  REQUIRE_FALSE(store->put_unless_skipped("b.wav", SignatureAlgorithm::Spectral,
                                          stamped(b, SignatureAlgorithm::Spectral)));
  REQUIRE_FALSE(store->get("b.wav", SignatureAlgorithm::Spectral).has_value());

  store->set_ignore_flag(true);
  REQUIRE(store->skips("a.wav"));
  REQUIRE_FALSE(store->put_unless_skipped("a.wav", SignatureAlgorithm::Lightweight,
                                          stamped(a, SignatureAlgorithm::Lightweight)));
  REQUIRE_FALSE(store->get("a.wav", SignatureAlgorithm::Lightweight).has_value());
}
