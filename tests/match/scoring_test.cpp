/// @file scoring_test.cpp
/// @brief Tests for pairwise signature similarity.

#include "match/scoring.h"

#include "fingerprint/extractor.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <random>

#include "util/test_signals.h"

using namespace bandprint;
using Catch::Matchers::WithinAbs;

namespace {

Signature random_bands(unsigned seed, int n_frames, int n_bands = 8) {
  std::mt19937 rng(seed);
  std::normal_distribution<float> dist(0.0f, 1.0f);
  Signature sig;
  sig.algorithm = SignatureAlgorithm::Spectral;
  sig.n_bands = n_bands;
  sig.frame_rate = 10.0f;
  sig.frames.resize(static_cast<size_t>(n_frames) * n_bands);
  for (float& v : sig.frames) v = dist(rng);
  return sig;
}

Signature drop_rows(const Signature& sig, int rows) {
  Signature out = sig;
  out.frames.erase(out.frames.begin(), out.frames.begin() + static_cast<size_t>(rows) * sig.n_bands);
  return out;
}

std::vector<Landmark> random_landmarks(unsigned seed, int count) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<uint32_t> hash(0, (1u << 20) - 1);
  std::vector<Landmark> out;
  for (int i = 0; i < count; ++i) {
    out.push_back({hash(rng), static_cast<int32_t>(i * 2)});
  }
  return out;
}

}  // namespace

TEST_CASE("band_similarity identical", "[scoring]") {
  Signature a = random_bands(1, 100);
  REQUIRE_THAT(band_similarity(a, a, 20), WithinAbs(1.0f, 1e-5f));
}

TEST_CASE("band_similarity finds time shift", "[scoring]") {
  Signature a = random_bands(1, 100);
  Signature later = drop_rows(a, 5);

  REQUIRE_THAT(band_similarity(a, later, 20), WithinAbs(1.0f, 1e-5f));
  REQUIRE_THAT(band_similarity(later, a, 20), WithinAbs(1.0f, 1e-5f));
  // Shift outside the search window
  REQUIRE(band_similarity(a, later, 2) < 0.5f);
}

TEST_CASE("band_similarity unrelated and inverted", "[scoring]") {
  Signature a = random_bands(1, 100);
  Signature b = random_bands(2, 100);
  REQUIRE(band_similarity(a, b, 20) < 0.3f);

  Signature inverted = a;
  for (float& v : inverted.frames) v = -v;
  REQUIRE(band_similarity(a, inverted, 0) == 0.0f);
}

TEST_CASE("band_similarity incompatible inputs", "[scoring]") {
  Signature a = random_bands(1, 100, 8);
  Signature b = random_bands(1, 100, 16);
  REQUIRE(band_similarity(a, b, 20) == 0.0f);
  REQUIRE(band_similarity(a, Signature(), 20) == 0.0f);
}

TEST_CASE("band_similarity requires half overlap", "[scoring]") {
  Signature a = random_bands(1, 100);
  // Only 30 rows overlap: below half of the shorter signature
  Signature tail = drop_rows(a, 70);
  Signature padded = tail;
  Signature extra = random_bands(9, 70);
  padded.frames.insert(padded.frames.end(), extra.frames.begin(), extra.frames.end());

  REQUIRE(band_similarity(a, padded, 100) < 0.9f);
}

TEST_CASE("band_similarity ignores a shared band profile", "[scoring]") {
  Signature a = random_bands(31, 80);
  Signature b = random_bands(32, 80);
  for (size_t i = 0; i < a.frames.size(); ++i) {
    const float level = 5.0f + 3.0f * static_cast<float>(i % 8);
    a.frames[i] += level;
    b.frames[i] += level;
  }
  REQUIRE(band_similarity(a, b, 20) < 0.3f);
}

TEST_CASE("band_similarity separates extracted songs", "[scoring]") {
  const int sr = 22050;
  const std::vector<float> song1 = test::melody(20.0f, sr, 1);
  const std::vector<float> song2 = test::melody(20.0f, sr, 2);
  const std::vector<float> take = test::retake(song1, 0.8f, 3 * 2048, 7);

  const Signature s1 = extract_signature(song1.data(), song1.size(), sr, SignatureAlgorithm::Spectral);
  const Signature s2 = extract_signature(song2.data(), song2.size(), sr, SignatureAlgorithm::Spectral);
  const Signature st = extract_signature(take.data(), take.size(), sr, SignatureAlgorithm::Spectral);

  REQUIRE(band_similarity(s1, s2, 40) < 0.5f);
  REQUIRE(band_similarity(s1, st, 40) >= 0.7f);
}

TEST_CASE("landmark_similarity", "[scoring]") {
  auto base = random_landmarks(1, 200);

  SECTION("identical") {
    LandmarkIndex a(base);
    REQUIRE_THAT(landmark_similarity(a, a), WithinAbs(1.0f, 1e-6f));
  }

  SECTION("constant offset") {
    auto shifted = base;
    for (auto& lm : shifted) lm.time += 37;
    REQUIRE_THAT(landmark_similarity(LandmarkIndex(base), LandmarkIndex(shifted)),
                 WithinAbs(1.0f, 1e-6f));
  }

  SECTION("one-frame jitter is tolerated") {
    auto jittered = base;
    for (size_t i = 0; i < jittered.size(); ++i) jittered[i].time += 10 + static_cast<int>(i % 2);
    REQUIRE_THAT(landmark_similarity(LandmarkIndex(base), LandmarkIndex(jittered)),
                 WithinAbs(1.0f, 1e-6f));
  }

  SECTION("half shared") {
    auto half = random_landmarks(2, 200);
    std::copy(base.begin(), base.begin() + 100, half.begin());
    float s = landmark_similarity(LandmarkIndex(base), LandmarkIndex(half));
    REQUIRE(s >= 0.5f);
    REQUIRE(s < 0.6f);
  }

  SECTION("unrelated") {
    auto other = random_landmarks(3, 200);
    REQUIRE(landmark_similarity(LandmarkIndex(base), LandmarkIndex(other)) < 0.1f);
  }

  SECTION("empty") {
    REQUIRE(landmark_similarity(LandmarkIndex(base), LandmarkIndex()) == 0.0f);
  }
}
