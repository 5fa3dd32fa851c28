/// @file resample_test.cpp
/// @brief Tests for audio resampling.

#include "core/resample.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <vector>

#include "util/exception.h"
#include "util/test_signals.h"

using namespace bandprint;
using Catch::Matchers::WithinRel;

namespace {

float compute_rms(const float* data, size_t begin, size_t end) {
  float sum_sq = 0.0f;
  for (size_t i = begin; i < end; ++i) {
    sum_sq += data[i] * data[i];
  }
  return std::sqrt(sum_sq / static_cast<float>(end - begin));
}

}  // namespace

TEST_CASE("resample same rate returns copy", "[resample]") {
  auto samples = test::sine(1000, 440.0f, 22050);
  auto result = resample(samples.data(), samples.size(), 22050, 22050);
  REQUIRE(result == samples);
}

TEST_CASE("resample 44100 to 22050", "[resample]") {
  auto samples = test::sine(44100, 440.0f, 44100, 0.5f);
  auto result = resample(samples.data(), samples.size(), 44100, 22050);

  REQUIRE(result.size() == 22050);
  // Skip filter edges
  float rms = compute_rms(result.data(), 2000, 20000);
  REQUIRE_THAT(rms, WithinRel(0.5f / std::sqrt(2.0f), 0.02f));
}

TEST_CASE("resample 22050 to 11025 removes content above Nyquist", "[resample]") {
  auto samples = test::sine(22050, 8000.0f, 22050, 0.5f);
  auto result = resample(samples.data(), samples.size(), 22050, 11025);

  REQUIRE(result.size() == 11025);
  REQUIRE(compute_rms(result.data(), 1000, 10000) < 0.01f);
}

TEST_CASE("resample Audio", "[resample]") {
  auto samples = test::sine(4410, 440.0f, 44100);
  Audio audio = Audio::from_vector(samples, 44100);

  Audio same = resample(audio, 44100);
  REQUIRE(same.data() == audio.data());

  Audio down = resample(audio, 11025);
  REQUIRE(down.sample_rate() == 11025);
  REQUIRE(down.size() == 1103);

  REQUIRE(resample(Audio(), 11025).empty());
}

TEST_CASE("resample invalid rates", "[resample]") {
  std::vector<float> samples(100, 0.0f);
  REQUIRE_THROWS_AS(resample(samples.data(), samples.size(), 0, 22050), BandprintException);
  REQUIRE_THROWS_AS(resample(samples.data(), samples.size(), 22050, -1), BandprintException);
}
