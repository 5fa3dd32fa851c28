/// @file chroma_test.cpp
/// @brief Tests for chroma filterbank.

#include "filters/chroma.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <numeric>

#include "core/convert.h"

using namespace bandprint;
using Catch::Matchers::WithinAbs;

TEST_CASE("hz_to_pitch_class", "[chroma]") {
  REQUIRE(hz_to_pitch_class(261.63f) == 0);  // C4
  REQUIRE(hz_to_pitch_class(440.0f) == 9);   // A4
  REQUIRE(hz_to_pitch_class(880.0f) == 9);   // A5
  REQUIRE(hz_to_pitch_class(493.88f) == 11); // B4
  REQUIRE(hz_to_pitch_class(0.0f) == -1);
}

TEST_CASE("hz_to_chroma tuning", "[chroma]") {
  REQUIRE_THAT(hz_to_chroma(440.0f), WithinAbs(9.0f, 1e-3f));
  REQUIRE_THAT(hz_to_chroma(440.0f, 0.5f), WithinAbs(8.5f, 1e-3f));
  REQUIRE(hz_to_chroma(-1.0f) < 0.0f);
}

TEST_CASE("create_chroma_filterbank shape", "[chroma]") {
  Filterbank bank = create_chroma_filterbank(22050, 4096);
  REQUIRE(bank.n_filters == 12);
  REQUIRE(bank.n_bins == 2049);

  for (int c = 0; c < 12; ++c) {
    const float* row = bank.row(c);
    REQUIRE_THAT(std::accumulate(row, row + bank.n_bins, 0.0f), WithinAbs(1.0f, 1e-4f));
  }
}

TEST_CASE("create_chroma_filterbank maps A to pitch class 9", "[chroma]") {
  constexpr int sr = 22050;
  constexpr int n_fft = 4096;
  Filterbank bank = create_chroma_filterbank(sr, n_fft);

  int bin = hz_to_bin(440.0f, sr, n_fft);
  int best = 0;
  for (int c = 1; c < 12; ++c) {
    if (bank.row(c)[bin] > bank.row(best)[bin]) best = c;
  }
  REQUIRE(best == 9);
}

TEST_CASE("create_chroma_filterbank ignores out-of-range bins", "[chroma]") {
  constexpr int sr = 22050;
  constexpr int n_fft = 4096;
  Filterbank bank = create_chroma_filterbank(sr, n_fft);

  int low = hz_to_bin(50.0f, sr, n_fft);
  int high = hz_to_bin(8000.0f, sr, n_fft);
  for (int c = 0; c < 12; ++c) {
    REQUIRE(bank.row(c)[low] == 0.0f);
    REQUIRE(bank.row(c)[high] == 0.0f);
  }
}
