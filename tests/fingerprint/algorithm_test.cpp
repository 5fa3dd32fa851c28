/// @file algorithm_test.cpp
/// @brief Tests for algorithm identifiers.

#include "fingerprint/algorithm.h"

#include <catch2/catch_test_macros.hpp>
#include <string>

#include "util/exception.h"

using namespace bandprint;

TEST_CASE("algorithm ids round-trip", "[algorithm]") {
  for (const auto& info : all_algorithms()) {
    REQUIRE(parse_algorithm(info.id) == info.algorithm);
    REQUIRE(std::string(algorithm_id(info.algorithm)) == info.id);
    REQUIRE(&algorithm_info(info.algorithm) == &info);
  }
}

TEST_CASE("algorithm ids are stable", "[algorithm]") {
  REQUIRE(std::string(algorithm_id(SignatureAlgorithm::Spectral)) == "spectral");
  REQUIRE(std::string(algorithm_id(SignatureAlgorithm::Lightweight)) == "lightweight");
  REQUIRE(std::string(algorithm_id(SignatureAlgorithm::ChromaprintStyle)) == "chromaprint");
  REQUIRE(std::string(algorithm_id(SignatureAlgorithm::AudfprintStyle)) == "audfprint");
}

TEST_CASE("all_algorithms lists the default first", "[algorithm]") {
  const auto& all = all_algorithms();
  REQUIRE(all.size() == 4);
  REQUIRE(all.front().algorithm == SignatureAlgorithm::Spectral);
}

TEST_CASE("parse_algorithm unknown id", "[algorithm]") {
  REQUIRE_THROWS_AS(parse_algorithm("shazam"), BandprintException);

  SignatureAlgorithm out = SignatureAlgorithm::Lightweight;
  REQUIRE_FALSE(try_parse_algorithm("", out));
  REQUIRE(out == SignatureAlgorithm::Lightweight);
  REQUIRE(try_parse_algorithm("audfprint", out));
  REQUIRE(out == SignatureAlgorithm::AudfprintStyle);
}

TEST_CASE("is_landmark_algorithm", "[algorithm]") {
  REQUIRE_FALSE(is_landmark_algorithm(SignatureAlgorithm::Spectral));
  REQUIRE_FALSE(is_landmark_algorithm(SignatureAlgorithm::Lightweight));
  REQUIRE(is_landmark_algorithm(SignatureAlgorithm::ChromaprintStyle));
  REQUIRE(is_landmark_algorithm(SignatureAlgorithm::AudfprintStyle));
}
