/// @file audio_file_source_test.cpp
/// @brief Tests for audio file enumeration.

#include "io/audio_file_source.h"

#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>

#include "util/test_signals.h"

using namespace bandprint;
namespace fs = std::filesystem;

namespace {

void touch(const fs::path& path) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  out << "x";
}

}  // namespace

TEST_CASE("is_audio_file", "[audio_file_source]") {
  REQUIRE(is_audio_file("song.wav"));
  REQUIRE(is_audio_file("/a/b/Song.WAV"));
  REQUIRE(is_audio_file("take.wave"));
  REQUIRE(is_audio_file("demo.Mp3"));
  REQUIRE_FALSE(is_audio_file("notes.txt"));
  REQUIRE_FALSE(is_audio_file("wav"));
  REQUIRE_FALSE(is_audio_file("song.flac"));
}

TEST_CASE("DirectoryAudioFileSource lists audio files", "[audio_file_source]") {
  test::TempDir dir;
  touch(dir.path() / "b.wav");
  touch(dir.path() / "a.MP3");
  touch(dir.path() / "notes.txt");
  touch(dir.path() / ".hidden.wav");
  touch(dir.path() / "sub" / "c.wave");
  touch(dir.path() / ".git" / "d.wav");

  DirectoryAudioFileSource source;

  SECTION("flat") {
    auto files = source.list(dir.path().string(), false);
    REQUIRE(files.size() == 2);
    REQUIRE(fs::path(files[0]).filename().string() == "a.MP3");
    REQUIRE(fs::path(files[1]).filename().string() == "b.wav");
  }

  SECTION("recursive skips hidden directories") {
    auto files = source.list(dir.path().string(), true);
    REQUIRE(files.size() == 3);
    REQUIRE(std::is_sorted(files.begin(), files.end()));
    bool found_sub = false;
    for (const auto& f : files) {
      REQUIRE(f.find(".git") == std::string::npos);
      if (fs::path(f).filename().string() == "c.wave") found_sub = true;
    }
    REQUIRE(found_sub);
  }

  SECTION("missing folder") {
    REQUIRE(source.list((dir.path() / "missing").string(), true).empty());
  }
}
