#pragma once

/// @file audio_file_source.h
/// @brief Enumeration of audio files in folders.

#include <string>
#include <vector>

namespace bandprint {

/// @brief Lists audio files for a batch.
class AudioFileSource {
 public:
  virtual ~AudioFileSource() = default;

  /// @brief Lists audio files under a folder.
  /// @param recursive Descend into sub-folders
  /// @return Full paths, sorted
  virtual std::vector<std::string> list(const std::string& folder, bool recursive) const = 0;
};

/// @brief Lists .wav, .wave and .mp3 files (case-insensitive) on disk.
/// @details Hidden entries (leading dot) are skipped, as are unreadable
///          sub-directories.
class DirectoryAudioFileSource : public AudioFileSource {
 public:
  std::vector<std::string> list(const std::string& folder, bool recursive) const override;
};

/// @brief True if the path has a supported audio extension.
bool is_audio_file(const std::string& path);

}  // namespace bandprint
