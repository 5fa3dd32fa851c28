#pragma once

/// @file audio_decoder.h
/// @brief Decoding collaborator used by the generation batch.

#include <string>

#include "core/audio.h"

namespace bandprint {

/// @brief Decodes a file to mono PCM.
/// @details Implementations must be safe to call from several threads on
///          distinct files.
class AudioDecoder {
 public:
  virtual ~AudioDecoder() = default;

  /// @throws BandprintException FileNotFound, InvalidFormat or DecodeFailed
  virtual Audio decode(const std::string& path) const = 0;
};

/// @brief Decodes WAV and MP3 files with dr_wav and minimp3.
class FileAudioDecoder : public AudioDecoder {
 public:
  Audio decode(const std::string& path) const override { return Audio::from_file(path); }
};

}  // namespace bandprint
