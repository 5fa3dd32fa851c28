#pragma once

/// @file audio_io.h
/// @brief WAV/MP3 decoding with dr_wav and minimp3.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bandprint {

/// @brief Container format detected from the file header.
enum class AudioFormat {
  Unknown,
  WAV,
  MP3,
};

/// @brief Decoded mono samples.
struct DecodedAudio {
  std::vector<float> samples;  ///< Mono, normalized to [-1, 1]
  int sample_rate = 0;
};

/// @brief Limits applied while decoding.
struct DecodeOptions {
  /// @brief Maximum file size in bytes (0 = no limit).
  size_t max_file_size = 500 * 1024 * 1024;
};

/// @brief Detects container format from header bytes.
AudioFormat detect_format(const uint8_t* data, size_t size);

/// @brief Decodes a WAV or MP3 buffer to mono.
/// @throws BandprintException InvalidFormat for unknown headers, DecodeFailed otherwise
DecodedAudio decode_buffer(const uint8_t* data, size_t size);

/// @brief Decodes a WAV or MP3 file to mono.
/// @throws BandprintException FileNotFound, InvalidFormat or DecodeFailed
DecodedAudio decode_file(const std::string& path, const DecodeOptions& options = DecodeOptions{});

/// @brief Writes mono samples as a 16-bit PCM WAV file.
/// @throws BandprintException on invalid input or write error
void save_wav(const std::string& path, const std::vector<float>& samples, int sample_rate);

}  // namespace bandprint
