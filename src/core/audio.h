#pragma once

/// @file audio.h
/// @brief Mono PCM buffer shared between decoder and extractors.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace bandprint {

/// @brief Mono audio with shared ownership and zero-copy segments.
/// @details Samples are normalized to [-1, 1]. Segments share the
///          underlying buffer, so cutting the analysed middle out of a long
///          track costs nothing.
class Audio {
 public:
  Audio();

  /// @brief Creates Audio by copying existing samples.
  /// @throws BandprintException if sample_rate is not positive
  static Audio from_buffer(const float* samples, size_t size, int sample_rate);

  /// @brief Creates Audio by taking ownership of a vector.
  /// @throws BandprintException if sample_rate is not positive
  static Audio from_vector(std::vector<float> samples, int sample_rate);

  /// @brief Decodes a WAV or MP3 file.
  /// @throws BandprintException on missing file or decode error
  static Audio from_file(const std::string& path);

  const float* data() const;
  size_t size() const { return length_; }
  int sample_rate() const { return sample_rate_; }
  bool empty() const { return length_ == 0; }

  /// @brief Duration in seconds.
  float duration() const;

  /// @brief Returns a segment by sample indices (clamped to the buffer).
  Audio slice_samples(size_t start_sample, size_t end_sample) const;

  /// @brief Returns the centred segment of at most max_seconds.
  /// @details Audio not longer than max_seconds is returned whole.
  Audio middle(float max_seconds) const;

  const float* begin() const { return data(); }
  const float* end() const { return data() + size(); }

 private:
  Audio(std::shared_ptr<const std::vector<float>> buffer, size_t offset, size_t length,
        int sample_rate);

  std::shared_ptr<const std::vector<float>> buffer_;
  size_t offset_;
  size_t length_;
  int sample_rate_;
};

}  // namespace bandprint
