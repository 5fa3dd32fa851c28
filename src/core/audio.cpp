#include "core/audio.h"

#include <algorithm>
#include <cmath>

#include "core/audio_io.h"
#include "util/exception.h"

namespace bandprint {

Audio::Audio() : buffer_(nullptr), offset_(0), length_(0), sample_rate_(0) {}

Audio::Audio(std::shared_ptr<const std::vector<float>> buffer, size_t offset, size_t length,
             int sample_rate)
    : buffer_(std::move(buffer)), offset_(offset), length_(length), sample_rate_(sample_rate) {}

Audio Audio::from_buffer(const float* samples, size_t size, int sample_rate) {
  BANDPRINT_CHECK(sample_rate > 0, ErrorCode::InvalidParameter);
  auto buffer = std::make_shared<std::vector<float>>(samples, samples + size);
  return Audio(buffer, 0, size, sample_rate);
}

Audio Audio::from_vector(std::vector<float> samples, int sample_rate) {
  BANDPRINT_CHECK(sample_rate > 0, ErrorCode::InvalidParameter);
  size_t size = samples.size();
  auto buffer = std::make_shared<std::vector<float>>(std::move(samples));
  return Audio(buffer, 0, size, sample_rate);
}

Audio Audio::from_file(const std::string& path) {
  DecodedAudio decoded = decode_file(path);
  return from_vector(std::move(decoded.samples), decoded.sample_rate);
}

const float* Audio::data() const {
  if (!buffer_) {
    return nullptr;
  }
  return buffer_->data() + offset_;
}

float Audio::duration() const {
  if (sample_rate_ == 0) {
    return 0.0f;
  }
  return static_cast<float>(length_) / static_cast<float>(sample_rate_);
}

Audio Audio::slice_samples(size_t start_sample, size_t end_sample) const {
  if (!buffer_) {
    return Audio();
  }
  start_sample = std::min(start_sample, length_);
  end_sample = std::min(end_sample, length_);
  if (start_sample >= end_sample) {
    return Audio();
  }
  return Audio(buffer_, offset_ + start_sample, end_sample - start_sample, sample_rate_);
}

Audio Audio::middle(float max_seconds) const {
  if (!buffer_ || max_seconds <= 0.0f) {
    return *this;
  }
  size_t keep = static_cast<size_t>(std::llround(max_seconds * sample_rate_));
  if (keep >= length_) {
    return *this;
  }
  size_t start = (length_ - keep) / 2;
  return slice_samples(start, start + keep);
}

}  // namespace bandprint
