#include "core/resample.h"

#include <algorithm>
#include <cmath>

#include "CDSPResampler.h"
#include "util/exception.h"

namespace bandprint {

namespace {
constexpr int kBlockSize = 1024;
constexpr int kMaxFlushBlocks = 16;
}  // namespace

std::vector<float> resample(const float* samples, size_t size, int src_sr, int target_sr) {
  BANDPRINT_CHECK(src_sr > 0 && target_sr > 0, ErrorCode::InvalidParameter);
  if (size == 0) {
    return {};
  }
  if (src_sr == target_sr) {
    return std::vector<float>(samples, samples + size);
  }

  const double ratio = static_cast<double>(target_sr) / static_cast<double>(src_sr);
  const size_t expected = static_cast<size_t>(std::llround(static_cast<double>(size) * ratio));

  r8b::CDSPResampler24 resampler(static_cast<double>(src_sr), static_cast<double>(target_sr),
                                 kBlockSize);
  std::vector<double> block(kBlockSize);
  std::vector<float> out;
  out.reserve(expected + kBlockSize);

  auto push = [&out](const double* ptr, int len) {
    for (int i = 0; i < len; ++i) out.push_back(static_cast<float>(ptr[i]));
  };

  for (size_t pos = 0; pos < size; pos += kBlockSize) {
    int len = static_cast<int>(std::min(size - pos, static_cast<size_t>(kBlockSize)));
    std::copy(samples + pos, samples + pos + len, block.begin());
    double* output = nullptr;
    int produced = resampler.process(block.data(), len, output);
    if (produced > 0 && output != nullptr) push(output, produced);
  }

  // Flush the filter delay with silence
  std::fill(block.begin(), block.end(), 0.0);
  for (int i = 0; i < kMaxFlushBlocks && out.size() < expected; ++i) {
    double* output = nullptr;
    int produced = resampler.process(block.data(), kBlockSize, output);
    if (produced > 0 && output != nullptr) push(output, produced);
  }

  if (out.size() > expected) {
    out.resize(expected);
  }
  return out;
}

Audio resample(const Audio& audio, int target_sr) {
  if (audio.empty() || audio.sample_rate() == target_sr) {
    return audio;
  }
  return Audio::from_vector(resample(audio.data(), audio.size(), audio.sample_rate(), target_sr),
                            target_sr);
}

}  // namespace bandprint
