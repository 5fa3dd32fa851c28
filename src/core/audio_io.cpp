#include "core/audio_io.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include "util/exception.h"

#define DR_WAV_IMPLEMENTATION
#include "dr_wav.h"

#define MINIMP3_IMPLEMENTATION
#include "minimp3.h"
#include "minimp3_ex.h"

namespace bandprint {

namespace {

/// @brief Owns the sample buffer minimp3 allocates with malloc.
struct Mp3BufferGuard {
  mp3d_sample_t* ptr = nullptr;
  ~Mp3BufferGuard() {
    if (ptr) {
      free(ptr);
    }
  }
};

/// @brief Averages interleaved channels into one.
template <typename Sample>
std::vector<float> downmix(const Sample* data, size_t frame_count, int channels, float scale) {
  std::vector<float> mono(frame_count);
  const float inv = scale / static_cast<float>(channels);
  for (size_t i = 0; i < frame_count; ++i) {
    float sum = 0.0f;
    for (int ch = 0; ch < channels; ++ch) {
      sum += static_cast<float>(data[i * channels + ch]);
    }
    mono[i] = sum * inv;
  }
  return mono;
}

std::vector<uint8_t> read_file(const std::string& path, size_t max_size) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  BANDPRINT_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);

  auto size = file.tellg();
  BANDPRINT_CHECK_MSG(size >= 0, ErrorCode::DecodeFailed, "Cannot stat file: " + path);
  BANDPRINT_CHECK_MSG(max_size == 0 || static_cast<size_t>(size) <= max_size,
                      ErrorCode::DecodeFailed,
                      "File too large: " + path + " (" + std::to_string(size) + " bytes)");
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> buffer(static_cast<size_t>(size));
  file.read(reinterpret_cast<char*>(buffer.data()), size);
  BANDPRINT_CHECK_MSG(file.good(), ErrorCode::DecodeFailed, "Failed to read file: " + path);
  return buffer;
}

DecodedAudio decode_wav(const uint8_t* data, size_t size) {
  drwav wav;
  BANDPRINT_CHECK_MSG(drwav_init_memory(&wav, data, size, nullptr), ErrorCode::DecodeFailed,
                      "Failed to parse WAV data");

  const int channels = static_cast<int>(wav.channels);
  std::vector<float> interleaved(static_cast<size_t>(wav.totalPCMFrameCount) * channels);
  drwav_uint64 frames_read =
      drwav_read_pcm_frames_f32(&wav, wav.totalPCMFrameCount, interleaved.data());
  DecodedAudio out;
  out.sample_rate = static_cast<int>(wav.sampleRate);
  drwav_uninit(&wav);

  BANDPRINT_CHECK_MSG(frames_read > 0 && channels > 0, ErrorCode::DecodeFailed,
                      "No audio frames in WAV data");
  out.samples = downmix(interleaved.data(), static_cast<size_t>(frames_read), channels, 1.0f);
  return out;
}

DecodedAudio decode_mp3(const uint8_t* data, size_t size) {
  mp3dec_t mp3d;
  mp3dec_file_info_t info;
  mp3dec_init(&mp3d);
  int result = mp3dec_load_buf(&mp3d, data, size, &info, nullptr, nullptr);
  Mp3BufferGuard guard;
  guard.ptr = info.buffer;
  BANDPRINT_CHECK_MSG(result == 0, ErrorCode::DecodeFailed, "Failed to decode MP3 data");
  BANDPRINT_CHECK_MSG(info.samples > 0 && info.channels > 0, ErrorCode::DecodeFailed,
                      "No audio samples in MP3 data");

  DecodedAudio out;
  out.sample_rate = info.hz;
  size_t frame_count = static_cast<size_t>(info.samples) / static_cast<size_t>(info.channels);
  out.samples = downmix(info.buffer, frame_count, info.channels, 1.0f / 32768.0f);
  return out;
}

}  // namespace

AudioFormat detect_format(const uint8_t* data, size_t size) {
  if (size < 12) {
    return AudioFormat::Unknown;
  }
  if (std::equal(data, data + 4, "RIFF") && std::equal(data + 8, data + 12, "WAVE")) {
    return AudioFormat::WAV;
  }
  // Frame sync or ID3v2 tag
  if ((data[0] == 0xFF && (data[1] & 0xE0) == 0xE0) || std::equal(data, data + 3, "ID3")) {
    return AudioFormat::MP3;
  }
  return AudioFormat::Unknown;
}

DecodedAudio decode_buffer(const uint8_t* data, size_t size) {
  switch (detect_format(data, size)) {
    case AudioFormat::WAV:
      return decode_wav(data, size);
    case AudioFormat::MP3:
      return decode_mp3(data, size);
    case AudioFormat::Unknown:
      break;
  }
  throw BandprintException(ErrorCode::InvalidFormat, "Unknown or unsupported audio format");
}

DecodedAudio decode_file(const std::string& path, const DecodeOptions& options) {
  std::vector<uint8_t> data = read_file(path, options.max_file_size);
  try {
    return decode_buffer(data.data(), data.size());
  } catch (const BandprintException& e) {
    throw BandprintException(e.code(), std::string(e.what()) + ": " + path);
  }
}

void save_wav(const std::string& path, const std::vector<float>& samples, int sample_rate) {
  BANDPRINT_CHECK_MSG(!samples.empty(), ErrorCode::InvalidParameter, "No samples to save");
  BANDPRINT_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter, "Invalid sample rate");

  drwav_data_format format;
  format.container = drwav_container_riff;
  format.format = DR_WAVE_FORMAT_PCM;
  format.channels = 1;
  format.sampleRate = static_cast<drwav_uint32>(sample_rate);
  format.bitsPerSample = 16;

  std::vector<int16_t> pcm(samples.size());
  for (size_t i = 0; i < samples.size(); ++i) {
    float clamped = std::max(-1.0f, std::min(1.0f, samples[i]));
    pcm[i] = static_cast<int16_t>(clamped * 32767.0f);
  }

  drwav wav;
  BANDPRINT_CHECK_MSG(drwav_init_file_write(&wav, path.c_str(), &format, nullptr),
                      ErrorCode::InvalidParameter, "Failed to create WAV file: " + path);
  drwav_uint64 written = drwav_write_pcm_frames(&wav, pcm.size(), pcm.data());
  drwav_uninit(&wav);
  BANDPRINT_CHECK_MSG(written == pcm.size(), ErrorCode::InvalidParameter,
                      "Failed to write all samples: " + path);
}

}  // namespace bandprint
