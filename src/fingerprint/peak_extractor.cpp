#include "fingerprint/peak_extractor.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

#include "core/spectrum.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace bandprint {

namespace {

constexpr float kMinMagnitude = 1e-10f;

bool is_local_max(const std::vector<float>& level, int n_frames, int n_bins, int bin, int frame,
                  int freq_radius, int time_radius) {
  const float center = level[static_cast<size_t>(bin) * n_frames + frame];
  for (int db = -freq_radius; db <= freq_radius; ++db) {
    int k = bin + db;
    if (k < 0 || k >= n_bins) continue;
    for (int dt = -time_radius; dt <= time_radius; ++dt) {
      int t = frame + dt;
      if (t < 0 || t >= n_frames || (db == 0 && dt == 0)) continue;
      if (level[static_cast<size_t>(k) * n_frames + t] > center) return false;
    }
  }
  return true;
}

}  // namespace

uint32_t landmark_hash(int f1, int df, int dt) {
  return (static_cast<uint32_t>(f1 & 0xFF) << 12) |
         (static_cast<uint32_t>((df + 32) & 0x3F) << 6) | static_cast<uint32_t>(dt & 0x3F);
}

std::vector<SpectralPeak> find_spectral_peaks(const std::vector<float>& level_db, int n_bins,
                                              int n_frames, const PeakExtractorConfig& config) {
  std::vector<SpectralPeak> peaks;
  std::vector<float> column(n_bins);
  std::vector<SpectralPeak> frame_peaks;

  for (int t = 0; t < n_frames; ++t) {
    for (int k = 0; k < n_bins; ++k) {
      column[k] = level_db[static_cast<size_t>(k) * n_frames + t];
    }
    const float threshold =
        std::max(median(column.data(), column.size()) + config.threshold_db, config.floor_db);

    frame_peaks.clear();
    // DC and Nyquist bins carry no usable pitch information
    for (int k = 1; k < n_bins - 1; ++k) {
      if (column[k] <= threshold) continue;
      if (is_local_max(level_db, n_frames, n_bins, k, t, config.freq_radius, config.time_radius)) {
        frame_peaks.push_back({t, k, column[k]});
      }
    }
    if (static_cast<int>(frame_peaks.size()) > config.max_peaks_per_frame) {
      std::stable_sort(frame_peaks.begin(), frame_peaks.end(),
                       [](const SpectralPeak& a, const SpectralPeak& b) {
                         return a.level_db > b.level_db;
                       });
      frame_peaks.resize(config.max_peaks_per_frame);
      std::sort(frame_peaks.begin(), frame_peaks.end(),
                [](const SpectralPeak& a, const SpectralPeak& b) { return a.bin < b.bin; });
    }
    peaks.insert(peaks.end(), frame_peaks.begin(), frame_peaks.end());
  }
  return peaks;
}

PeakExtractor::PeakExtractor(const PeakExtractorConfig& config) : config_(config) {
  BANDPRINT_CHECK_MSG(config.sample_rate > 0 && config.hop_length > 0 && config.fanout > 0 &&
                          config.max_peaks_per_frame > 0,
                      ErrorCode::InvalidParameter, "Invalid peak extractor configuration");
  BANDPRINT_CHECK_MSG(config.max_dt >= 1 && config.max_dt <= 63 && config.max_df >= 0 &&
                          config.max_df <= 31,
                      ErrorCode::InvalidParameter, "Target zone exceeds the hash layout");
}

Signature PeakExtractor::compute(const Audio& audio) {
  StftConfig stft;
  stft.n_fft = config_.n_fft;
  stft.hop_length = config_.hop_length;
  Spectrogram spec = Spectrogram::compute(audio, stft);

  std::vector<float> level(spec.magnitude().size());
  for (size_t i = 0; i < level.size(); ++i) {
    level[i] = 20.0f * std::log10(std::max(spec.magnitude()[i], kMinMagnitude));
  }
  std::vector<SpectralPeak> peaks =
      find_spectral_peaks(level, spec.n_bins(), spec.n_frames(), config_);

  Signature signature;
  signature.frame_rate = spec.frame_rate();
  for (size_t i = 0; i < peaks.size(); ++i) {
    const SpectralPeak& anchor = peaks[i];
    int paired = 0;
    for (size_t j = i + 1; j < peaks.size() && paired < config_.fanout; ++j) {
      int dt = peaks[j].frame - anchor.frame;
      if (dt < 1) continue;
      if (dt > config_.max_dt) break;
      int df = peaks[j].bin - anchor.bin;
      if (std::abs(df) > config_.max_df) continue;
      signature.landmarks.push_back({landmark_hash(anchor.bin, df, dt), anchor.frame});
      ++paired;
    }
  }
  return signature;
}

}  // namespace bandprint
