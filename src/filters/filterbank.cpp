#include "filters/filterbank.h"

#include <Eigen/Core>

#include "util/exception.h"

namespace bandprint {

std::vector<float> apply_filterbank(const Spectrogram& spec, const Filterbank& bank,
                                    bool use_power) {
  BANDPRINT_CHECK_MSG(spec.empty() || spec.n_bins() == bank.n_bins, ErrorCode::InvalidParameter,
                      "Filterbank bin count does not match spectrogram");
  const int n_frames = spec.n_frames();
  std::vector<float> out(static_cast<size_t>(n_frames) * bank.n_filters, 0.0f);
  if (spec.empty() || bank.n_filters == 0) {
    return out;
  }

  using RowMajor = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
  Eigen::Map<const RowMajor> weights(bank.weights.data(), bank.n_filters, bank.n_bins);
  Eigen::Map<const RowMajor> mag(spec.magnitude().data(), spec.n_bins(), n_frames);
  // Output is [n_frames x n_filters]; a row-major map of it is the transpose product
  Eigen::Map<RowMajor> features(out.data(), n_frames, bank.n_filters);

  if (use_power) {
    RowMajor power = mag.array().square().matrix();
    features.noalias() = power.transpose() * weights.transpose();
  } else {
    features.noalias() = mag.transpose() * weights.transpose();
  }
  return out;
}

}  // namespace bandprint
