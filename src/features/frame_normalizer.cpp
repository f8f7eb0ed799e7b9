#include <islr/features/frame_normalizer.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>

namespace islr::features {

namespace ic = islr::core;

namespace {

float sanitize(float v) noexcept { return std::isfinite(v) ? v : 0.f; }

}  // namespace

std::expected<void, ic::RecognitionError> validate_frame(
    const ic::KeypointFrame& frame) noexcept {
  if (frame.size() != ic::kPointsPerFrame) {
    return std::unexpected(ic::RecognitionError::ShapeError);
  }
  return {};
}

std::expected<void, ic::RecognitionError> normalize_frame_into(
    const ic::KeypointFrame& frame,
    std::span<float> out) {
  if (auto valid = validate_frame(frame); !valid) {
    return std::unexpected(valid.error());
  }
  if (out.size() != ic::kFeatureDim) {
    return std::unexpected(ic::RecognitionError::ShapeError);
  }
  std::size_t k = 0;
  for (const ic::Point3& p : frame.points()) {
    out[k++] = sanitize(p.x);
    out[k++] = sanitize(p.y);
    out[k++] = sanitize(p.z);
  }
  return {};
}

std::expected<FeatureVector, ic::RecognitionError> normalize_frame(
    const ic::KeypointFrame& frame) {
  FeatureVector out(ic::kFeatureDim);
  auto ok = normalize_frame_into(frame, out);
  if (!ok) {
    return std::unexpected(ok.error());
  }
  return out;
}

void center_and_scale(cv::Mat& rows) {
  if (rows.empty() || rows.type() != CV_32F) return;
  CV_Assert(rows.cols % static_cast<int>(ic::kCoordsPerPoint) == 0);

  // View as (N * points) x 3 so each column is one coordinate axis.
  cv::Mat points = rows.reshape(1, rows.rows * rows.cols / 3);
  std::array<double, 3> mean{};
  for (int c = 0; c < 3; ++c) {
    mean[static_cast<std::size_t>(c)] = cv::mean(points.col(c))[0];
  }
  double max_abs = 0.0;
  for (int r = 0; r < points.rows; ++r) {
    float* p = points.ptr<float>(r);
    for (int c = 0; c < 3; ++c) {
      p[c] = static_cast<float>(p[c] - mean[static_cast<std::size_t>(c)]);
      max_abs = std::max(max_abs, static_cast<double>(std::abs(p[c])));
    }
  }
  if (max_abs > 0.0) {
    points *= 1.0 / max_abs;
  }
}

}  // namespace islr::features
