#include <islr/features/sequence_padder.hpp>
#include <islr/features/frame_normalizer.hpp>
#include <algorithm>
#include <numeric>
#include <span>
#include <vector>

namespace islr::features {

namespace ic = islr::core;

std::expected<cv::Mat, ic::RecognitionError> pad_or_truncate(
    const cv::Mat& rows,
    std::size_t length) {
  if (length == 0) {
    return std::unexpected(ic::RecognitionError::InvalidConfig);
  }
  if (rows.empty() || rows.rows == 0) {
    return std::unexpected(ic::RecognitionError::EmptySequence);
  }
  const int target = static_cast<int>(length);
  if (rows.rows >= target) {
    return rows.rowRange(0, target).clone();
  }
  cv::Mat out = cv::Mat::zeros(target, rows.cols, rows.type());
  rows.copyTo(out.rowRange(0, rows.rows));
  return out;
}

std::expected<cv::Mat, ic::RecognitionError> build_window(
    const ic::KeypointSequence& sequence,
    const WindowOptions& options) {
  if (options.length == 0) {
    return std::unexpected(ic::RecognitionError::InvalidConfig);
  }
  if (sequence.empty()) {
    return std::unexpected(ic::RecognitionError::EmptySequence);
  }
  for (const auto& frame : sequence) {
    if (auto valid = validate_frame(frame); !valid) {
      return std::unexpected(valid.error());
    }
  }

  std::vector<std::size_t> order(sequence.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return sequence[a].frame_id() < sequence[b].frame_id();
  });
  for (std::size_t i = 1; i < order.size(); ++i) {
    if (sequence[order[i]].frame_id() == sequence[order[i - 1]].frame_id()) {
      return std::unexpected(ic::RecognitionError::InvalidFrameOrder);
    }
  }

  // Centering statistics cover every frame, including those truncation drops.
  const std::size_t normalized = options.center_coordinates ? order.size()
                                                            : std::min(order.size(), options.length);
  cv::Mat rows(static_cast<int>(normalized), static_cast<int>(ic::kFeatureDim), CV_32F);
  for (std::size_t i = 0; i < normalized; ++i) {
    std::span<float> row(rows.ptr<float>(static_cast<int>(i)), ic::kFeatureDim);
    if (auto ok = normalize_frame_into(sequence[order[i]], row); !ok) {
      return std::unexpected(ok.error());
    }
  }
  if (options.center_coordinates) {
    center_and_scale(rows);
  }
  return pad_or_truncate(rows, options.length);
}

}  // namespace islr::features
