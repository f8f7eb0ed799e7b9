#pragma once

#include <islr/core/error.hpp>
#include <islr/core/keypoint_frame.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <expected>

namespace islr::features {

/// Returns exactly `length` rows: the first `length` rows of `rows` if it is at
/// least that long, otherwise `rows` followed by zero rows.
/// rows: N x D, CV_32F. Fails with EmptySequence if N == 0 and InvalidConfig if
/// length == 0. The result never aliases the input.
[[nodiscard]] std::expected<cv::Mat, islr::core::RecognitionError> pad_or_truncate(
    const cv::Mat& rows,
    std::size_t length);

struct WindowOptions {
  std::size_t length{islr::core::kDefaultWindowLength};
  bool center_coordinates{false};
};

/// Model input for one gesture: sorts frames by frame_id, flattens each frame
/// and pads/truncates to options.length. Result: length x kFeatureDim, CV_32F.
/// With center_coordinates, centering runs over the whole sorted sequence before truncation.
/// Every frame is shape-checked, including frames later dropped by truncation.
[[nodiscard]] std::expected<cv::Mat, islr::core::RecognitionError> build_window(
    const islr::core::KeypointSequence& sequence,
    const WindowOptions& options = {});

}  // namespace islr::features
