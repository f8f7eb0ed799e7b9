#pragma once

#include <islr/core/error.hpp>
#include <islr/core/keypoint_frame.hpp>
#include <opencv2/core.hpp>
#include <expected>
#include <span>
#include <vector>

namespace islr::features {

/// Flat per-frame feature vector [p0.x, p0.y, p0.z, p1.x, ...] of length kFeatureDim.
using FeatureVector = std::vector<float>;

/// Checks that the frame carries exactly kPointsPerFrame points.
[[nodiscard]] std::expected<void, islr::core::RecognitionError> validate_frame(
    const islr::core::KeypointFrame& frame) noexcept;

/// Flattens one frame. Coordinates are passed through unchanged (the model is
/// trained on raw detector output); non-finite values become 0.
[[nodiscard]] std::expected<FeatureVector, islr::core::RecognitionError>
normalize_frame(const islr::core::KeypointFrame& frame);

/// Same as normalize_frame, writing into out (size must be kFeatureDim).
[[nodiscard]] std::expected<void, islr::core::RecognitionError> normalize_frame_into(
    const islr::core::KeypointFrame& frame,
    std::span<float> out);

/// Re-centers every coordinate axis around its mean over all rows and points,
/// then scales by the largest absolute value so values fall in [-1, 1].
/// rows: N x kFeatureDim, CV_32F, modified in place. All-zero input is left as is.
/// Off by default: models trained on raw coordinates degrade with it.
void center_and_scale(cv::Mat& rows);

}  // namespace islr::features
