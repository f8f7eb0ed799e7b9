#pragma once

#include <islr/core/error.hpp>
#include <islr/core/keypoint_frame.hpp>
#include <nlohmann/json.hpp>
#include <expected>
#include <string>

namespace islr::features {

/// One training sample: {"sign_label": "...", "frames": [...]}.
struct LabeledSample {
  std::string sign_label;
  islr::core::KeypointSequence frames;
};

/// Parses a "frames" array of {"frame_id": int, "keypoints": [[x,y,z], ...]}.
/// Frames keep their input order and any point count; a point that is not
/// exactly 3 numbers is a ShapeError, a missing or negative frame_id is
/// InvalidFrameOrder.
[[nodiscard]] std::expected<islr::core::KeypointSequence, islr::core::RecognitionError>
parse_frames(const nlohmann::json& frames);

/// DatasetError if "sign_label" is missing or not a string.
[[nodiscard]] std::expected<LabeledSample, islr::core::RecognitionError> parse_sample(
    const nlohmann::json& doc);

/// Inverse of parse_frames.
[[nodiscard]] nlohmann::json frames_to_json(const islr::core::KeypointSequence& frames);

}  // namespace islr::features
