#pragma once

#include <islr/core/error.hpp>
#include <islr/core/keypoint_frame.hpp>
#include <islr/core/prediction.hpp>
#include <nlohmann/json.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace islr::app {

/// Body of a recognition request: {"frames": [...], "user_id": "..."}.
/// Frames are parsed with islr::features::parse_frames.
struct RecognitionRequest {
  islr::core::KeypointSequence frames;
  std::string user_id{"anonymous"};
};

[[nodiscard]] std::expected<RecognitionRequest, islr::core::RecognitionError> parse_request(
    std::string_view text);

/// Reads and parses a request file. ShapeError if it cannot be read or parsed.
[[nodiscard]] std::expected<RecognitionRequest, islr::core::RecognitionError>
load_request_file(const std::string& path);

/// {"predictions": [{"label", "confidence", "class_index"}], "text", "num_frames"}.
[[nodiscard]] nlohmann::json to_json(const islr::core::RecognitionResult& result);

}  // namespace islr::app
