#include <islr/features/keypoint_json.hpp>
#include <cstdint>
#include <utility>
#include <vector>

namespace islr::features {

namespace ic = islr::core;
using json = nlohmann::json;

namespace {

std::expected<ic::KeypointFrame, ic::RecognitionError> parse_frame(const json& frame) {
  if (!frame.is_object()) return std::unexpected(ic::RecognitionError::ShapeError);

  const auto id = frame.find("frame_id");
  if (id == frame.end() || !id->is_number_integer()) {
    return std::unexpected(ic::RecognitionError::InvalidFrameOrder);
  }
  if (!id->is_number_unsigned() && id->get<std::int64_t>() < 0) {
    return std::unexpected(ic::RecognitionError::InvalidFrameOrder);
  }

  const auto keypoints = frame.find("keypoints");
  if (keypoints == frame.end() || !keypoints->is_array()) {
    return std::unexpected(ic::RecognitionError::ShapeError);
  }
  std::vector<ic::Point3> points;
  points.reserve(keypoints->size());
  for (const auto& p : *keypoints) {
    if (!p.is_array() || p.size() != ic::kCoordsPerPoint) {
      return std::unexpected(ic::RecognitionError::ShapeError);
    }
    for (const auto& c : p) {
      if (!c.is_number()) return std::unexpected(ic::RecognitionError::ShapeError);
    }
    points.push_back({p[0].get<float>(), p[1].get<float>(), p[2].get<float>()});
  }
  return ic::KeypointFrame(id->get<std::uint64_t>(), std::move(points));
}

}  // namespace

std::expected<ic::KeypointSequence, ic::RecognitionError> parse_frames(const json& frames) {
  if (!frames.is_array()) return std::unexpected(ic::RecognitionError::ShapeError);
  ic::KeypointSequence out;
  out.reserve(frames.size());
  for (const auto& f : frames) {
    auto frame = parse_frame(f);
    if (!frame) return std::unexpected(frame.error());
    out.push_back(std::move(*frame));
  }
  return out;
}

std::expected<LabeledSample, ic::RecognitionError> parse_sample(const json& doc) {
  if (!doc.is_object()) return std::unexpected(ic::RecognitionError::DatasetError);
  const auto label = doc.find("sign_label");
  if (label == doc.end() || !label->is_string()) {
    return std::unexpected(ic::RecognitionError::DatasetError);
  }
  const auto frames_it = doc.find("frames");
  if (frames_it == doc.end()) return std::unexpected(ic::RecognitionError::DatasetError);
  auto frames = parse_frames(*frames_it);
  if (!frames) return std::unexpected(frames.error());
  return LabeledSample{label->get<std::string>(), std::move(*frames)};
}

json frames_to_json(const ic::KeypointSequence& frames) {
  json out = json::array();
  for (const auto& frame : frames) {
    json points = json::array();
    for (const auto& p : frame.points()) {
      points.push_back({p.x, p.y, p.z});
    }
    out.push_back({{"frame_id", frame.frame_id()}, {"keypoints", std::move(points)}});
  }
  return out;
}

}  // namespace islr::features
