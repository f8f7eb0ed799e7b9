#include <islr/app/keypoint_json.hpp>
#include <islr/core/logger.hpp>
#include <islr/features/keypoint_json.hpp>
#include <fstream>
#include <sstream>
#include <utility>

namespace islr::app {

namespace ic = islr::core;
using json = nlohmann::json;

std::expected<RecognitionRequest, ic::RecognitionError> parse_request(std::string_view text) {
  json doc;
  try {
    doc = json::parse(text);
  } catch (const json::parse_error& e) {
    ic::Logger::warn("Malformed request JSON: ", e.what());
    return std::unexpected(ic::RecognitionError::ShapeError);
  }
  if (!doc.is_object() || !doc.contains("frames")) {
    return std::unexpected(ic::RecognitionError::ShapeError);
  }
  auto frames = islr::features::parse_frames(doc["frames"]);
  if (!frames) return std::unexpected(frames.error());

  RecognitionRequest request;
  request.frames = std::move(*frames);
  if (auto it = doc.find("user_id"); it != doc.end() && it->is_string()) {
    request.user_id = it->get<std::string>();
  }
  return request;
}

std::expected<RecognitionRequest, ic::RecognitionError> load_request_file(
    const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    ic::Logger::error("Cannot open request file ", path);
    return std::unexpected(ic::RecognitionError::ShapeError);
  }
  std::ostringstream buffer;
  buffer << f.rdbuf();
  return parse_request(buffer.str());
}

json to_json(const ic::RecognitionResult& result) {
  json predictions = json::array();
  for (const auto& p : result.predictions) {
    predictions.push_back(
        {{"label", p.label}, {"confidence", p.confidence}, {"class_index", p.class_index}});
  }
  return {{"predictions", std::move(predictions)},
          {"text", result.text},
          {"num_frames", result.num_frames}};
}

}  // namespace islr::app
