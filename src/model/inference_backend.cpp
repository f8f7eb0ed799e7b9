#include <islr/model/inference_backend.hpp>

namespace islr::model {

std::expected<void, islr::core::RecognitionError> IInferenceBackend::validate_input(
    const cv::Mat& window) const {
  if (window.empty() || window.type() != CV_32F) {
    return std::unexpected(islr::core::RecognitionError::ShapeError);
  }
  return {};
}

std::expected<std::vector<std::vector<float>>, islr::core::RecognitionError>
IInferenceBackend::infer_batch(std::span<const cv::Mat> windows) const {
  std::vector<std::vector<float>> results;
  results.reserve(windows.size());
  for (const auto& window : windows) {
    auto single = infer(window);
    if (!single) {
      return std::unexpected(single.error());
    }
    results.push_back(std::move(*single));
  }
  return results;
}

}  // namespace islr::model
