#include <islr/model/mock_inference_backend.hpp>

namespace islr::model {

MockInferenceBackend::MockInferenceBackend(std::vector<float> logits)
    : logits_(std::move(logits)) {}

std::expected<std::vector<float>, islr::core::RecognitionError>
MockInferenceBackend::infer(const cv::Mat& window) const {
  if (auto valid = validate_input(window); !valid) {
    return std::unexpected(valid.error());
  }
  calls_.fetch_add(1);
  return logits_;
}

}  // namespace islr::model
