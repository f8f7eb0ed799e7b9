#include <islr/model/native_inference_backend.hpp>
#include <islr/core/keypoint_frame.hpp>
#include <islr/core/logger.hpp>

namespace islr::model {

NativeInferenceBackend::NativeInferenceBackend(RecognitionModel model)
    : model_(std::move(model)) {}

std::size_t NativeInferenceBackend::num_classes() const noexcept {
  return model_.config().num_classes;
}

std::expected<void, islr::core::RecognitionError> NativeInferenceBackend::validate_input(
    const cv::Mat& window) const {
  if (window.empty() || window.type() != CV_32F ||
      window.cols != static_cast<int>(model_.config().input_dim)) {
    return std::unexpected(islr::core::RecognitionError::ShapeError);
  }
  return {};
}

std::expected<std::vector<float>, islr::core::RecognitionError>
NativeInferenceBackend::infer(const cv::Mat& window) const {
  auto logits = model_.forward(window);
  if (!logits) {
    return std::unexpected(logits.error());
  }
  const float* p = logits->ptr<float>(0);
  return std::vector<float>(p, p + logits->cols);
}

void NativeInferenceBackend::warmup() {
  const cv::Mat dummy = cv::Mat::zeros(static_cast<int>(islr::core::kDefaultWindowLength),
                                       static_cast<int>(model_.config().input_dim), CV_32F);
  if (auto r = infer(dummy); !r) {
    islr::core::Logger::warn("Native backend warmup failed: ", islr::core::to_string(r.error()));
  }
}

}  // namespace islr::model
