#pragma once

#include <islr/model/inference_backend.hpp>
#include <islr/model/recognition_model.hpp>

namespace islr::model {

/// Runs the in-process RecognitionModel (OpenCV math, CPU).
class NativeInferenceBackend : public IInferenceBackend {
 public:
  explicit NativeInferenceBackend(RecognitionModel model);

  [[nodiscard]] std::expected<std::vector<float>, islr::core::RecognitionError>
  infer(const cv::Mat& window) const override;

  [[nodiscard]] std::size_t num_classes() const noexcept override;

  [[nodiscard]] std::expected<void, islr::core::RecognitionError>
  validate_input(const cv::Mat& window) const override;

  void warmup() override;

  [[nodiscard]] const RecognitionModel& model() const noexcept { return model_; }

 private:
  RecognitionModel model_;
};

}  // namespace islr::model
