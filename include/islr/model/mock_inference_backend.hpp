#pragma once

#include <islr/model/inference_backend.hpp>
#include <atomic>
#include <vector>

namespace islr::model {

/// Backend returning fixed logits regardless of input (for tests/demo).
class MockInferenceBackend : public IInferenceBackend {
 public:
  explicit MockInferenceBackend(std::vector<float> logits);

  [[nodiscard]] std::expected<std::vector<float>, islr::core::RecognitionError>
  infer(const cv::Mat& window) const override;

  [[nodiscard]] std::size_t num_classes() const noexcept override {
    return logits_.size();
  }

  /// Number of infer() calls so far.
  [[nodiscard]] std::size_t calls() const noexcept { return calls_.load(); }

 private:
  std::vector<float> logits_;
  mutable std::atomic<std::size_t> calls_{0};
};

}  // namespace islr::model
