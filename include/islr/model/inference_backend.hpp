#pragma once

#include <islr/core/error.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <vector>

namespace islr::model {

/// Abstract recognition backend: padded window (L x kFeatureDim, CV_32F) -> logits.
/// Implementations are read-only after construction: infer() is const and must be
/// safe to call from many threads at once.
class IInferenceBackend {
 public:
  virtual ~IInferenceBackend() = default;

  /// Raw class scores, one per output class. Must be implemented.
  [[nodiscard]] virtual std::expected<std::vector<float>, islr::core::RecognitionError>
  infer(const cv::Mat& window) const = 0;

  /// Width of the output layer.
  [[nodiscard]] virtual std::size_t num_classes() const noexcept = 0;

  /// Optional: validate window shape before infer. Default: non-empty CV_32F.
  [[nodiscard]] virtual std::expected<void, islr::core::RecognitionError>
  validate_input(const cv::Mat& window) const;

  /// Optional: batch inference. Default: loop over infer().
  [[nodiscard]] virtual std::expected<std::vector<std::vector<float>>,
                                      islr::core::RecognitionError>
  infer_batch(std::span<const cv::Mat> windows) const;

  /// Optional: warmup run (e.g. dummy inference). Default: no-op.
  virtual void warmup() {}
};

}  // namespace islr::model
