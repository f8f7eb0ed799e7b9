#pragma once

#include <islr/core/error.hpp>
#include <islr/model/inference_backend.hpp>
#include <cstddef>
#include <memory>
#include <string>

namespace islr::model {

/// ONNX Runtime backend for a recognizer exported from the reference training
/// code: one float input [1, L, 1629] (L may be dynamic) and one output [1, V]
/// of logits. V must be static; it is read from the model at construction.
///
/// Constructor throws Ort::Exception if the model cannot be loaded and
/// std::runtime_error if its input/output layout is not the one above.
class OnnxInferenceBackend : public IInferenceBackend {
 public:
  /// \param model_path Path to the .onnx file.
  /// \param input_name Optional input tensor name; first input if empty.
  /// \param output_name Optional output tensor name; first output if empty.
  explicit OnnxInferenceBackend(std::string model_path,
                                std::string input_name = {},
                                std::string output_name = {});

  ~OnnxInferenceBackend() override;

  OnnxInferenceBackend(const OnnxInferenceBackend&) = delete;
  OnnxInferenceBackend& operator=(const OnnxInferenceBackend&) = delete;

  [[nodiscard]] std::expected<std::vector<float>, islr::core::RecognitionError>
  infer(const cv::Mat& window) const override;

  [[nodiscard]] std::size_t num_classes() const noexcept override;

  [[nodiscard]] std::expected<void, islr::core::RecognitionError>
  validate_input(const cv::Mat& window) const override;

  void warmup() override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace islr::model
