#include <islr/model/onnx_inference_backend.hpp>
#include <islr/core/keypoint_frame.hpp>
#include <islr/core/logger.hpp>
#include <onnxruntime_cxx_api.h>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace islr::model {

namespace ic = islr::core;

namespace {

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

}  // namespace

struct OnnxInferenceBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "islr"};
  Ort::SessionOptions session_options;
  // Session::Run is thread-safe; the C++ wrapper just does not mark it const.
  mutable Ort::Session session{nullptr};

  std::string input_name;
  std::string output_name;

  std::int64_t window_length{-1};  // -1 if dynamic
  std::int64_t feature_dim{static_cast<std::int64_t>(ic::kFeatureDim)};
  std::size_t num_classes{0};

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxInferenceBackend::OnnxInferenceBackend(std::string model_path,
                                           std::string input_name,
                                           std::string output_name)
    : impl_(std::make_unique<Impl>()) {
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxInferenceBackend: model has no inputs");
  }
  if (impl_->session.GetOutputCount() == 0) {
    throw std::runtime_error("OnnxInferenceBackend: model has no outputs");
  }
  impl_->input_name = input_name.empty()
                          ? std::string(impl_->session.GetInputNameAllocated(0, allocator).get())
                          : std::move(input_name);
  impl_->output_name = output_name.empty()
                           ? std::string(impl_->session.GetOutputNameAllocated(0, allocator).get())
                           : std::move(output_name);

  const std::vector<int64_t> in_dims =
      impl_->session.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
  if (in_dims.size() != 3u) {
    throw std::runtime_error("OnnxInferenceBackend: expected input shape [1, L, 1629]");
  }
  if (in_dims[2] > 0 && in_dims[2] != impl_->feature_dim) {
    throw std::runtime_error("OnnxInferenceBackend: input feature width is not 1629");
  }
  impl_->window_length = in_dims[1];

  const std::vector<int64_t> out_dims =
      impl_->session.GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
  if (out_dims.size() != 2u || out_dims[1] <= 0) {
    throw std::runtime_error("OnnxInferenceBackend: expected output shape [1, V] with static V");
  }
  impl_->num_classes = static_cast<std::size_t>(out_dims[1]);
  ic::Logger::info("Loaded ONNX recognizer ", model_path, " (", impl_->num_classes, " classes)");
}

OnnxInferenceBackend::~OnnxInferenceBackend() = default;

std::size_t OnnxInferenceBackend::num_classes() const noexcept {
  return impl_->num_classes;
}

std::expected<void, ic::RecognitionError> OnnxInferenceBackend::validate_input(
    const cv::Mat& window) const {
  if (window.empty() || window.type() != CV_32F ||
      window.cols != static_cast<int>(impl_->feature_dim)) {
    return std::unexpected(ic::RecognitionError::ShapeError);
  }
  if (impl_->window_length > 0 && window.rows != impl_->window_length) {
    return std::unexpected(ic::RecognitionError::ShapeError);
  }
  return {};
}

std::expected<std::vector<float>, ic::RecognitionError> OnnxInferenceBackend::infer(
    const cv::Mat& window) const {
  if (auto valid = validate_input(window); !valid) {
    return std::unexpected(valid.error());
  }
  const cv::Mat input = window.isContinuous() ? window : window.clone();

  const std::array<int64_t, 3> shape{1, static_cast<int64_t>(input.rows),
                                     static_cast<int64_t>(input.cols)};
  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  // ORT does not write to input tensors.
  Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
      mem_info, const_cast<float*>(input.ptr<float>(0)), input.total(), shape.data(),
      shape.size());

  const char* input_names[] = {impl_->input_name.c_str()};
  const char* output_names[] = {impl_->output_name.c_str()};
  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(Ort::RunOptions{nullptr}, input_names, &input_tensor, 1,
                                 output_names, 1);
  } catch (const Ort::Exception& e) {
    ic::Logger::error("ONNX inference failed: ", e.what());
    return std::unexpected(ic::RecognitionError::InferenceFailed);
  }
  if (outputs.empty() || !outputs[0].IsTensor()) {
    return std::unexpected(ic::RecognitionError::InferenceFailed);
  }
  const std::size_t count = outputs[0].GetTensorTypeAndShapeInfo().GetElementCount();
  if (count != impl_->num_classes) {
    return std::unexpected(ic::RecognitionError::InferenceFailed);
  }
  const float* logits = outputs[0].GetTensorData<float>();
  return std::vector<float>(logits, logits + count);
}

void OnnxInferenceBackend::warmup() {
  const int rows = impl_->window_length > 0 ? static_cast<int>(impl_->window_length)
                                            : static_cast<int>(ic::kDefaultWindowLength);
  const cv::Mat dummy = cv::Mat::zeros(rows, static_cast<int>(impl_->feature_dim), CV_32F);
  if (auto r = infer(dummy); !r) {
    ic::Logger::warn("ONNX warmup failed: ", ic::to_string(r.error()));
  }
}

}  // namespace islr::model
