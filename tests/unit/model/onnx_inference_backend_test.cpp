// Unit tests for OnnxInferenceBackend.
// One test runs without a model (constructor with missing file). The rest require an exported
// recognizer (.onnx with input [1, L, 1629], L dynamic or 64, and output [1, V]): set
// ISLR_TEST_ONNX_MODEL to its path.
// They are skipped if the env var is unset or the file is missing, so CI without a model still passes.
#include <islr/core/error.hpp>
#include <islr/core/keypoint_frame.hpp>
#include <islr/model/onnx_inference_backend.hpp>
#include <onnxruntime_cxx_api.h>
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace im = islr::model;
namespace ic = islr::core;

static std::string get_test_model_path() {
  const char* env = std::getenv("ISLR_TEST_ONNX_MODEL");
  if (env && env[0] != '\0' && std::filesystem::exists(env)) {
    return env;
  }
  return "";
}

static cv::Mat make_window(int rows) {
  return cv::Mat::zeros(rows, static_cast<int>(ic::kFeatureDim), CV_32F);
}

TEST(OnnxInferenceBackend, ConstructorThrowsWhenFileMissing) {
  EXPECT_THROW(
      { im::OnnxInferenceBackend backend("nonexistent_islr_model_12345_should_not_exist.onnx"); },
      Ort::Exception);
}

TEST(OnnxInferenceBackend, ValidateInputRejectsWrongWidth) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set ISLR_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  im::OnnxInferenceBackend backend(path);
  auto valid = backend.validate_input(cv::Mat::zeros(64, 100, CV_32F));
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error(), ic::RecognitionError::ShapeError);
}

TEST(OnnxInferenceBackend, InferReturnsOneLogitPerClass) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set ISLR_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  im::OnnxInferenceBackend backend(path);
  backend.warmup();
  auto logits = backend.infer(make_window(static_cast<int>(ic::kDefaultWindowLength)));
  ASSERT_TRUE(logits.has_value()) << "infer() should succeed with a valid window";
  EXPECT_EQ(logits->size(), backend.num_classes());
  EXPECT_GT(backend.num_classes(), 0u);
}

TEST(OnnxInferenceBackend, WarmupDoesNotThrow) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set ISLR_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  im::OnnxInferenceBackend backend(path);
  EXPECT_NO_THROW(backend.warmup());
}
