// Finite-difference check of the analytic gradients (BPTT through both LSTM
// directions, attention pooling and the classifier head).
#include <islr/model/recognition_model.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <string>

namespace im = islr::model;

namespace {

double loss_of(const im::RecognitionModel& model, const cv::Mat& window, std::size_t label) {
  auto logits = model.forward(window);
  EXPECT_TRUE(logits.has_value());
  return logits ? static_cast<double>(im::cross_entropy(*logits, label)) : 0.0;
}

}  // namespace

TEST(GradientCheck, AnalyticMatchesFiniteDifferences) {
  im::ModelConfig config;
  config.input_dim = 5;
  config.hidden_dim = 3;
  config.num_layers = 2;
  config.num_classes = 4;
  config.dropout = 0.f;
  config.seed = 11;
  auto model = im::RecognitionModel::create(config);
  ASSERT_TRUE(model.has_value());

  cv::Mat window(4, 5, CV_32F);
  cv::RNG rng(3);
  rng.fill(window, cv::RNG::UNIFORM, -1.0, 1.0);
  const std::size_t label = 2;

  auto grads = model->parameters().zeros_like();
  ASSERT_TRUE(model->forward_backward(window, label, grads).has_value());

  constexpr double kEps = 1e-3;
  auto& params = model->parameters();
  int checked = 0;
  for (std::size_t t = 0; t < params.size(); ++t) {
    cv::Mat& p = params.at(t);
    const int total = static_cast<int>(p.total());
    // A few spread-out entries per tensor.
    for (int k : {0, total / 2, total - 1}) {
      float* value = p.ptr<float>(0) + k;
      const float saved = *value;
      *value = static_cast<float>(saved + kEps);
      const double up = loss_of(*model, window, label);
      *value = static_cast<float>(saved - kEps);
      const double down = loss_of(*model, window, label);
      *value = saved;

      const double numeric = (up - down) / (2.0 * kEps);
      const double analytic = grads.at(t).ptr<float>(0)[k];
      EXPECT_NEAR(analytic, numeric, 2e-3 + 0.05 * std::abs(numeric))
          << params.name(t) << "[" << k << "]";
      ++checked;
    }
  }
  EXPECT_GT(checked, 40);
}

TEST(GradientCheck, GradientsAccumulateAcrossCalls) {
  im::ModelConfig config;
  config.input_dim = 4;
  config.hidden_dim = 2;
  config.num_layers = 1;
  config.num_classes = 3;
  config.dropout = 0.f;
  auto model = im::RecognitionModel::create(config);
  ASSERT_TRUE(model.has_value());
  cv::Mat window = cv::Mat::ones(3, 4, CV_32F);

  auto once = model->parameters().zeros_like();
  ASSERT_TRUE(model->forward_backward(window, 1, once).has_value());
  auto twice = model->parameters().zeros_like();
  ASSERT_TRUE(model->forward_backward(window, 1, twice).has_value());
  ASSERT_TRUE(model->forward_backward(window, 1, twice).has_value());

  for (std::size_t t = 0; t < once.size(); ++t) {
    cv::Mat doubled = once.at(t) * 2.0;
    EXPECT_LT(cv::norm(doubled, twice.at(t), cv::NORM_INF), 1e-5) << once.name(t);
  }
}

TEST(GradientCheck, DropoutIsDeterministicForASeed) {
  im::ModelConfig config;
  config.input_dim = 4;
  config.hidden_dim = 3;
  config.num_layers = 2;
  config.num_classes = 3;
  config.dropout = 0.5f;
  auto model = im::RecognitionModel::create(config);
  ASSERT_TRUE(model.has_value());
  cv::Mat window = cv::Mat::ones(3, 4, CV_32F);

  auto a = model->parameters().zeros_like();
  auto b = model->parameters().zeros_like();
  cv::RNG rng_a(5);
  cv::RNG rng_b(5);
  auto sa = model->forward_backward(window, 0, a, &rng_a);
  auto sb = model->forward_backward(window, 0, b, &rng_b);
  ASSERT_TRUE(sa && sb);
  EXPECT_EQ(sa->loss, sb->loss);
  for (std::size_t t = 0; t < a.size(); ++t) {
    EXPECT_EQ(cv::norm(a.at(t), b.at(t), cv::NORM_INF), 0.0);
  }
}
