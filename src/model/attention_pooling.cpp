#include <islr/model/attention_pooling.hpp>
#include "tensor_ops.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace islr::model {

cv::Mat attention_forward(const cv::Mat& hidden,
                          const AttentionWeights& w,
                          AttentionCache* cache) {
  const int steps = hidden.rows;
  cv::Mat activation = detail::affine(hidden, w.w1, w.b1);
  for (int t = 0; t < steps; ++t) {
    float* a = activation.ptr<float>(t);
    for (int j = 0; j < activation.cols; ++j) a[j] = std::tanh(a[j]);
  }

  cv::Mat scores;
  cv::gemm(activation, w.w2, 1.0, cv::noArray(), 0.0, scores, cv::GEMM_2_T);  // L x 1
  const float bias = w.b2.at<float>(0, 0);

  // Softmax over time; the shared bias cancels but is kept for exact parity.
  float max_score = -std::numeric_limits<float>::infinity();
  for (int t = 0; t < steps; ++t) {
    max_score = std::max(max_score, scores.at<float>(t, 0) + bias);
  }
  cv::Mat weights(steps, 1, CV_32F);
  double total = 0.0;
  for (int t = 0; t < steps; ++t) {
    const double e = std::exp(static_cast<double>(scores.at<float>(t, 0) + bias - max_score));
    weights.at<float>(t, 0) = static_cast<float>(e);
    total += e;
  }
  for (int t = 0; t < steps; ++t) {
    weights.at<float>(t, 0) = static_cast<float>(weights.at<float>(t, 0) / total);
  }

  cv::Mat context;
  cv::gemm(weights, hidden, 1.0, cv::noArray(), 0.0, context, cv::GEMM_1_T);  // 1 x F

  if (cache) {
    cache->hidden = hidden;
    cache->activation = activation;
    cache->weights = weights;
  }
  return context;
}

cv::Mat attention_backward(const AttentionCache& cache,
                           const AttentionWeights& w,
                           const cv::Mat& d_context,
                           AttentionGradients& grads) {
  const int steps = cache.hidden.rows;

  cv::Mat d_weights;  // L x 1
  cv::gemm(cache.hidden, d_context, 1.0, cv::noArray(), 0.0, d_weights, cv::GEMM_2_T);

  double dot = 0.0;
  for (int t = 0; t < steps; ++t) {
    dot += static_cast<double>(cache.weights.at<float>(t, 0)) * d_weights.at<float>(t, 0);
  }
  cv::Mat d_scores(steps, 1, CV_32F);
  for (int t = 0; t < steps; ++t) {
    const float alpha = cache.weights.at<float>(t, 0);
    d_scores.at<float>(t, 0) =
        static_cast<float>(alpha * (d_weights.at<float>(t, 0) - dot));
  }

  cv::Mat d_hidden;
  cv::gemm(cache.weights, d_context, 1.0, cv::noArray(), 0.0, d_hidden);  // L x F

  detail::gemm_into(grads.w2, d_scores, cache.activation, cv::GEMM_1_T);
  detail::colsum_into(grads.b2, d_scores);

  cv::Mat d_activation;
  cv::gemm(d_scores, w.w2, 1.0, cv::noArray(), 0.0, d_activation);  // L x A
  for (int t = 0; t < steps; ++t) {
    const float* u = cache.activation.ptr<float>(t);
    float* d = d_activation.ptr<float>(t);
    for (int j = 0; j < d_activation.cols; ++j) d[j] *= 1.f - u[j] * u[j];
  }

  detail::gemm_into(grads.w1, d_activation, cache.hidden, cv::GEMM_1_T);
  detail::colsum_into(grads.b1, d_activation);

  cv::Mat d_from_scores;
  cv::gemm(d_activation, w.w1, 1.0, cv::noArray(), 0.0, d_from_scores);
  detail::add_into(d_hidden, d_from_scores);
  return d_hidden;
}

}  // namespace islr::model
