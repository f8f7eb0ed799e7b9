#pragma once

#include <opencv2/core.hpp>

namespace islr::model {

/// Additive attention over timesteps:
///   score_t = w2 . tanh(w1 h_t + b1) + b2,  alpha = softmax_t(score),
///   context = sum_t alpha_t h_t.
/// w1: A x F, b1: 1 x A, w2: 1 x A, b2: 1 x 1 (F = feature width of h_t).
struct AttentionWeights {
  cv::Mat w1;
  cv::Mat b1;
  cv::Mat w2;
  cv::Mat b2;
};

using AttentionGradients = AttentionWeights;

struct AttentionCache {
  cv::Mat hidden;      // L x F
  cv::Mat activation;  // L x A, tanh(w1 h + b1)
  cv::Mat weights;     // L x 1, alpha
};

/// Returns the 1 x F context vector for hidden (L x F).
[[nodiscard]] cv::Mat attention_forward(const cv::Mat& hidden,
                                        const AttentionWeights& w,
                                        AttentionCache* cache = nullptr);

/// Adds parameter gradients into grads; returns d hidden (L x F).
[[nodiscard]] cv::Mat attention_backward(const AttentionCache& cache,
                                         const AttentionWeights& w,
                                         const cv::Mat& d_context,
                                         AttentionGradients& grads);

}  // namespace islr::model
