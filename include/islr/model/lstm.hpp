#pragma once

#include <opencv2/core.hpp>

namespace islr::model {

/// One direction of one LSTM layer, PyTorch layout: gate blocks [i, f, g, o].
/// w_ih: 4H x in, w_hh: 4H x H, b_ih / b_hh: 1 x 4H. Headers share data with the
/// owning ParameterStore.
struct LstmWeights {
  cv::Mat w_ih;
  cv::Mat w_hh;
  cv::Mat b_ih;
  cv::Mat b_hh;
};

/// Same layout as LstmWeights; backward accumulates into these.
using LstmGradients = LstmWeights;

/// Activations kept for backpropagation through time.
struct LstmCache {
  cv::Mat input;   // L x in
  cv::Mat gates;   // L x 4H, post-activation [i, f, g, o]
  cv::Mat cell;    // L x H
  cv::Mat hidden;  // L x H
  bool reverse{false};
};

/// Runs the recurrence over the rows of x (time-major, L x in) starting from
/// zero state. reverse processes t = L-1 .. 0; row t of the result is always
/// the state at timestep t. Returns L x H.
[[nodiscard]] cv::Mat lstm_forward(const cv::Mat& x,
                                   const LstmWeights& w,
                                   bool reverse,
                                   LstmCache* cache = nullptr);

/// Backpropagates d_hidden (L x H) through the cached pass; adds parameter
/// gradients into grads and returns the gradient w.r.t. the input (L x in).
[[nodiscard]] cv::Mat lstm_backward(const LstmCache& cache,
                                    const LstmWeights& w,
                                    const cv::Mat& d_hidden,
                                    LstmGradients& grads);

}  // namespace islr::model
