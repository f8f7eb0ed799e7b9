#include <islr/model/lstm.hpp>
#include "tensor_ops.hpp"
#include <cmath>

namespace islr::model {

cv::Mat lstm_forward(const cv::Mat& x,
                     const LstmWeights& w,
                     bool reverse,
                     LstmCache* cache) {
  const int steps = x.rows;
  const int h_dim = w.w_hh.cols;
  CV_Assert(w.w_ih.rows == 4 * h_dim && w.w_ih.cols == x.cols);

  const cv::Mat bias = w.b_ih + w.b_hh;
  const cv::Mat proj = detail::affine(x, w.w_ih, bias);  // L x 4H

  cv::Mat gates(steps, 4 * h_dim, CV_32F);
  cv::Mat cell(steps, h_dim, CV_32F);
  cv::Mat hidden(steps, h_dim, CV_32F);
  cv::Mat h_prev = cv::Mat::zeros(1, h_dim, CV_32F);
  cv::Mat c_prev = cv::Mat::zeros(1, h_dim, CV_32F);
  cv::Mat pre;

  for (int s = 0; s < steps; ++s) {
    const int t = reverse ? steps - 1 - s : s;
    cv::gemm(h_prev, w.w_hh, 1.0, proj.row(t), 1.0, pre, cv::GEMM_2_T);

    const float* a = pre.ptr<float>(0);
    const float* cp = c_prev.ptr<float>(0);
    float* g = gates.ptr<float>(t);
    float* c = cell.ptr<float>(t);
    float* h = hidden.ptr<float>(t);
    for (int j = 0; j < h_dim; ++j) {
      const float in_gate = detail::sigmoid(a[j]);
      const float forget_gate = detail::sigmoid(a[h_dim + j]);
      const float candidate = std::tanh(a[2 * h_dim + j]);
      const float out_gate = detail::sigmoid(a[3 * h_dim + j]);
      g[j] = in_gate;
      g[h_dim + j] = forget_gate;
      g[2 * h_dim + j] = candidate;
      g[3 * h_dim + j] = out_gate;
      c[j] = forget_gate * cp[j] + in_gate * candidate;
      h[j] = out_gate * std::tanh(c[j]);
    }
    h_prev = hidden.row(t);
    c_prev = cell.row(t);
  }

  if (cache) {
    cache->input = x;
    cache->gates = gates;
    cache->cell = cell;
    cache->hidden = hidden;
    cache->reverse = reverse;
  }
  return hidden;
}

cv::Mat lstm_backward(const LstmCache& cache,
                      const LstmWeights& w,
                      const cv::Mat& d_hidden,
                      LstmGradients& grads) {
  const int steps = cache.hidden.rows;
  const int h_dim = cache.hidden.cols;
  CV_Assert(d_hidden.rows == steps && d_hidden.cols == h_dim);

  cv::Mat d_pre(steps, 4 * h_dim, CV_32F);
  cv::Mat h_prev_rows = cv::Mat::zeros(steps, h_dim, CV_32F);
  cv::Mat dh_next = cv::Mat::zeros(1, h_dim, CV_32F);
  cv::Mat dc_next = cv::Mat::zeros(1, h_dim, CV_32F);

  // Walk the recurrence backwards in processing order.
  for (int s = steps - 1; s >= 0; --s) {
    const int t = cache.reverse ? steps - 1 - s : s;
    const int t_prev = cache.reverse ? t + 1 : t - 1;
    const bool has_prev = s > 0;

    const float* g = cache.gates.ptr<float>(t);
    const float* c = cache.cell.ptr<float>(t);
    const float* c_prev = has_prev ? cache.cell.ptr<float>(t_prev) : nullptr;
    const float* dh_out = d_hidden.ptr<float>(t);
    const float* dh_rec = dh_next.ptr<float>(0);
    float* dc_rec = dc_next.ptr<float>(0);
    float* dp = d_pre.ptr<float>(t);

    for (int j = 0; j < h_dim; ++j) {
      const float in_gate = g[j];
      const float forget_gate = g[h_dim + j];
      const float candidate = g[2 * h_dim + j];
      const float out_gate = g[3 * h_dim + j];
      const float tc = std::tanh(c[j]);

      const float dh = dh_out[j] + dh_rec[j];
      const float d_out = dh * tc;
      const float dc = dh * out_gate * (1.f - tc * tc) + dc_rec[j];
      const float d_in = dc * candidate;
      const float d_cand = dc * in_gate;
      const float d_forget = has_prev ? dc * c_prev[j] : 0.f;
      dc_rec[j] = dc * forget_gate;

      dp[j] = d_in * in_gate * (1.f - in_gate);
      dp[h_dim + j] = d_forget * forget_gate * (1.f - forget_gate);
      dp[2 * h_dim + j] = d_cand * (1.f - candidate * candidate);
      dp[3 * h_dim + j] = d_out * out_gate * (1.f - out_gate);
    }

    cv::gemm(d_pre.row(t), w.w_hh, 1.0, cv::noArray(), 0.0, dh_next);
    if (has_prev) {
      cache.hidden.row(t_prev).copyTo(h_prev_rows.row(t));
    }
  }

  detail::gemm_into(grads.w_ih, d_pre, cache.input, cv::GEMM_1_T);
  detail::gemm_into(grads.w_hh, d_pre, h_prev_rows, cv::GEMM_1_T);
  detail::colsum_into(grads.b_ih, d_pre);
  detail::colsum_into(grads.b_hh, d_pre);

  cv::Mat d_input;
  cv::gemm(d_pre, w.w_ih, 1.0, cv::noArray(), 0.0, d_input);
  return d_input;
}

}  // namespace islr::model
