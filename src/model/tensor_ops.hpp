#pragma once

#include <opencv2/core.hpp>
#include <cmath>

namespace islr::model::detail {

inline float sigmoid(float x) noexcept { return 1.f / (1.f + std::exp(-x)); }

/// dst += src; dst keeps its buffer so headers into a ParameterStore stay valid.
inline void add_into(cv::Mat& dst, const cv::Mat& src) {
  CV_Assert(dst.size() == src.size() && dst.type() == src.type());
  cv::add(dst, src, dst);
}

/// dst += op(a) * op(b), gemm flags as in cv::gemm.
inline void gemm_into(cv::Mat& dst, const cv::Mat& a, const cv::Mat& b, int flags) {
  cv::Mat tmp;
  cv::gemm(a, b, 1.0, cv::noArray(), 0.0, tmp, flags);
  add_into(dst, tmp);
}

/// dst += column sums of src (dst is 1 x src.cols).
inline void colsum_into(cv::Mat& dst, const cv::Mat& src) {
  cv::Mat tmp;
  cv::reduce(src, tmp, 0, cv::REDUCE_SUM, CV_32F);
  add_into(dst, tmp);
}

/// x * W^T + b for row-major activations x (n x in), W (out x in), b (1 x out).
inline cv::Mat affine(const cv::Mat& x, const cv::Mat& w, const cv::Mat& b) {
  cv::Mat out;
  cv::gemm(x, w, 1.0, cv::repeat(b, x.rows, 1), 1.0, out, cv::GEMM_2_T);
  return out;
}

/// Inverted dropout mask: 0 with probability p, 1 / (1 - p) otherwise.
inline cv::Mat dropout_mask(int rows, int cols, float p, cv::RNG& rng) {
  cv::Mat mask(rows, cols, CV_32F);
  rng.fill(mask, cv::RNG::UNIFORM, 0.0, 1.0);
  const float keep_scale = 1.f / (1.f - p);
  for (int r = 0; r < rows; ++r) {
    float* m = mask.ptr<float>(r);
    for (int c = 0; c < cols; ++c) {
      m[c] = m[c] < p ? 0.f : keep_scale;
    }
  }
  return mask;
}

}  // namespace islr::model::detail
