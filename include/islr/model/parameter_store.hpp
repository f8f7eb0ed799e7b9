#pragma once

#include <opencv2/core.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace islr::model {

struct NamedTensor {
  std::string name;
  cv::Mat value;  // CV_32F, weights out x in, biases 1 x n
};

/// Ordered collection of named float tensors (model weights, gradients or
/// optimizer moments). Order is the registration order and is stable.
class ParameterStore {
 public:
  /// Registers a tensor and returns its index.
  std::size_t add(std::string name, cv::Mat value);

  [[nodiscard]] std::size_t size() const noexcept { return tensors_.size(); }
  [[nodiscard]] bool empty() const noexcept { return tensors_.empty(); }

  [[nodiscard]] cv::Mat& at(std::size_t i) { return tensors_.at(i).value; }
  [[nodiscard]] const cv::Mat& at(std::size_t i) const { return tensors_.at(i).value; }
  [[nodiscard]] const std::string& name(std::size_t i) const { return tensors_.at(i).name; }

  /// Index of a named tensor, or size() if absent.
  [[nodiscard]] std::size_t find(std::string_view name) const noexcept;

  [[nodiscard]] const std::vector<NamedTensor>& tensors() const noexcept {
    return tensors_;
  }

  /// Same names and shapes, all zeros.
  [[nodiscard]] ParameterStore zeros_like() const;
  /// Zeros every tensor in place.
  void set_zero();
  /// Element-wise this += other * scale. Layouts must match.
  void accumulate(const ParameterStore& other, double scale = 1.0);
  /// Total number of scalars.
  [[nodiscard]] std::size_t num_elements() const noexcept;
  /// Deep copy (cv::Mat copies are shallow).
  [[nodiscard]] ParameterStore clone() const;

 private:
  std::vector<NamedTensor> tensors_;
};

}  // namespace islr::model
