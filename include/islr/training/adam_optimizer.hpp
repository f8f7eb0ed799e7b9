#pragma once

#include <islr/core/error.hpp>
#include <islr/model/checkpoint.hpp>
#include <islr/model/parameter_store.hpp>
#include <cstdint>
#include <expected>

namespace islr::training {

struct AdamOptions {
  double learning_rate{1e-3};
  double beta1{0.9};
  double beta2{0.999};
  double epsilon{1e-8};
};

/// Adam with PyTorch's bias correction. Moments share the parameter layout.
class AdamOptimizer {
 public:
  AdamOptimizer(const islr::model::ParameterStore& parameters, AdamOptions options = {});

  /// params -= lr * m_hat / (sqrt(v_hat) + eps). InvalidConfig if params or
  /// grads do not match the layout the optimizer was created with.
  [[nodiscard]] std::expected<void, islr::core::RecognitionError> step(
      islr::model::ParameterStore& parameters,
      const islr::model::ParameterStore& gradients);

  [[nodiscard]] double learning_rate() const noexcept { return options_.learning_rate; }
  void set_learning_rate(double lr) noexcept { options_.learning_rate = lr; }
  [[nodiscard]] std::uint64_t steps() const noexcept { return step_; }
  [[nodiscard]] const AdamOptions& options() const noexcept { return options_; }

  [[nodiscard]] islr::model::OptimizerState export_state() const;
  /// CheckpointLoadFailed if the moment layout differs.
  [[nodiscard]] std::expected<void, islr::core::RecognitionError> import_state(
      const islr::model::OptimizerState& state);

 private:
  AdamOptions options_;
  std::uint64_t step_{0};
  islr::model::ParameterStore m_;
  islr::model::ParameterStore v_;
};

}  // namespace islr::training
