#pragma once

#include <islr/model/checkpoint.hpp>
#include <cstddef>

namespace islr::training {

struct PlateauOptions {
  double factor{0.5};
  std::size_t patience{5};
  double threshold{1e-4};  // relative
  double min_lr{0.0};
  double eps{1e-8};  // smaller reductions are ignored
};

/// Reduce-on-plateau in "min" mode with a relative threshold: a metric is an
/// improvement when it is below best * (1 - threshold). After more than
/// `patience` consecutive non-improving epochs the learning rate is multiplied
/// by `factor` (never below min_lr) and the counter restarts.
class ReduceLROnPlateau {
 public:
  explicit ReduceLROnPlateau(PlateauOptions options = {});

  /// Feeds one epoch's metric; returns the learning rate to use next.
  [[nodiscard]] double step(double metric, double learning_rate);

  [[nodiscard]] double best() const noexcept { return best_; }
  [[nodiscard]] std::size_t num_bad_epochs() const noexcept { return num_bad_epochs_; }
  [[nodiscard]] const PlateauOptions& options() const noexcept { return options_; }

  [[nodiscard]] islr::model::SchedulerState state() const noexcept;
  void restore(const islr::model::SchedulerState& state) noexcept;

 private:
  PlateauOptions options_;
  double best_;
  std::size_t num_bad_epochs_{0};
};

}  // namespace islr::training
