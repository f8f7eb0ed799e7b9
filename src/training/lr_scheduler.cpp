#include <islr/training/lr_scheduler.hpp>
#include <islr/core/logger.hpp>
#include <algorithm>
#include <limits>

namespace islr::training {

ReduceLROnPlateau::ReduceLROnPlateau(PlateauOptions options)
    : options_(options), best_(std::numeric_limits<double>::infinity()) {}

double ReduceLROnPlateau::step(double metric, double learning_rate) {
  if (metric < best_ * (1.0 - options_.threshold)) {
    best_ = metric;
    num_bad_epochs_ = 0;
  } else {
    ++num_bad_epochs_;
  }

  if (num_bad_epochs_ > options_.patience) {
    num_bad_epochs_ = 0;
    const double reduced = std::max(learning_rate * options_.factor, options_.min_lr);
    if (learning_rate - reduced > options_.eps) {
      islr::core::Logger::info("Reducing learning rate to ", reduced);
      return reduced;
    }
  }
  return learning_rate;
}

islr::model::SchedulerState ReduceLROnPlateau::state() const noexcept {
  return {best_, num_bad_epochs_};
}

void ReduceLROnPlateau::restore(const islr::model::SchedulerState& state) noexcept {
  best_ = state.best;
  num_bad_epochs_ = state.num_bad_epochs;
}

}  // namespace islr::training
