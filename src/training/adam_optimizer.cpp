#include <islr/training/adam_optimizer.hpp>
#include <opencv2/core.hpp>
#include <cmath>

namespace islr::training {

namespace ic = islr::core;
namespace im = islr::model;

namespace {

bool same_layout(const im::ParameterStore& a, const im::ParameterStore& b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (a.name(i) != b.name(i) || a.at(i).size() != b.at(i).size()) return false;
  }
  return true;
}

}  // namespace

AdamOptimizer::AdamOptimizer(const im::ParameterStore& parameters, AdamOptions options)
    : options_(options), m_(parameters.zeros_like()), v_(parameters.zeros_like()) {}

std::expected<void, ic::RecognitionError> AdamOptimizer::step(im::ParameterStore& parameters,
                                                              const im::ParameterStore& gradients) {
  if (!same_layout(parameters, m_) || !same_layout(gradients, m_)) {
    return std::unexpected(ic::RecognitionError::InvalidConfig);
  }
  ++step_;
  const double t = static_cast<double>(step_);
  const double bias1 = 1.0 - std::pow(options_.beta1, t);
  const double bias2 = 1.0 - std::pow(options_.beta2, t);
  const double step_size = options_.learning_rate / bias1;
  const double inv_sqrt_bias2 = 1.0 / std::sqrt(bias2);

  cv::Mat g2;
  cv::Mat denom;
  cv::Mat update;
  for (std::size_t i = 0; i < parameters.size(); ++i) {
    const cv::Mat& g = gradients.at(i);
    cv::Mat& m = m_.at(i);
    cv::Mat& v = v_.at(i);
    cv::addWeighted(m, options_.beta1, g, 1.0 - options_.beta1, 0.0, m);
    cv::multiply(g, g, g2);
    cv::addWeighted(v, options_.beta2, g2, 1.0 - options_.beta2, 0.0, v);
    cv::sqrt(v, denom);
    denom.convertTo(denom, -1, inv_sqrt_bias2, options_.epsilon);
    cv::divide(m, denom, update);
    cv::scaleAdd(update, -step_size, parameters.at(i), parameters.at(i));
  }
  return {};
}

im::OptimizerState AdamOptimizer::export_state() const {
  im::OptimizerState state;
  state.step = step_;
  state.learning_rate = options_.learning_rate;
  state.first_moment = m_.clone();
  state.second_moment = v_.clone();
  return state;
}

std::expected<void, ic::RecognitionError> AdamOptimizer::import_state(
    const im::OptimizerState& state) {
  if (!same_layout(state.first_moment, m_) || !same_layout(state.second_moment, v_)) {
    return std::unexpected(ic::RecognitionError::CheckpointLoadFailed);
  }
  step_ = state.step;
  options_.learning_rate = state.learning_rate;
  m_ = state.first_moment.clone();
  v_ = state.second_moment.clone();
  return {};
}

}  // namespace islr::training
