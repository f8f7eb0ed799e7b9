#include <islr/model/recognition_model.hpp>
#include "tensor_ops.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace islr::model {

namespace ic = islr::core;

namespace {

cv::Mat uniform(int rows, int cols, double bound, cv::RNG& rng) {
  cv::Mat m(rows, cols, CV_32F);
  rng.fill(m, cv::RNG::UNIFORM, -bound, bound);
  return m;
}

std::string lstm_name(const char* kind, std::size_t layer, bool reverse) {
  std::string name = "lstm.";
  name += kind;
  name += "_l" + std::to_string(layer);
  if (reverse) name += "_reverse";
  return name;
}

}  // namespace

bool is_valid(const ModelConfig& config) noexcept {
  return config.input_dim > 0 && config.hidden_dim > 0 && config.num_layers > 0 &&
         config.num_classes > 0 && config.dropout >= 0.f && config.dropout < 1.f;
}

struct RecognitionModel::ForwardCache {
  std::vector<LstmCache> forward;
  std::vector<LstmCache> backward;
  std::vector<cv::Mat> layer_masks;  // dropout on layer outputs, empty if unused
  AttentionCache attention;
  cv::Mat context;     // 1 x 2H
  cv::Mat pre_relu;    // 1 x H
  cv::Mat head_mask;   // 1 x H or empty
  cv::Mat head_out;    // 1 x H after ReLU and dropout
};

RecognitionModel::RecognitionModel(const ModelConfig& config) : config_(config) {
  register_parameters();
}

std::expected<RecognitionModel, ic::RecognitionError> RecognitionModel::create(
    const ModelConfig& config) {
  if (!is_valid(config)) {
    return std::unexpected(ic::RecognitionError::InvalidConfig);
  }
  RecognitionModel model(config);
  cv::RNG rng(config.seed);
  model.initialize(rng);
  return model;
}

void RecognitionModel::register_parameters() {
  const int h = static_cast<int>(config_.hidden_dim);
  const int in = static_cast<int>(config_.input_dim);
  const int classes = static_cast<int>(config_.num_classes);

  auto add_direction = [&](std::size_t layer, int layer_in, bool reverse) {
    DirectionIndex idx{};
    idx.w_ih = params_.add(lstm_name("weight_ih", layer, reverse), cv::Mat::zeros(4 * h, layer_in, CV_32F));
    idx.w_hh = params_.add(lstm_name("weight_hh", layer, reverse), cv::Mat::zeros(4 * h, h, CV_32F));
    idx.b_ih = params_.add(lstm_name("bias_ih", layer, reverse), cv::Mat::zeros(1, 4 * h, CV_32F));
    idx.b_hh = params_.add(lstm_name("bias_hh", layer, reverse), cv::Mat::zeros(1, 4 * h, CV_32F));
    return idx;
  };

  for (std::size_t k = 0; k < config_.num_layers; ++k) {
    const int layer_in = k == 0 ? in : 2 * h;
    LayerIndex layer{};
    layer.forward = add_direction(k, layer_in, false);
    layer.backward = add_direction(k, layer_in, true);
    layers_.push_back(layer);
  }

  attention_w1_ = params_.add("attention.0.weight", cv::Mat::zeros(h, 2 * h, CV_32F));
  attention_b1_ = params_.add("attention.0.bias", cv::Mat::zeros(1, h, CV_32F));
  attention_w2_ = params_.add("attention.2.weight", cv::Mat::zeros(1, h, CV_32F));
  attention_b2_ = params_.add("attention.2.bias", cv::Mat::zeros(1, 1, CV_32F));
  classifier_w1_ = params_.add("classifier.0.weight", cv::Mat::zeros(h, 2 * h, CV_32F));
  classifier_b1_ = params_.add("classifier.0.bias", cv::Mat::zeros(1, h, CV_32F));
  classifier_w2_ = params_.add("classifier.3.weight", cv::Mat::zeros(classes, h, CV_32F));
  classifier_b2_ = params_.add("classifier.3.bias", cv::Mat::zeros(1, classes, CV_32F));
}

void RecognitionModel::initialize(cv::RNG& rng) {
  const double lstm_bound = 1.0 / std::sqrt(static_cast<double>(config_.hidden_dim));
  const double head_bound = 1.0 / std::sqrt(2.0 * static_cast<double>(config_.hidden_dim));
  const double out_bound = 1.0 / std::sqrt(static_cast<double>(config_.hidden_dim));

  for (const auto& layer : layers_) {
    for (const DirectionIndex* d : {&layer.forward, &layer.backward}) {
      for (std::size_t i : {d->w_ih, d->w_hh, d->b_ih, d->b_hh}) {
        cv::Mat& m = params_.at(i);
        m = uniform(m.rows, m.cols, lstm_bound, rng);
      }
    }
  }
  for (std::size_t i : {attention_w1_, attention_b1_, classifier_w1_, classifier_b1_}) {
    cv::Mat& m = params_.at(i);
    m = uniform(m.rows, m.cols, head_bound, rng);
  }
  for (std::size_t i : {attention_w2_, attention_b2_, classifier_w2_, classifier_b2_}) {
    cv::Mat& m = params_.at(i);
    m = uniform(m.rows, m.cols, out_bound, rng);
  }
}

LstmWeights RecognitionModel::lstm_view(const ParameterStore& store,
                                        const DirectionIndex& idx) {
  return {store.at(idx.w_ih), store.at(idx.w_hh), store.at(idx.b_ih), store.at(idx.b_hh)};
}

AttentionWeights RecognitionModel::attention_view(const ParameterStore& store) const {
  return {store.at(attention_w1_), store.at(attention_b1_), store.at(attention_w2_),
          store.at(attention_b2_)};
}

cv::Mat RecognitionModel::run(const cv::Mat& window, ForwardCache* cache, cv::RNG* rng) const {
  const bool use_dropout = rng != nullptr && config_.dropout > 0.f;
  if (cache) {
    cache->forward.resize(layers_.size());
    cache->backward.resize(layers_.size());
    cache->layer_masks.assign(layers_.size(), cv::Mat());
  }

  cv::Mat x = window;
  for (std::size_t k = 0; k < layers_.size(); ++k) {
    const cv::Mat fwd = lstm_forward(x, lstm_view(params_, layers_[k].forward), false,
                                     cache ? &cache->forward[k] : nullptr);
    const cv::Mat bwd = lstm_forward(x, lstm_view(params_, layers_[k].backward), true,
                                     cache ? &cache->backward[k] : nullptr);
    cv::Mat out;
    cv::hconcat(fwd, bwd, out);
    if (use_dropout && k + 1 < layers_.size()) {
      cv::Mat mask = detail::dropout_mask(out.rows, out.cols, config_.dropout, *rng);
      out = out.mul(mask);
      if (cache) cache->layer_masks[k] = mask;
    }
    x = out;
  }

  const cv::Mat context = attention_forward(x, attention_view(params_),
                                            cache ? &cache->attention : nullptr);

  cv::Mat pre_relu = detail::affine(context, params_.at(classifier_w1_), params_.at(classifier_b1_));
  cv::Mat head_out = cv::max(pre_relu, 0.0);
  cv::Mat head_mask;
  if (use_dropout) {
    head_mask = detail::dropout_mask(1, head_out.cols, config_.dropout, *rng);
    head_out = head_out.mul(head_mask);
  }
  cv::Mat logits = detail::affine(head_out, params_.at(classifier_w2_), params_.at(classifier_b2_));

  if (cache) {
    cache->context = context;
    cache->pre_relu = pre_relu;
    cache->head_mask = head_mask;
    cache->head_out = head_out;
  }
  return logits;
}

std::expected<cv::Mat, ic::RecognitionError> RecognitionModel::forward(
    const cv::Mat& window) const {
  if (window.empty() || window.type() != CV_32F ||
      window.cols != static_cast<int>(config_.input_dim)) {
    return std::unexpected(ic::RecognitionError::ShapeError);
  }
  return run(window, nullptr, nullptr);
}

std::expected<TrainStep, ic::RecognitionError> RecognitionModel::forward_backward(
    const cv::Mat& window,
    std::size_t label,
    ParameterStore& grads,
    cv::RNG* dropout_rng) const {
  if (window.empty() || window.type() != CV_32F ||
      window.cols != static_cast<int>(config_.input_dim)) {
    return std::unexpected(ic::RecognitionError::ShapeError);
  }
  if (label >= config_.num_classes) {
    return std::unexpected(ic::RecognitionError::DatasetError);
  }
  if (grads.size() != params_.size()) {
    return std::unexpected(ic::RecognitionError::InvalidConfig);
  }

  ForwardCache cache;
  const cv::Mat logits = run(window, &cache, dropout_rng);

  TrainStep step;
  step.loss = cross_entropy(logits, label);
  step.logits = logits;

  // d loss / d logits = softmax - one_hot(label)
  const std::vector<float> probs =
      softmax(logits.ptr<float>(0), static_cast<std::size_t>(logits.cols));
  cv::Mat d_logits(1, logits.cols, CV_32F);
  for (int c = 0; c < logits.cols; ++c) {
    d_logits.at<float>(0, c) = probs[static_cast<std::size_t>(c)] -
                               (static_cast<std::size_t>(c) == label ? 1.f : 0.f);
  }

  detail::gemm_into(grads.at(classifier_w2_), d_logits, cache.head_out, cv::GEMM_1_T);
  detail::add_into(grads.at(classifier_b2_), d_logits);

  cv::Mat d_head;
  cv::gemm(d_logits, params_.at(classifier_w2_), 1.0, cv::noArray(), 0.0, d_head);
  if (!cache.head_mask.empty()) {
    d_head = d_head.mul(cache.head_mask);
  }
  for (int j = 0; j < d_head.cols; ++j) {
    if (cache.pre_relu.at<float>(0, j) <= 0.f) d_head.at<float>(0, j) = 0.f;
  }
  detail::gemm_into(grads.at(classifier_w1_), d_head, cache.context, cv::GEMM_1_T);
  detail::add_into(grads.at(classifier_b1_), d_head);

  cv::Mat d_context;
  cv::gemm(d_head, params_.at(classifier_w1_), 1.0, cv::noArray(), 0.0, d_context);

  AttentionGradients attention_grads = attention_view(grads);
  cv::Mat d_x = attention_backward(cache.attention, attention_view(params_), d_context,
                                   attention_grads);

  const int h = static_cast<int>(config_.hidden_dim);
  for (std::size_t k = layers_.size(); k-- > 0;) {
    if (!cache.layer_masks[k].empty()) {
      d_x = d_x.mul(cache.layer_masks[k]);
    }
    const cv::Mat d_fwd = d_x.colRange(0, h).clone();
    const cv::Mat d_bwd = d_x.colRange(h, 2 * h).clone();

    LstmGradients fwd_grads = lstm_view(grads, layers_[k].forward);
    LstmGradients bwd_grads = lstm_view(grads, layers_[k].backward);
    cv::Mat d_in = lstm_backward(cache.forward[k], lstm_view(params_, layers_[k].forward),
                                 d_fwd, fwd_grads);
    detail::add_into(d_in, lstm_backward(cache.backward[k],
                                         lstm_view(params_, layers_[k].backward), d_bwd,
                                         bwd_grads));
    d_x = d_in;
  }
  return step;
}

std::expected<void, ic::RecognitionError> RecognitionModel::load_parameters(
    const ParameterStore& source) {
  const std::size_t out_idx = source.find(params_.name(classifier_w2_));
  if (out_idx == source.size()) {
    return std::unexpected(ic::RecognitionError::CheckpointLoadFailed);
  }
  if (source.at(out_idx).rows != static_cast<int>(config_.num_classes)) {
    return std::unexpected(ic::RecognitionError::VocabularyMismatch);
  }

  std::vector<std::size_t> mapping(params_.size());
  for (std::size_t i = 0; i < params_.size(); ++i) {
    const std::size_t j = source.find(params_.name(i));
    if (j == source.size()) {
      return std::unexpected(ic::RecognitionError::CheckpointLoadFailed);
    }
    const cv::Mat& src = source.at(j);
    const cv::Mat& dst = params_.at(i);
    // PyTorch stores biases as 1-D; accept n x 1 as well as 1 x n.
    const bool same_shape = src.size() == dst.size() ||
                            (dst.rows == 1 && src.cols == 1 && src.rows == dst.cols);
    if (!same_shape || src.total() != dst.total()) {
      return std::unexpected(ic::RecognitionError::CheckpointLoadFailed);
    }
    mapping[i] = j;
  }
  for (std::size_t i = 0; i < params_.size(); ++i) {
    cv::Mat converted;
    source.at(mapping[i]).convertTo(converted, CV_32F);
    converted.reshape(1, params_.at(i).rows).copyTo(params_.at(i));
  }
  return {};
}

float cross_entropy(const cv::Mat& logits, std::size_t label) {
  const float* z = logits.ptr<float>(0);
  const int n = logits.cols;
  double max_z = -std::numeric_limits<double>::infinity();
  for (int c = 0; c < n; ++c) max_z = std::max(max_z, static_cast<double>(z[c]));
  double sum = 0.0;
  for (int c = 0; c < n; ++c) sum += std::exp(static_cast<double>(z[c]) - max_z);
  const double log_sum = max_z + std::log(sum);
  return static_cast<float>(log_sum - static_cast<double>(z[label]));
}

std::vector<float> softmax(const float* logits, std::size_t n) {
  std::vector<float> out(n);
  if (n == 0) return out;
  double max_z = -std::numeric_limits<double>::infinity();
  for (std::size_t c = 0; c < n; ++c) max_z = std::max(max_z, static_cast<double>(logits[c]));
  std::vector<double> e(n);
  double sum = 0.0;
  for (std::size_t c = 0; c < n; ++c) {
    e[c] = std::exp(static_cast<double>(logits[c]) - max_z);
    sum += e[c];
  }
  for (std::size_t c = 0; c < n; ++c) out[c] = static_cast<float>(e[c] / sum);
  return out;
}

}  // namespace islr::model
