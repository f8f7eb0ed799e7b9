#pragma once

#include <islr/core/error.hpp>
#include <islr/model/attention_pooling.hpp>
#include <islr/model/lstm.hpp>
#include <islr/model/model_config.hpp>
#include <islr/model/parameter_store.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <expected>
#include <vector>

namespace islr::model {

/// Loss and raw scores of one training sample.
struct TrainStep {
  float loss{0.f};
  cv::Mat logits;  // 1 x num_classes
};

/// Bidirectional LSTM encoder, attention pooling and a two-layer classifier
/// head, mapping a window (L x input_dim, CV_32F) to num_classes logits.
///
/// Parameter names follow the PyTorch state-dict keys of the reference model
/// ("lstm.weight_ih_l0", "lstm.weight_ih_l0_reverse", "attention.0.weight",
/// "classifier.3.bias", ...) so exported weights map one to one.
///
/// Thread-safety: forward() and forward_backward() are const and may run
/// concurrently; parameters() / load_parameters() must not overlap with them.
class RecognitionModel {
 public:
  /// Randomly initialized model (seeded by config.seed). InvalidConfig if
  /// is_valid(config) is false.
  [[nodiscard]] static std::expected<RecognitionModel, islr::core::RecognitionError>
  create(const ModelConfig& config);

  /// Inference pass without dropout. ShapeError if window is not
  /// N x input_dim CV_32F with N > 0.
  [[nodiscard]] std::expected<cv::Mat, islr::core::RecognitionError> forward(
      const cv::Mat& window) const;

  /// Training pass: cross-entropy of the logits against label, gradients added
  /// into grads (layout of parameters().zeros_like()). Dropout is applied only
  /// when dropout_rng is non-null.
  [[nodiscard]] std::expected<TrainStep, islr::core::RecognitionError> forward_backward(
      const cv::Mat& window,
      std::size_t label,
      ParameterStore& grads,
      cv::RNG* dropout_rng = nullptr) const;

  /// Copies values from source by name. VocabularyMismatch if the output layer
  /// width differs; CheckpointLoadFailed for any other missing or mis-shaped
  /// tensor. On failure the model is left unchanged.
  [[nodiscard]] std::expected<void, islr::core::RecognitionError> load_parameters(
      const ParameterStore& source);

  RecognitionModel(const RecognitionModel&) = delete;
  RecognitionModel& operator=(const RecognitionModel&) = delete;
  RecognitionModel(RecognitionModel&&) noexcept = default;
  RecognitionModel& operator=(RecognitionModel&&) noexcept = default;

  [[nodiscard]] const ModelConfig& config() const noexcept { return config_; }
  [[nodiscard]] ParameterStore& parameters() noexcept { return params_; }
  [[nodiscard]] const ParameterStore& parameters() const noexcept { return params_; }

 private:
  struct DirectionIndex {
    std::size_t w_ih;
    std::size_t w_hh;
    std::size_t b_ih;
    std::size_t b_hh;
  };
  struct LayerIndex {
    DirectionIndex forward;
    DirectionIndex backward;
  };
  struct ForwardCache;

  explicit RecognitionModel(const ModelConfig& config);

  void register_parameters();
  void initialize(cv::RNG& rng);

  [[nodiscard]] static LstmWeights lstm_view(const ParameterStore& store,
                                             const DirectionIndex& idx);
  [[nodiscard]] AttentionWeights attention_view(const ParameterStore& store) const;

  cv::Mat run(const cv::Mat& window, ForwardCache* cache, cv::RNG* rng) const;

  ModelConfig config_;
  ParameterStore params_;
  std::vector<LayerIndex> layers_;
  std::size_t attention_w1_{0};
  std::size_t attention_b1_{0};
  std::size_t attention_w2_{0};
  std::size_t attention_b2_{0};
  std::size_t classifier_w1_{0};
  std::size_t classifier_b1_{0};
  std::size_t classifier_w2_{0};
  std::size_t classifier_b2_{0};
};

/// Numerically stable log-softmax cross-entropy of one logit row.
[[nodiscard]] float cross_entropy(const cv::Mat& logits, std::size_t label);

/// Softmax of one logit row, computed in double precision.
[[nodiscard]] std::vector<float> softmax(const float* logits, std::size_t n);

}  // namespace islr::model
