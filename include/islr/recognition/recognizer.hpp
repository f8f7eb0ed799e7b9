#pragma once

#include <islr/core/error.hpp>
#include <islr/core/keypoint_frame.hpp>
#include <islr/core/prediction.hpp>
#include <islr/core/vocabulary.hpp>
#include <islr/features/sequence_padder.hpp>
#include <islr/model/inference_backend.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace islr::recognition {

/// Confidence a top prediction must exceed (strictly) to be emitted as text.
inline constexpr float kDefaultAcceptanceThreshold = 0.5f;
inline constexpr std::size_t kDefaultTopK = 3;

struct RecognizerOptions {
  islr::features::WindowOptions window{};
  float acceptance_threshold{kDefaultAcceptanceThreshold};
};

/// Backend bound to the vocabulary it was trained against.
/// All operations are const and safe to call concurrently.
class Recognizer {
 public:
  /// VocabularyMismatch unless backend->num_classes() == vocabulary.size();
  /// InvalidConfig for a null backend or zero window length.
  [[nodiscard]] static std::expected<Recognizer, islr::core::RecognitionError> bind(
      std::shared_ptr<const islr::model::IInferenceBackend> backend,
      islr::core::Vocabulary vocabulary,
      RecognizerOptions options = {});

  /// Up to min(top_k, V) predictions sorted by descending confidence, ties by
  /// vocabulary order. Errors from window construction (ShapeError,
  /// EmptySequence, InvalidFrameOrder) and the backend are propagated.
  [[nodiscard]] std::expected<std::vector<islr::core::Prediction>,
                              islr::core::RecognitionError>
  recognize(const islr::core::KeypointSequence& sequence, std::size_t top_k) const;

  /// Top label if its confidence exceeds the acceptance threshold, else "".
  [[nodiscard]] std::expected<std::string, islr::core::RecognitionError>
  recognize_and_emit_text(const islr::core::KeypointSequence& sequence) const;

  /// Classifies each window independently and joins accepted labels with a
  /// single space. Stops at the first failing window.
  [[nodiscard]] std::expected<std::string, islr::core::RecognitionError>
  recognize_stream(std::span<const islr::core::KeypointSequence> windows) const;

  /// Ranked predictions, gated text and frame count in one call.
  [[nodiscard]] std::expected<islr::core::RecognitionResult, islr::core::RecognitionError>
  recognize_with_text(const islr::core::KeypointSequence& sequence,
                      std::size_t top_k = kDefaultTopK) const;

  /// Full probability distribution over the vocabulary. InferenceFailed if the
  /// backend yields scores that do not produce finite probabilities.
  [[nodiscard]] std::expected<std::vector<float>, islr::core::RecognitionError>
  probabilities(const islr::core::KeypointSequence& sequence) const;

  [[nodiscard]] const islr::core::Vocabulary& vocabulary() const noexcept {
    return vocabulary_;
  }
  [[nodiscard]] const RecognizerOptions& options() const noexcept { return options_; }
  [[nodiscard]] const islr::model::IInferenceBackend& backend() const noexcept {
    return *backend_;
  }

 private:
  Recognizer(std::shared_ptr<const islr::model::IInferenceBackend> backend,
             islr::core::Vocabulary vocabulary,
             RecognizerOptions options);

  [[nodiscard]] std::string gate(const std::vector<islr::core::Prediction>& ranked) const;

  std::shared_ptr<const islr::model::IInferenceBackend> backend_;
  islr::core::Vocabulary vocabulary_;
  RecognizerOptions options_;
};

/// Indices of the top_k largest probabilities, descending, ties by lower index.
/// NaN entries rank last.
[[nodiscard]] std::vector<std::size_t> top_k_indices(const std::vector<float>& probs,
                                                     std::size_t top_k);

}  // namespace islr::recognition
