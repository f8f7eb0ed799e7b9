#include <islr/recognition/recognizer.hpp>
#include <islr/core/logger.hpp>
#include <islr/model/recognition_model.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace islr::recognition {

namespace ic = islr::core;

std::vector<std::size_t> top_k_indices(const std::vector<float>& probs, std::size_t top_k) {
  const std::size_t k = std::min(top_k, probs.size());
  // NaN ranks below every number.
  const auto rank = [](float p) {
    return std::isnan(p) ? -std::numeric_limits<float>::infinity() : p;
  };
  std::vector<std::size_t> order(probs.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(k), order.end(),
                    [&](std::size_t a, std::size_t b) {
                      if (rank(probs[a]) != rank(probs[b])) return rank(probs[a]) > rank(probs[b]);
                      return a < b;
                    });
  order.resize(k);
  return order;
}

Recognizer::Recognizer(std::shared_ptr<const islr::model::IInferenceBackend> backend,
                       ic::Vocabulary vocabulary,
                       RecognizerOptions options)
    : backend_(std::move(backend)),
      vocabulary_(std::move(vocabulary)),
      options_(options) {}

std::expected<Recognizer, ic::RecognitionError> Recognizer::bind(
    std::shared_ptr<const islr::model::IInferenceBackend> backend,
    ic::Vocabulary vocabulary,
    RecognizerOptions options) {
  if (!backend || options.window.length == 0) {
    return std::unexpected(ic::RecognitionError::InvalidConfig);
  }
  if (backend->num_classes() != vocabulary.size()) {
    return std::unexpected(ic::RecognitionError::VocabularyMismatch);
  }
  return Recognizer(std::move(backend), std::move(vocabulary), options);
}

std::expected<std::vector<float>, ic::RecognitionError> Recognizer::probabilities(
    const ic::KeypointSequence& sequence) const {
  auto window = islr::features::build_window(sequence, options_.window);
  if (!window) {
    return std::unexpected(window.error());
  }
  if (auto valid = backend_->validate_input(*window); !valid) {
    return std::unexpected(valid.error());
  }
  auto logits = backend_->infer(*window);
  if (!logits) {
    return std::unexpected(logits.error());
  }
  if (logits->size() != vocabulary_.size()) {
    return std::unexpected(ic::RecognitionError::VocabularyMismatch);
  }
  auto probs = islr::model::softmax(logits->data(), logits->size());
  if (!std::all_of(probs.begin(), probs.end(), [](float p) { return std::isfinite(p); })) {
    ic::Logger::error("Model produced non-finite class scores");
    return std::unexpected(ic::RecognitionError::InferenceFailed);
  }
  return probs;
}

std::expected<std::vector<ic::Prediction>, ic::RecognitionError> Recognizer::recognize(
    const ic::KeypointSequence& sequence,
    std::size_t top_k) const {
  auto probs = probabilities(sequence);
  if (!probs) {
    return std::unexpected(probs.error());
  }
  std::vector<ic::Prediction> out;
  for (std::size_t idx : top_k_indices(*probs, top_k)) {
    out.push_back({vocabulary_.label(idx), (*probs)[idx], idx});
  }
  return out;
}

std::string Recognizer::gate(const std::vector<ic::Prediction>& ranked) const {
  if (ranked.empty() || !(ranked.front().confidence > options_.acceptance_threshold)) {
    return {};
  }
  return ranked.front().label;
}

std::expected<std::string, ic::RecognitionError> Recognizer::recognize_and_emit_text(
    const ic::KeypointSequence& sequence) const {
  auto top = recognize(sequence, 1);
  if (!top) {
    return std::unexpected(top.error());
  }
  return gate(*top);
}

std::expected<std::string, ic::RecognitionError> Recognizer::recognize_stream(
    std::span<const ic::KeypointSequence> windows) const {
  std::string text;
  for (const auto& window : windows) {
    auto token = recognize_and_emit_text(window);
    if (!token) {
      return std::unexpected(token.error());
    }
    if (token->empty()) continue;
    if (!text.empty()) text += ' ';
    text += *token;
  }
  return text;
}

std::expected<ic::RecognitionResult, ic::RecognitionError> Recognizer::recognize_with_text(
    const ic::KeypointSequence& sequence,
    std::size_t top_k) const {
  auto ranked = recognize(sequence, std::max<std::size_t>(top_k, 1));
  if (!ranked) {
    return std::unexpected(ranked.error());
  }
  ic::RecognitionResult result;
  result.text = gate(*ranked);
  ranked->resize(std::min(ranked->size(), top_k));
  result.predictions = std::move(*ranked);
  result.num_frames = sequence.size();
  return result;
}

}  // namespace islr::recognition
