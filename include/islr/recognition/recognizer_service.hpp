#pragma once

#include <islr/core/error.hpp>
#include <islr/core/keypoint_frame.hpp>
#include <islr/core/prediction.hpp>
#include <islr/model/model_config.hpp>
#include <islr/recognition/recognizer.hpp>
#include <islr/recognition/vocabulary_resolver.hpp>
#include <atomic>
#include <cstddef>
#include <expected>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace islr::recognition {

/// Inference backend type: native (in-process model + checkpoint) or onnx (exported model).
enum class BackendType {
  Native,
  Onnx,
};

struct ServiceOptions {
  BackendType backend_type{BackendType::Native};
  /// Checkpoint file (native) or .onnx file. May be empty.
  std::string model_path;
  /// Vocabulary file paths; checkpoint_path is taken from model_path for the
  /// native backend.
  VocabularyPaths vocabulary{};
  /// Replaces the standard fallback chain when non-empty.
  std::vector<VocabularyStrategy> vocabulary_chain;
  /// Architecture used when no checkpoint is loaded. num_classes is always
  /// taken from the resolved vocabulary.
  islr::model::ModelConfig model{};
  RecognizerOptions recognizer{};
  /// Fail initialize() with CheckpointLoadFailed instead of falling back to
  /// randomly initialized weights.
  bool strict_load{false};
  bool warmup{false};
};

/// What initialize() ended up loading.
struct LoadReport {
  std::string vocabulary_source;
  std::size_t vocabulary_size{0};
  BackendType backend_type{BackendType::Native};
  bool pretrained{false};  // false when running on random weights
};

/// Service context owning the model + vocabulary lifecycle. Construct once at
/// startup and pass by reference to request handlers.
///
/// initialize() is idempotent and safe under concurrent first access: exactly
/// one load runs and every caller observes the same Recognizer. After that all
/// recognition calls are lock-free reads of immutable state.
class RecognizerService {
 public:
  explicit RecognizerService(ServiceOptions options);

  RecognizerService(const RecognizerService&) = delete;
  RecognizerService& operator=(const RecognizerService&) = delete;

  /// Loads on first call; later calls return the same instance. A failed load
  /// leaves the service uninitialized so the caller may retry.
  [[nodiscard]] std::expected<const Recognizer*, islr::core::RecognitionError> initialize();

  [[nodiscard]] bool is_initialized() const noexcept;

  /// ModelNotLoaded before a successful initialize().
  [[nodiscard]] std::expected<const Recognizer*, islr::core::RecognitionError> recognizer()
      const;

  /// Valid only after a successful initialize(); nullptr otherwise.
  [[nodiscard]] const LoadReport* load_report() const noexcept;

  [[nodiscard]] std::expected<std::vector<islr::core::Prediction>,
                              islr::core::RecognitionError>
  recognize(const islr::core::KeypointSequence& sequence,
            std::size_t top_k = kDefaultTopK) const;

  [[nodiscard]] std::expected<std::string, islr::core::RecognitionError>
  recognize_and_emit_text(const islr::core::KeypointSequence& sequence) const;

  [[nodiscard]] std::expected<std::string, islr::core::RecognitionError>
  recognize_stream(std::span<const islr::core::KeypointSequence> windows) const;

  [[nodiscard]] std::expected<islr::core::RecognitionResult, islr::core::RecognitionError>
  recognize_with_text(const islr::core::KeypointSequence& sequence,
                      std::size_t top_k = kDefaultTopK) const;

  [[nodiscard]] const ServiceOptions& options() const noexcept { return options_; }

 private:
  struct Loaded {
    std::unique_ptr<Recognizer> recognizer;
    LoadReport report;
  };

  [[nodiscard]] std::expected<Loaded, islr::core::RecognitionError> load() const;

  ServiceOptions options_;
  std::mutex init_mutex_;
  std::unique_ptr<Recognizer> recognizer_;
  LoadReport report_;
  std::atomic<const Recognizer*> ready_{nullptr};
};

}  // namespace islr::recognition
