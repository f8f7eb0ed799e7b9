#pragma once

#include <islr/core/error.hpp>
#include <islr/model/model_config.hpp>
#include <islr/model/parameter_store.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace islr::model {

/// Scalar metrics recorded with a checkpoint.
struct TrainingMetrics {
  std::size_t epoch{0};
  double val_loss{0.0};
  double val_accuracy{0.0};  // fraction in [0, 1]
  double best_val_accuracy{0.0};  // best val_accuracy of the run so far
};

/// Adam state (training only).
struct OptimizerState {
  std::uint64_t step{0};
  double learning_rate{0.0};
  ParameterStore first_moment;
  ParameterStore second_moment;
};

/// Plateau scheduler state (training only).
struct SchedulerState {
  double best{0.0};
  std::size_t num_bad_epochs{0};
};

/// Persisted training state. The vocabulary is stored with the weights; its
/// size must equal config.num_classes.
struct Checkpoint {
  ModelConfig config;
  std::vector<std::string> vocabulary;
  ParameterStore parameters;
  TrainingMetrics metrics;
  std::optional<OptimizerState> optimizer;
  std::optional<SchedulerState> scheduler;
};

/// Writes with cv::FileStorage; format follows the extension (.yml, .yaml,
/// .json, .xml, optionally followed by .gz).
/// VocabularyMismatch if vocabulary size != config.num_classes,
/// CheckpointLoadFailed if the file cannot be written.
[[nodiscard]] std::expected<void, islr::core::RecognitionError> save_checkpoint(
    const Checkpoint& checkpoint,
    const std::string& path);

/// Reads a checkpoint written by save_checkpoint. CheckpointLoadFailed for a
/// missing, unparsable or incomplete file; VocabularyMismatch if the stored
/// vocabulary size disagrees with the stored output width.
[[nodiscard]] std::expected<Checkpoint, islr::core::RecognitionError> load_checkpoint(
    const std::string& path);

/// Reads only the embedded vocabulary (no parameters are materialized beyond
/// what the parser needs).
[[nodiscard]] std::expected<std::vector<std::string>, islr::core::RecognitionError>
read_checkpoint_vocabulary(const std::string& path);

}  // namespace islr::model
