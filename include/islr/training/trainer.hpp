#pragma once

#include <islr/core/error.hpp>
#include <islr/core/vocabulary.hpp>
#include <islr/features/sequence_padder.hpp>
#include <islr/model/checkpoint.hpp>
#include <islr/model/model_config.hpp>
#include <islr/model/recognition_model.hpp>
#include <islr/training/adam_optimizer.hpp>
#include <islr/training/dataset.hpp>
#include <islr/training/lr_scheduler.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace islr::training {

enum class TrainerState {
  Initializing,
  TrainPhase,
  ValidatePhase,
  Converged,
  ExhaustedEpochs,
};

[[nodiscard]] std::string_view to_string(TrainerState state) noexcept;

inline constexpr const char* kBestModelFile = "best_model.yml.gz";

struct TrainerOptions {
  /// Checkpoints are written here. Empty disables checkpoint files.
  std::string output_dir{"trained_models"};
  std::size_t epochs{50};
  std::size_t batch_size{32};
  AdamOptions adam{};
  PlateauOptions plateau{};
  /// Converged once the plateau policy brings the rate down to this value.
  /// 0 disables the check.
  double min_learning_rate{0.0};
  /// Snapshot period in epochs; 0 disables snapshots.
  std::size_t snapshot_every{10};
  /// Shuffling and dropout masks.
  std::uint64_t seed{42};
  /// Accumulate per-sample gradients of a batch in parallel (oneTBB builds).
  bool parallel{true};
};

struct EpochMetrics {
  std::size_t epoch{0};  // 1-based
  double train_loss{0.0};
  double train_accuracy{0.0};  // fraction
  double val_loss{0.0};
  double val_accuracy{0.0};  // fraction
  double learning_rate{0.0};  // after the scheduler step
  bool saved_best{false};
  bool saved_snapshot{false};
};

struct TrainingReport {
  TrainerState final_state{TrainerState::Initializing};
  std::size_t epochs_run{0};
  std::size_t best_epoch{0};  // 0 if no epoch improved on the starting best
  double best_val_accuracy{0.0};
  double best_val_loss{0.0};
  std::vector<EpochMetrics> history;
};

using EpochCallback = std::function<void(const EpochMetrics&)>;

/// Best model is replaced only on strictly higher validation accuracy.
[[nodiscard]] bool should_save_best(double val_accuracy, double best_val_accuracy) noexcept;

/// True every `every` epochs (1-based epoch numbers); never when every == 0.
[[nodiscard]] bool should_snapshot(std::size_t epoch, std::size_t every) noexcept;

/// "checkpoint_epoch_<N>.yml.gz".
[[nodiscard]] std::string snapshot_file_name(std::size_t epoch);

/// Mini-batch training loop: Adam on mean cross-entropy, plateau scheduling on
/// validation loss, best / periodic checkpoints.
class Trainer {
 public:
  Trainer(islr::model::RecognitionModel model,
          islr::core::Vocabulary vocabulary,
          TrainerOptions options = {});

  /// Continues from a checkpoint of the same architecture and vocabulary:
  /// weights, optimizer, scheduler and epoch counter.
  /// VocabularyMismatch if the vocabulary differs.
  [[nodiscard]] std::expected<void, islr::core::RecognitionError> resume(
      const islr::model::Checkpoint& checkpoint);

  /// Runs until the epoch budget is spent or the rate reaches
  /// min_learning_rate. DatasetError if either split is empty.
  [[nodiscard]] std::expected<TrainingReport, islr::core::RecognitionError> fit(
      const Dataset& train,
      const Dataset& val,
      const EpochCallback& on_epoch = {});

  [[nodiscard]] TrainerState state() const noexcept { return state_; }
  [[nodiscard]] const islr::model::RecognitionModel& model() const noexcept { return model_; }
  [[nodiscard]] const islr::core::Vocabulary& vocabulary() const noexcept { return vocabulary_; }
  [[nodiscard]] double learning_rate() const noexcept { return optimizer_.learning_rate(); }

  /// Mean batch loss and accuracy without dropout or updates.
  struct PassResult {
    double loss{0.0};
    double accuracy{0.0};
  };
  [[nodiscard]] std::expected<PassResult, islr::core::RecognitionError> evaluate(
      const Dataset& data) const;

 private:
  [[nodiscard]] std::expected<PassResult, islr::core::RecognitionError> train_epoch(
      const Dataset& data,
      std::size_t epoch);

  [[nodiscard]] std::expected<void, islr::core::RecognitionError> save(
      const std::string& file,
      const EpochMetrics& metrics) const;

  islr::model::RecognitionModel model_;
  islr::core::Vocabulary vocabulary_;
  TrainerOptions options_;
  AdamOptimizer optimizer_;
  ReduceLROnPlateau scheduler_;
  TrainerState state_{TrainerState::Initializing};
  std::size_t start_epoch_{0};
  double best_accuracy_{0.0};
};

/// Loads train_dir and val_dir, builds the vocabulary from the training
/// labels, writes it to <output_dir>/vocabulary.json, creates a model sized to
/// it and trains. When resume_from is non-empty, training continues from that
/// checkpoint.
[[nodiscard]] std::expected<TrainingReport, islr::core::RecognitionError> train_from_directories(
    const std::string& train_dir,
    const std::string& val_dir,
    islr::model::ModelConfig model_config,
    const TrainerOptions& options,
    const islr::features::WindowOptions& window = {},
    const std::string& resume_from = {},
    const EpochCallback& on_epoch = {});

}  // namespace islr::training
