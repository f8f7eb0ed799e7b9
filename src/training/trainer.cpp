#include <islr/training/trainer.hpp>
#include <islr/core/logger.hpp>
#include <opencv2/core.hpp>
#include <algorithm>
#include <filesystem>
#include <numeric>
#include <optional>
#include <random>
#include <system_error>
#include <utility>

#ifdef ISLR_HAS_TBB
#include <tbb/blocked_range.h>
#include <tbb/combinable.h>
#include <tbb/parallel_for.h>
#endif

namespace islr::training {

namespace ic = islr::core;
namespace im = islr::model;

namespace {

std::uint64_t mix(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

/// Dropout stream of one sample in one epoch, independent of thread scheduling.
std::uint64_t sample_seed(std::uint64_t seed, std::size_t epoch, std::size_t index) {
  return mix(mix(mix(seed) ^ epoch) ^ index);
}

std::size_t argmax(const cv::Mat& logits) {
  cv::Point max_loc;
  cv::minMaxLoc(logits, nullptr, nullptr, nullptr, &max_loc);
  return static_cast<std::size_t>(max_loc.x);
}

PlateauOptions with_floor(PlateauOptions plateau, double min_learning_rate) {
  plateau.min_lr = std::max(plateau.min_lr, min_learning_rate);
  return plateau;
}

struct BatchStats {
  double loss_sum{0.0};
  std::size_t correct{0};
};

}  // namespace

std::string_view to_string(TrainerState state) noexcept {
  switch (state) {
    case TrainerState::Initializing:
      return "Initializing";
    case TrainerState::TrainPhase:
      return "TrainPhase";
    case TrainerState::ValidatePhase:
      return "ValidatePhase";
    case TrainerState::Converged:
      return "Converged";
    case TrainerState::ExhaustedEpochs:
      return "ExhaustedEpochs";
  }
  return "Unknown";
}

bool should_save_best(double val_accuracy, double best_val_accuracy) noexcept {
  return val_accuracy > best_val_accuracy;
}

bool should_snapshot(std::size_t epoch, std::size_t every) noexcept {
  return every > 0 && epoch > 0 && epoch % every == 0;
}

std::string snapshot_file_name(std::size_t epoch) {
  return "checkpoint_epoch_" + std::to_string(epoch) + ".yml.gz";
}

Trainer::Trainer(im::RecognitionModel model, ic::Vocabulary vocabulary, TrainerOptions options)
    : model_(std::move(model)),
      vocabulary_(std::move(vocabulary)),
      options_(std::move(options)),
      optimizer_(model_.parameters(), options_.adam),
      scheduler_(with_floor(options_.plateau, options_.min_learning_rate)) {}

std::expected<void, ic::RecognitionError> Trainer::resume(const im::Checkpoint& checkpoint) {
  if (checkpoint.vocabulary != vocabulary_.labels()) {
    ic::Logger::error("Cannot resume: checkpoint vocabulary differs from the training vocabulary");
    return std::unexpected(ic::RecognitionError::VocabularyMismatch);
  }
  if (auto r = model_.load_parameters(checkpoint.parameters); !r) {
    return std::unexpected(r.error());
  }
  if (checkpoint.optimizer) {
    if (auto r = optimizer_.import_state(*checkpoint.optimizer); !r) {
      return std::unexpected(r.error());
    }
  }
  if (checkpoint.scheduler) scheduler_.restore(*checkpoint.scheduler);
  start_epoch_ = checkpoint.metrics.epoch;
  best_accuracy_ =
      std::max(checkpoint.metrics.best_val_accuracy, checkpoint.metrics.val_accuracy);
  ic::Logger::info("Resuming after epoch ", start_epoch_, " (lr ", optimizer_.learning_rate(), ")");
  return {};
}

std::expected<Trainer::PassResult, ic::RecognitionError> Trainer::train_epoch(const Dataset& data,
                                                                             std::size_t epoch) {
  const std::size_t n = data.size();
  const std::size_t batch = std::max<std::size_t>(options_.batch_size, 1);
  std::vector<std::size_t> order(n);
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::mt19937_64 shuffle_rng(sample_seed(options_.seed, epoch, n));
  std::shuffle(order.begin(), order.end(), shuffle_rng);

  const bool use_dropout = model_.config().dropout > 0.f;
  auto sample_step = [&](std::size_t index, im::ParameterStore& grads,
                         BatchStats& stats) -> std::expected<void, ic::RecognitionError> {
    cv::RNG rng(sample_seed(options_.seed, epoch, index));
    auto step = model_.forward_backward(data.windows[index], data.labels[index], grads,
                                        use_dropout ? &rng : nullptr);
    if (!step) return std::unexpected(step.error());
    stats.loss_sum += step->loss;
    if (argmax(step->logits) == data.labels[index]) ++stats.correct;
    return {};
  };

  im::ParameterStore grads = model_.parameters().zeros_like();
  double loss_total = 0.0;
  std::size_t correct_total = 0;
  std::size_t num_batches = 0;

  for (std::size_t start = 0; start < n; start += batch) {
    const std::size_t end = std::min(start + batch, n);
    const std::size_t count = end - start;
    grads.set_zero();
    BatchStats stats;

    bool done = false;
#ifdef ISLR_HAS_TBB
    if (options_.parallel && count > 1) {
      struct Local {
        im::ParameterStore grads;
        BatchStats stats;
        ic::RecognitionError error{ic::RecognitionError::None};
      };
      tbb::combinable<Local> locals(
          [this] { return Local{model_.parameters().zeros_like(), {}, ic::RecognitionError::None}; });
      tbb::parallel_for(tbb::blocked_range<std::size_t>(start, end),
                        [&](const tbb::blocked_range<std::size_t>& range) {
                          Local& local = locals.local();
                          for (std::size_t i = range.begin(); i != range.end(); ++i) {
                            if (local.error != ic::RecognitionError::None) return;
                            if (auto r = sample_step(order[i], local.grads, local.stats); !r) {
                              local.error = r.error();
                            }
                          }
                        });
      std::optional<ic::RecognitionError> error;
      locals.combine_each([&](const Local& local) {
        if (local.error != ic::RecognitionError::None && !error) error = local.error;
        grads.accumulate(local.grads);
        stats.loss_sum += local.stats.loss_sum;
        stats.correct += local.stats.correct;
      });
      if (error) return std::unexpected(*error);
      done = true;
    }
#endif
    if (!done) {
      for (std::size_t i = start; i < end; ++i) {
        if (auto r = sample_step(order[i], grads, stats); !r) {
          return std::unexpected(r.error());
        }
      }
    }

    const double inv = 1.0 / static_cast<double>(count);
    for (std::size_t p = 0; p < grads.size(); ++p) {
      grads.at(p) *= inv;
    }
    if (auto r = optimizer_.step(model_.parameters(), grads); !r) {
      return std::unexpected(r.error());
    }

    loss_total += stats.loss_sum * inv;
    correct_total += stats.correct;
    ++num_batches;
    if (num_batches % 10 == 0) {
      ic::Logger::debug("Epoch ", epoch, " batch ", num_batches, " loss ", stats.loss_sum * inv);
    }
  }
  return PassResult{loss_total / static_cast<double>(num_batches),
                    static_cast<double>(correct_total) / static_cast<double>(n)};
}

std::expected<Trainer::PassResult, ic::RecognitionError> Trainer::evaluate(
    const Dataset& data) const {
  if (data.empty()) return std::unexpected(ic::RecognitionError::DatasetError);
  const std::size_t n = data.size();
  const std::size_t batch = std::max<std::size_t>(options_.batch_size, 1);
  double loss_total = 0.0;
  std::size_t correct = 0;
  std::size_t num_batches = 0;
  for (std::size_t start = 0; start < n; start += batch) {
    const std::size_t end = std::min(start + batch, n);
    double batch_loss = 0.0;
    for (std::size_t i = start; i < end; ++i) {
      auto logits = model_.forward(data.windows[i]);
      if (!logits) return std::unexpected(logits.error());
      batch_loss += im::cross_entropy(*logits, data.labels[i]);
      if (argmax(*logits) == data.labels[i]) ++correct;
    }
    loss_total += batch_loss / static_cast<double>(end - start);
    ++num_batches;
  }
  return PassResult{loss_total / static_cast<double>(num_batches),
                    static_cast<double>(correct) / static_cast<double>(n)};
}

std::expected<void, ic::RecognitionError> Trainer::save(const std::string& file,
                                                        const EpochMetrics& metrics) const {
  im::Checkpoint checkpoint;
  checkpoint.config = model_.config();
  checkpoint.vocabulary = vocabulary_.labels();
  checkpoint.parameters = model_.parameters();
  checkpoint.metrics = {metrics.epoch, metrics.val_loss, metrics.val_accuracy, best_accuracy_};
  checkpoint.optimizer = optimizer_.export_state();
  checkpoint.scheduler = scheduler_.state();
  const std::string path = (std::filesystem::path(options_.output_dir) / file).string();
  auto saved = im::save_checkpoint(checkpoint, path);
  if (!saved) {
    ic::Logger::error("Failed to write checkpoint ", path);
  }
  return saved;
}

std::expected<TrainingReport, ic::RecognitionError> Trainer::fit(const Dataset& train,
                                                                 const Dataset& val,
                                                                 const EpochCallback& on_epoch) {
  state_ = TrainerState::Initializing;
  if (train.empty() || val.empty()) {
    ic::Logger::error("Training needs non-empty training and validation sets (", train.size(),
                      " / ", val.size(), " samples)");
    return std::unexpected(ic::RecognitionError::DatasetError);
  }
  if (model_.config().num_classes != vocabulary_.size()) {
    return std::unexpected(ic::RecognitionError::VocabularyMismatch);
  }

  ic::Logger::info("Training on ", train.size(), " samples, validating on ", val.size(), ", ",
                   vocabulary_.size(), " signs");

  TrainingReport report;
  report.best_val_accuracy = best_accuracy_;
  for (std::size_t epoch = start_epoch_ + 1; epoch <= options_.epochs; ++epoch) {
    state_ = TrainerState::TrainPhase;
    auto trained = train_epoch(train, epoch);
    if (!trained) return std::unexpected(trained.error());

    state_ = TrainerState::ValidatePhase;
    auto validated = evaluate(val);
    if (!validated) return std::unexpected(validated.error());

    const double lr = scheduler_.step(validated->loss, optimizer_.learning_rate());
    optimizer_.set_learning_rate(lr);

    EpochMetrics m;
    m.epoch = epoch;
    m.train_loss = trained->loss;
    m.train_accuracy = trained->accuracy;
    m.val_loss = validated->loss;
    m.val_accuracy = validated->accuracy;
    m.learning_rate = lr;

    ic::Logger::info("Epoch [", epoch, "/", options_.epochs, "] train loss ", m.train_loss,
                     " acc ", m.train_accuracy * 100.0, "% | val loss ", m.val_loss, " acc ",
                     m.val_accuracy * 100.0, "%");

    if (should_save_best(m.val_accuracy, report.best_val_accuracy)) {
      report.best_val_accuracy = m.val_accuracy;
      best_accuracy_ = m.val_accuracy;
      report.best_val_loss = m.val_loss;
      report.best_epoch = epoch;
      if (!options_.output_dir.empty()) {
        if (auto r = save(kBestModelFile, m); !r) return std::unexpected(r.error());
        m.saved_best = true;
        ic::Logger::info("Saved best model (val acc ", m.val_accuracy * 100.0, "%)");
      }
    }
    if (should_snapshot(epoch, options_.snapshot_every) && !options_.output_dir.empty()) {
      if (auto r = save(snapshot_file_name(epoch), m); !r) return std::unexpected(r.error());
      m.saved_snapshot = true;
    }

    report.history.push_back(m);
    ++report.epochs_run;
    if (on_epoch) on_epoch(m);

    if (options_.min_learning_rate > 0.0 && lr <= options_.min_learning_rate) {
      state_ = TrainerState::Converged;
      ic::Logger::info("Learning rate reached ", lr, "; stopping");
      break;
    }
  }
  if (state_ != TrainerState::Converged) state_ = TrainerState::ExhaustedEpochs;
  report.final_state = state_;
  ic::Logger::info("Training finished (", to_string(state_), "), best val acc ",
                   report.best_val_accuracy * 100.0, "% at epoch ", report.best_epoch);
  return report;
}

std::expected<TrainingReport, ic::RecognitionError> train_from_directories(
    const std::string& train_dir,
    const std::string& val_dir,
    im::ModelConfig model_config,
    const TrainerOptions& options,
    const islr::features::WindowOptions& window,
    const std::string& resume_from,
    const EpochCallback& on_epoch) {
  auto train_samples = load_samples(train_dir, window);
  if (!train_samples) return std::unexpected(train_samples.error());
  auto val_samples = load_samples(val_dir, window);
  if (!val_samples) return std::unexpected(val_samples.error());
  if (train_samples->empty()) {
    ic::Logger::error("No usable training samples in ", train_dir);
    return std::unexpected(ic::RecognitionError::DatasetError);
  }

  auto vocabulary = build_training_vocabulary(*train_samples);
  if (!vocabulary) return std::unexpected(vocabulary.error());
  ic::Logger::info("Vocabulary: ", vocabulary->size(), " signs");

  if (!options.output_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(options.output_dir, ec);
    if (ec) {
      ic::Logger::error("Cannot create output directory ", options.output_dir, ": ", ec.message());
      return std::unexpected(ic::RecognitionError::DatasetError);
    }
    const auto vocab_path = (std::filesystem::path(options.output_dir) / "vocabulary.json").string();
    if (auto r = ic::save_vocabulary_file(*vocabulary, vocab_path); !r) {
      return std::unexpected(r.error());
    }
  }

  const Dataset train = make_dataset(*train_samples, *vocabulary);
  const Dataset val = make_dataset(*val_samples, *vocabulary);

  model_config.num_classes = vocabulary->size();
  auto model = im::RecognitionModel::create(model_config);
  if (!model) return std::unexpected(model.error());

  Trainer trainer(std::move(*model), std::move(*vocabulary), options);
  if (!resume_from.empty()) {
    auto checkpoint = im::load_checkpoint(resume_from);
    if (!checkpoint) return std::unexpected(checkpoint.error());
    if (auto r = trainer.resume(*checkpoint); !r) return std::unexpected(r.error());
  }
  return trainer.fit(train, val, on_epoch);
}

}  // namespace islr::training
