#pragma once

#include <islr/core/error.hpp>
#include <islr/model/model_config.hpp>
#include <islr/recognition/recognizer_service.hpp>
#include <islr/training/trainer.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace islr::app {

/// Training section (keys prefixed with "train_").
struct TrainingConfig {
  std::string train_dir;
  std::string val_dir;
  std::string output_dir{"trained_models"};
  std::string resume_from;
  std::size_t epochs{50};
  std::size_t batch_size{32};
  double learning_rate{1e-3};
  double min_learning_rate{0.0};
  std::size_t patience{5};
  double factor{0.5};
  std::size_t snapshot_every{10};
  bool parallel{true};
};

/// Application configuration: model location, vocabulary fallbacks, windowing,
/// gating and architecture.
struct AppConfig {
  recognition::BackendType backend_type{recognition::BackendType::Native};
  std::string model_path;
  std::string model_vocab_path;
  std::string dataset_vocab_path;
  std::size_t default_vocab_size{100};
  std::size_t window_length{islr::core::kDefaultWindowLength};
  bool center_coordinates{false};
  float acceptance_threshold{0.5f};
  std::size_t top_k{3};
  std::size_t hidden_dim{256};
  std::size_t num_layers{2};
  float dropout{0.3f};
  std::uint64_t seed{42};
  bool strict_load{false};
  bool warmup{false};
  std::size_t num_workers{0};  // 0 = hardware concurrency
  std::string log_level{"info"};
  TrainingConfig training{};
};

/// Default config when no file is provided. ISLR_MODEL_PATH overrides model_path.
AppConfig default_config();

/// Applies one key=value setting. InvalidConfig for an unknown key or a value
/// that does not parse.
[[nodiscard]] std::expected<void, islr::core::RecognitionError> apply_setting(
    AppConfig& config,
    std::string_view key,
    std::string_view value);

/// Load config from a simple key=value file (one per line, '#' comments) on top
/// of default_config(). A missing file yields the defaults; a bad line is
/// InvalidConfig.
[[nodiscard]] std::expected<AppConfig, islr::core::RecognitionError> load_config(
    const std::string& path);

[[nodiscard]] recognition::ServiceOptions to_service_options(const AppConfig& config);
[[nodiscard]] islr::model::ModelConfig to_model_config(const AppConfig& config);
[[nodiscard]] training::TrainerOptions to_trainer_options(const AppConfig& config);

}  // namespace islr::app
