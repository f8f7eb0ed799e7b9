/**
 * islr-train: Train the sign recognition model on a processed keypoint dataset, or verify one.
 * Run: ./build/islr_train --data datasets/processed [--output trained_models] [--epochs 50]
 *      ./build/islr_train --verify datasets/processed
 */

#include <islr/app/config.hpp>
#include <islr/core/error.hpp>
#include <islr/core/logger.hpp>
#include <islr/training/dataset.hpp>
#include <islr/training/trainer.hpp>

#include <algorithm>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

void print_split(const char* name, const islr::training::SplitReport& split) {
  std::cout << name << ": " << split.files << " files, " << split.valid << " valid\n";
  for (const auto& [label, count] : split.label_counts) {
    std::cout << "  " << label << ": " << count << "\n";
  }
  const std::size_t shown = std::min<std::size_t>(split.errors.size(), 5);
  for (std::size_t i = 0; i < shown; ++i) {
    std::cout << "  error: " << split.errors[i] << "\n";
  }
  if (split.errors.size() > shown) {
    std::cout << "  ... and " << split.errors.size() - shown << " more errors\n";
  }
}

int verify(const std::string& root) {
  const auto report = islr::training::verify_dataset(root);
  for (const auto& e : report.errors) std::cout << "error: " << e << "\n";
  if (!report.structure_ok) return 1;
  std::cout << "vocabulary: " << report.vocabulary_size << " signs\n";
  print_split("train", report.train);
  print_split("val", report.val);
  std::cout << (report.ok() ? "dataset OK\n" : "dataset has problems\n");
  return report.ok() ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string verify_root;
  std::string data_root;
  std::vector<std::pair<std::string, std::string>> overrides;
  std::vector<std::string> settings;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto next = [&]() -> std::string { return argv[++i]; };
    if (arg == "--config" && i + 1 < argc) {
      config_path = next();
    } else if (arg == "--verify" && i + 1 < argc) {
      verify_root = next();
    } else if (arg == "--data" && i + 1 < argc) {
      data_root = next();
    } else if (arg == "--train" && i + 1 < argc) {
      overrides.emplace_back("train_dir", next());
    } else if (arg == "--val" && i + 1 < argc) {
      overrides.emplace_back("val_dir", next());
    } else if (arg == "--output" && i + 1 < argc) {
      overrides.emplace_back("output_dir", next());
    } else if (arg == "--epochs" && i + 1 < argc) {
      overrides.emplace_back("epochs", next());
    } else if (arg == "--batch-size" && i + 1 < argc) {
      overrides.emplace_back("batch_size", next());
    } else if (arg == "--lr" && i + 1 < argc) {
      overrides.emplace_back("learning_rate", next());
    } else if (arg == "--resume" && i + 1 < argc) {
      overrides.emplace_back("resume_from", next());
    } else if (arg == "--log-level" && i + 1 < argc) {
      overrides.emplace_back("log_level", next());
    } else if (arg == "--set" && i + 1 < argc) {
      settings.push_back(next());
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: islr_train [options]\n"
                << "  --verify <root>     Check <root>/train, <root>/val and <root>/vocabulary.json\n"
                << "  --data <root>       Train on <root>/train, validate on <root>/val\n"
                << "  --train <dir>       Training samples directory\n"
                << "  --val <dir>         Validation samples directory\n"
                << "  --output <dir>      Checkpoint directory (default trained_models)\n"
                << "  --epochs <n>        Epoch budget (default 50)\n"
                << "  --batch-size <n>    Mini-batch size (default 32)\n"
                << "  --lr <rate>         Initial learning rate (default 0.001)\n"
                << "  --resume <file>     Continue from a checkpoint\n"
                << "  --config <path>     Config (key=value file)\n"
                << "  --set key=value     Override any config key\n"
                << "  --log-level <lvl>   debug | info | warn | error | off\n";
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  if (!verify_root.empty()) return verify(verify_root);

  auto loaded = config_path.empty()
                    ? std::expected<islr::app::AppConfig, islr::core::RecognitionError>(
                          islr::app::default_config())
                    : islr::app::load_config(config_path);
  if (!loaded) {
    std::cerr << "Config error: " << islr::core::to_string(loaded.error()) << "\n";
    return 1;
  }
  islr::app::AppConfig cfg = std::move(*loaded);

  if (!data_root.empty()) {
    cfg.training.train_dir = (std::filesystem::path(data_root) / "train").string();
    cfg.training.val_dir = (std::filesystem::path(data_root) / "val").string();
  }
  for (const auto& s : settings) {
    const auto pos = s.find('=');
    if (pos == std::string::npos) {
      std::cerr << "Invalid --set " << s << "\n";
      return 1;
    }
    overrides.emplace_back(s.substr(0, pos), s.substr(pos + 1));
  }
  for (const auto& [key, value] : overrides) {
    if (!islr::app::apply_setting(cfg, key, value)) {
      std::cerr << "Invalid value for " << key << ": " << value << "\n";
      return 1;
    }
  }
  islr::core::Logger::set_level(islr::core::parse_log_level(cfg.log_level));

  if (cfg.training.train_dir.empty() || cfg.training.val_dir.empty()) {
    std::cerr << "Training needs --data <root> or both --train and --val\n";
    return 1;
  }

  islr::features::WindowOptions window;
  window.length = cfg.window_length;
  window.center_coordinates = cfg.center_coordinates;

  auto report = islr::training::train_from_directories(
      cfg.training.train_dir, cfg.training.val_dir, islr::app::to_model_config(cfg),
      islr::app::to_trainer_options(cfg), window, cfg.training.resume_from);
  if (!report) {
    std::cerr << "Training failed: " << islr::core::to_string(report.error()) << "\n";
    return 1;
  }

  std::cout << "Training complete (" << islr::training::to_string(report->final_state) << ")\n"
            << "Epochs run: " << report->epochs_run << "\n"
            << "Best validation accuracy: " << report->best_val_accuracy * 100.0 << "% (epoch "
            << report->best_epoch << ")\n"
            << "Best validation loss: " << report->best_val_loss << "\n"
            << "Model saved to: "
            << (std::filesystem::path(cfg.training.output_dir) / islr::training::kBestModelFile)
                   .string()
            << "\n";
  return 0;
}
