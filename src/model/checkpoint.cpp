#include <islr/model/checkpoint.hpp>
#include <islr/core/logger.hpp>
#include <opencv2/core/persistence.hpp>
#include <filesystem>
#include <system_error>

namespace islr::model {

namespace ic = islr::core;

namespace {

constexpr const char* kFormatTag = "islr-checkpoint";
constexpr int kFormatVersion = 1;

void write_store(cv::FileStorage& fs, const std::string& key, const ParameterStore& store) {
  fs << key << "[";
  for (const auto& t : store.tensors()) {
    fs << "{" << "name" << t.name << "value" << t.value << "}";
  }
  fs << "]";
}

bool read_store(const cv::FileNode& node, ParameterStore& store) {
  if (!node.isSeq()) return false;
  for (auto it = node.begin(); it != node.end(); ++it) {
    const cv::FileNode entry = *it;
    std::string name;
    cv::Mat value;
    entry["name"] >> name;
    entry["value"] >> value;
    if (name.empty() || value.empty()) return false;
    if (value.type() != CV_32F) value.convertTo(value, CV_32F);
    store.add(std::move(name), std::move(value));
  }
  return true;
}

bool read_vocabulary(const cv::FileNode& node, std::vector<std::string>& labels) {
  if (!node.isSeq()) return false;
  for (auto it = node.begin(); it != node.end(); ++it) {
    labels.push_back(static_cast<std::string>(*it));
  }
  return !labels.empty();
}

bool is_checkpoint(const cv::FileStorage& fs) {
  return static_cast<std::string>(fs["format"]) == kFormatTag &&
         static_cast<int>(fs["version"]) == kFormatVersion;
}

}  // namespace

std::expected<void, ic::RecognitionError> save_checkpoint(const Checkpoint& checkpoint,
                                                          const std::string& path) {
  if (checkpoint.vocabulary.size() != checkpoint.config.num_classes) {
    return std::unexpected(ic::RecognitionError::VocabularyMismatch);
  }
  try {
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    cv::FileStorage fs(path, cv::FileStorage::WRITE);
    if (!fs.isOpened()) {
      ic::Logger::error("Cannot open checkpoint for writing: ", path);
      return std::unexpected(ic::RecognitionError::CheckpointLoadFailed);
    }
    const ModelConfig& c = checkpoint.config;
    fs << "format" << kFormatTag;
    fs << "version" << kFormatVersion;
    fs << "epoch" << static_cast<int>(checkpoint.metrics.epoch);
    fs << "val_loss" << checkpoint.metrics.val_loss;
    fs << "val_accuracy" << checkpoint.metrics.val_accuracy;
    fs << "best_val_accuracy" << checkpoint.metrics.best_val_accuracy;
    fs << "model" << "{"
       << "input_dim" << static_cast<int>(c.input_dim)
       << "hidden_dim" << static_cast<int>(c.hidden_dim)
       << "num_layers" << static_cast<int>(c.num_layers)
       << "num_classes" << static_cast<int>(c.num_classes)
       << "dropout" << static_cast<double>(c.dropout)
       << "}";
    fs << "vocabulary" << "[";
    for (const auto& label : checkpoint.vocabulary) fs << label;
    fs << "]";
    write_store(fs, "parameters", checkpoint.parameters);

    if (checkpoint.optimizer) {
      const OptimizerState& o = *checkpoint.optimizer;
      fs << "optimizer" << "{"
         << "step" << static_cast<int>(o.step)
         << "learning_rate" << o.learning_rate;
      write_store(fs, "first_moment", o.first_moment);
      write_store(fs, "second_moment", o.second_moment);
      fs << "}";
    }
    if (checkpoint.scheduler) {
      fs << "scheduler" << "{"
         << "best" << checkpoint.scheduler->best
         << "num_bad_epochs" << static_cast<int>(checkpoint.scheduler->num_bad_epochs)
         << "}";
    }
    fs.release();
  } catch (const cv::Exception& e) {
    ic::Logger::error("Failed to write checkpoint ", path, ": ", e.what());
    return std::unexpected(ic::RecognitionError::CheckpointLoadFailed);
  } catch (const std::filesystem::filesystem_error& e) {
    ic::Logger::error("Failed to write checkpoint ", path, ": ", e.what());
    return std::unexpected(ic::RecognitionError::CheckpointLoadFailed);
  }
  return {};
}

std::expected<Checkpoint, ic::RecognitionError> load_checkpoint(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::unexpected(ic::RecognitionError::CheckpointLoadFailed);
  }
  Checkpoint ckpt;
  try {
    cv::FileStorage fs(path, cv::FileStorage::READ);
    if (!fs.isOpened() || !is_checkpoint(fs)) {
      return std::unexpected(ic::RecognitionError::CheckpointLoadFailed);
    }
    ckpt.metrics.epoch = static_cast<std::size_t>(static_cast<int>(fs["epoch"]));
    ckpt.metrics.val_loss = static_cast<double>(fs["val_loss"]);
    ckpt.metrics.val_accuracy = static_cast<double>(fs["val_accuracy"]);
    const cv::FileNode best = fs["best_val_accuracy"];
    ckpt.metrics.best_val_accuracy =
        best.empty() ? ckpt.metrics.val_accuracy : static_cast<double>(best);

    const cv::FileNode m = fs["model"];
    if (!m.isMap()) {
      return std::unexpected(ic::RecognitionError::CheckpointLoadFailed);
    }
    ckpt.config.input_dim = static_cast<std::size_t>(static_cast<int>(m["input_dim"]));
    ckpt.config.hidden_dim = static_cast<std::size_t>(static_cast<int>(m["hidden_dim"]));
    ckpt.config.num_layers = static_cast<std::size_t>(static_cast<int>(m["num_layers"]));
    ckpt.config.num_classes = static_cast<std::size_t>(static_cast<int>(m["num_classes"]));
    ckpt.config.dropout = static_cast<float>(static_cast<double>(m["dropout"]));

    if (!read_vocabulary(fs["vocabulary"], ckpt.vocabulary) ||
        !read_store(fs["parameters"], ckpt.parameters)) {
      return std::unexpected(ic::RecognitionError::CheckpointLoadFailed);
    }

    const cv::FileNode o = fs["optimizer"];
    if (o.isMap()) {
      OptimizerState state;
      state.step = static_cast<std::uint64_t>(static_cast<int>(o["step"]));
      state.learning_rate = static_cast<double>(o["learning_rate"]);
      if (!read_store(o["first_moment"], state.first_moment) ||
          !read_store(o["second_moment"], state.second_moment)) {
        return std::unexpected(ic::RecognitionError::CheckpointLoadFailed);
      }
      ckpt.optimizer = std::move(state);
    }
    const cv::FileNode s = fs["scheduler"];
    if (s.isMap()) {
      ckpt.scheduler = SchedulerState{static_cast<double>(s["best"]),
                                      static_cast<std::size_t>(static_cast<int>(s["num_bad_epochs"]))};
    }
  } catch (const cv::Exception& e) {
    ic::Logger::warn("Could not parse checkpoint ", path, ": ", e.what());
    return std::unexpected(ic::RecognitionError::CheckpointLoadFailed);
  }

  if (ckpt.vocabulary.size() != ckpt.config.num_classes) {
    return std::unexpected(ic::RecognitionError::VocabularyMismatch);
  }
  return ckpt;
}

std::expected<std::vector<std::string>, ic::RecognitionError> read_checkpoint_vocabulary(
    const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::unexpected(ic::RecognitionError::CheckpointLoadFailed);
  }
  std::vector<std::string> labels;
  try {
    cv::FileStorage fs(path, cv::FileStorage::READ);
    if (!fs.isOpened() || !is_checkpoint(fs) || !read_vocabulary(fs["vocabulary"], labels)) {
      return std::unexpected(ic::RecognitionError::CheckpointLoadFailed);
    }
  } catch (const cv::Exception& e) {
    ic::Logger::warn("Could not read vocabulary from checkpoint ", path, ": ", e.what());
    return std::unexpected(ic::RecognitionError::CheckpointLoadFailed);
  }
  return labels;
}

}  // namespace islr::model
