#include <islr/recognition/recognizer_service.hpp>
#include <islr/core/logger.hpp>
#include <islr/model/checkpoint.hpp>
#include <islr/model/native_inference_backend.hpp>
#include <islr/model/onnx_inference_backend.hpp>
#include <islr/model/recognition_model.hpp>
#include <onnxruntime_cxx_api.h>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace islr::recognition {

namespace ic = islr::core;
namespace im = islr::model;

namespace {

bool file_exists(const std::string& path) {
  std::error_code ec;
  return !path.empty() && std::filesystem::exists(path, ec);
}

const char* backend_name(BackendType type) {
  return type == BackendType::Onnx ? "onnx" : "native";
}

}  // namespace

RecognizerService::RecognizerService(ServiceOptions options) : options_(std::move(options)) {}

std::expected<RecognizerService::Loaded, ic::RecognitionError> RecognizerService::load() const {
  const bool onnx = options_.backend_type == BackendType::Onnx;

  std::vector<VocabularyStrategy> chain = options_.vocabulary_chain;
  if (chain.empty()) {
    VocabularyPaths paths = options_.vocabulary;
    if (onnx) {
      paths.checkpoint_path.clear();
      if (paths.model_vocab_path.empty() && !options_.model_path.empty()) {
        paths.model_vocab_path =
            (std::filesystem::path(options_.model_path).parent_path() / "vocabulary.json").string();
      }
    } else {
      paths.checkpoint_path = options_.model_path;
    }
    chain = default_vocabulary_chain(paths);
  }
  auto resolved = resolve_vocabulary(chain);
  if (!resolved) {
    return std::unexpected(resolved.error());
  }
  const std::size_t vocab_size = resolved->vocabulary.size();

  // Returns an error under strict_load, otherwise logs the random-weight fallback.
  auto on_load_failure = [&](const std::string& reason) -> std::expected<void, ic::RecognitionError> {
    if (options_.strict_load) {
      ic::Logger::error(reason, " (strict_load is set)");
      return std::unexpected(ic::RecognitionError::CheckpointLoadFailed);
    }
    ic::Logger::warn(reason, ". Using randomly initialized weights.");
    ic::Logger::warn("Predictions are not meaningful until a trained model is provided.");
    return {};
  };

  std::shared_ptr<const im::IInferenceBackend> backend;
  BackendType active = BackendType::Native;
  bool pretrained = false;

  if (onnx) {
    if (!file_exists(options_.model_path)) {
      if (auto r = on_load_failure("No ONNX model found at '" + options_.model_path + "'"); !r) {
        return std::unexpected(r.error());
      }
    } else {
      try {
        auto onnx_backend = std::make_shared<im::OnnxInferenceBackend>(options_.model_path);
        if (onnx_backend->num_classes() != vocab_size) {
          ic::Logger::error("ONNX model has ", onnx_backend->num_classes(),
                            " outputs but the vocabulary has ", vocab_size, " signs");
          return std::unexpected(ic::RecognitionError::VocabularyMismatch);
        }
        if (options_.warmup) onnx_backend->warmup();
        backend = std::move(onnx_backend);
        active = BackendType::Onnx;
        pretrained = true;
      } catch (const Ort::Exception& e) {
        if (auto r = on_load_failure(std::string("Could not load ONNX model: ") + e.what()); !r) {
          return std::unexpected(r.error());
        }
      } catch (const std::runtime_error& e) {
        if (auto r = on_load_failure(std::string("Unsupported ONNX model: ") + e.what()); !r) {
          return std::unexpected(r.error());
        }
      }
    }
  }

  if (!backend) {
    im::ModelConfig config = options_.model;
    config.input_dim = ic::kFeatureDim;
    config.num_classes = vocab_size;

    std::optional<im::Checkpoint> checkpoint;
    if (!onnx) {
      if (!file_exists(options_.model_path)) {
        if (auto r = on_load_failure("No pre-trained model found at '" + options_.model_path + "'");
            !r) {
          return std::unexpected(r.error());
        }
      } else {
        auto loaded = im::load_checkpoint(options_.model_path);
        if (loaded) {
          checkpoint = std::move(*loaded);
        } else if (loaded.error() == ic::RecognitionError::VocabularyMismatch) {
          ic::Logger::error("Checkpoint ", options_.model_path,
                            " vocabulary does not match its output layer");
          return std::unexpected(loaded.error());
        } else if (auto r = on_load_failure("Could not load model weights from '" +
                                            options_.model_path + "'");
                   !r) {
          return std::unexpected(r.error());
        }
      }
    }

    if (checkpoint && checkpoint->config.input_dim != ic::kFeatureDim) {
      if (auto r = on_load_failure("Checkpoint expects " +
                                   std::to_string(checkpoint->config.input_dim) +
                                   " features per frame, keypoint windows have " +
                                   std::to_string(ic::kFeatureDim));
          !r) {
        return std::unexpected(r.error());
      }
      checkpoint.reset();
    }
    if (checkpoint) {
      if (checkpoint->config.num_classes != vocab_size) {
        ic::Logger::error("Checkpoint has ", checkpoint->config.num_classes,
                          " output classes but the vocabulary has ", vocab_size, " signs");
        return std::unexpected(ic::RecognitionError::VocabularyMismatch);
      }
      config.hidden_dim = checkpoint->config.hidden_dim;
      config.num_layers = checkpoint->config.num_layers;
      config.dropout = checkpoint->config.dropout;
    }

    auto model = im::RecognitionModel::create(config);
    if (!model) {
      ic::Logger::error("Invalid model configuration");
      return std::unexpected(model.error());
    }
    if (checkpoint) {
      auto applied = model->load_parameters(checkpoint->parameters);
      if (applied) {
        pretrained = true;
        ic::Logger::info("Loaded model weights from ", options_.model_path, " (epoch ",
                         checkpoint->metrics.epoch, ", val acc ",
                         checkpoint->metrics.val_accuracy, ")");
      } else if (applied.error() == ic::RecognitionError::VocabularyMismatch) {
        return std::unexpected(applied.error());
      } else if (auto r = on_load_failure("Checkpoint parameters do not fit the model"); !r) {
        return std::unexpected(r.error());
      }
    }
    auto native = std::make_shared<im::NativeInferenceBackend>(std::move(*model));
    if (options_.warmup) native->warmup();
    backend = std::move(native);
  }

  LoadReport report;
  report.vocabulary_source = resolved->source;
  report.vocabulary_size = vocab_size;
  report.backend_type = active;
  report.pretrained = pretrained;

  auto bound = Recognizer::bind(std::move(backend), std::move(resolved->vocabulary),
                                options_.recognizer);
  if (!bound) {
    return std::unexpected(bound.error());
  }
  ic::Logger::info("Recognizer ready: ", backend_name(active), " backend, ",
                   vocab_size, " signs, ", pretrained ? "pretrained" : "random", " weights");
  return Loaded{std::make_unique<Recognizer>(std::move(*bound)), std::move(report)};
}

std::expected<const Recognizer*, ic::RecognitionError> RecognizerService::initialize() {
  if (const Recognizer* r = ready_.load(std::memory_order_acquire)) {
    return r;
  }
  std::lock_guard lock(init_mutex_);
  if (const Recognizer* r = ready_.load(std::memory_order_acquire)) {
    return r;
  }
  auto loaded = load();
  if (!loaded) {
    ic::Logger::error("Recognizer initialization failed: ", ic::to_string(loaded.error()));
    return std::unexpected(loaded.error());
  }
  recognizer_ = std::move(loaded->recognizer);
  report_ = std::move(loaded->report);
  ready_.store(recognizer_.get(), std::memory_order_release);
  return recognizer_.get();
}

bool RecognizerService::is_initialized() const noexcept {
  return ready_.load(std::memory_order_acquire) != nullptr;
}

std::expected<const Recognizer*, ic::RecognitionError> RecognizerService::recognizer() const {
  if (const Recognizer* r = ready_.load(std::memory_order_acquire)) {
    return r;
  }
  return std::unexpected(ic::RecognitionError::ModelNotLoaded);
}

const LoadReport* RecognizerService::load_report() const noexcept {
  return is_initialized() ? &report_ : nullptr;
}

std::expected<std::vector<ic::Prediction>, ic::RecognitionError> RecognizerService::recognize(
    const ic::KeypointSequence& sequence,
    std::size_t top_k) const {
  auto r = recognizer();
  if (!r) return std::unexpected(r.error());
  return (*r)->recognize(sequence, top_k);
}

std::expected<std::string, ic::RecognitionError> RecognizerService::recognize_and_emit_text(
    const ic::KeypointSequence& sequence) const {
  auto r = recognizer();
  if (!r) return std::unexpected(r.error());
  return (*r)->recognize_and_emit_text(sequence);
}

std::expected<std::string, ic::RecognitionError> RecognizerService::recognize_stream(
    std::span<const ic::KeypointSequence> windows) const {
  auto r = recognizer();
  if (!r) return std::unexpected(r.error());
  return (*r)->recognize_stream(windows);
}

std::expected<ic::RecognitionResult, ic::RecognitionError> RecognizerService::recognize_with_text(
    const ic::KeypointSequence& sequence,
    std::size_t top_k) const {
  auto r = recognizer();
  if (!r) return std::unexpected(r.error());
  return (*r)->recognize_with_text(sequence, top_k);
}

}  // namespace islr::recognition
