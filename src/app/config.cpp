#include <islr/app/config.hpp>
#include <islr/core/logger.hpp>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <string>
#include <system_error>

namespace islr::app {

namespace ic = islr::core;

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

template <typename T>
bool parse_number(std::string_view text, T& out) {
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

bool parse_bool(std::string_view text, bool& out) {
  if (text == "true" || text == "1" || text == "yes" || text == "on") {
    out = true;
    return true;
  }
  if (text == "false" || text == "0" || text == "no" || text == "off") {
    out = false;
    return true;
  }
  return false;
}

}  // namespace

AppConfig default_config() {
  AppConfig c;
  c.backend_type = recognition::BackendType::Native;
  c.model_path = "trained_models/best_model.yml.gz";
  if (const char* env = std::getenv("ISLR_MODEL_PATH"); env != nullptr && *env != '\0') {
    c.model_path = env;
  }
  c.dataset_vocab_path = "datasets/processed/vocabulary.json";
  c.default_vocab_size = ic::kMaxDefaultVocabularySize;
  c.acceptance_threshold = recognition::kDefaultAcceptanceThreshold;
  c.top_k = recognition::kDefaultTopK;
  return c;
}

std::expected<void, ic::RecognitionError> apply_setting(AppConfig& c,
                                                        std::string_view key,
                                                        std::string_view value) {
  bool ok = true;
  auto& t = c.training;

  if (key == "backend_type") {
    if (value == "native") c.backend_type = recognition::BackendType::Native;
    else if (value == "onnx") c.backend_type = recognition::BackendType::Onnx;
    else ok = false;
  }
  else if (key == "model_path") c.model_path.assign(value);
  else if (key == "model_vocab_path") c.model_vocab_path.assign(value);
  else if (key == "dataset_vocab_path") c.dataset_vocab_path.assign(value);
  else if (key == "default_vocab_size") ok = parse_number(value, c.default_vocab_size);
  else if (key == "window_length") ok = parse_number(value, c.window_length) && c.window_length > 0;
  else if (key == "center_coordinates") ok = parse_bool(value, c.center_coordinates);
  else if (key == "acceptance_threshold") ok = parse_number(value, c.acceptance_threshold);
  else if (key == "top_k") ok = parse_number(value, c.top_k);
  else if (key == "hidden_dim") ok = parse_number(value, c.hidden_dim);
  else if (key == "num_layers") ok = parse_number(value, c.num_layers);
  else if (key == "dropout") ok = parse_number(value, c.dropout);
  else if (key == "seed") ok = parse_number(value, c.seed);
  else if (key == "strict_load") ok = parse_bool(value, c.strict_load);
  else if (key == "warmup") ok = parse_bool(value, c.warmup);
  else if (key == "num_workers") ok = parse_number(value, c.num_workers);
  else if (key == "log_level") c.log_level.assign(value);
  else if (key == "train_dir") t.train_dir.assign(value);
  else if (key == "val_dir") t.val_dir.assign(value);
  else if (key == "output_dir") t.output_dir.assign(value);
  else if (key == "resume_from") t.resume_from.assign(value);
  else if (key == "epochs") ok = parse_number(value, t.epochs);
  else if (key == "batch_size") ok = parse_number(value, t.batch_size) && t.batch_size > 0;
  else if (key == "learning_rate") ok = parse_number(value, t.learning_rate) && t.learning_rate > 0.0;
  else if (key == "min_learning_rate") ok = parse_number(value, t.min_learning_rate);
  else if (key == "patience") ok = parse_number(value, t.patience);
  else if (key == "lr_factor") ok = parse_number(value, t.factor) && t.factor > 0.0 && t.factor < 1.0;
  else if (key == "snapshot_every") ok = parse_number(value, t.snapshot_every);
  else if (key == "parallel") ok = parse_bool(value, t.parallel);
  else {
    ic::Logger::error("Unknown config key '", key, "'");
    return std::unexpected(ic::RecognitionError::InvalidConfig);
  }

  if (!ok) {
    ic::Logger::error("Invalid value '", value, "' for config key '", key, "'");
    return std::unexpected(ic::RecognitionError::InvalidConfig);
  }
  return {};
}

std::expected<AppConfig, ic::RecognitionError> load_config(const std::string& path) {
  AppConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    ic::Logger::warn("Config file ", path, " not found; using defaults");
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) {
      ic::Logger::error("Malformed config line '", line, "' in ", path);
      return std::unexpected(ic::RecognitionError::InvalidConfig);
    }
    if (auto r = apply_setting(c, key, value); !r) return std::unexpected(r.error());
  }
  return c;
}

islr::model::ModelConfig to_model_config(const AppConfig& config) {
  islr::model::ModelConfig m;
  m.hidden_dim = config.hidden_dim;
  m.num_layers = config.num_layers;
  m.dropout = config.dropout;
  m.seed = config.seed;
  return m;
}

recognition::ServiceOptions to_service_options(const AppConfig& config) {
  recognition::ServiceOptions o;
  o.backend_type = config.backend_type;
  o.model_path = config.model_path;
  o.vocabulary.model_vocab_path = config.model_vocab_path;
  o.vocabulary.dataset_vocab_path = config.dataset_vocab_path;
  o.vocabulary.default_size = config.default_vocab_size;
  o.model = to_model_config(config);
  o.recognizer.window.length = config.window_length;
  o.recognizer.window.center_coordinates = config.center_coordinates;
  o.recognizer.acceptance_threshold = config.acceptance_threshold;
  o.strict_load = config.strict_load;
  o.warmup = config.warmup;
  return o;
}

training::TrainerOptions to_trainer_options(const AppConfig& config) {
  const TrainingConfig& t = config.training;
  training::TrainerOptions o;
  o.output_dir = t.output_dir;
  o.epochs = t.epochs;
  o.batch_size = t.batch_size;
  o.adam.learning_rate = t.learning_rate;
  o.plateau.patience = t.patience;
  o.plateau.factor = t.factor;
  o.min_learning_rate = t.min_learning_rate;
  o.snapshot_every = t.snapshot_every;
  o.seed = config.seed;
  o.parallel = t.parallel;
  return o;
}

}  // namespace islr::app
