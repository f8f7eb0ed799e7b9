/**
 * islr-cli: Recognize ISL signs from keypoint JSON file(s); print ranked predictions and text.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/islr_cli [--config path] [--input request.json ...]
 * With --input: also writes results to output/<basename>.txt (same content as terminal).
 */

#include <islr/app/config.hpp>
#include <islr/app/keypoint_json.hpp>
#include <islr/app/recognition_runner.hpp>
#include <islr/core/error.hpp>
#include <islr/core/keypoint_frame.hpp>
#include <islr/core/logger.hpp>
#include <islr/core/prediction.hpp>
#include <islr/recognition/recognizer_service.hpp>

#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace {

islr::core::KeypointSequence make_demo_sequence(std::size_t frames) {
  islr::core::KeypointSequence seq;
  seq.reserve(frames);
  for (std::size_t i = 0; i < frames; ++i) {
    seq.push_back(islr::core::KeypointFrame::absent(i));
  }
  return seq;
}

std::string format_result(const islr::core::RecognitionResult& r, bool as_json) {
  if (as_json) return islr::app::to_json(r).dump(2) + "\n";
  std::ostringstream out;
  out << "frames=" << r.num_frames << " text=\"" << r.text << "\"\n";
  for (const auto& p : r.predictions) {
    out << "  " << p.label << " confidence=" << p.confidence << " index=" << p.class_index << "\n";
  }
  return out.str();
}

void write_output_file(const std::string& input_path, const std::string& text) {
  std::filesystem::path p(input_path);
  std::filesystem::path out_dir("output");
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  std::filesystem::path out_file = out_dir / (p.stem().string() + ".txt");
  std::ofstream f(out_file);
  if (f) {
    f << text;
  } else {
    std::cerr << "Warning: could not write " << out_file << "\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::string> input_paths;
  std::vector<std::string> settings;
  std::string backend_override;  // "native" or "onnx"
  std::string model_override;
  std::string log_level_override;
  std::size_t top_k = 0;
  bool top_k_set = false;
  bool strict = false;
  bool stream = false;
  bool as_json = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_paths.emplace_back(argv[++i]);
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--top-k" && i + 1 < argc) {
      try {
        top_k = static_cast<std::size_t>(std::stoul(argv[++i]));
      } catch (const std::exception&) {
        std::cerr << "Invalid --top-k value\n";
        return 1;
      }
      top_k_set = true;
    } else if (arg == "--set" && i + 1 < argc) {
      settings.emplace_back(argv[++i]);
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level_override = argv[++i];
    } else if (arg == "--strict") {
      strict = true;
    } else if (arg == "--stream") {
      stream = true;
    } else if (arg == "--json") {
      as_json = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: islr_cli [options] [--input <request.json> ...]\n"
                << "  --config <path>     Config (key=value file); default: built-in\n"
                << "  --backend <type>    Override backend: native | onnx (default from config)\n"
                << "  --model <path>      Override model path (checkpoint or .onnx file)\n"
                << "  --input <path>      Request JSON {\"frames\": [...]}; repeatable.\n"
                << "                      Without --input a demo sequence of empty frames is used.\n"
                << "  --top-k <n>         Number of ranked predictions (default 3)\n"
                << "  --set key=value     Override any config key\n"
                << "  --strict            Fail instead of using random weights when the model is missing\n"
                << "  --stream            Treat the inputs as consecutive windows; print the joined text\n"
                << "  --json              Print results as JSON\n"
                << "  --log-level <lvl>   debug | info | warn | error | off\n";
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  auto loaded_cfg = config_path.empty() ? std::expected<islr::app::AppConfig,
                                                        islr::core::RecognitionError>(
                                              islr::app::default_config())
                                        : islr::app::load_config(config_path);
  if (!loaded_cfg) {
    std::cerr << "Config error: " << islr::core::to_string(loaded_cfg.error()) << "\n";
    return 1;
  }
  islr::app::AppConfig cfg = std::move(*loaded_cfg);

  for (const auto& s : settings) {
    const auto pos = s.find('=');
    if (pos == std::string::npos ||
        !islr::app::apply_setting(cfg, s.substr(0, pos), s.substr(pos + 1))) {
      std::cerr << "Invalid --set " << s << "\n";
      return 1;
    }
  }
  if (!backend_override.empty()) {
    if (!islr::app::apply_setting(cfg, "backend_type", backend_override)) {
      std::cerr << "Unknown --backend " << backend_override << " (use native or onnx)\n";
      return 1;
    }
  }
  if (!model_override.empty()) cfg.model_path = model_override;
  if (!log_level_override.empty()) cfg.log_level = log_level_override;
  if (strict) cfg.strict_load = true;
  if (top_k_set) cfg.top_k = top_k;

  islr::core::Logger::set_level(islr::core::parse_log_level(cfg.log_level));

  islr::recognition::RecognizerService service(islr::app::to_service_options(cfg));
  auto recognizer = service.initialize();
  if (!recognizer) {
    std::cerr << "Initialization error: " << islr::core::to_string(recognizer.error()) << "\n";
    return 1;
  }

  std::vector<islr::core::KeypointSequence> sequences;
  if (input_paths.empty()) {
    sequences.push_back(make_demo_sequence(20));
  } else {
    for (const auto& path : input_paths) {
      auto request = islr::app::load_request_file(path);
      if (!request) {
        std::cerr << "Failed to load request " << path << ": "
                  << islr::core::to_string(request.error()) << "\n";
        return 1;
      }
      sequences.push_back(std::move(request->frames));
    }
  }

  if (stream) {
    auto text = service.recognize_stream(sequences);
    if (!text) {
      std::cerr << "Recognition error: " << islr::core::to_string(text.error()) << "\n";
      return 1;
    }
    std::cout << *text << "\n";
    return 0;
  }

  std::vector<islr::app::RecognitionOutcome> outcomes(
      sequences.size(), std::unexpected(islr::core::RecognitionError::None));
  std::mutex outcomes_mutex;
  islr::app::recognize_batch_parallel(
      **recognizer, sequences, cfg.top_k,
      [&](std::size_t index, const islr::app::RecognitionOutcome& outcome) {
        std::lock_guard lock(outcomes_mutex);
        outcomes[index] = outcome;
      },
      cfg.num_workers);

  int status = 0;
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    const auto& outcome = outcomes[i];
    if (!outcome) {
      std::cerr << (input_paths.empty() ? std::string("demo") : input_paths[i])
                << ": recognition error: " << islr::core::to_string(outcome.error()) << "\n";
      status = 1;
      continue;
    }
    const std::string text = format_result(*outcome, as_json);
    std::cout << text;
    if (!input_paths.empty()) write_output_file(input_paths[i], text);
  }
  return status;
}
