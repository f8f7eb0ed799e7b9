#include <islr/training/dataset.hpp>
#include <islr/core/logger.hpp>
#include <islr/features/keypoint_json.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <system_error>
#include <utility>

namespace islr::training {

namespace ic = islr::core;
namespace fs = std::filesystem;

namespace {

std::vector<fs::path> json_files(const fs::path& dir) {
  std::vector<fs::path> files;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".json") {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::expected<nlohmann::json, std::string> read_json(const fs::path& file) {
  std::ifstream in(file);
  if (!in) return std::unexpected("cannot open file");
  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    return std::unexpected(std::string("invalid JSON: ") + e.what());
  }
}

bool is_directory(const fs::path& p) {
  std::error_code ec;
  return fs::is_directory(p, ec);
}

void verify_split(const fs::path& dir, const ic::Vocabulary& vocabulary, SplitReport& report) {
  const auto files = json_files(dir);
  report.files = files.size();
  for (const auto& file : files) {
    const std::string name = file.filename().string();
    auto doc = read_json(file);
    if (!doc) {
      report.errors.push_back(name + ": " + doc.error());
      continue;
    }
    if (!doc->is_object() || !doc->contains("sign_label")) {
      report.errors.push_back(name + ": missing 'sign_label'");
      continue;
    }
    if (!doc->contains("frames")) {
      report.errors.push_back(name + ": missing 'frames'");
      continue;
    }
    auto sample = islr::features::parse_sample(*doc);
    if (!sample) {
      report.errors.push_back(name + ": " + std::string(ic::to_string(sample.error())));
      continue;
    }
    report.label_counts[sample->sign_label]++;
    if (!vocabulary.index_of(sample->sign_label)) {
      report.errors.push_back(name + ": label '" + sample->sign_label + "' not in vocabulary");
      continue;
    }
    if (sample->frames.empty()) {
      report.errors.push_back(name + ": no frames");
      continue;
    }
    const auto bad = std::find_if(sample->frames.begin(), sample->frames.end(),
                                  [](const ic::KeypointFrame& f) {
                                    return f.size() != ic::kPointsPerFrame;
                                  });
    if (bad != sample->frames.end()) {
      report.errors.push_back(name + ": frame " + std::to_string(bad->frame_id()) + " has " +
                              std::to_string(bad->size()) + " keypoints, expected " +
                              std::to_string(ic::kPointsPerFrame));
      continue;
    }
    ++report.valid;
  }
}

}  // namespace

std::expected<std::vector<RawSample>, ic::RecognitionError> load_samples(
    const std::string& dir,
    const islr::features::WindowOptions& window) {
  if (!is_directory(dir)) {
    ic::Logger::error("Dataset directory not found: ", dir);
    return std::unexpected(ic::RecognitionError::DatasetError);
  }
  std::vector<RawSample> samples;
  const auto files = json_files(dir);
  for (const auto& file : files) {
    const std::string name = file.filename().string();
    auto doc = read_json(file);
    if (!doc) {
      ic::Logger::warn("Skipping ", name, ": ", doc.error());
      continue;
    }
    auto sample = islr::features::parse_sample(*doc);
    if (!sample) {
      ic::Logger::warn("Skipping ", name, ": ", ic::to_string(sample.error()));
      continue;
    }
    auto built = islr::features::build_window(sample->frames, window);
    if (!built) {
      ic::Logger::warn("Skipping ", name, ": ", ic::to_string(built.error()));
      continue;
    }
    samples.push_back({name, std::move(sample->sign_label), std::move(*built)});
  }
  ic::Logger::info("Loaded ", samples.size(), " of ", files.size(), " samples from ", dir);
  return samples;
}

std::expected<ic::Vocabulary, ic::RecognitionError> build_training_vocabulary(
    const std::vector<RawSample>& samples) {
  std::set<std::string> unique;
  for (const auto& s : samples) unique.insert(s.sign_label);
  return ic::Vocabulary::create(std::vector<std::string>(unique.begin(), unique.end()));
}

Dataset make_dataset(const std::vector<RawSample>& samples, const ic::Vocabulary& vocabulary) {
  Dataset out;
  out.windows.reserve(samples.size());
  out.labels.reserve(samples.size());
  for (const auto& s : samples) {
    const auto index = vocabulary.index_of(s.sign_label);
    if (!index) {
      ic::Logger::warn("Skipping ", s.file, ": label '", s.sign_label, "' not in vocabulary");
      continue;
    }
    out.windows.push_back(s.window);
    out.labels.push_back(*index);
  }
  return out;
}

DatasetReport verify_dataset(const std::string& root) {
  DatasetReport report;
  const fs::path base(root);
  const fs::path train_dir = base / "train";
  const fs::path val_dir = base / "val";
  const fs::path vocab_file = base / "vocabulary.json";

  if (!is_directory(train_dir)) report.errors.push_back("training directory not found: " + train_dir.string());
  if (!is_directory(val_dir)) report.errors.push_back("validation directory not found: " + val_dir.string());
  std::error_code ec;
  if (!fs::exists(vocab_file, ec)) {
    report.errors.push_back("vocabulary file not found: " + vocab_file.string());
  }
  if (!report.errors.empty()) return report;

  auto vocabulary = ic::load_vocabulary_file(vocab_file.string());
  if (!vocabulary) {
    report.errors.push_back("vocabulary file is not a valid vocabulary: " + vocab_file.string());
    return report;
  }
  report.structure_ok = true;
  report.vocabulary_size = vocabulary->size();

  verify_split(train_dir, *vocabulary, report.train);
  verify_split(val_dir, *vocabulary, report.val);
  return report;
}

}  // namespace islr::training
