#pragma once

#include <islr/core/error.hpp>
#include <islr/core/vocabulary.hpp>
#include <islr/features/sequence_padder.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <expected>
#include <map>
#include <string>
#include <vector>

namespace islr::training {

/// One labeled gesture, already converted to a model window.
struct RawSample {
  std::string file;
  std::string sign_label;
  cv::Mat window;  // length x kFeatureDim, CV_32F
};

/// Indexed samples ready for training.
struct Dataset {
  std::vector<cv::Mat> windows;
  std::vector<std::size_t> labels;

  [[nodiscard]] std::size_t size() const noexcept { return windows.size(); }
  [[nodiscard]] bool empty() const noexcept { return windows.empty(); }
};

/// Loads every *.json sample in dir (sorted by file name). Samples with no
/// frames or malformed geometry are skipped with a warning.
/// DatasetError if dir is not a directory.
[[nodiscard]] std::expected<std::vector<RawSample>, islr::core::RecognitionError> load_samples(
    const std::string& dir,
    const islr::features::WindowOptions& window = {});

/// Sorted unique labels of samples. InvalidVocabulary if samples is empty.
[[nodiscard]] std::expected<islr::core::Vocabulary, islr::core::RecognitionError>
build_training_vocabulary(const std::vector<RawSample>& samples);

/// Maps labels to vocabulary indices; samples whose label is not in the
/// vocabulary are skipped with a warning.
[[nodiscard]] Dataset make_dataset(const std::vector<RawSample>& samples,
                                   const islr::core::Vocabulary& vocabulary);

/// Result of verify_dataset for one split directory.
struct SplitReport {
  std::size_t files{0};
  std::size_t valid{0};
  std::map<std::string, std::size_t> label_counts;
  std::vector<std::string> errors;  // "<file>: <reason>"
};

struct DatasetReport {
  bool structure_ok{false};  // train/, val/ and vocabulary.json present and readable
  std::size_t vocabulary_size{0};
  SplitReport train;
  SplitReport val;
  std::vector<std::string> errors;  // structural problems

  [[nodiscard]] bool ok() const noexcept {
    return structure_ok && train.errors.empty() && val.errors.empty() && train.valid > 0 &&
           val.valid > 0;
  }
};

/// Checks a processed dataset root (train/, val/, vocabulary.json): every
/// sample must name a vocabulary label and carry 543 x 3 keypoints per frame.
[[nodiscard]] DatasetReport verify_dataset(const std::string& root);

}  // namespace islr::training
