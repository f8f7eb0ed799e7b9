#pragma once

#include <islr/core/error.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace islr::core {

/// Ordered, duplicate-free, non-empty list of sign labels.
/// Label order defines the classifier's output index. Immutable after create().
class Vocabulary {
 public:
  /// Fails with InvalidVocabulary if labels is empty or contains duplicates.
  [[nodiscard]] static std::expected<Vocabulary, RecognitionError> create(
      std::vector<std::string> labels);

  [[nodiscard]] std::size_t size() const noexcept { return labels_.size(); }
  [[nodiscard]] const std::vector<std::string>& labels() const noexcept {
    return labels_;
  }
  [[nodiscard]] const std::string& label(std::size_t index) const {
    return labels_.at(index);
  }
  [[nodiscard]] std::optional<std::size_t> index_of(std::string_view label) const;

  friend bool operator==(const Vocabulary& a, const Vocabulary& b) {
    return a.labels_ == b.labels_;
  }

 private:
  explicit Vocabulary(std::vector<std::string> labels);

  std::vector<std::string> labels_;
  std::unordered_map<std::string, std::size_t> index_;
};

/// Reads a JSON array of unique strings.
[[nodiscard]] std::expected<Vocabulary, RecognitionError> load_vocabulary_file(
    const std::string& path);

/// Writes the labels as a pretty-printed JSON array (order preserved).
[[nodiscard]] std::expected<void, RecognitionError> save_vocabulary_file(
    const Vocabulary& vocabulary,
    const std::string& path);

/// Hard cap on the built-in reference vocabulary.
inline constexpr std::size_t kMaxDefaultVocabularySize = 100;

/// First min(count, kMaxDefaultVocabularySize) labels of the built-in list of
/// common signs (at least one).
[[nodiscard]] Vocabulary default_vocabulary(
    std::size_t count = kMaxDefaultVocabularySize);

}  // namespace islr::core
