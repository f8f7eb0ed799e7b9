#include <islr/core/vocabulary.hpp>
#include <islr/core/logger.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <fstream>
#include <string_view>

namespace islr::core {

namespace {

constexpr std::array<std::string_view, 99> kCommonSigns = {
    "hello", "thank you", "please", "yes", "no", "help", "sorry",
    "good", "bad", "eat", "drink", "water", "food", "home", "work",
    "family", "friend", "love", "happy", "sad", "angry", "tired",
    "morning", "afternoon", "evening", "night", "today", "tomorrow",
    "yesterday", "now", "later", "here", "there", "what", "when",
    "where", "who", "why", "how", "can", "cannot", "want", "need",
    "like", "dislike", "understand", "not understand", "repeat",
    "slow", "fast", "big", "small", "hot", "cold", "new", "old",
    "good morning", "good night", "how are you", "fine", "okay",
    "excuse me", "welcome", "goodbye", "see you", "take care",
    "mother", "father", "brother", "sister", "child", "baby",
    "man", "woman", "boy", "girl", "doctor", "teacher", "student",
    "hospital", "school", "shop", "restaurant", "bathroom",
    "one", "two", "three", "four", "five", "six", "seven", "eight",
    "nine", "ten", "hundred", "thousand", "money", "expensive", "cheap",
};

}  // namespace

Vocabulary::Vocabulary(std::vector<std::string> labels)
    : labels_(std::move(labels)) {
  index_.reserve(labels_.size());
  for (std::size_t i = 0; i < labels_.size(); ++i) {
    index_.emplace(labels_[i], i);
  }
}

std::expected<Vocabulary, RecognitionError> Vocabulary::create(
    std::vector<std::string> labels) {
  if (labels.empty()) {
    return std::unexpected(RecognitionError::InvalidVocabulary);
  }
  Vocabulary v(std::move(labels));
  if (v.index_.size() != v.labels_.size()) {
    return std::unexpected(RecognitionError::InvalidVocabulary);
  }
  return v;
}

std::optional<std::size_t> Vocabulary::index_of(std::string_view label) const {
  auto it = index_.find(std::string(label));
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

std::expected<Vocabulary, RecognitionError> load_vocabulary_file(
    const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    return std::unexpected(RecognitionError::InvalidVocabulary);
  }
  std::vector<std::string> labels;
  try {
    const nlohmann::json doc = nlohmann::json::parse(f);
    if (!doc.is_array()) {
      Logger::warn("Vocabulary file ", path, " is not a JSON array");
      return std::unexpected(RecognitionError::InvalidVocabulary);
    }
    labels = doc.get<std::vector<std::string>>();
  } catch (const nlohmann::json::exception& e) {
    Logger::warn("Could not parse vocabulary file ", path, ": ", e.what());
    return std::unexpected(RecognitionError::InvalidVocabulary);
  }
  return Vocabulary::create(std::move(labels));
}

std::expected<void, RecognitionError> save_vocabulary_file(
    const Vocabulary& vocabulary,
    const std::string& path) {
  std::ofstream f(path);
  if (!f) {
    return std::unexpected(RecognitionError::InvalidVocabulary);
  }
  const nlohmann::json doc = vocabulary.labels();
  f << doc.dump(2) << "\n";
  if (!f) {
    return std::unexpected(RecognitionError::InvalidVocabulary);
  }
  return {};
}

Vocabulary default_vocabulary(std::size_t count) {
  const std::size_t n = std::max<std::size_t>(
      1, std::min({count, kMaxDefaultVocabularySize, kCommonSigns.size()}));
  std::vector<std::string> labels;
  labels.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    labels.emplace_back(kCommonSigns[i]);
  }
  // The reference list is unique and n >= 1, so create() cannot fail.
  return *Vocabulary::create(std::move(labels));
}

}  // namespace islr::core
