#pragma once

#include <islr/core/error.hpp>
#include <islr/core/vocabulary.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace islr::recognition {

/// One source in the vocabulary fallback chain. resolve() returns nullopt when
/// the source is absent or unusable; it must not throw.
struct VocabularyStrategy {
  std::string name;
  std::function<std::optional<islr::core::Vocabulary>()> resolve;
};

/// Vocabulary together with the strategy that produced it.
struct ResolvedVocabulary {
  islr::core::Vocabulary vocabulary;
  std::string source;
};

/// Tries strategies in order; the first non-empty result wins and is logged.
/// InvalidVocabulary if no strategy yields a vocabulary.
[[nodiscard]] std::expected<ResolvedVocabulary, islr::core::RecognitionError>
resolve_vocabulary(const std::vector<VocabularyStrategy>& strategies);

/// Vocabulary embedded in a model checkpoint.
[[nodiscard]] VocabularyStrategy checkpoint_vocabulary(std::string name,
                                                       std::string checkpoint_path);

/// JSON array file (e.g. next to trained model artifacts or a processed dataset).
[[nodiscard]] VocabularyStrategy file_vocabulary(std::string name, std::string path);

/// Built-in reference list, first `count` labels (capped at 100). Never fails.
[[nodiscard]] VocabularyStrategy builtin_vocabulary(std::size_t count);

struct VocabularyPaths {
  std::string checkpoint_path;     // may be empty
  std::string model_vocab_path;    // default: <checkpoint dir>/vocabulary.json
  std::string dataset_vocab_path;  // may be empty
  std::size_t default_size{islr::core::kMaxDefaultVocabularySize};
};

/// Standard chain: checkpoint -> model_artifacts -> dataset -> default.
/// Empty paths are skipped.
[[nodiscard]] std::vector<VocabularyStrategy> default_vocabulary_chain(
    const VocabularyPaths& paths);

}  // namespace islr::recognition
