#include <islr/recognition/vocabulary_resolver.hpp>
#include <islr/core/logger.hpp>
#include <islr/model/checkpoint.hpp>
#include <filesystem>
#include <system_error>

namespace islr::recognition {

namespace ic = islr::core;

std::expected<ResolvedVocabulary, ic::RecognitionError> resolve_vocabulary(
    const std::vector<VocabularyStrategy>& strategies) {
  for (const auto& strategy : strategies) {
    if (!strategy.resolve) continue;
    std::optional<ic::Vocabulary> v = strategy.resolve();
    if (v) {
      ic::Logger::info("Vocabulary resolved from ", strategy.name, ": ", v->size(), " signs");
      return ResolvedVocabulary{std::move(*v), strategy.name};
    }
    ic::Logger::debug("Vocabulary source ", strategy.name, " unavailable");
  }
  return std::unexpected(ic::RecognitionError::InvalidVocabulary);
}

VocabularyStrategy checkpoint_vocabulary(std::string name, std::string checkpoint_path) {
  return {std::move(name), [path = std::move(checkpoint_path)]() -> std::optional<ic::Vocabulary> {
            std::error_code ec;
            if (path.empty() || !std::filesystem::exists(path, ec)) return std::nullopt;
            auto labels = islr::model::read_checkpoint_vocabulary(path);
            if (!labels) {
              ic::Logger::warn("Could not load vocabulary from checkpoint ", path);
              return std::nullopt;
            }
            auto v = ic::Vocabulary::create(std::move(*labels));
            if (!v) return std::nullopt;
            return std::move(*v);
          }};
}

VocabularyStrategy file_vocabulary(std::string name, std::string path) {
  return {std::move(name), [path = std::move(path)]() -> std::optional<ic::Vocabulary> {
            std::error_code ec;
            if (path.empty() || !std::filesystem::exists(path, ec)) return std::nullopt;
            auto v = ic::load_vocabulary_file(path);
            if (!v) {
              ic::Logger::warn("Could not load vocabulary from ", path);
              return std::nullopt;
            }
            return std::move(*v);
          }};
}

VocabularyStrategy builtin_vocabulary(std::size_t count) {
  return {"default", [count]() -> std::optional<ic::Vocabulary> {
            ic::Logger::warn("Using built-in vocabulary; train a model for production use");
            return ic::default_vocabulary(count);
          }};
}

std::vector<VocabularyStrategy> default_vocabulary_chain(const VocabularyPaths& paths) {
  std::vector<VocabularyStrategy> chain;
  if (!paths.checkpoint_path.empty()) {
    chain.push_back(checkpoint_vocabulary("checkpoint", paths.checkpoint_path));
  }
  std::string model_vocab = paths.model_vocab_path;
  if (model_vocab.empty() && !paths.checkpoint_path.empty()) {
    model_vocab = (std::filesystem::path(paths.checkpoint_path).parent_path() / "vocabulary.json")
                      .string();
  }
  if (!model_vocab.empty()) {
    chain.push_back(file_vocabulary("model_artifacts", std::move(model_vocab)));
  }
  if (!paths.dataset_vocab_path.empty()) {
    chain.push_back(file_vocabulary("dataset", paths.dataset_vocab_path));
  }
  chain.push_back(builtin_vocabulary(paths.default_size));
  return chain;
}

}  // namespace islr::recognition
