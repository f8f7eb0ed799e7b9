#include <islr/core/error.hpp>

namespace islr::core {

std::string_view to_string(RecognitionError error) noexcept {
  switch (error) {
    case RecognitionError::None:
      return "None";
    case RecognitionError::ShapeError:
      return "ShapeError";
    case RecognitionError::EmptySequence:
      return "EmptySequenceError";
    case RecognitionError::InvalidFrameOrder:
      return "InvalidFrameOrder";
    case RecognitionError::VocabularyMismatch:
      return "VocabularyMismatchError";
    case RecognitionError::ModelNotLoaded:
      return "ModelNotLoadedError";
    case RecognitionError::CheckpointLoadFailed:
      return "CheckpointLoadError";
    case RecognitionError::InvalidVocabulary:
      return "InvalidVocabulary";
    case RecognitionError::InvalidConfig:
      return "InvalidConfig";
    case RecognitionError::InferenceFailed:
      return "InferenceFailed";
    case RecognitionError::DatasetError:
      return "DatasetError";
  }
  return "Unknown";
}

}  // namespace islr::core
