#pragma once

#include <string_view>

namespace islr::core {

/// Recognition error codes; used with std::expected for recoverable failures.
enum class RecognitionError {
  None = 0,
  ShapeError,            // frame is not 543 points of 3 coordinates
  EmptySequence,         // no usable frames
  InvalidFrameOrder,     // duplicate frame_id within one sequence
  VocabularyMismatch,    // vocabulary size != model output width
  ModelNotLoaded,        // recognition before successful initialize()
  CheckpointLoadFailed,  // missing, corrupt or incompatible checkpoint
  InvalidVocabulary,     // empty, duplicate labels or unparsable file
  InvalidConfig,
  InferenceFailed,
  DatasetError,
};

/// Stable name for logs and CLI output.
[[nodiscard]] std::string_view to_string(RecognitionError error) noexcept;

}  // namespace islr::core
