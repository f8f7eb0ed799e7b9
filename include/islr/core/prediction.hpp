#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace islr::core {

/// Single ranked recognition result.
struct Prediction {
  std::string label;
  float confidence{0.f};
  std::size_t class_index{0};  // position in the bound vocabulary
};

/// Response of one recognition call: ranked predictions plus gated text.
struct RecognitionResult {
  std::vector<Prediction> predictions;
  std::string text;  // empty when the top prediction was not accepted
  std::size_t num_frames{0};
};

}  // namespace islr::core
