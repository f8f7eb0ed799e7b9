#pragma once

#include <islr/core/keypoint_frame.hpp>
#include <cstddef>
#include <cstdint>

namespace islr::model {

/// Architecture of the BiLSTM + attention classifier.
/// Defaults match the reference training setup.
struct ModelConfig {
  std::size_t input_dim{islr::core::kFeatureDim};
  std::size_t hidden_dim{256};
  std::size_t num_layers{2};
  std::size_t num_classes{5};
  float dropout{0.3f};
  std::uint64_t seed{42};  // weight initialization
};

/// True if every dimension is positive and dropout is in [0, 1).
[[nodiscard]] bool is_valid(const ModelConfig& config) noexcept;

}  // namespace islr::model
