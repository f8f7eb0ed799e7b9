#pragma once

#include <islr/core/error.hpp>
#include <islr/core/keypoint_frame.hpp>
#include <islr/core/prediction.hpp>
#include <islr/recognition/recognizer.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <vector>

namespace islr::app {

using RecognitionOutcome =
    std::expected<islr::core::RecognitionResult, islr::core::RecognitionError>;

/// Callback for each request of a batch with its index in the input.
/// Must be thread-safe if using recognize_batch_parallel or recognize_batch_tbb.
using RecognitionCallback = std::function<void(std::size_t index, const RecognitionOutcome&)>;

/// Runs one request. No threading; direct call.
[[nodiscard]] RecognitionOutcome run_recognition(const recognition::Recognizer& recognizer,
                                                 const islr::core::KeypointSequence& sequence,
                                                 std::size_t top_k = recognition::kDefaultTopK);

/// Runs requests sequentially in input order; calls callback for each.
void recognize_batch(const recognition::Recognizer& recognizer,
                     const std::vector<islr::core::KeypointSequence>& sequences,
                     std::size_t top_k,
                     const RecognitionCallback& callback);

/// Runs requests on a pool of std::thread workers. The recognizer is shared
/// read-only; callback may be invoked from any worker in any order.
/// num_workers 0 = use hardware concurrency.
void recognize_batch_parallel(const recognition::Recognizer& recognizer,
                              const std::vector<islr::core::KeypointSequence>& sequences,
                              std::size_t top_k,
                              const RecognitionCallback& callback,
                              std::size_t num_workers = 0);

}  // namespace islr::app
