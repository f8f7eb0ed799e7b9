#pragma once

#include <islr/app/recognition_runner.hpp>
#include <islr/core/keypoint_frame.hpp>
#include <islr/recognition/recognizer.hpp>
#include <cstddef>
#include <vector>

#ifdef ISLR_HAS_TBB

namespace islr::app {

/// Runs requests in parallel using TBB.
///
/// The recognizer is shared by every task; its operations are const and its
/// backend is read-only after load, so no per-task copy is needed.
/// \param callback Invoked once per request with (index, outcome). Must be thread-safe.
void recognize_batch_tbb(const recognition::Recognizer& recognizer,
                         const std::vector<islr::core::KeypointSequence>& sequences,
                         std::size_t top_k,
                         const RecognitionCallback& callback);

}  // namespace islr::app

#endif  // ISLR_HAS_TBB
