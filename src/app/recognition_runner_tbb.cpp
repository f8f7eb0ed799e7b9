#include <islr/app/recognition_runner_tbb.hpp>

#ifdef ISLR_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace islr::app {

void recognize_batch_tbb(const recognition::Recognizer& recognizer,
                         const std::vector<islr::core::KeypointSequence>& sequences,
                         std::size_t top_k,
                         const RecognitionCallback& callback) {
  if (sequences.empty() || !callback) return;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, sequences.size()),
      [&recognizer, &sequences, top_k, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          callback(i, run_recognition(recognizer, sequences[i], top_k));
        }
      });
}

}  // namespace islr::app

#endif  // ISLR_HAS_TBB
