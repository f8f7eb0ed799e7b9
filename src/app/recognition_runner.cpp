#include <islr/app/recognition_runner.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace islr::app {

RecognitionOutcome run_recognition(const recognition::Recognizer& recognizer,
                                   const islr::core::KeypointSequence& sequence,
                                   std::size_t top_k) {
  return recognizer.recognize_with_text(sequence, top_k);
}

void recognize_batch(const recognition::Recognizer& recognizer,
                     const std::vector<islr::core::KeypointSequence>& sequences,
                     std::size_t top_k,
                     const RecognitionCallback& callback) {
  if (!callback) return;
  for (std::size_t i = 0; i < sequences.size(); ++i) {
    callback(i, run_recognition(recognizer, sequences[i], top_k));
  }
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void recognize_batch_parallel(const recognition::Recognizer& recognizer,
                              const std::vector<islr::core::KeypointSequence>& sequences,
                              std::size_t top_k,
                              const RecognitionCallback& callback,
                              std::size_t num_workers) {
  const std::size_t n = sequences.size();
  if (n == 0 || !callback) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    recognize_batch(recognizer, sequences, top_k, callback);
    return;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      callback(idx, run_recognition(recognizer, sequences[idx], top_k));
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace islr::app
