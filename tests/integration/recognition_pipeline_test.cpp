#include <islr/app/keypoint_json.hpp>
#include <islr/app/recognition_runner.hpp>
#include <islr/core/error.hpp>
#include <islr/core/vocabulary.hpp>
#include <islr/features/keypoint_json.hpp>
#include <islr/recognition/recognizer_service.hpp>
#include "support/test_helpers.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace ic = islr::core;
namespace ir = islr::recognition;

namespace {

ir::ServiceOptions service_options(const islr::test::TempDir& dir) {
  ir::ServiceOptions o;
  o.model_path = dir.file("trained_models/best_model.yml.gz");
  o.vocabulary.dataset_vocab_path = dir.file("vocabulary.json");
  o.model = islr::test::tiny_config(1);
  o.recognizer.window.length = 16;
  return o;
}

}  // namespace

TEST(RecognitionPipeline, JsonRequestToResponse) {
  islr::test::TempDir dir;
  const auto vocabulary = ic::Vocabulary::create({"hello", "thanks", "yes", "no", "sorry"});
  ASSERT_TRUE(ic::save_vocabulary_file(*vocabulary, dir.file("vocabulary.json")).has_value());

  ir::RecognizerService service(service_options(dir));
  auto recognizer = service.initialize();
  ASSERT_TRUE(recognizer.has_value());
  EXPECT_EQ(service.load_report()->vocabulary_source, "dataset");
  EXPECT_FALSE(service.load_report()->pretrained);

  ic::KeypointSequence frames;
  for (std::uint64_t id = 20; id > 0; --id) frames.push_back(islr::test::make_frame(id - 1, 0.1f));
  const nlohmann::json request{{"user_id", "signer-1"},
                               {"frames", islr::features::frames_to_json(frames)}};

  auto parsed = islr::app::parse_request(request.dump());
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->user_id, "signer-1");

  auto result = service.recognize_with_text(parsed->frames, 3);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->num_frames, 20u);
  ASSERT_EQ(result->predictions.size(), 3u);

  const auto response = islr::app::to_json(*result);
  EXPECT_EQ(response["predictions"].size(), 3u);
  EXPECT_EQ(response["num_frames"], 20);
  const std::string top = response["predictions"][0]["label"];
  EXPECT_TRUE(vocabulary->index_of(top).has_value());
  if (result->predictions[0].confidence > 0.5f) {
    EXPECT_EQ(response["text"], top);
  } else {
    EXPECT_EQ(response["text"], "");
  }
}

TEST(RecognitionPipeline, BatchOfRequestsSharesOneRecognizer) {
  islr::test::TempDir dir;
  const auto vocabulary = ic::Vocabulary::create({"hello", "thanks", "yes"});
  ASSERT_TRUE(ic::save_vocabulary_file(*vocabulary, dir.file("vocabulary.json")).has_value());
  ir::RecognizerService service(service_options(dir));
  auto recognizer = service.initialize();
  ASSERT_TRUE(recognizer.has_value());

  std::vector<ic::KeypointSequence> requests{islr::test::make_sequence(5),
                                             islr::test::make_sequence(30),
                                             {},
                                             islr::test::make_sequence(5)};
  std::vector<islr::app::RecognitionOutcome> outcomes(requests.size(),
                                                      std::unexpected(ic::RecognitionError::None));
  std::mutex mutex;
  islr::app::recognize_batch_parallel(
      **recognizer, requests, 3,
      [&](std::size_t i, const islr::app::RecognitionOutcome& o) {
        std::lock_guard lock(mutex);
        outcomes[i] = o;
      },
      2);
  ASSERT_TRUE(outcomes[0].has_value());
  ASSERT_TRUE(outcomes[1].has_value());
  ASSERT_FALSE(outcomes[2].has_value());
  EXPECT_EQ(outcomes[2].error(), ic::RecognitionError::EmptySequence);
  ASSERT_TRUE(outcomes[3].has_value());
  // Identical windows give identical answers.
  EXPECT_EQ(outcomes[0]->predictions[0].class_index, outcomes[3]->predictions[0].class_index);
  EXPECT_EQ(outcomes[0]->predictions[0].confidence, outcomes[3]->predictions[0].confidence);
}
