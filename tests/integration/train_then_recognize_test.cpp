#include <islr/core/vocabulary.hpp>
#include <islr/features/keypoint_json.hpp>
#include <islr/recognition/recognizer_service.hpp>
#include <islr/training/trainer.hpp>
#include "support/test_helpers.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <string>

namespace ic = islr::core;
namespace ir = islr::recognition;
namespace it = islr::training;

namespace {

void write_sample(const std::filesystem::path& file, const std::string& label, float value) {
  ic::KeypointSequence seq;
  for (std::uint64_t i = 0; i < 4; ++i) seq.push_back(islr::test::make_frame(i, value));
  const nlohmann::json doc{{"sign_label", label}, {"frames", islr::features::frames_to_json(seq)}};
  islr::test::write_text(file, doc.dump());
}

void write_split(const std::filesystem::path& dir, std::size_t per_class) {
  for (std::size_t i = 0; i < per_class; ++i) {
    const float jitter = 0.01f * static_cast<float>(i);
    write_sample(dir / ("hello_" + std::to_string(i) + ".json"), "hello", 0.5f + jitter);
    write_sample(dir / ("thanks_" + std::to_string(i) + ".json"), "thanks", -0.5f - jitter);
  }
}

}  // namespace

TEST(TrainThenRecognize, TrainedCheckpointServesRecognition) {
  islr::test::TempDir dir;
  write_split(dir.path() / "train", 3);
  write_split(dir.path() / "val", 1);

  islr::features::WindowOptions window;
  window.length = 4;
  it::TrainerOptions options;
  options.output_dir = dir.file("trained_models");
  options.epochs = 12;
  options.batch_size = 2;
  options.adam.learning_rate = 0.01;
  options.snapshot_every = 0;

  auto report = it::train_from_directories(dir.file("train"), dir.file("val"),
                                           islr::test::tiny_config(2), options, window);
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->epochs_run, 12u);
  ASSERT_GT(report->best_epoch, 0u);
  EXPECT_TRUE(std::filesystem::exists(dir.path() / "trained_models" / "vocabulary.json"));

  const std::string model_path = (dir.path() / "trained_models" / it::kBestModelFile).string();
  ASSERT_TRUE(std::filesystem::exists(model_path));

  ir::ServiceOptions service_options;
  service_options.model_path = model_path;
  service_options.strict_load = true;
  service_options.recognizer.window = window;
  ir::RecognizerService service(service_options);
  ASSERT_TRUE(service.initialize().has_value());
  EXPECT_TRUE(service.load_report()->pretrained);
  EXPECT_EQ(service.load_report()->vocabulary_source, "checkpoint");
  EXPECT_EQ(service.load_report()->vocabulary_size, 2u);

  ic::KeypointSequence hello;
  for (std::uint64_t i = 0; i < 4; ++i) hello.push_back(islr::test::make_frame(i, 0.5f));
  auto preds = service.recognize(hello, 2);
  ASSERT_TRUE(preds.has_value());
  ASSERT_EQ(preds->size(), 2u);
  EXPECT_GE((*preds)[0].confidence, (*preds)[1].confidence);
  if (report->best_val_accuracy == 1.0) {
    EXPECT_EQ((*preds)[0].label, "hello");
  }
}

TEST(TrainThenRecognize, EmptyTrainingDirectoryFails) {
  islr::test::TempDir dir;
  std::filesystem::create_directories(dir.path() / "train");
  std::filesystem::create_directories(dir.path() / "val");
  it::TrainerOptions options;
  options.output_dir.clear();
  auto report = it::train_from_directories(dir.file("train"), dir.file("val"),
                                           islr::test::tiny_config(2), options);
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), ic::RecognitionError::DatasetError);
}
