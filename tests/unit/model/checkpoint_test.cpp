#include <islr/core/error.hpp>
#include <islr/model/checkpoint.hpp>
#include <islr/model/recognition_model.hpp>
#include "support/test_helpers.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace ic = islr::core;
namespace im = islr::model;

namespace {

im::Checkpoint make_checkpoint(const im::RecognitionModel& model,
                               std::vector<std::string> vocabulary) {
  im::Checkpoint c;
  c.config = model.config();
  c.vocabulary = std::move(vocabulary);
  c.parameters = model.parameters().clone();
  c.metrics = {12, 0.75, 0.6, 0.9};
  return c;
}

cv::Mat window(int rows, int cols) {
  cv::Mat w(rows, cols, CV_32F);
  cv::RNG rng(21);
  rng.fill(w, cv::RNG::UNIFORM, -1.0, 1.0);
  return w;
}

}  // namespace

class CheckpointFormat : public ::testing::TestWithParam<const char*> {};

TEST_P(CheckpointFormat, SaveLoadReproducesLogits) {
  islr::test::TempDir dir;
  auto model = im::RecognitionModel::create(islr::test::tiny_config(3, 12));
  ASSERT_TRUE(model.has_value());
  const std::string path = dir.file(std::string("model") + GetParam());

  ASSERT_TRUE(im::save_checkpoint(make_checkpoint(*model, {"hello", "thank you", "yes"}), path)
                  .has_value());
  auto loaded = im::load_checkpoint(path);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->vocabulary, (std::vector<std::string>{"hello", "thank you", "yes"}));
  EXPECT_EQ(loaded->config.hidden_dim, 8u);
  EXPECT_EQ(loaded->config.num_classes, 3u);
  EXPECT_EQ(loaded->metrics.epoch, 12u);
  EXPECT_DOUBLE_EQ(loaded->metrics.val_accuracy, 0.6);
  EXPECT_DOUBLE_EQ(loaded->metrics.best_val_accuracy, 0.9);
  EXPECT_FALSE(loaded->optimizer.has_value());

  auto restored = im::RecognitionModel::create(loaded->config);
  ASSERT_TRUE(restored.has_value());
  ASSERT_TRUE(restored->load_parameters(loaded->parameters).has_value());
  const cv::Mat w = window(5, 12);
  EXPECT_EQ(cv::norm(*model->forward(w), *restored->forward(w), cv::NORM_INF), 0.0);
}

INSTANTIATE_TEST_SUITE_P(Formats, CheckpointFormat,
                         ::testing::Values(".yml.gz", ".yml", ".json", ".xml"));

TEST(Checkpoint, OptimizerAndSchedulerStateRoundTrip) {
  islr::test::TempDir dir;
  auto model = im::RecognitionModel::create(islr::test::tiny_config(2, 6));
  ASSERT_TRUE(model.has_value());
  im::Checkpoint c = make_checkpoint(*model, {"a", "b"});
  im::OptimizerState o;
  o.step = 40;
  o.learning_rate = 5e-4;
  o.first_moment = model->parameters().zeros_like();
  o.second_moment = model->parameters().clone();
  c.optimizer = std::move(o);
  c.scheduler = im::SchedulerState{0.42, 3};

  const std::string path = dir.file("ckpt.yml.gz");
  ASSERT_TRUE(im::save_checkpoint(c, path).has_value());
  auto loaded = im::load_checkpoint(path);
  ASSERT_TRUE(loaded.has_value());
  ASSERT_TRUE(loaded->optimizer.has_value());
  EXPECT_EQ(loaded->optimizer->step, 40u);
  EXPECT_DOUBLE_EQ(loaded->optimizer->learning_rate, 5e-4);
  ASSERT_EQ(loaded->optimizer->second_moment.size(), model->parameters().size());
  EXPECT_EQ(cv::norm(loaded->optimizer->second_moment.at(0), model->parameters().at(0),
                     cv::NORM_INF),
            0.0);
  ASSERT_TRUE(loaded->scheduler.has_value());
  EXPECT_DOUBLE_EQ(loaded->scheduler->best, 0.42);
  EXPECT_EQ(loaded->scheduler->num_bad_epochs, 3u);
}

TEST(Checkpoint, SaveRejectsVocabularyOfWrongSize) {
  islr::test::TempDir dir;
  auto model = im::RecognitionModel::create(islr::test::tiny_config(3, 6));
  ASSERT_TRUE(model.has_value());
  auto r = im::save_checkpoint(make_checkpoint(*model, {"a", "b"}), dir.file("bad.yml"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), ic::RecognitionError::VocabularyMismatch);
}

TEST(Checkpoint, LoadFailsForMissingOrForeignFiles) {
  islr::test::TempDir dir;
  auto missing = im::load_checkpoint(dir.file("nope.yml.gz"));
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), ic::RecognitionError::CheckpointLoadFailed);

  islr::test::write_text(dir.path() / "other.yml", "%YAML:1.0\n---\nfoo: 1\n");
  auto foreign = im::load_checkpoint(dir.file("other.yml"));
  ASSERT_FALSE(foreign.has_value());
  EXPECT_EQ(foreign.error(), ic::RecognitionError::CheckpointLoadFailed);

  islr::test::write_text(dir.path() / "garbage.json", "{ this is not json");
  auto garbage = im::load_checkpoint(dir.file("garbage.json"));
  ASSERT_FALSE(garbage.has_value());
  EXPECT_EQ(garbage.error(), ic::RecognitionError::CheckpointLoadFailed);
}

TEST(Checkpoint, ReadVocabularyOnly) {
  islr::test::TempDir dir;
  auto model = im::RecognitionModel::create(islr::test::tiny_config(2, 6));
  ASSERT_TRUE(model.has_value());
  const std::string path = dir.file("v.yml.gz");
  ASSERT_TRUE(im::save_checkpoint(make_checkpoint(*model, {"no", "sorry"}), path).has_value());
  auto labels = im::read_checkpoint_vocabulary(path);
  ASSERT_TRUE(labels.has_value());
  EXPECT_EQ(*labels, (std::vector<std::string>{"no", "sorry"}));
}
