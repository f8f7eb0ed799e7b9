#include <islr/core/error.hpp>
#include <islr/core/vocabulary.hpp>
#include <islr/features/keypoint_json.hpp>
#include <islr/training/dataset.hpp>
#include "support/test_helpers.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace ic = islr::core;
namespace it = islr::training;

namespace {

void write_sample(const std::filesystem::path& file, const std::string& label, float value,
                  std::size_t frames = 3) {
  ic::KeypointSequence seq;
  for (std::size_t i = 0; i < frames; ++i) seq.push_back(islr::test::make_frame(i, value));
  nlohmann::json doc{{"sign_label", label}, {"frames", islr::features::frames_to_json(seq)}};
  islr::test::write_text(file, doc.dump());
}

void write_vocabulary(const std::filesystem::path& file, std::vector<std::string> labels) {
  auto v = ic::Vocabulary::create(std::move(labels));
  ASSERT_TRUE(v.has_value());
  std::filesystem::create_directories(file.parent_path());
  ASSERT_TRUE(ic::save_vocabulary_file(*v, file.string()).has_value());
}

}  // namespace

TEST(Dataset, MissingDirectoryIsDatasetError) {
  islr::test::TempDir dir;
  auto r = it::load_samples(dir.file("nope"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), ic::RecognitionError::DatasetError);
}

TEST(Dataset, LoadsSortedSamplesAndSkipsBadOnes) {
  islr::test::TempDir dir;
  write_sample(dir.path() / "b.json", "thanks", 0.2f);
  write_sample(dir.path() / "a.json", "hello", 0.1f);
  write_sample(dir.path() / "empty.json", "hello", 0.f, 0);
  islr::test::write_text(dir.path() / "broken.json", "{not json");
  islr::test::write_text(dir.path() / "nolabel.json", R"({"frames": []})");
  islr::test::write_text(dir.path() / "notes.txt", "ignored");

  islr::features::WindowOptions window;
  window.length = 5;
  auto samples = it::load_samples(dir.path().string(), window);
  ASSERT_TRUE(samples.has_value());
  ASSERT_EQ(samples->size(), 2u);
  EXPECT_EQ((*samples)[0].file, "a.json");
  EXPECT_EQ((*samples)[0].sign_label, "hello");
  EXPECT_EQ((*samples)[1].sign_label, "thanks");
  EXPECT_EQ((*samples)[0].window.rows, 5);
  EXPECT_EQ((*samples)[0].window.cols, static_cast<int>(ic::kFeatureDim));
  EXPECT_FLOAT_EQ((*samples)[0].window.at<float>(0, 0), 0.1f);
  EXPECT_FLOAT_EQ((*samples)[0].window.at<float>(4, 0), 0.f);
}

TEST(Dataset, VocabularyIsSortedAndUnique) {
  std::vector<it::RawSample> samples{{"1", "yes", {}}, {"2", "hello", {}}, {"3", "yes", {}}};
  auto v = it::build_training_vocabulary(samples);
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(v->labels(), (std::vector<std::string>{"hello", "yes"}));

  auto empty = it::build_training_vocabulary({});
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), ic::RecognitionError::InvalidVocabulary);
}

TEST(Dataset, MakeDatasetSkipsUnknownLabels) {
  const cv::Mat w = cv::Mat::zeros(2, 3, CV_32F);
  std::vector<it::RawSample> samples{{"1", "yes", w}, {"2", "maybe", w}, {"3", "hello", w}};
  auto v = ic::Vocabulary::create({"hello", "yes"});
  ASSERT_TRUE(v.has_value());
  const it::Dataset d = it::make_dataset(samples, *v);
  ASSERT_EQ(d.size(), 2u);
  EXPECT_EQ(d.labels, (std::vector<std::size_t>{1, 0}));
}

TEST(Dataset, VerifyAcceptsWellFormedRoot) {
  islr::test::TempDir dir;
  write_vocabulary(dir.path() / "vocabulary.json", {"hello", "thanks"});
  write_sample(dir.path() / "train" / "0.json", "hello", 0.1f);
  write_sample(dir.path() / "train" / "1.json", "thanks", 0.2f);
  write_sample(dir.path() / "val" / "0.json", "hello", 0.3f);

  const auto report = it::verify_dataset(dir.path().string());
  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.vocabulary_size, 2u);
  EXPECT_EQ(report.train.valid, 2u);
  EXPECT_EQ(report.val.valid, 1u);
  EXPECT_EQ(report.train.label_counts.at("thanks"), 1u);
}

TEST(Dataset, VerifyReportsProblems) {
  islr::test::TempDir dir;
  const auto missing = it::verify_dataset(dir.path().string());
  EXPECT_FALSE(missing.structure_ok);
  EXPECT_EQ(missing.errors.size(), 3u);

  write_vocabulary(dir.path() / "vocabulary.json", {"hello"});
  write_sample(dir.path() / "train" / "ok.json", "hello", 0.1f);
  write_sample(dir.path() / "train" / "unknown.json", "bye", 0.1f);
  islr::test::write_text(dir.path() / "val" / "short.json",
                         R"({"sign_label": "hello",
                             "frames": [{"frame_id": 0, "keypoints": [[0.0, 0.0, 0.0]]}]})");

  const auto report = it::verify_dataset(dir.path().string());
  EXPECT_TRUE(report.structure_ok);
  EXPECT_FALSE(report.ok());
  EXPECT_EQ(report.train.files, 2u);
  EXPECT_EQ(report.train.valid, 1u);
  ASSERT_EQ(report.train.errors.size(), 1u);
  EXPECT_NE(report.train.errors[0].find("bye"), std::string::npos);
  EXPECT_EQ(report.val.valid, 0u);
  ASSERT_EQ(report.val.errors.size(), 1u);
  EXPECT_NE(report.val.errors[0].find("keypoints"), std::string::npos);
}
