#include <islr/core/error.hpp>
#include <islr/core/keypoint_frame.hpp>
#include <islr/features/sequence_padder.hpp>
#include "support/test_helpers.hpp"
#include <gtest/gtest.h>
#include <vector>

namespace ic = islr::core;
namespace ifeat = islr::features;

namespace {

cv::Mat numbered_rows(int n, int cols = 4) {
  cv::Mat m(n, cols, CV_32F);
  for (int r = 0; r < n; ++r) m.row(r).setTo(static_cast<float>(r + 1));
  return m;
}

}  // namespace

TEST(PadOrTruncate, PadsWithZeroRows) {
  auto out = ifeat::pad_or_truncate(numbered_rows(3), 5);
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->rows, 5);
  EXPECT_EQ(out->at<float>(2, 0), 3.f);
  EXPECT_EQ(cv::countNonZero(out->rowRange(3, 5)), 0);
}

TEST(PadOrTruncate, TruncatesKeepingFirstRows) {
  auto out = ifeat::pad_or_truncate(numbered_rows(10), 4);
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->rows, 4);
  EXPECT_EQ(out->at<float>(0, 0), 1.f);
  EXPECT_EQ(out->at<float>(3, 0), 4.f);
}

TEST(PadOrTruncate, ExactLengthIsIdentityAndNotAliased) {
  cv::Mat in = numbered_rows(6);
  auto out = ifeat::pad_or_truncate(in, 6);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(cv::norm(in, *out, cv::NORM_INF), 0.0);
  in.setTo(0.f);
  EXPECT_EQ(out->at<float>(5, 0), 6.f);
}

TEST(PadOrTruncate, Errors) {
  auto empty = ifeat::pad_or_truncate(cv::Mat(), 4);
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), ic::RecognitionError::EmptySequence);

  auto zero = ifeat::pad_or_truncate(numbered_rows(2), 0);
  ASSERT_FALSE(zero.has_value());
  EXPECT_EQ(zero.error(), ic::RecognitionError::InvalidConfig);
}

TEST(BuildWindow, SortsByFrameId) {
  ic::KeypointSequence seq;
  seq.push_back(islr::test::make_frame(7, 3.f));
  seq.push_back(islr::test::make_frame(2, 1.f));
  seq.push_back(islr::test::make_frame(5, 2.f));
  ifeat::WindowOptions options;
  options.length = 4;
  auto w = ifeat::build_window(seq, options);
  ASSERT_TRUE(w.has_value());
  ASSERT_EQ(w->rows, 4);
  ASSERT_EQ(w->cols, static_cast<int>(ic::kFeatureDim));
  EXPECT_EQ(w->at<float>(0, 0), 1.f);
  EXPECT_EQ(w->at<float>(1, 0), 2.f);
  EXPECT_EQ(w->at<float>(2, 0), 3.f);
  EXPECT_EQ(w->at<float>(3, 0), 0.f);
}

TEST(BuildWindow, DefaultLengthIs64) {
  auto w = ifeat::build_window(islr::test::make_sequence(20));
  ASSERT_TRUE(w.has_value());
  EXPECT_EQ(w->rows, 64);
}

TEST(BuildWindow, TruncatesAfterSorting) {
  ic::KeypointSequence seq;
  for (int i = 9; i >= 0; --i) seq.push_back(islr::test::make_frame(static_cast<std::uint64_t>(i), static_cast<float>(i)));
  ifeat::WindowOptions options;
  options.length = 3;
  auto w = ifeat::build_window(seq, options);
  ASSERT_TRUE(w.has_value());
  EXPECT_EQ(w->at<float>(0, 0), 0.f);
  EXPECT_EQ(w->at<float>(2, 0), 2.f);
}

TEST(BuildWindow, Errors) {
  auto empty = ifeat::build_window({});
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), ic::RecognitionError::EmptySequence);

  ic::KeypointSequence bad = islr::test::make_sequence(3);
  bad.push_back(ic::KeypointFrame(3, std::vector<ic::Point3>(500)));
  auto shape = ifeat::build_window(bad);
  ASSERT_FALSE(shape.has_value());
  EXPECT_EQ(shape.error(), ic::RecognitionError::ShapeError);

  ic::KeypointSequence dup = islr::test::make_sequence(3);
  dup.push_back(ic::KeypointFrame::absent(1));
  auto order = ifeat::build_window(dup);
  ASSERT_FALSE(order.has_value());
  EXPECT_EQ(order.error(), ic::RecognitionError::InvalidFrameOrder);
}

TEST(BuildWindow, MalformedFrameBeyondWindowIsStillRejected) {
  ic::KeypointSequence seq = islr::test::make_sequence(5);
  seq.push_back(ic::KeypointFrame(99, std::vector<ic::Point3>(10)));
  ifeat::WindowOptions options;
  options.length = 2;
  auto w = ifeat::build_window(seq, options);
  ASSERT_FALSE(w.has_value());
  EXPECT_EQ(w.error(), ic::RecognitionError::ShapeError);
}

TEST(BuildWindow, CenteringIsOptIn) {
  ic::KeypointSequence seq{islr::test::make_frame(0, 4.f), islr::test::make_frame(1, 8.f)};
  ifeat::WindowOptions raw;
  raw.length = 2;
  auto plain = ifeat::build_window(seq, raw);
  ASSERT_TRUE(plain.has_value());
  EXPECT_EQ(plain->at<float>(1, 0), 8.f);

  ifeat::WindowOptions centered = raw;
  centered.center_coordinates = true;
  auto scaled = ifeat::build_window(seq, centered);
  ASSERT_TRUE(scaled.has_value());
  EXPECT_FLOAT_EQ(scaled->at<float>(0, 0), -1.f);
  EXPECT_FLOAT_EQ(scaled->at<float>(1, 0), 1.f);
}

TEST(BuildWindow, CenteringUsesFramesBeyondTheWindow) {
  ic::KeypointSequence seq{islr::test::make_frame(2, 4.f), islr::test::make_frame(0, 0.f),
                           islr::test::make_frame(1, 2.f)};
  ifeat::WindowOptions options;
  options.length = 2;
  options.center_coordinates = true;
  auto w = ifeat::build_window(seq, options);
  ASSERT_TRUE(w.has_value());
  ASSERT_EQ(w->rows, 2);
  // Mean 2 and scale 2 come from all three frames.
  EXPECT_FLOAT_EQ(w->at<float>(0, 0), -1.f);
  EXPECT_FLOAT_EQ(w->at<float>(1, 0), 0.f);
  EXPECT_FLOAT_EQ(w->at<float>(1, static_cast<int>(ic::kFeatureDim) - 1), 0.f);
}
