#include <islr/core/error.hpp>
#include <islr/core/keypoint_frame.hpp>
#include <islr/features/frame_normalizer.hpp>
#include "support/test_helpers.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>

namespace ic = islr::core;
namespace ifeat = islr::features;

TEST(FrameNormalizer, FlattensPointMajor) {
  std::vector<ic::Point3> points(ic::kPointsPerFrame);
  points[0] = {0.1f, 0.2f, 0.3f};
  points[1] = {0.4f, 0.5f, 0.6f};
  points[542] = {0.7f, 0.8f, 0.9f};
  auto v = ifeat::normalize_frame(ic::KeypointFrame(0, std::move(points)));
  ASSERT_TRUE(v.has_value());
  ASSERT_EQ(v->size(), ic::kFeatureDim);
  EXPECT_FLOAT_EQ((*v)[0], 0.1f);
  EXPECT_FLOAT_EQ((*v)[2], 0.3f);
  EXPECT_FLOAT_EQ((*v)[3], 0.4f);
  EXPECT_FLOAT_EQ((*v)[1628], 0.9f);
}

TEST(FrameNormalizer, DoesNotRescale) {
  auto v = ifeat::normalize_frame(islr::test::make_frame(0, 250.f));
  ASSERT_TRUE(v.has_value());
  EXPECT_FLOAT_EQ((*v)[100], 250.f);
}

TEST(FrameNormalizer, RejectsWrongPointCount) {
  for (std::size_t n : {0u, 500u, 542u, 544u}) {
    auto v = ifeat::normalize_frame(ic::KeypointFrame(0, std::vector<ic::Point3>(n)));
    ASSERT_FALSE(v.has_value()) << n;
    EXPECT_EQ(v.error(), ic::RecognitionError::ShapeError);
  }
}

TEST(FrameNormalizer, NonFiniteBecomesZero) {
  std::vector<ic::Point3> points(ic::kPointsPerFrame, {1.f, 1.f, 1.f});
  points[5].x = std::numeric_limits<float>::quiet_NaN();
  points[6].y = std::numeric_limits<float>::infinity();
  auto v = ifeat::normalize_frame(ic::KeypointFrame(0, std::move(points)));
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ((*v)[15], 0.f);
  EXPECT_EQ((*v)[19], 0.f);
  EXPECT_EQ((*v)[16], 1.f);
}

TEST(FrameNormalizer, NormalizeIntoRejectsWrongBuffer) {
  std::vector<float> out(10);
  auto r = ifeat::normalize_frame_into(islr::test::make_frame(0), out);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), ic::RecognitionError::ShapeError);
}

TEST(FrameNormalizer, CenterAndScaleBoundsValues) {
  cv::Mat rows(2, static_cast<int>(ic::kFeatureDim), CV_32F);
  for (int c = 0; c < rows.cols; ++c) {
    rows.at<float>(0, c) = static_cast<float>(c % 7);
    rows.at<float>(1, c) = static_cast<float>(-(c % 5));
  }
  ifeat::center_and_scale(rows);
  double lo = 0.0;
  double hi = 0.0;
  cv::minMaxLoc(rows, &lo, &hi);
  EXPECT_GE(lo, -1.0 - 1e-6);
  EXPECT_LE(hi, 1.0 + 1e-6);
  EXPECT_NEAR(std::max(std::abs(lo), std::abs(hi)), 1.0, 1e-6);
}

TEST(FrameNormalizer, CenterAndScaleLeavesZerosAlone) {
  cv::Mat rows = cv::Mat::zeros(3, static_cast<int>(ic::kFeatureDim), CV_32F);
  ifeat::center_and_scale(rows);
  EXPECT_EQ(cv::countNonZero(rows), 0);
}
