#include <islr/model/parameter_store.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>

namespace im = islr::model;

TEST(ParameterStore, FindAndOrder) {
  im::ParameterStore store;
  EXPECT_TRUE(store.empty());
  EXPECT_EQ(store.add("a", cv::Mat::ones(2, 3, CV_32F)), 0u);
  EXPECT_EQ(store.add("b", cv::Mat::ones(1, 4, CV_32F)), 1u);
  EXPECT_EQ(store.find("b"), 1u);
  EXPECT_EQ(store.find("missing"), store.size());
  EXPECT_EQ(store.name(0), "a");
  EXPECT_EQ(store.num_elements(), 10u);
}

TEST(ParameterStore, ZerosLikeKeepsLayout) {
  im::ParameterStore store;
  store.add("w", cv::Mat::ones(3, 2, CV_32F));
  const auto zeros = store.zeros_like();
  ASSERT_EQ(zeros.size(), 1u);
  EXPECT_EQ(zeros.name(0), "w");
  EXPECT_EQ(zeros.at(0).size(), cv::Size(2, 3));
  EXPECT_EQ(cv::countNonZero(zeros.at(0)), 0);
}

TEST(ParameterStore, AccumulateScales) {
  im::ParameterStore a;
  a.add("w", cv::Mat::ones(2, 2, CV_32F));
  im::ParameterStore b = a.clone();
  a.accumulate(b, 0.5);
  EXPECT_FLOAT_EQ(a.at(0).at<float>(1, 1), 1.5f);
  EXPECT_FLOAT_EQ(b.at(0).at<float>(1, 1), 1.f);
}

TEST(ParameterStore, CloneIsDeep) {
  im::ParameterStore a;
  a.add("w", cv::Mat::ones(2, 2, CV_32F));
  im::ParameterStore b = a.clone();
  a.set_zero();
  EXPECT_FLOAT_EQ(b.at(0).at<float>(0, 0), 1.f);
  EXPECT_FLOAT_EQ(a.at(0).at<float>(0, 0), 0.f);
}
