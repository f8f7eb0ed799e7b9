#include <islr/training/lr_scheduler.hpp>
#include <gtest/gtest.h>

namespace it = islr::training;

TEST(ReduceLROnPlateau, ImprovingMetricKeepsRate) {
  it::ReduceLROnPlateau s;
  double lr = 1e-3;
  for (double loss : {2.0, 1.5, 1.2, 1.0, 0.9, 0.8, 0.7, 0.6}) {
    lr = s.step(loss, lr);
  }
  EXPECT_DOUBLE_EQ(lr, 1e-3);
  EXPECT_DOUBLE_EQ(s.best(), 0.6);
  EXPECT_EQ(s.num_bad_epochs(), 0u);
}

TEST(ReduceLROnPlateau, HalvesAfterPatienceIsExceeded) {
  it::ReduceLROnPlateau s;  // patience 5, factor 0.5
  double lr = s.step(1.0, 1e-3);
  for (int i = 0; i < 5; ++i) {
    lr = s.step(1.0, lr);
    EXPECT_DOUBLE_EQ(lr, 1e-3) << "bad epoch " << i + 1;
  }
  EXPECT_EQ(s.num_bad_epochs(), 5u);
  lr = s.step(1.0, lr);
  EXPECT_DOUBLE_EQ(lr, 5e-4);
  EXPECT_EQ(s.num_bad_epochs(), 0u);
}

TEST(ReduceLROnPlateau, TinyImprovementBelowThresholdCountsAsBad) {
  it::ReduceLROnPlateau s;
  (void)s.step(1.0, 1e-3);
  (void)s.step(1.0 - 1e-6, 1e-3);
  EXPECT_EQ(s.num_bad_epochs(), 1u);
  EXPECT_DOUBLE_EQ(s.best(), 1.0);
}

TEST(ReduceLROnPlateau, NeverGoesBelowMinimum) {
  it::ReduceLROnPlateau s({.factor = 0.1, .patience = 0, .min_lr = 2e-4});
  double lr = s.step(1.0, 1e-3);
  lr = s.step(1.0, lr);
  EXPECT_DOUBLE_EQ(lr, 2e-4);
  lr = s.step(1.0, lr);
  EXPECT_DOUBLE_EQ(lr, 2e-4);
}

TEST(ReduceLROnPlateau, RestoredStateContinuesCounting) {
  it::ReduceLROnPlateau a;
  (void)a.step(1.0, 1e-3);
  (void)a.step(1.1, 1e-3);
  (void)a.step(1.2, 1e-3);

  it::ReduceLROnPlateau b;
  b.restore(a.state());
  EXPECT_DOUBLE_EQ(b.best(), 1.0);
  EXPECT_EQ(b.num_bad_epochs(), 2u);
  double lr = 1e-3;
  for (int i = 0; i < 3; ++i) lr = b.step(1.0, lr);
  EXPECT_DOUBLE_EQ(lr, 1e-3);
  lr = b.step(1.0, lr);
  EXPECT_DOUBLE_EQ(lr, 5e-4);
}
