#include <gtest/gtest.h>
#include "strategy/rate_model.hpp"
#include "strategy/strategy_state.hpp"

static RateCurveConfig SeedCurve() { return DefaultStrategySeed().curve; }

TEST(UtilizationRateModelTest, CapacityLessVaultPaysBaseRate) {
  EXPECT_EQ(UtilizationRateModel::Rate(U256(0), U256(500), SeedCurve()), U256(200));
  EXPECT_EQ(UtilizationRateModel::UtilizationBps(U256(0), U256(500)), U256(0));
}

TEST(UtilizationRateModelTest, EmptyVaultPaysBaseRate) {
  EXPECT_EQ(UtilizationRateModel::Rate(U256(1000), U256(0), SeedCurve()), U256(200));
}

TEST(UtilizationRateModelTest, LowBranchTruncatesToWholePercent) {
  // 799 bps -> 7 whole percent
  EXPECT_EQ(UtilizationRateModel::Rate(U256(10000), U256(799), SeedCurve()), U256(200 + 7 * 5));
  EXPECT_EQ(UtilizationRateModel::Rate(U256(10000), U256(800), SeedCurve()), U256(200 + 8 * 5));
}

TEST(UtilizationRateModelTest, BranchesMeetAtKink) {
  EXPECT_EQ(UtilizationRateModel::Rate(U256(10000), U256(8000), SeedCurve()), U256(600));
  EXPECT_EQ(UtilizationRateModel::Rate(U256(10000), U256(8099), SeedCurve()), U256(600));
  EXPECT_EQ(UtilizationRateModel::Rate(U256(10000), U256(8100), SeedCurve()), U256(650));
  EXPECT_EQ(UtilizationRateModel::Rate(U256(10000), U256(10000), SeedCurve()), U256(600 + 20 * 50));
}

TEST(UtilizationRateModelTest, UtilizationTruncates) {
  EXPECT_EQ(UtilizationRateModel::UtilizationBps(U256(3), U256(1)), U256(3333));
  EXPECT_EQ(UtilizationRateModel::UtilizationBps(Ether(1000), Ether(50)), U256(500));
}

TEST(UtilizationRateModelTest, NonDecreasingInDeposits) {
  const U256 capacity(1000);
  U256 previous = UtilizationRateModel::Rate(capacity, U256(0), SeedCurve());
  for (unsigned d = 1; d <= 1000; ++d) {
    U256 r = UtilizationRateModel::Rate(capacity, U256(d), SeedCurve());
    ASSERT_GE(r, previous) << "deposited=" << d;
    previous = r;
  }
}

TEST(UtilizationRateModelTest, RateIsNotCapped) {
  RateCurveConfig steep{U256(8000), U256(200), U256(5), U256(1000)};
  EXPECT_EQ(UtilizationRateModel::Rate(U256(100), U256(100), steep), U256(600 + 20 * 1000));
}

TEST(UtilizationRateModelTest, ValidateBounds) {
  EXPECT_NO_THROW(UtilizationRateModel::Validate(RateCurveConfig{U256(10000), U256(10000), U256(0), U256(0)}));
  try {
    UtilizationRateModel::Validate(RateCurveConfig{U256(10001), U256(200), U256(5), U256(50)});
    FAIL() << "kink above 10000 accepted";
  } catch (const StrategyError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::kInvalidKink);
  }
  try {
    UtilizationRateModel::Validate(RateCurveConfig{U256(8000), U256(10001), U256(5), U256(50)});
    FAIL() << "base rate above 10000 accepted";
  } catch (const StrategyError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::kInvalidBaseRate);
  }
}
