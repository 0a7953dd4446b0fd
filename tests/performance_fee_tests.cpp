#include <gtest/gtest.h>
#include <memory>
#include "strategy/performance_fee.hpp"
#include "test_support.hpp"

// Fee 20%, global mark 10000, alice holds 5000 units of value
class PerformanceFeeTest : public ::testing::Test {
protected:
  void SetUp() override {
    StrategySeed seed = DefaultStrategySeed();
    seed.fee_bps = U256(2000);
    state = std::make_unique<StrategyState>(MakeStrategyState(seed, treasury));
    token.SetBalance(alice, U256(5000));
    fees = std::make_unique<PerformanceFeeAccountant>(*state, token);
  }

  InMemoryTokenLedger token;
  Address alice = TestAddress(0xa1);
  Address treasury = TestAddress(0xfee);
  std::unique_ptr<StrategyState> state;
  std::unique_ptr<PerformanceFeeAccountant> fees;
};

TEST_F(PerformanceFeeTest, NoSharesMeansNoFee) {
  token.SetSupply(U256(11000), U256(0));
  EXPECT_EQ(fees->PendingFee(alice), U256(0));
  EXPECT_FALSE(fees->Charge(alice).has_value());
}

TEST_F(PerformanceFeeTest, FeeOnGainAboveMark) {
  token.SetSupply(U256(11000), U256(10000));
  FeeQuote q = fees->Quote(alice);
  EXPECT_EQ(q.supply_per_share, U256(11000));
  EXPECT_EQ(q.reference_mark, U256(10000));
  // excess (1000 * 5000) / 10000 = 500, fee 500 * 2000 / 10000 = 100
  EXPECT_EQ(q.fee, U256(100));
}

TEST_F(PerformanceFeeTest, NoFeeAtOrBelowMark) {
  token.SetSupply(U256(10000), U256(10000));
  EXPECT_EQ(fees->PendingFee(alice), U256(0));
  token.SetSupply(U256(9000), U256(10000));
  EXPECT_EQ(fees->PendingFee(alice), U256(0));
}

TEST_F(PerformanceFeeTest, TinyGainsTruncateToZero) {
  token.SetBalance(alice, U256(1));
  token.SetSupply(U256(10001), U256(10000));
  EXPECT_EQ(fees->PendingFee(alice), U256(0));
}

TEST_F(PerformanceFeeTest, ChargeMovesFeeAndRaisesUserMark) {
  token.SetSupply(U256(11000), U256(10000));
  auto charge = fees->Charge(alice);
  ASSERT_TRUE(charge.has_value());
  EXPECT_EQ(charge->fee, U256(100));
  EXPECT_EQ(charge->previous_mark, U256(10000));
  EXPECT_EQ(charge->new_mark, U256(11000));
  EXPECT_EQ(token.BalanceOf(alice), U256(4900));
  EXPECT_EQ(token.BalanceOf(treasury), U256(100));
  EXPECT_EQ(fees->ReferenceMark(alice), U256(11000));
  EXPECT_EQ(state->global_high_water_mark, U256(10000));
  EXPECT_EQ(fees->PendingFee(alice), U256(0));
}

TEST_F(PerformanceFeeTest, UserMarkOverridesGlobal) {
  token.SetSupply(U256(11000), U256(10000));
  fees->Charge(alice);
  token.SetSupply(U256(12100), U256(10000));
  // (12100 - 11000) * 4900 / 10000 = 539, * 2000 / 10000 = 107
  EXPECT_EQ(fees->PendingFee(alice), U256(107));
}

TEST_F(PerformanceFeeTest, RefusedTransferLeavesEverythingUntouched) {
  token.SetSupply(U256(11000), U256(10000));
  token.SetTransfersFrozen(true);
  try {
    fees->Charge(alice);
    FAIL() << "charge succeeded with a refused transfer";
  } catch (const StrategyError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::kTransferFailed);
    EXPECT_EQ(e.Category(), ErrorCategory::kCollaborator);
  }
  EXPECT_EQ(token.BalanceOf(alice), U256(5000));
  EXPECT_EQ(token.BalanceOf(treasury), U256(0));
  EXPECT_TRUE(state->user_high_water_marks.empty());
  EXPECT_EQ(fees->PendingFee(alice), U256(100));
}

TEST_F(PerformanceFeeTest, GlobalMarkRefresh) {
  EXPECT_FALSE(fees->RefreshGlobalMark().has_value());
  EXPECT_EQ(state->global_high_water_mark, U256(10000));

  token.SetSupply(U256(9000), U256(10000));
  auto update = fees->RefreshGlobalMark();
  ASSERT_TRUE(update.has_value());
  EXPECT_EQ(update->previous_mark, U256(10000));
  EXPECT_EQ(update->new_mark, U256(9000));
  EXPECT_EQ(state->global_high_water_mark, U256(9000));
}

TEST_F(PerformanceFeeTest, ValidateFeeConfig) {
  EXPECT_NO_THROW(PerformanceFeeAccountant::Validate(PerformanceFeeConfig{U256(5000), treasury}));
  try {
    PerformanceFeeAccountant::Validate(PerformanceFeeConfig{U256(5001), treasury});
    FAIL();
  } catch (const StrategyError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::kInvalidFeeRate);
  }
  try {
    PerformanceFeeAccountant::Validate(PerformanceFeeConfig{U256(100), Address()});
    FAIL();
  } catch (const StrategyError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::kInvalidRecipient);
  }
}
