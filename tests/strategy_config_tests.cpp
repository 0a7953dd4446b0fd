#include <gtest/gtest.h>
#include <fstream>
#include "common/config_manager.hpp"
#include "config/strategy_config.hpp"
#include "test_support.hpp"

class StrategyConfigTest : public ::testing::Test {
protected:
  void SetUp() override { ConfigManager::Clear(); }
  void TearDown() override { ConfigManager::Clear(); }

  static ErrorKind LoadErrorKind() {
    try {
      LoadStrategySeed();
    } catch (const StrategyError& e) {
      return e.Kind();
    }
    ADD_FAILURE() << "seed loaded";
    return ErrorKind::kUnauthorized;
  }
};

TEST_F(StrategyConfigTest, EmptyConfigYieldsDefaults) {
  StrategySeed seed = LoadStrategySeed();
  EXPECT_EQ(seed.curve.kink_bps, U256(8000));
  EXPECT_EQ(seed.curve.base_rate_bps, U256(200));
  EXPECT_EQ(seed.curve.low_slope, U256(5));
  EXPECT_EQ(seed.curve.high_slope, U256(50));
  EXPECT_EQ(seed.tiers.At(Tier::Diamond).min_deposit, Ether(1000));
  EXPECT_EQ(seed.lock_policies.At(LockPeriod::ThreeSixtyFiveDays).duration, U256(365 * kDaySeconds));
  EXPECT_EQ(seed.fee_bps, U256(1000));
  EXPECT_FALSE(seed.fee_recipient.has_value());
  EXPECT_EQ(seed.initial_high_water_mark, U256(10000));
}

TEST_F(StrategyConfigTest, OverridesApply) {
  ConfigManager::Set("RATE_KINK_BPS", "7000");
  ConfigManager::Set("RATE_HIGH_SLOPE", "75");
  ConfigManager::Set("TIER_CONFIG", "gold:40ether:150,4:2000ether:400");
  ConfigManager::Set("LOCK_CONFIG", "NinetyDays:100:13000");
  ConfigManager::Set("PERF_FEE_BPS", "1500");
  ConfigManager::Set("FEE_RECIPIENT", "0x00000000000000000000000000000000000000fe");
  ConfigManager::Set("INITIAL_HIGH_WATER_MARK", "12000");

  StrategySeed seed = LoadStrategySeed();
  EXPECT_EQ(seed.curve.kink_bps, U256(7000));
  EXPECT_EQ(seed.curve.base_rate_bps, U256(200));
  EXPECT_EQ(seed.curve.high_slope, U256(75));
  EXPECT_EQ(seed.tiers.At(Tier::Gold).min_deposit, Ether(40));
  EXPECT_EQ(seed.tiers.At(Tier::Gold).bonus_bps, U256(150));
  EXPECT_EQ(seed.tiers.At(Tier::Diamond).min_deposit, Ether(2000));
  EXPECT_EQ(seed.tiers.At(Tier::Silver).min_deposit, Ether(10));
  EXPECT_EQ(seed.lock_policies.At(LockPeriod::NinetyDays).duration, U256(100));
  EXPECT_EQ(seed.lock_policies.At(LockPeriod::NinetyDays).bonus_multiplier_bps, U256(13000));
  EXPECT_EQ(seed.fee_bps, U256(1500));
  ASSERT_TRUE(seed.fee_recipient.has_value());
  EXPECT_EQ(*seed.fee_recipient, TestAddress(0xfe));
  EXPECT_EQ(seed.initial_high_water_mark, U256(12000));

  StrategyState state = MakeStrategyState(seed, TestAddress(0x1));
  EXPECT_EQ(state.fee.recipient, TestAddress(0xfe));
  EXPECT_EQ(state.global_high_water_mark, U256(12000));
}

TEST_F(StrategyConfigTest, MalformedEntriesAreRejected) {
  ConfigManager::Set("TIER_CONFIG", "gold:40");
  EXPECT_EQ(LoadErrorKind(), ErrorKind::kInvalidConfig);
  ConfigManager::Set("TIER_CONFIG", "mithril:1:1");
  EXPECT_EQ(LoadErrorKind(), ErrorKind::kInvalidConfig);
  ConfigManager::Set("TIER_CONFIG", "gold:lots:1");
  EXPECT_EQ(LoadErrorKind(), ErrorKind::kInvalidConfig);
  ConfigManager::Clear();
  ConfigManager::Set("RATE_KINK_BPS", "abc");
  EXPECT_EQ(LoadErrorKind(), ErrorKind::kInvalidConfig);
  ConfigManager::Clear();
  ConfigManager::Set("FEE_RECIPIENT", "treasury");
  EXPECT_EQ(LoadErrorKind(), ErrorKind::kInvalidConfig);
}

TEST_F(StrategyConfigTest, SeedRangesAreValidated) {
  StrategySeed seed = DefaultStrategySeed();
  seed.curve.kink_bps = U256(10001);
  EXPECT_THROW(MakeStrategyState(seed, TestAddress(0x1)), StrategyError);

  seed = DefaultStrategySeed();
  seed.tiers.At(Tier::Gold).bonus_bps = U256(2000);
  EXPECT_THROW(MakeStrategyState(seed, TestAddress(0x1)), StrategyError);

  seed = DefaultStrategySeed();
  seed.lock_policies.At(LockPeriod::ThirtyDays).bonus_multiplier_bps = U256(5000);
  EXPECT_THROW(MakeStrategyState(seed, TestAddress(0x1)), StrategyError);

  try {
    MakeStrategyState(DefaultStrategySeed(), Address());
    FAIL() << "null fee recipient accepted";
  } catch (const StrategyError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::kInvalidRecipient);
  }
}

TEST_F(StrategyConfigTest, RuntimeConfigAndEnvFile) {
  const std::string path = ::testing::TempDir() + "strategy_config_test.env";
  {
    std::ofstream env(path);
    env << "# comment\n"
        << "LOG_LEVEL = debug\n"
        << "EVENT_JOURNAL=events.jsonl\n"
        << "\n"
        << "PERF_FEE_BPS=300\n";
  }
  ConfigManager::Initialize(path);
  RuntimeConfig runtime = LoadRuntimeConfig();
  EXPECT_EQ(runtime.log_level, LogLevel::DEBUG);
  EXPECT_EQ(runtime.event_journal, "events.jsonl");
  EXPECT_EQ(runtime.log_file, "strategy.log");
  EXPECT_EQ(LoadStrategySeed().fee_bps, U256(300));
}

TEST(LogLevelTest, ParsesNamesWithFallback) {
  EXPECT_EQ(ParseLogLevel("WARN"), LogLevel::WARNING);
  EXPECT_EQ(ParseLogLevel("Critical"), LogLevel::CRITICAL);
  EXPECT_EQ(ParseLogLevel("chatty", LogLevel::ERROR), LogLevel::ERROR);
}
