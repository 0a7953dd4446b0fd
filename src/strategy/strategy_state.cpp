#include "strategy/strategy_state.hpp"
#include "strategy/rate_model.hpp"
#include "strategy/tier_classifier.hpp"
#include "strategy/lock_manager.hpp"
#include "strategy/performance_fee.hpp"
#include "common/logger.hpp"

static constexpr std::uint64_t kDay = 24ULL * 60 * 60;

StrategySeed DefaultStrategySeed() {
  return StrategySeed{
    RateCurveConfig{U256(8000), U256(200), U256(5), U256(50)},
    TierTable{
      {Tier::Bronze, TierConfig{U256(0), U256(0)}},
      {Tier::Silver, TierConfig{Ether(10), U256(50)}},
      {Tier::Gold, TierConfig{Ether(50), U256(100)}},
      {Tier::Platinum, TierConfig{Ether(200), U256(200)}},
      {Tier::Diamond, TierConfig{Ether(1000), U256(300)}},
    },
    LockPolicyTable{
      {LockPeriod::None, LockPolicyConfig{U256(0), U256(10000)}},
      {LockPeriod::ThirtyDays, LockPolicyConfig{U256(30 * kDay), U256(11000)}},
      {LockPeriod::NinetyDays, LockPolicyConfig{U256(90 * kDay), U256(12500)}},
      {LockPeriod::OneEightyDays, LockPolicyConfig{U256(180 * kDay), U256(15000)}},
      {LockPeriod::ThreeSixtyFiveDays, LockPolicyConfig{U256(365 * kDay), U256(20000)}},
    },
    U256(1000),
    std::nullopt,
    U256(BasisPoints::kScale),
  };
}

StrategyState MakeStrategyState(const StrategySeed& seed, const Address& vault_fee_recipient) {
  UtilizationRateModel::Validate(seed.curve);
  for (std::size_t i = 0; i < kTierCount; ++i) {
    TierClassifier::Validate(seed.tiers.At(static_cast<Tier>(i)));
  }
  if (!TierClassifier::IsMonotonic(seed.tiers)) {
    Logger::Warning("seeded tier ladder is not strictly increasing", __FILE__, __LINE__);
  }
  for (std::size_t i = 0; i < kLockPeriodCount; ++i) {
    LockManager::Validate(seed.lock_policies.At(static_cast<LockPeriod>(i)));
  }
  PerformanceFeeConfig fee{seed.fee_bps, seed.fee_recipient.value_or(vault_fee_recipient)};
  PerformanceFeeAccountant::Validate(fee);
  return StrategyState{seed.curve, seed.tiers, seed.lock_policies, fee, seed.initial_high_water_mark, {}, {}};
}
