#pragma once
#include <optional>
#include <unordered_map>
#include "strategy/types.hpp"

// Configuration a strategy starts from. Tables are exhaustive by construction.
struct StrategySeed {
  RateCurveConfig curve;
  TierTable tiers;
  LockPolicyTable lock_policies;
  U256 fee_bps;
  std::optional<Address> fee_recipient;  // unset: take the vault's fee recipient
  U256 initial_high_water_mark;
};

StrategySeed DefaultStrategySeed();

// Every mutable record of the strategy. Owned by the host and passed by reference to the components.
struct StrategyState {
  RateCurveConfig curve;
  TierTable tiers;
  LockPolicyTable lock_policies;
  PerformanceFeeConfig fee;
  U256 global_high_water_mark;  // value per 10000 shares
  std::unordered_map<Address, U256> user_high_water_marks;
  std::unordered_map<Address, UserLock> locks;
};

// Validates every seeded value with the same rules as the authorized setters
StrategyState MakeStrategyState(const StrategySeed& seed, const Address& vault_fee_recipient);
