#pragma once
#include <cstdint>
#include "strategy/strategy_state.hpp"

class VaultView;
class LockManager;

// Rate a user actually earns: the frozen lock bonus while locked, base + tier bonus otherwise.
class EffectiveRateCalculator {
public:
  EffectiveRateCalculator(const StrategyState& state, const VaultView& vault, const LockManager& locks)
    : state_(state), vault_(vault), locks_(locks) {}

  U256 BaseRate() const;
  U256 UtilizationBps() const;
  Tier TierOf(const Address& user) const;
  U256 TierBonus(const Address& user) const;
  U256 EffectiveRate(const Address& user, std::uint64_t now) const;
private:
  const StrategyState& state_;
  const VaultView& vault_;
  const LockManager& locks_;
};
