#include "strategy/effective_rate.hpp"
#include "strategy/lock_manager.hpp"
#include "strategy/rate_model.hpp"
#include "strategy/tier_classifier.hpp"
#include "vault/collaborators.hpp"

U256 EffectiveRateCalculator::BaseRate() const {
  return UtilizationRateModel::Rate(vault_.MaxCapacity(), vault_.TotalDeposited(), state_.curve);
}

U256 EffectiveRateCalculator::UtilizationBps() const {
  return UtilizationRateModel::UtilizationBps(vault_.MaxCapacity(), vault_.TotalDeposited());
}

Tier EffectiveRateCalculator::TierOf(const Address& user) const {
  return TierClassifier::TierOf(vault_.UserDeposit(user), state_.tiers);
}

U256 EffectiveRateCalculator::TierBonus(const Address& user) const {
  return TierClassifier::BonusOf(TierOf(user), state_.tiers);
}

U256 EffectiveRateCalculator::EffectiveRate(const Address& user, std::uint64_t now) const {
  if (locks_.IsLocked(user, now)) return locks_.LockOf(user)->bonus_rate;
  return BaseRate() + TierBonus(user);
}
