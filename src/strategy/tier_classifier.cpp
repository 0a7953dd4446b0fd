#include "strategy/tier_classifier.hpp"

Tier TierClassifier::TierOf(const U256& cumulative_deposit, const TierTable& tiers) {
  for (std::size_t i = kTierCount; i-- > 0;) {
    Tier t = static_cast<Tier>(i);
    if (cumulative_deposit >= tiers.At(t).min_deposit) return t;
  }
  return Tier::Bronze;
}

void TierClassifier::Validate(const TierConfig& config) {
  if (config.bonus_bps > kMaxBonusBps) {
    throw StrategyError(ErrorKind::kInvalidTierBonus, "tier bonus " + ToDecimal(config.bonus_bps) + " bps exceeds 1000");
  }
}

bool TierClassifier::IsMonotonic(const TierTable& tiers) {
  for (std::size_t i = 1; i < kTierCount; ++i) {
    if (tiers.At(static_cast<Tier>(i)).min_deposit <= tiers.At(static_cast<Tier>(i - 1)).min_deposit) return false;
  }
  return true;
}
