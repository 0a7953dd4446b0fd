#pragma once
#include "strategy/types.hpp"

class TierClassifier {
public:
  inline static constexpr std::uint32_t kMaxBonusBps = 1000;

  // Highest tier whose minimum the deposit meets; Bronze when none does
  static Tier TierOf(const U256& cumulative_deposit, const TierTable& tiers);
  static U256 BonusOf(Tier tier, const TierTable& tiers) { return tiers.At(tier).bonus_bps; }
  static void Validate(const TierConfig& config);
  // True when minimum deposits strictly increase with the tier ordinal
  static bool IsMonotonic(const TierTable& tiers);
};
