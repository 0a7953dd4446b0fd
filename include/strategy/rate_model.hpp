#pragma once
#include "strategy/types.hpp"

// Kinked piecewise-linear base rate over deposited/capacity utilization.
class UtilizationRateModel {
public:
  // deposited * 10000 / capacity; 0 for a capacity-less vault
  static U256 UtilizationBps(const U256& capacity, const U256& deposited);
  // Base rate in bps. Not capped: steep slopes can exceed 10000.
  static U256 Rate(const U256& capacity, const U256& deposited, const RateCurveConfig& curve);
  // kink and base rate must be <= 10000 bps
  static void Validate(const RateCurveConfig& curve);
};
