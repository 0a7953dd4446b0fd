#include "strategy/rate_model.hpp"

U256 UtilizationRateModel::UtilizationBps(const U256& capacity, const U256& deposited) {
  if (capacity == 0) return U256(0);
  return BasisPoints::Ratio(deposited, capacity);
}

U256 UtilizationRateModel::Rate(const U256& capacity, const U256& deposited, const RateCurveConfig& curve) {
  if (capacity == 0) return curve.base_rate_bps;
  U256 utilization = UtilizationBps(capacity, deposited);
  if (utilization <= curve.kink_bps) {
    return curve.base_rate_bps + BasisPoints::WholePercent(utilization) * curve.low_slope;
  }
  // Both segments truncate to whole percents independently
  U256 kink_rate = curve.base_rate_bps + BasisPoints::WholePercent(curve.kink_bps) * curve.low_slope;
  U256 excess_percent = BasisPoints::WholePercent(utilization - curve.kink_bps);
  return kink_rate + excess_percent * curve.high_slope;
}

void UtilizationRateModel::Validate(const RateCurveConfig& curve) {
  if (curve.kink_bps > BasisPoints::kScale) {
    throw StrategyError(ErrorKind::kInvalidKink, "kink " + ToDecimal(curve.kink_bps) + " bps exceeds 10000");
  }
  if (curve.base_rate_bps > BasisPoints::kScale) {
    throw StrategyError(ErrorKind::kInvalidBaseRate, "base rate " + ToDecimal(curve.base_rate_bps) + " bps exceeds 10000");
  }
}
