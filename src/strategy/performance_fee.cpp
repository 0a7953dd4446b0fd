#include "strategy/performance_fee.hpp"
#include "vault/collaborators.hpp"

FeeQuote PerformanceFeeAccountant::Quote(const Address& user) const {
  FeeQuote q;
  q.reference_mark = ReferenceMark(user);
  U256 shares = token_.TotalShares();
  if (shares == 0) return q;
  q.supply_per_share = BasisPoints::Ratio(token_.TotalSupply(), shares);
  if (q.supply_per_share > q.reference_mark) {
    U256 excess_return = BasisPoints::Apply(q.supply_per_share - q.reference_mark, token_.BalanceOf(user));
    q.fee = BasisPoints::Apply(excess_return, state_.fee.fee_bps);
  }
  return q;
}

U256 PerformanceFeeAccountant::ReferenceMark(const Address& user) const {
  auto it = state_.user_high_water_marks.find(user);
  return it != state_.user_high_water_marks.end() ? it->second : state_.global_high_water_mark;
}

std::optional<FeeCharge> PerformanceFeeAccountant::Charge(const Address& user) {
  // The new mark comes from the same supply/shares read as the fee itself
  FeeQuote q = Quote(user);
  if (q.fee == 0) return std::nullopt;
  if (!token_.TransferValue(user, state_.fee.recipient, q.fee)) {
    throw StrategyError(ErrorKind::kTransferFailed,
                        "fee transfer of " + ToDecimal(q.fee) + " from " + user.Hex() + " refused");
  }
  state_.user_high_water_marks[user] = q.supply_per_share;
  return FeeCharge{q.fee, q.reference_mark, q.supply_per_share};
}

std::optional<MarkUpdate> PerformanceFeeAccountant::RefreshGlobalMark() {
  U256 shares = token_.TotalShares();
  if (shares == 0) return std::nullopt;
  MarkUpdate update{state_.global_high_water_mark, BasisPoints::Ratio(token_.TotalSupply(), shares)};
  state_.global_high_water_mark = update.new_mark;
  return update;
}

void PerformanceFeeAccountant::Validate(const PerformanceFeeConfig& config) {
  if (config.fee_bps > kMaxFeeBps) {
    throw StrategyError(ErrorKind::kInvalidFeeRate, "fee " + ToDecimal(config.fee_bps) + " bps exceeds 5000");
  }
  if (config.recipient.IsZero()) {
    throw StrategyError(ErrorKind::kInvalidRecipient, "fee recipient is the null address");
  }
}
