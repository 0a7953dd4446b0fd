#pragma once
#include <cstdint>
#include <optional>
#include "strategy/strategy_state.hpp"

class TokenLedger;

// Snapshot of one pending-fee computation.
struct FeeQuote {
  U256 fee;
  U256 supply_per_share;  // value per 10000 shares at quote time; 0 when there are no shares
  U256 reference_mark;
};

struct FeeCharge {
  U256 fee;
  U256 previous_mark;
  U256 new_mark;
};

struct MarkUpdate {
  U256 previous_mark;
  U256 new_mark;
};

// High-water-mark performance fee on gains in value per share.
class PerformanceFeeAccountant {
public:
  inline static constexpr std::uint32_t kMaxFeeBps = 5000;

  PerformanceFeeAccountant(StrategyState& state, TokenLedger& token) : state_(state), token_(token) {}

  FeeQuote Quote(const Address& user) const;
  U256 PendingFee(const Address& user) const { return Quote(user).fee; }
  // User override if set, else the global mark
  U256 ReferenceMark(const Address& user) const;
  // Transfers the pending fee to the recipient, then moves the user's mark.
  // nullopt when nothing is owed. A refused transfer throws kTransferFailed with no mark change.
  std::optional<FeeCharge> Charge(const Address& user);
  // nullopt (no change) when there are no shares
  std::optional<MarkUpdate> RefreshGlobalMark();

  static void Validate(const PerformanceFeeConfig& config);
private:
  StrategyState& state_;
  TokenLedger& token_;
};
