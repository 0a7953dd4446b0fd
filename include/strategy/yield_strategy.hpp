#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "strategy/effective_rate.hpp"
#include "strategy/lock_manager.hpp"
#include "strategy/performance_fee.hpp"
#include "strategy/strategy_state.hpp"
#include "telemetry/event_sink.hpp"

class Clock;
class TokenLedger;
class VaultView;

struct StrategyInfo {
  U256 rate;
  Tier tier = Tier::Bronze;
  U256 tier_bonus;
  bool is_locked = false;
  LockPeriod lock_period = LockPeriod::None;  // from the lock record, None without one
  U256 unlock_time;
  U256 effective_rate;
  U256 pending_fee;

  nlohmann::json ToJson() const;
};

// Public surface of the strategy engine. Every operation runs isolated under one mutex and
// either commits fully or throws StrategyError with state untouched.
class YieldStrategy {
public:
  YieldStrategy(StrategyState& state, VaultView& vault, TokenLedger& token, const Clock& clock, EventSink& events);

  U256 Rate() const;
  U256 UtilizationBps() const;
  void SetUtilizationConfig(const Address& caller, const U256& kink_bps, const U256& base_rate_bps,
                            const U256& low_slope, const U256& high_slope);
  RateCurveConfig GetUtilizationConfig() const;

  Tier TierOf(const Address& user) const;
  U256 TierBonus(const Address& user) const;
  void SetTierConfig(const Address& caller, Tier tier, const U256& min_deposit, const U256& bonus_bps);
  TierConfig GetTierConfig(Tier tier) const;

  UserLock LockDeposit(const Address& caller, LockPeriod period);
  UserLock UnlockDeposit(const Address& caller);
  std::optional<UserLock> LockOf(const Address& user) const;
  bool IsLocked(const Address& user) const;
  void SetLockConfig(const Address& caller, LockPeriod period, const U256& duration, const U256& bonus_multiplier_bps);
  LockPolicyConfig GetLockConfig(LockPeriod period) const;

  U256 PendingFee(const Address& user) const;
  void SetPerformanceFeeConfig(const Address& caller, const U256& fee_bps, const Address& recipient);
  PerformanceFeeConfig GetPerformanceFeeConfig() const;
  void UpdateGlobalHighWaterMark(const Address& caller);
  U256 GlobalHighWaterMark() const;
  U256 UserHighWaterMark(const Address& user) const;

  // Withdrawal hook, called by the vault before it releases funds: rejects a locked user,
  // then charges the performance fee against pre-withdrawal balances. Returns the fee charged.
  U256 PrepareWithdrawal(const Address& user);

  U256 EffectiveRate(const Address& user) const;
  StrategyInfo Info(const Address& user) const;
private:
  void RequireAuthorized(const Address& caller, const char* operation) const;
  U256 ChargeFee(const Address& user, std::uint64_t now);
  // Queues an event; DeliverEvents hands the queue to the sink after the operation commits
  void Publish(StrategyEvent event, std::uint64_t now);
  void DeliverEvents(std::unique_lock<std::mutex>& lock);
  template <typename Fn> auto Logged(const char* operation, Fn&& fn) -> decltype(fn());

  mutable std::mutex mutex_;
  StrategyState& state_;
  VaultView& vault_;
  const Clock& clock_;
  EventSink& events_;
  LockManager locks_;
  PerformanceFeeAccountant fees_;
  EffectiveRateCalculator rates_;
  std::vector<StrategyEvent> outbox_;
};
