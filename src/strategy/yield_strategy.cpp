#include "strategy/yield_strategy.hpp"
#include "strategy/rate_model.hpp"
#include "strategy/tier_classifier.hpp"
#include "common/clock.hpp"
#include "common/logger.hpp"
#include "telemetry/event_sink.hpp"
#include "vault/collaborators.hpp"

nlohmann::json StrategyInfo::ToJson() const {
  return nlohmann::json{
    {"rate", ToDecimal(rate)},
    {"tier", TierName(tier)},
    {"tierBonus", ToDecimal(tier_bonus)},
    {"isLocked", is_locked},
    {"lockPeriod", LockPeriodName(lock_period)},
    {"unlockTime", ToDecimal(unlock_time)},
    {"effectiveRate", ToDecimal(effective_rate)},
    {"pendingFee", ToDecimal(pending_fee)},
  };
}

YieldStrategy::YieldStrategy(StrategyState& state, VaultView& vault, TokenLedger& token, const Clock& clock,
                             EventSink& events)
  : state_(state), vault_(vault), clock_(clock), events_(events),
    locks_(state, vault), fees_(state, token), rates_(state, vault, locks_) {}

template <typename Fn>
auto YieldStrategy::Logged(const char* operation, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const StrategyError& e) {
    Logger::Warning(std::string(operation) + " rejected: " + e.what(), __FILE__, __LINE__);
    throw;
  }
}

void YieldStrategy::RequireAuthorized(const Address& caller, const char* operation) const {
  if (!vault_.IsAuthorized(caller)) {
    throw StrategyError(ErrorKind::kUnauthorized, caller.Hex() + " may not call " + operation);
  }
}

void YieldStrategy::Publish(StrategyEvent event, std::uint64_t now) {
  event.timestamp = now;
  outbox_.push_back(std::move(event));
}

// Sinks run without the engine lock held, so they may query the engine back.
void YieldStrategy::DeliverEvents(std::unique_lock<std::mutex>& lock) {
  std::vector<StrategyEvent> committed;
  committed.swap(outbox_);
  lock.unlock();
  for (const auto& event : committed) events_.Publish(event);
}

U256 YieldStrategy::Rate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rates_.BaseRate();
}

U256 YieldStrategy::UtilizationBps() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rates_.UtilizationBps();
}

void YieldStrategy::SetUtilizationConfig(const Address& caller, const U256& kink_bps, const U256& base_rate_bps,
                                         const U256& low_slope, const U256& high_slope) {
  std::unique_lock<std::mutex> lock(mutex_);
  Logged("SetUtilizationConfig", [&] {
    RequireAuthorized(caller, "SetUtilizationConfig");
    RateCurveConfig next{kink_bps, base_rate_bps, low_slope, high_slope};
    UtilizationRateModel::Validate(next);
    RateCurveConfig previous = state_.curve;
    state_.curve = next;
    Logger::Info("rate curve set: kink=" + ToDecimal(kink_bps) + " base=" + ToDecimal(base_rate_bps) +
                 " low=" + ToDecimal(low_slope) + " high=" + ToDecimal(high_slope), __FILE__, __LINE__);
    StrategyEvent ev;
    ev.name = "UtilizationConfigUpdated";
    ev.signature = "UtilizationConfigUpdated(uint256,uint256,uint256,uint256)";
    ev.fields = {
      {"previous", {{"kinkBps", ToDecimal(previous.kink_bps)}, {"baseRateBps", ToDecimal(previous.base_rate_bps)},
                    {"lowSlope", ToDecimal(previous.low_slope)}, {"highSlope", ToDecimal(previous.high_slope)}}},
      {"current", {{"kinkBps", ToDecimal(next.kink_bps)}, {"baseRateBps", ToDecimal(next.base_rate_bps)},
                   {"lowSlope", ToDecimal(next.low_slope)}, {"highSlope", ToDecimal(next.high_slope)}}},
    };
    Publish(std::move(ev), clock_.Now());
  });
  DeliverEvents(lock);
}

RateCurveConfig YieldStrategy::GetUtilizationConfig() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.curve;
}

Tier YieldStrategy::TierOf(const Address& user) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rates_.TierOf(user);
}

U256 YieldStrategy::TierBonus(const Address& user) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rates_.TierBonus(user);
}

void YieldStrategy::SetTierConfig(const Address& caller, Tier tier, const U256& min_deposit, const U256& bonus_bps) {
  std::unique_lock<std::mutex> lock(mutex_);
  Logged("SetTierConfig", [&] {
    RequireAuthorized(caller, "SetTierConfig");
    TierConfig next{min_deposit, bonus_bps};
    TierClassifier::Validate(next);
    TierConfig previous = state_.tiers.At(tier);
    state_.tiers.At(tier) = next;
    Logger::Info(std::string("tier ") + TierName(tier) + " set: min=" + ToDecimal(min_deposit) +
                 " bonus=" + ToDecimal(bonus_bps), __FILE__, __LINE__);
    if (!TierClassifier::IsMonotonic(state_.tiers)) {
      Logger::Warning("tier ladder is no longer strictly increasing after setting " + std::string(TierName(tier)),
                      __FILE__, __LINE__);
    }
    StrategyEvent ev;
    ev.name = "TierConfigUpdated";
    ev.signature = "TierConfigUpdated(uint8,uint256,uint256)";
    ev.fields = {
      {"tier", TierName(tier)},
      {"previous", {{"minDeposit", ToDecimal(previous.min_deposit)}, {"bonusBps", ToDecimal(previous.bonus_bps)}}},
      {"current", {{"minDeposit", ToDecimal(next.min_deposit)}, {"bonusBps", ToDecimal(next.bonus_bps)}}},
    };
    Publish(std::move(ev), clock_.Now());
  });
  DeliverEvents(lock);
}

TierConfig YieldStrategy::GetTierConfig(Tier tier) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.tiers.At(tier);
}

UserLock YieldStrategy::LockDeposit(const Address& caller, LockPeriod period) {
  std::unique_lock<std::mutex> lock(mutex_);
  UserLock result = Logged("LockDeposit", [&] {
    std::uint64_t now = clock_.Now();
    UserLock created = locks_.Lock(caller, period, now);
    Logger::Info("lock created for " + caller.ToChecksum() + ": amount=" + ToDecimal(created.amount) +
                 " period=" + LockPeriodName(period) + " bonus=" + ToDecimal(created.bonus_rate), __FILE__, __LINE__);
    StrategyEvent ev;
    ev.name = "LockCreated";
    ev.signature = "LockCreated(address,uint256,uint256,uint8,uint256)";
    ev.fields = {
      {"user", caller.ToChecksum()},
      {"amount", ToDecimal(created.amount)},
      {"unlockTime", ToDecimal(created.unlock_time)},
      {"period", LockPeriodName(created.period)},
      {"bonusRate", ToDecimal(created.bonus_rate)},
    };
    Publish(std::move(ev), now);
    return created;
  });
  DeliverEvents(lock);
  return result;
}

UserLock YieldStrategy::UnlockDeposit(const Address& caller) {
  std::unique_lock<std::mutex> lock(mutex_);
  UserLock result = Logged("UnlockDeposit", [&] {
    std::uint64_t now = clock_.Now();
    UserLock released = locks_.Unlock(caller, now);
    Logger::Info("lock released for " + caller.ToChecksum() + ": amount=" + ToDecimal(released.amount),
                 __FILE__, __LINE__);
    StrategyEvent ev;
    ev.name = "LockReleased";
    ev.signature = "LockReleased(address,uint256)";
    ev.fields = {{"user", caller.ToChecksum()}, {"amount", ToDecimal(released.amount)}};
    Publish(std::move(ev), now);
    return released;
  });
  DeliverEvents(lock);
  return result;
}

std::optional<UserLock> YieldStrategy::LockOf(const Address& user) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return locks_.LockOf(user);
}

bool YieldStrategy::IsLocked(const Address& user) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return locks_.IsLocked(user, clock_.Now());
}

void YieldStrategy::SetLockConfig(const Address& caller, LockPeriod period, const U256& duration,
                                  const U256& bonus_multiplier_bps) {
  std::unique_lock<std::mutex> lock(mutex_);
  Logged("SetLockConfig", [&] {
    RequireAuthorized(caller, "SetLockConfig");
    LockPolicyConfig next{duration, bonus_multiplier_bps};
    LockManager::Validate(next);
    LockPolicyConfig previous = state_.lock_policies.At(period);
    state_.lock_policies.At(period) = next;
    Logger::Info(std::string("lock policy ") + LockPeriodName(period) + " set: duration=" + ToDecimal(duration) +
                 " multiplier=" + ToDecimal(bonus_multiplier_bps), __FILE__, __LINE__);
    StrategyEvent ev;
    ev.name = "LockConfigUpdated";
    ev.signature = "LockConfigUpdated(uint8,uint256,uint256)";
    ev.fields = {
      {"period", LockPeriodName(period)},
      {"previous", {{"duration", ToDecimal(previous.duration)},
                    {"bonusMultiplierBps", ToDecimal(previous.bonus_multiplier_bps)}}},
      {"current", {{"duration", ToDecimal(next.duration)},
                   {"bonusMultiplierBps", ToDecimal(next.bonus_multiplier_bps)}}},
    };
    Publish(std::move(ev), clock_.Now());
  });
  DeliverEvents(lock);
}

LockPolicyConfig YieldStrategy::GetLockConfig(LockPeriod period) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.lock_policies.At(period);
}

U256 YieldStrategy::PendingFee(const Address& user) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fees_.PendingFee(user);
}

void YieldStrategy::SetPerformanceFeeConfig(const Address& caller, const U256& fee_bps, const Address& recipient) {
  std::unique_lock<std::mutex> lock(mutex_);
  Logged("SetPerformanceFeeConfig", [&] {
    RequireAuthorized(caller, "SetPerformanceFeeConfig");
    PerformanceFeeConfig next{fee_bps, recipient};
    PerformanceFeeAccountant::Validate(next);
    PerformanceFeeConfig previous = state_.fee;
    state_.fee = next;
    Logger::Info("performance fee set: bps=" + ToDecimal(fee_bps) + " recipient=" + recipient.ToChecksum(),
                 __FILE__, __LINE__);
    StrategyEvent ev;
    ev.name = "PerformanceFeeConfigUpdated";
    ev.signature = "PerformanceFeeConfigUpdated(uint256,address)";
    ev.fields = {
      {"previous", {{"feeBps", ToDecimal(previous.fee_bps)}, {"recipient", previous.recipient.ToChecksum()}}},
      {"current", {{"feeBps", ToDecimal(next.fee_bps)}, {"recipient", next.recipient.ToChecksum()}}},
    };
    Publish(std::move(ev), clock_.Now());
  });
  DeliverEvents(lock);
}

PerformanceFeeConfig YieldStrategy::GetPerformanceFeeConfig() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.fee;
}

void YieldStrategy::UpdateGlobalHighWaterMark(const Address& caller) {
  std::unique_lock<std::mutex> lock(mutex_);
  Logged("UpdateGlobalHighWaterMark", [&] {
    RequireAuthorized(caller, "UpdateGlobalHighWaterMark");
    auto update = fees_.RefreshGlobalMark();
    if (!update) {
      Logger::Debug("global high-water mark unchanged: no shares outstanding", __FILE__, __LINE__);
      return;
    }
    if (update->new_mark < update->previous_mark) {
      Logger::Warning("global high-water mark decreased from " + ToDecimal(update->previous_mark) + " to " +
                      ToDecimal(update->new_mark), __FILE__, __LINE__);
    }
    StrategyEvent ev;
    ev.name = "HighWaterMarkUpdated";
    ev.signature = "HighWaterMarkUpdated(uint256,uint256)";
    ev.fields = {{"previousMark", ToDecimal(update->previous_mark)}, {"newMark", ToDecimal(update->new_mark)}};
    Publish(std::move(ev), clock_.Now());
  });
  DeliverEvents(lock);
}

U256 YieldStrategy::GlobalHighWaterMark() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.global_high_water_mark;
}

U256 YieldStrategy::UserHighWaterMark(const Address& user) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fees_.ReferenceMark(user);
}

U256 YieldStrategy::ChargeFee(const Address& user, std::uint64_t now) {
  auto charge = fees_.Charge(user);
  if (!charge) return U256(0);
  Logger::Info("performance fee " + ToDecimal(charge->fee) + " charged to " + user.ToChecksum() +
               ", mark " + ToDecimal(charge->previous_mark) + " -> " + ToDecimal(charge->new_mark), __FILE__, __LINE__);
  StrategyEvent ev;
  ev.name = "PerformanceFeeCharged";
  ev.signature = "PerformanceFeeCharged(address,uint256,uint256)";
  ev.fields = {
    {"user", user.ToChecksum()},
    {"fee", ToDecimal(charge->fee)},
    {"previousMark", ToDecimal(charge->previous_mark)},
    {"newMark", ToDecimal(charge->new_mark)},
    {"recipient", state_.fee.recipient.ToChecksum()},
  };
  Publish(std::move(ev), now);
  return charge->fee;
}

U256 YieldStrategy::PrepareWithdrawal(const Address& user) {
  std::unique_lock<std::mutex> lock(mutex_);
  U256 result = Logged("PrepareWithdrawal", [&] {
    std::uint64_t now = clock_.Now();
    if (locks_.IsLocked(user, now)) {
      throw StrategyError(ErrorKind::kWithdrawalLocked,
                          "user " + user.Hex() + " is locked until " + ToDecimal(locks_.LockOf(user)->unlock_time));
    }
    return ChargeFee(user, now);
  });
  DeliverEvents(lock);
  return result;
}

U256 YieldStrategy::EffectiveRate(const Address& user) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rates_.EffectiveRate(user, clock_.Now());
}

StrategyInfo YieldStrategy::Info(const Address& user) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::uint64_t now = clock_.Now();
  StrategyInfo info;
  info.rate = rates_.BaseRate();
  info.tier = rates_.TierOf(user);
  info.tier_bonus = TierClassifier::BonusOf(info.tier, state_.tiers);
  info.is_locked = locks_.IsLocked(user, now);
  if (auto record = locks_.LockOf(user)) {
    info.lock_period = record->period;
    info.unlock_time = record->unlock_time;
  }
  info.effective_rate = rates_.EffectiveRate(user, now);
  info.pending_fee = fees_.PendingFee(user);
  return info;
}
