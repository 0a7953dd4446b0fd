#include "strategy/lock_manager.hpp"
#include "strategy/rate_model.hpp"
#include "strategy/tier_classifier.hpp"
#include "vault/collaborators.hpp"

UserLock LockManager::Lock(const Address& user, LockPeriod period, std::uint64_t now) {
  if (state_.locks.count(user) != 0) {
    throw StrategyError(ErrorKind::kLockAlreadyExists, "user " + user.Hex() + " already has a lock record");
  }
  U256 amount = vault_.UserDeposit(user);
  if (amount == 0) {
    throw StrategyError(ErrorKind::kInsufficientBalance, "user " + user.Hex() + " has no deposit to lock");
  }
  const LockPolicyConfig& policy = state_.lock_policies.At(period);
  UserLock lock;
  lock.amount = amount;
  lock.unlock_time = U256(now) + policy.duration;
  lock.period = period;
  lock.bonus_rate = QuoteBonusRate(user, period);
  state_.locks.emplace(user, lock);
  return lock;
}

UserLock LockManager::Unlock(const Address& user, std::uint64_t now) {
  auto it = state_.locks.find(user);
  if (it == state_.locks.end()) {
    throw StrategyError(ErrorKind::kNoLockFound, "user " + user.Hex() + " has no lock");
  }
  if (U256(now) < it->second.unlock_time) {
    throw StrategyError(ErrorKind::kStillLocked,
                        "lock of " + user.Hex() + " expires at " + ToDecimal(it->second.unlock_time));
  }
  UserLock released = it->second;
  state_.locks.erase(it);
  return released;
}

std::optional<UserLock> LockManager::LockOf(const Address& user) const {
  auto it = state_.locks.find(user);
  if (it == state_.locks.end()) return std::nullopt;
  return it->second;
}

bool LockManager::IsLocked(const Address& user, std::uint64_t now) const {
  auto it = state_.locks.find(user);
  return it != state_.locks.end() && it->second.unlock_time > now;
}

U256 LockManager::QuoteBonusRate(const Address& user, LockPeriod period) const {
  U256 base = UtilizationRateModel::Rate(vault_.MaxCapacity(), vault_.TotalDeposited(), state_.curve);
  Tier tier = TierClassifier::TierOf(vault_.UserDeposit(user), state_.tiers);
  U256 tier_bonus = TierClassifier::BonusOf(tier, state_.tiers);
  return BasisPoints::Apply(base + tier_bonus, state_.lock_policies.At(period).bonus_multiplier_bps);
}

void LockManager::Validate(const LockPolicyConfig& policy) {
  if (policy.duration > kMaxDurationSeconds) {
    throw StrategyError(ErrorKind::kInvalidLockDuration,
                        "duration " + ToDecimal(policy.duration) + " s exceeds " + std::to_string(kMaxDurationSeconds));
  }
  if (policy.bonus_multiplier_bps < kMinMultiplierBps || policy.bonus_multiplier_bps > kMaxMultiplierBps) {
    throw StrategyError(ErrorKind::kInvalidLockMultiplier,
                        "multiplier " + ToDecimal(policy.bonus_multiplier_bps) + " bps outside [10000, 20000]");
  }
}
