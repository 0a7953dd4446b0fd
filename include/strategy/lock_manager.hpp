#pragma once
#include <cstdint>
#include <optional>
#include "strategy/strategy_state.hpp"

class VaultView;

// One optional time-locked commitment per user.
//
//   Unlocked --Lock()--> Locked --Unlock() once now >= unlock_time--> Unlocked
//
// A record stays in place after it expires; the user has to Unlock() before locking again.
class LockManager {
public:
  inline static constexpr std::uint32_t kMinMultiplierBps = 10000;
  inline static constexpr std::uint32_t kMaxMultiplierBps = 20000;
  // Ten years; keeps now + duration far inside the clock range
  inline static constexpr std::uint64_t kMaxDurationSeconds = 10ull * 365 * 24 * 60 * 60;

  LockManager(StrategyState& state, const VaultView& vault) : state_(state), vault_(vault) {}

  // Locks the user's whole deposit for the period and freezes the bonus rate
  UserLock Lock(const Address& user, LockPeriod period, std::uint64_t now);
  // Removes an expired record and returns it
  UserLock Unlock(const Address& user, std::uint64_t now);
  std::optional<UserLock> LockOf(const Address& user) const;
  // Record exists and unlock_time is still in the future
  bool IsLocked(const Address& user, std::uint64_t now) const;
  // (base rate + tier bonus) * multiplier / 10000, from current vault state
  U256 QuoteBonusRate(const Address& user, LockPeriod period) const;

  static void Validate(const LockPolicyConfig& policy);
private:
  StrategyState& state_;
  const VaultView& vault_;
};
