#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include "common/address.hpp"
#include "common/errors.hpp"
#include "common/uint256.hpp"

enum class Tier : std::uint8_t { Bronze, Silver, Gold, Platinum, Diamond };
inline constexpr std::size_t kTierCount = 5;

enum class LockPeriod : std::uint8_t { None, ThirtyDays, NinetyDays, OneEightyDays, ThreeSixtyFiveDays };
inline constexpr std::size_t kLockPeriodCount = 5;

const char* TierName(Tier tier);
const char* LockPeriodName(LockPeriod period);
// Name (case-insensitive) or ordinal; throws std::invalid_argument
Tier ParseTier(const std::string& text);
LockPeriod ParseLockPeriod(const std::string& text);

struct RateCurveConfig {
  U256 kink_bps;
  U256 base_rate_bps;
  U256 low_slope;   // bps per whole percent of utilization below the kink
  U256 high_slope;  // bps per whole percent above the kink
};

struct TierConfig {
  U256 min_deposit;
  U256 bonus_bps;
};

struct LockPolicyConfig {
  U256 duration;  // seconds
  U256 bonus_multiplier_bps;
};

struct UserLock {
  U256 amount;
  U256 unlock_time;
  LockPeriod period = LockPeriod::None;
  U256 bonus_rate;
};

struct PerformanceFeeConfig {
  U256 fee_bps;
  Address recipient;
};

// Fixed-size table indexed by a closed enum. Construction requires an entry for every variant.
template <typename Enum, typename Value, std::size_t N>
class EnumTable {
public:
  EnumTable(std::initializer_list<std::pair<Enum, Value>> entries) {
    std::array<bool, N> seen{};
    for (const auto& e : entries) {
      auto i = static_cast<std::size_t>(e.first);
      if (i >= N || seen[i]) {
        throw StrategyError(ErrorKind::kInvalidConfig, "duplicate or out-of-range table entry " + std::to_string(i));
      }
      seen[i] = true;
      values_[i] = e.second;
    }
    for (std::size_t i = 0; i < N; ++i) {
      if (!seen[i]) throw StrategyError(ErrorKind::kInvalidConfig, "missing table entry " + std::to_string(i));
    }
  }
  const Value& At(Enum key) const { return values_.at(static_cast<std::size_t>(key)); }
  Value& At(Enum key) { return values_.at(static_cast<std::size_t>(key)); }
  static constexpr std::size_t Size() { return N; }
private:
  std::array<Value, N> values_{};
};

using TierTable = EnumTable<Tier, TierConfig, kTierCount>;
using LockPolicyTable = EnumTable<LockPeriod, LockPolicyConfig, kLockPeriodCount>;
