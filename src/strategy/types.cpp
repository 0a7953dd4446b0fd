#include "strategy/types.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

static const std::array<const char*, kTierCount> kTierNames = {"Bronze", "Silver", "Gold", "Platinum", "Diamond"};
static const std::array<const char*, kLockPeriodCount> kLockPeriodNames = {
  "None", "ThirtyDays", "NinetyDays", "OneEightyDays", "ThreeSixtyFiveDays"};

static std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

template <std::size_t N>
static std::size_t ParseOrdinal(const std::string& text, const std::array<const char*, N>& names, const char* what) {
  auto lowered = Lower(text);
  for (std::size_t i = 0; i < N; ++i) {
    if (lowered == Lower(names[i])) return i;
  }
  if (!text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c){ return std::isdigit(c) != 0; })
      && text.size() < 3) {
    auto i = static_cast<std::size_t>(std::stoul(text));
    if (i < N) return i;
  }
  throw std::invalid_argument(std::string("unknown ") + what + ": " + text);
}

const char* TierName(Tier tier) { return kTierNames.at(static_cast<std::size_t>(tier)); }
const char* LockPeriodName(LockPeriod period) { return kLockPeriodNames.at(static_cast<std::size_t>(period)); }

Tier ParseTier(const std::string& text) { return static_cast<Tier>(ParseOrdinal(text, kTierNames, "tier")); }

LockPeriod ParseLockPeriod(const std::string& text) {
  return static_cast<LockPeriod>(ParseOrdinal(text, kLockPeriodNames, "lock period"));
}
