#include "config/strategy_config.hpp"
#include "common/config_manager.hpp"
#include <sstream>
#include <vector>

static std::vector<std::string> SplitOn(const std::string& s, char sep) {
  std::vector<std::string> parts;
  std::istringstream iss(s); std::string part;
  while (std::getline(iss, part, sep)) parts.push_back(part);
  return parts;
}

// key=a:b:c,d:e:f -> [[a,b,c],[d,e,f]]
static std::vector<std::vector<std::string>> ParseTriples(const std::string& key, const std::string& value) {
  std::vector<std::vector<std::string>> out;
  for (const auto& entry : SplitOn(value, ',')) {
    if (entry.empty()) continue;
    auto fields = SplitOn(entry, ':');
    if (fields.size() != 3) {
      throw StrategyError(ErrorKind::kInvalidConfig, key + ": expected name:value:value, got '" + entry + "'");
    }
    out.push_back(fields);
  }
  return out;
}

static U256 FieldU256(const std::string& key, const std::string& text) {
  try {
    return ParseU256(text);
  } catch (const std::exception& e) {
    throw StrategyError(ErrorKind::kInvalidConfig, key + ": " + e.what());
  }
}

StrategySeed LoadStrategySeed() {
  StrategySeed seed = DefaultStrategySeed();
  seed.curve.kink_bps = ConfigManager::GetU256Or("RATE_KINK_BPS", seed.curve.kink_bps);
  seed.curve.base_rate_bps = ConfigManager::GetU256Or("RATE_BASE_BPS", seed.curve.base_rate_bps);
  seed.curve.low_slope = ConfigManager::GetU256Or("RATE_LOW_SLOPE", seed.curve.low_slope);
  seed.curve.high_slope = ConfigManager::GetU256Or("RATE_HIGH_SLOPE", seed.curve.high_slope);

  if (auto v = ConfigManager::Get("TIER_CONFIG")) {
    for (const auto& f : ParseTriples("TIER_CONFIG", *v)) {
      Tier tier;
      try { tier = ParseTier(f[0]); } catch (const std::invalid_argument& e) {
        throw StrategyError(ErrorKind::kInvalidConfig, std::string("TIER_CONFIG: ") + e.what());
      }
      seed.tiers.At(tier) = TierConfig{FieldU256("TIER_CONFIG", f[1]), FieldU256("TIER_CONFIG", f[2])};
    }
  }
  if (auto v = ConfigManager::Get("LOCK_CONFIG")) {
    for (const auto& f : ParseTriples("LOCK_CONFIG", *v)) {
      LockPeriod period;
      try { period = ParseLockPeriod(f[0]); } catch (const std::invalid_argument& e) {
        throw StrategyError(ErrorKind::kInvalidConfig, std::string("LOCK_CONFIG: ") + e.what());
      }
      seed.lock_policies.At(period) = LockPolicyConfig{FieldU256("LOCK_CONFIG", f[1]), FieldU256("LOCK_CONFIG", f[2])};
    }
  }

  seed.fee_bps = ConfigManager::GetU256Or("PERF_FEE_BPS", seed.fee_bps);
  if (auto r = ConfigManager::Get("FEE_RECIPIENT")) {
    auto parsed = Address::TryParse(*r);
    if (!parsed) throw StrategyError(ErrorKind::kInvalidConfig, "FEE_RECIPIENT: not an address: " + *r);
    seed.fee_recipient = *parsed;
  }
  seed.initial_high_water_mark = ConfigManager::GetU256Or("INITIAL_HIGH_WATER_MARK", seed.initial_high_water_mark);
  return seed;
}

RuntimeConfig LoadRuntimeConfig() {
  RuntimeConfig cfg;
  cfg.log_file = ConfigManager::Get("LOG_FILE").value_or(cfg.log_file);
  if (auto lvl = ConfigManager::Get("LOG_LEVEL")) cfg.log_level = ParseLogLevel(*lvl, cfg.log_level);
  cfg.log_to_stderr = ConfigManager::GetBoolOr("LOG_STDERR", cfg.log_to_stderr);
  cfg.event_journal = ConfigManager::Get("EVENT_JOURNAL").value_or(cfg.event_journal);
  return cfg;
}
