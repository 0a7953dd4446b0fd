#pragma once
#include <string>
#include "common/logger.hpp"
#include "strategy/strategy_state.hpp"

struct RuntimeConfig {
  std::string log_file = "strategy.log";
  LogLevel log_level = LogLevel::INFO;
  bool log_to_stderr = false;
  std::string event_journal = "strategy-events.jsonl";
};

// Builds the seed from ConfigManager keys, starting from DefaultStrategySeed():
//   RATE_KINK_BPS, RATE_BASE_BPS, RATE_LOW_SLOPE, RATE_HIGH_SLOPE
//   TIER_CONFIG=tier:minDeposit:bonusBps,...     (tier by name or ordinal)
//   LOCK_CONFIG=period:durationSeconds:multiplierBps,...
//   PERF_FEE_BPS, FEE_RECIPIENT, INITIAL_HIGH_WATER_MARK
// Malformed entries throw StrategyError(kInvalidConfig). Range checks happen in MakeStrategyState().
StrategySeed LoadStrategySeed();

RuntimeConfig LoadRuntimeConfig();
