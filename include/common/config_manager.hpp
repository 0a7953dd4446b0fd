#pragma once
#include <string>
#include <unordered_map>
#include <optional>
#include "common/uint256.hpp"

// Process-wide KEY=VALUE configuration loaded from a .env file.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  // Overrides (or adds) a single key; used by tests and by the CLI
  static void Set(const std::string& key, const std::string& value);
  static void Clear();
  static std::optional<std::string> Get(const std::string& key);
  static bool GetBoolOr(const std::string& key, bool default_value);
  // Malformed values throw StrategyError(kInvalidConfig) instead of falling back
  static U256 GetU256Or(const std::string& key, const U256& default_value);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static void LoadEnvFile(const std::string& env_path);
};
