#include "cli/scenario_runner.hpp"
#include "strategy/yield_strategy.hpp"
#include "vault/memory_ledger.hpp"
#include "common/clock.hpp"
#include "common/logger.hpp"
#include <limits>
#include <sstream>
#include <stdexcept>

static void RequireArgs(const std::string& command, const std::vector<std::string>& args, size_t n) {
  if (args.size() != n) {
    throw std::invalid_argument(command + " expects " + std::to_string(n) + " argument(s), got " +
                                std::to_string(args.size()));
  }
}

bool ScenarioRunner::Execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command) || command[0] == '#') return true;
  std::vector<std::string> args;
  for (std::string a; iss >> a;) args.push_back(a);
  try {
    Dispatch(command, args);
    return true;
  } catch (const StrategyError& e) {
    out_ << "error " << ErrorKindName(e.Kind()) << ": " << command << '\n';
  } catch (const std::exception& e) {
    out_ << "error " << command << ": " << e.what() << '\n';
  }
  Logger::Warning("scenario command failed: " + line, __FILE__, __LINE__);
  return false;
}

int ScenarioRunner::Run(std::istream& script) {
  int failures = 0;
  for (std::string line; std::getline(script, line);) {
    if (!Execute(line)) ++failures;
  }
  return failures;
}

void ScenarioRunner::Dispatch(const std::string& command, const std::vector<std::string>& args) {
  if (command == "deposit") {
    RequireArgs(command, args, 2);
    vault_.Deposit(Address::Parse(args[0]), ParseU256(args[1]));
  } else if (command == "capacity") {
    RequireArgs(command, args, 1);
    vault_.SetCapacity(ParseU256(args[0]));
  } else if (command == "supply") {
    RequireArgs(command, args, 2);
    token_.SetSupply(ParseU256(args[0]), ParseU256(args[1]));
  } else if (command == "balance") {
    RequireArgs(command, args, 2);
    token_.SetBalance(Address::Parse(args[0]), ParseU256(args[1]));
  } else if (command == "advance") {
    RequireArgs(command, args, 1);
    U256 seconds = ParseU256(args[0]);
    if (seconds > std::numeric_limits<std::uint64_t>::max()) throw std::invalid_argument("advance: out of range");
    clock_.Advance(seconds.convert_to<std::uint64_t>());
  } else if (command == "lock") {
    RequireArgs(command, args, 2);
    UserLock l = strategy_.LockDeposit(Address::Parse(args[0]), ParseLockPeriod(args[1]));
    out_ << "locked " << ToDecimal(l.amount) << " until " << ToDecimal(l.unlock_time)
         << " at " << ToDecimal(l.bonus_rate) << " bps\n";
  } else if (command == "unlock") {
    RequireArgs(command, args, 1);
    UserLock l = strategy_.UnlockDeposit(Address::Parse(args[0]));
    out_ << "unlocked " << ToDecimal(l.amount) << '\n';
  } else if (command == "withdraw") {
    RequireArgs(command, args, 1);
    out_ << "fee " << ToDecimal(strategy_.PrepareWithdrawal(Address::Parse(args[0]))) << '\n';
  } else if (command == "set-curve") {
    RequireArgs(command, args, 5);
    strategy_.SetUtilizationConfig(Address::Parse(args[0]), ParseU256(args[1]), ParseU256(args[2]),
                                   ParseU256(args[3]), ParseU256(args[4]));
  } else if (command == "set-tier") {
    RequireArgs(command, args, 4);
    strategy_.SetTierConfig(Address::Parse(args[0]), ParseTier(args[1]), ParseU256(args[2]), ParseU256(args[3]));
  } else if (command == "set-lock") {
    RequireArgs(command, args, 4);
    strategy_.SetLockConfig(Address::Parse(args[0]), ParseLockPeriod(args[1]), ParseU256(args[2]),
                            ParseU256(args[3]));
  } else if (command == "set-fee") {
    RequireArgs(command, args, 3);
    strategy_.SetPerformanceFeeConfig(Address::Parse(args[0]), ParseU256(args[1]), Address::Parse(args[2]));
  } else if (command == "update-hwm") {
    RequireArgs(command, args, 1);
    strategy_.UpdateGlobalHighWaterMark(Address::Parse(args[0]));
  } else if (command == "info") {
    RequireArgs(command, args, 1);
    out_ << strategy_.Info(Address::Parse(args[0])).ToJson().dump() << '\n';
  } else {
    throw std::invalid_argument("unknown command");
  }
}
