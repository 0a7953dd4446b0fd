#include "cli/scenario_runner.hpp"
#include "common/clock.hpp"
#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include "config/strategy_config.hpp"
#include "strategy/yield_strategy.hpp"
#include "telemetry/event_sink.hpp"
#include "telemetry/event_journal.hpp"
#include "vault/memory_ledger.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

// Usage: strategy_cli [scenario-file] [env-file]
// Reads the scenario from stdin when no file is given.
int main(int argc, char** argv) {
  const std::string env_path = argc > 2 ? argv[2] : ".env";
  ConfigManager::Initialize(env_path);
  RuntimeConfig runtime = LoadRuntimeConfig();
  Logger::Initialize(runtime.log_file, runtime.log_level, runtime.log_to_stderr);
  if (!EventJournal::Instance().Open(runtime.event_journal)) {
    std::cerr << "warning: events will not be journaled" << std::endl;
  }
  Logger::Info("strategy_cli starting, env=" + env_path);

  int exit_code = 0;
  try {
    InMemoryVault vault;
    vault.SetCapacity(ConfigManager::GetU256Or("SIM_CAPACITY", U256(0)));
    if (auto admins = ConfigManager::Get("SIM_ADMINS")) {
      std::istringstream iss(*admins); std::string a;
      while (std::getline(iss, a, ',')) if (!a.empty()) vault.Authorize(Address::Parse(a));
    }
    if (auto r = ConfigManager::Get("SIM_FEE_RECIPIENT")) vault.SetFeeRecipient(Address::Parse(*r));
    InMemoryTokenLedger token;
    ManualClock clock(static_cast<std::uint64_t>(ConfigManager::GetU256Or("SIM_START_TIME", U256(SystemClock().Now()))
                                                   .convert_to<std::uint64_t>()));

    StrategyState state = MakeStrategyState(LoadStrategySeed(), vault.FeeRecipient());
    JournalEventSink events;
    YieldStrategy strategy(state, vault, token, clock, events);
    Logger::Info("strategy ready: rate=" + ToDecimal(strategy.Rate()) + " bps, fee=" +
                 ToDecimal(state.fee.fee_bps) + " bps to " + state.fee.recipient.ToChecksum());

    ScenarioRunner runner(strategy, vault, token, clock, std::cout);
    int failures = 0;
    if (argc > 1) {
      std::ifstream script(argv[1]);
      if (!script.is_open()) {
        std::cerr << "cannot open scenario " << argv[1] << std::endl;
        failures = 1;
      } else {
        failures = runner.Run(script);
      }
    } else {
      failures = runner.Run(std::cin);
    }
    Logger::Info("scenario finished with " + std::to_string(failures) + " failed command(s)");
    exit_code = failures == 0 ? 0 : 2;
  } catch (const std::exception& e) {
    std::cerr << "fatal: " << e.what() << std::endl;
    Logger::Critical(std::string("fatal: ") + e.what());
    exit_code = 1;
  }

  EventJournal::Instance().Close();
  Logger::Shutdown();
  return exit_code;
}
