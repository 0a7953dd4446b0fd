#pragma once
#include <istream>
#include <ostream>
#include <string>
#include <vector>

class YieldStrategy;
class InMemoryVault;
class InMemoryTokenLedger;
class ManualClock;

// Drives a YieldStrategy over in-memory collaborators from a line-oriented script.
// Blank lines and lines starting with '#' are skipped.
class ScenarioRunner {
public:
  ScenarioRunner(YieldStrategy& strategy, InMemoryVault& vault, InMemoryTokenLedger& token, ManualClock& clock,
                 std::ostream& out)
    : strategy_(strategy), vault_(vault), token_(token), clock_(clock), out_(out) {}

  // Runs one command. Failures are reported on the output stream; returns false on failure.
  bool Execute(const std::string& line);
  // Returns the number of failed commands
  int Run(std::istream& script);
private:
  void Dispatch(const std::string& command, const std::vector<std::string>& args);

  YieldStrategy& strategy_;
  InMemoryVault& vault_;
  InMemoryTokenLedger& token_;
  ManualClock& clock_;
  std::ostream& out_;
};
