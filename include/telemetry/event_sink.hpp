#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

// Notification emitted after a mutating strategy operation commits.
struct StrategyEvent {
  std::string name;       // e.g. "LockCreated"
  std::string signature;  // canonical form, e.g. "LockCreated(address,uint256,uint256,uint8,uint256)"
  std::uint64_t timestamp = 0;
  nlohmann::json fields = nlohmann::json::object();

  // keccak256(signature), like an EVM log topic0
  std::string Topic() const;
  nlohmann::json ToJson() const;
};

class EventSink {
public:
  virtual ~EventSink() = default;
  virtual void Publish(const StrategyEvent& event) = 0;
};

// Appends events to the EventJournal
class JournalEventSink : public EventSink {
public:
  void Publish(const StrategyEvent& event) override;
};

class NullEventSink : public EventSink {
public:
  void Publish(const StrategyEvent&) override {}
};
