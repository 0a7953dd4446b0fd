#include "telemetry/event_sink.hpp"
#include "telemetry/event_journal.hpp"
#include "crypto/keccak.hpp"

std::string StrategyEvent::Topic() const { return Crypto::Keccak256Raw(signature); }

nlohmann::json StrategyEvent::ToJson() const {
  nlohmann::json j;
  j["event"] = name;
  j["topic"] = Topic();
  j["timestamp"] = timestamp;
  j["fields"] = fields;
  return j;
}

void JournalEventSink::Publish(const StrategyEvent& event) {
  EventJournal::Instance().Append(event.ToJson());
}
