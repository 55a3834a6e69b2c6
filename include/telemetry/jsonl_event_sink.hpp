#pragma once
#include <nlohmann/json.hpp>
#include "strategy/strategy_events.hpp"

// Serializes a strategy event as {"event":..., "ts_ms":..., ...fields}
nlohmann::json StrategyEventToJson(const StrategyEvent& event);

// Forwards every event to StructuredLogger::Instance() as one JSON line. An event
// that cannot be serialized (e.g. non-UTF-8 text) is reported via Logger::Error
// and not written.
class JsonlEventSink : public EventSink {
public:
  void Emit(const StrategyEvent& event) noexcept override;
};
