#include "telemetry/jsonl_event_sink.hpp"
#include "telemetry/structured_logger.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <exception>
#include <string>

nlohmann::json StrategyEventToJson(const StrategyEvent& e) {
  auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now()).time_since_epoch().count();
  nlohmann::json j = {{"event", StrategyEventName(e.kind)}, {"ts_ms", now}};
  switch (e.kind) {
    case StrategyEventKind::DepositThresholdUpdated:
      j["old_threshold"] = e.previous_amount;
      j["new_threshold"] = e.amount;
      break;
    case StrategyEventKind::DepositQueued:
    case StrategyEventKind::DepositCommitted:
    case StrategyEventKind::EmergencyWithdrawn:
      j["amount"] = e.amount;
      break;
    case StrategyEventKind::Withdrawn:
    case StrategyEventKind::EthRescued:
      j["to"] = e.account;
      j["amount"] = e.amount;
      break;
    case StrategyEventKind::ClusterUpdated:
      j["old_cluster"] = e.previous_account;
      j["new_cluster"] = e.account;
      break;
    case StrategyEventKind::PauseUpdated:
      j["direction"] = PauseDirectionName(e.direction);
      j["before"] = e.before;
      j["after"] = e.after;
      break;
    case StrategyEventKind::CooldownRequested:
      j["kind"] = e.detail;
      j["quantity"] = e.amount;
      break;
    case StrategyEventKind::OwnershipTransferred:
      j["old_owner"] = e.previous_account;
      j["new_owner"] = e.account;
      break;
  }
  return j;
}

void JsonlEventSink::Emit(const StrategyEvent& event) noexcept {
  try {
    StructuredLogger::Instance().LogJsonLine(StrategyEventToJson(event).dump());
  } catch (const std::exception& e) {
    Logger::Error(std::string("event ") + StrategyEventName(event.kind) + " not journaled: " + e.what());
  }
}
