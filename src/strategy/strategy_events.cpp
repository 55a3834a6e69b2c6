#include "strategy/strategy_events.hpp"

const char* PauseDirectionName(PauseDirection d) {
  return d == PauseDirection::Deposit ? "deposit" : "withdraw";
}

const char* StrategyEventName(StrategyEventKind kind) {
  switch (kind) {
    case StrategyEventKind::DepositThresholdUpdated: return "deposit_threshold_updated";
    case StrategyEventKind::DepositQueued: return "deposit_queued";
    case StrategyEventKind::DepositCommitted: return "deposit_committed";
    case StrategyEventKind::Withdrawn: return "withdrawn";
    case StrategyEventKind::ClusterUpdated: return "cluster_updated";
    case StrategyEventKind::PauseUpdated: return "pause_updated";
    case StrategyEventKind::EmergencyWithdrawn: return "emergency_withdrawn";
    case StrategyEventKind::EthRescued: return "eth_rescued";
    case StrategyEventKind::CooldownRequested: return "cooldown_requested";
    case StrategyEventKind::OwnershipTransferred: return "ownership_transferred";
  }
  return "unknown";
}
