#pragma once
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "common/uint256.hpp"
#include "strategy/redemption_path.hpp"

class RpcClient;
struct NetworkConfig;

// Off-chain view of a deployed strategy's accounting (held balance + pool reading).
// Amounts are full-width base units of the held asset.
struct OnChainStrategyReport {
  Address strategy;
  unsigned long long block_number = 0;
  int decimals = 0;
  RedemptionMode mode = RedemptionMode::Immediate;
  unsigned long long cooldown_duration = 0;
  unsigned long long cooldown_end = 0;
  Uint256 held = 0;
  Uint256 pending_cooldown = 0;
  Uint256 immediate_withdrawable = 0;
  Uint256 pool = 0;
  Uint256 current_balance = 0;
  // Native coin balance of the strategy account (wei); anything here is rescuable
  Uint256 native_balance = 0;
};

// Reads the latest block number, then pins every call to that block so the
// report is one consistent snapshot. Throws on RPC/decoding failure.
OnChainStrategyReport ReadStrategyReport(RpcClient& rpc, const NetworkConfig& cfg);

// Amounts are rendered as base-10 strings.
nlohmann::json OnChainReportToJson(const OnChainStrategyReport& report);
