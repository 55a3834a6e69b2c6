#pragma once
#include <string>
#include <optional>

// On-chain endpoints and addresses for reading a deployed strategy.
struct NetworkConfig {
  std::string rpc_url;
  std::optional<std::string> auth_header;
  int timeout_ms = 3000;
  std::string strategy_address;
  std::string staking_vault;
  std::string held_asset;
};

// Reads RPC_URL, RPC_AUTH_HEADER, RPC_TIMEOUT_MS, STRATEGY_ADDRESS, STAKING_VAULT, HELD_ASSET.
// Throws std::runtime_error on missing keys and std::invalid_argument on malformed addresses.
NetworkConfig LoadNetworkConfig();
