#include "config/network.hpp"
#include "common/config_manager.hpp"
#include "utils/hex.hpp"
#include <stdexcept>

static std::string RequireAddress(const std::string& key) {
  std::string v = ConfigManager::GetOrThrow(key);
  if (!IsHexAddress(v)) throw std::invalid_argument("config " + key + " is not an address: " + v);
  return ToLowerHex(v);
}

NetworkConfig LoadNetworkConfig() {
  NetworkConfig cfg;
  cfg.rpc_url = ConfigManager::GetOrThrow("RPC_URL");
  if (auto a = ConfigManager::Get("RPC_AUTH_HEADER")) {
    if (!a->empty()) cfg.auth_header = *a;
  }
  cfg.timeout_ms = ConfigManager::GetIntOr("RPC_TIMEOUT_MS", 3000);
  if (cfg.timeout_ms <= 0) throw std::invalid_argument("config RPC_TIMEOUT_MS must be positive");
  cfg.strategy_address = RequireAddress("STRATEGY_ADDRESS");
  cfg.staking_vault = RequireAddress("STAKING_VAULT");
  cfg.held_asset = RequireAddress("HELD_ASSET");
  return cfg;
}
