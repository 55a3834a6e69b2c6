#pragma once
#include <optional>
#include <string>
#include "common/types.hpp"
#include "common/uint256.hpp"
#include "strategy/redemption_path.hpp"

class RpcClient;

// cooldowns(holder) as stored on chain; the amount is a uint152.
struct OnChainCooldown {
  unsigned long long cooldown_end = 0;
  Uint256 underlying_amount = 0;
};

// Read-only eth_call view of a deployed staking vault. Amounts are full width.
// With `block` set every read is pinned to that block, otherwise "latest".
class RpcStakingVaultView {
public:
  RpcStakingVaultView(RpcClient& rpc, const Address& vault,
                      const std::optional<std::string>& block = std::nullopt)
    : rpc_(rpc), vault_(vault), block_(block) {}
  const Address& VaultAddress() const { return vault_; }
  Address Asset() const;
  unsigned long long CooldownDuration() const;
  RedemptionMode Mode() const { return RedemptionModeFor(CooldownDuration()); }
  OnChainCooldown Cooldowns(const Address& holder) const;
  Uint256 MaxWithdraw(const Address& holder) const;
private:
  std::string Call(const std::string& data) const;

  RpcClient& rpc_;
  Address vault_;
  std::optional<std::string> block_;
};
