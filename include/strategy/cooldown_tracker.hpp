#pragma once
#include "common/types.hpp"
#include "strategy/redemption_path.hpp"

class StakingVaultView;

// Live reads of the staking position. Nothing is cached between calls.
class CooldownTracker {
public:
  CooldownTracker(const StakingVaultView& vault, const Address& holder) : vault_(vault), holder_(holder) {}
  Amount PendingCooldownAmount() const;
  Amount ImmediateWithdrawable() const;
  RedemptionMode CurrentMode() const;
  // Pool reading for the current mode
  Amount PoolBalance() const;
  Amount Harvestable() const { return PoolBalance(); }
private:
  const StakingVaultView& vault_;
  Address holder_;
};
