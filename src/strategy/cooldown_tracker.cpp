#include "strategy/cooldown_tracker.hpp"
#include "protocols/staking_vault.hpp"

Amount CooldownTracker::PendingCooldownAmount() const {
  return vault_.Cooldowns(holder_).underlying_amount;
}

Amount CooldownTracker::ImmediateWithdrawable() const {
  return vault_.MaxWithdraw(holder_);
}

RedemptionMode CooldownTracker::CurrentMode() const {
  return SelectRedemptionPath(vault_).Mode();
}

Amount CooldownTracker::PoolBalance() const {
  return SelectRedemptionPath(vault_).Available(vault_, holder_);
}
